#include "trailgraph/common/log_sink.hpp"
#include "trailgraph/io/trail_json.hpp"
#include "trailgraph/reconstruction/dag_reconstructor.hpp"
#include "trailgraph/traversal/trail_traversal.hpp"
#include "trailgraph/validation/dag_validator.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace trailgraph;

namespace
{

constexpr int kExitInvalidReport = 2;

struct CliOptions
{
    std::string input_path{"-"};
    std::optional<std::string> start_node_id;
    bool first_write_wins{false};
    bool report_dead_ends{false};
    bool strict{false};
    bool quiet{false};
    bool show_help{false};
    int indent{2};
};

void print_usage(std::ostream& os)
{
    os << "Usage: trailgraph_cli [options] [FILE|-]\n"
       << "\n"
       << "Reads a trail document (a trail_steps array, or an object holding one),\n"
       << "rebuilds the story DAG, validates it and prints the result as JSON.\n"
       << "\n"
       << "Options:\n"
       << "  --start ID           start node id (overrides the document)\n"
       << "  --first-write-wins   keep the first node when a node id repeats\n"
       << "  --report-dead-ends   add a dead-end warning to the validation report\n"
       << "  --strict             exit with status 2 if the report is not valid\n"
       << "  --indent N           JSON indentation (default 2, -1 for compact)\n"
       << "  --quiet              do not log reconstruction warnings to stderr\n"
       << "  --help               show this message\n";
}

int parse_indent(const std::string& value)
{
    size_t pos = 0;
    int indent = 0;
    try
    {
        indent = std::stoi(value, &pos);
    }
    catch (const std::logic_error&)
    {
        throw std::invalid_argument("Invalid value for --indent: " + value);
    }
    if (pos != value.size())
    {
        throw std::invalid_argument("Invalid value for --indent: " + value);
    }
    return indent;
}

CliOptions parse_args(int argc, char** argv)
{
    CliOptions options;
    bool have_path = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        auto next_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg == "--start")
        {
            options.start_node_id = next_value(arg);
        }
        else if (arg == "--first-write-wins")
        {
            options.first_write_wins = true;
        }
        else if (arg == "--report-dead-ends")
        {
            options.report_dead_ends = true;
        }
        else if (arg == "--strict")
        {
            options.strict = true;
        }
        else if (arg == "--quiet")
        {
            options.quiet = true;
        }
        else if (arg == "--indent")
        {
            options.indent = parse_indent(next_value(arg));
        }
        else if (arg.size() > 1 && arg[0] == '-' && arg != "-")
        {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        else if (!have_path)
        {
            options.input_path = arg;
            have_path = true;
        }
        else
        {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    return options;
}

std::string read_input(const std::string& path)
{
    if (path == "-")
    {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        const CliOptions cli = parse_args(argc, argv);
        if (cli.show_help)
        {
            print_usage(std::cout);
            return EXIT_SUCCESS;
        }

        TrailDocument document = parse_trail_document(read_input(cli.input_path));
        const std::string start_node_id =
            cli.start_node_id.value_or(document.start_node_id.value_or(std::string{}));

        ReconstructorOptions reconstructor_options;
        reconstructor_options.duplicate_policy =
            cli.first_write_wins ? DuplicateNodePolicy::FirstWriteWins : DuplicateNodePolicy::LastWriteWins;
        if (!cli.quiet)
        {
            reconstructor_options.log_sink = std::make_shared<StreamLogSink>(std::cerr, LogLevel::Warning);
        }

        const DagReconstructor reconstructor(std::move(reconstructor_options));
        const ReconstructionResult result = reconstructor.reconstruct(document.steps, start_node_id);

        ValidatorOptions validator_options;
        validator_options.report_dead_ends = cli.report_dead_ends;
        const ValidationReport report = DagValidator(validator_options).validate(*result.dag);

        const nlohmann::json output{
            {"dag", dag_to_json(*result.dag)},
            {"diagnostics", diagnostics_to_json(*result.diagnostics)},
            {"validation", report_to_json(report)},
            {"reading_order", linear_reading_order(*result.dag)},
        };
        std::cout << output.dump(cli.indent) << "\n" << std::flush;

        if (cli.strict && !report.valid)
        {
            return kExitInvalidReport;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

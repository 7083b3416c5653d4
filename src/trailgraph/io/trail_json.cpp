/**
 * @file trail_json.cpp
 */
#include "trailgraph/io/trail_json.hpp"

#include <cmath>
#include <limits>

namespace trailgraph
{

using nlohmann::json;

namespace
{

// ============================================================================
// Lenient field readers
// ============================================================================

const json* find_field(const json& obj, const char* key)
{
    if (!obj.is_object())
    {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> read_string(const json& obj, const char* key)
{
    const json* field = find_field(obj, key);
    if (field == nullptr || !field->is_string())
    {
        return std::nullopt;
    }
    return field->get<std::string>();
}

std::optional<bool> read_bool(const json& obj, const char* key)
{
    const json* field = find_field(obj, key);
    if (field == nullptr || !field->is_boolean())
    {
        return std::nullopt;
    }
    return field->get<bool>();
}

std::optional<int64_t> read_int(const json& obj, const char* key)
{
    const json* field = find_field(obj, key);
    if (field == nullptr || !field->is_number())
    {
        return std::nullopt;
    }
    if (field->is_number_unsigned())
    {
        const auto value = field->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (field->is_number_integer())
    {
        return field->get<int64_t>();
    }

    // Whole-number floats such as 2.0 are accepted; [-2^63, 2^63) is exact in double.
    const double value = field->get<double>();
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || std::trunc(value) != value || value < -kLimit || value >= kLimit)
    {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::vector<std::string> read_string_list(const json& obj, const char* key)
{
    std::vector<std::string> result;
    const json* field = find_field(obj, key);
    if (field == nullptr || !field->is_array())
    {
        return result;
    }
    for (const auto& entry : *field)
    {
        if (entry.is_string())
        {
            result.push_back(entry.get<std::string>());
        }
    }
    return result;
}

// ============================================================================
// Record readers
// ============================================================================

Choice parse_choice(const json& j)
{
    Choice choice;
    choice.id = read_string(j, "id");
    choice.text = read_string(j, "text");
    choice.next_node_id = read_string(j, "next_node_id");
    return choice;
}

EducationalContent parse_educational(const json& j)
{
    EducationalContent edu;
    edu.topic = read_string(j, "topic");
    edu.vocabulary_words = read_string_list(j, "vocabulary_words");
    edu.educational_facts = read_string_list(j, "educational_facts");
    edu.learning_objective = read_string(j, "learning_objective");
    return edu;
}

StepContent parse_content(const json& j)
{
    StepContent content;
    content.text = read_string(j, "text");
    if (const json* choices = find_field(j, "choices"); choices != nullptr && choices->is_array())
    {
        std::vector<Choice> parsed;
        parsed.reserve(choices->size());
        for (const auto& entry : *choices)
        {
            parsed.push_back(parse_choice(entry));
        }
        content.choices = std::move(parsed);
    }
    if (const json* edu = find_field(j, "educational_content"); edu != nullptr && edu->is_object())
    {
        content.educational_content = parse_educational(*edu);
    }
    content.convergence_point = read_bool(j, "convergence_point");
    return content;
}

StepMetadata parse_metadata(const json& j)
{
    StepMetadata metadata;
    metadata.node_id = read_string(j, "node_id");
    metadata.convergence_point = read_bool(j, "convergence_point");
    metadata.incoming_edges = read_int(j, "incoming_edges");
    metadata.outgoing_edges = read_int(j, "outgoing_edges");
    metadata.timestamp = read_string(j, "timestamp");
    metadata.llm_model = read_string(j, "llm_model");
    return metadata;
}

StepRecord parse_step(const json& j)
{
    StepRecord step;
    step.step_order = read_int(j, "step_order").value_or(0);
    if (const json* ref = find_field(j, "content_reference"); ref != nullptr && ref->is_object())
    {
        ContentReference reference;
        reference.temp_node_id = read_string(*ref, "temp_node_id");
        if (const json* content = find_field(*ref, "content"); content != nullptr && content->is_object())
        {
            reference.content = parse_content(*content);
        }
        step.content_reference = std::move(reference);
    }
    if (const json* metadata = find_field(j, "metadata"); metadata != nullptr && metadata->is_object())
    {
        step.metadata = parse_metadata(*metadata);
    }
    return step;
}

std::optional<std::string> find_start_node_id(const json& doc)
{
    if (auto id = read_string(doc, "start_node_id"))
    {
        return id;
    }
    const json* trail = find_field(doc, "trail");
    if (trail == nullptr)
    {
        return std::nullopt;
    }
    const json* metadata = find_field(*trail, "metadata");
    if (metadata == nullptr)
    {
        return std::nullopt;
    }
    if (auto id = read_string(*metadata, "start_node_id"))
    {
        return id;
    }
    if (const json* params = find_field(*metadata, "generation_params"))
    {
        return read_string(*params, "start_node_id");
    }
    return std::nullopt;
}

// ============================================================================
// Writers
// ============================================================================

template <typename T>
void put_optional(json& obj, const char* key, const std::optional<T>& value)
{
    if (value)
    {
        obj[key] = *value;
    }
}

json choice_to_json(const Choice& choice)
{
    json j = json::object();
    put_optional(j, "id", choice.id);
    put_optional(j, "text", choice.text);
    put_optional(j, "next_node_id", choice.next_node_id);
    return j;
}

json choices_to_json(const std::vector<Choice>& choices)
{
    json arr = json::array();
    for (const auto& choice : choices)
    {
        arr.push_back(choice_to_json(choice));
    }
    return arr;
}

json educational_to_json(const EducationalContent& edu)
{
    json j = json::object();
    put_optional(j, "topic", edu.topic);
    if (!edu.vocabulary_words.empty())
    {
        j["vocabulary_words"] = edu.vocabulary_words;
    }
    if (!edu.educational_facts.empty())
    {
        j["educational_facts"] = edu.educational_facts;
    }
    put_optional(j, "learning_objective", edu.learning_objective);
    return j;
}

json node_to_json(const ContentNode& node)
{
    json j{
        {"id", node.id},
        {"content", {{"text", node.content.text}, {"choices", choices_to_json(node.content.choices)}}},
        {"incoming_edges", node.incoming_edges},
        {"outgoing_edges", node.outgoing_edges},
    };
    if (node.generation_metadata)
    {
        json gen = educational_to_json(node.generation_metadata->educational);
        put_optional(gen, "timestamp", node.generation_metadata->timestamp);
        put_optional(gen, "llm_model", node.generation_metadata->llm_model);
        j["generation_metadata"] = std::move(gen);
    }
    return j;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

std::vector<StepRecord> parse_trail_steps(const json& j)
{
    if (!j.is_array())
    {
        throw TrailFormatError("trail steps must be a JSON array");
    }
    std::vector<StepRecord> steps;
    steps.reserve(j.size());
    for (const auto& entry : j)
    {
        steps.push_back(parse_step(entry));
    }
    return steps;
}

TrailDocument parse_trail_document(const std::string& payload)
{
    auto doc = json::parse(payload, nullptr, false);
    if (doc.is_discarded())
    {
        throw TrailFormatError("invalid trail document JSON");
    }

    TrailDocument result;
    if (doc.is_array())
    {
        result.steps = parse_trail_steps(doc);
        return result;
    }

    const json* steps = find_field(doc, "trail_steps");
    if (steps == nullptr)
    {
        throw TrailFormatError("trail document has no trail_steps array");
    }
    result.steps = parse_trail_steps(*steps);
    result.start_node_id = find_start_node_id(doc);
    return result;
}

// ============================================================================
// Serialization
// ============================================================================

json dag_to_json(const TrailDag& dag)
{
    json nodes = json::object();
    for (const auto& [node_id, node] : dag.nodes)
    {
        nodes[node_id] = node_to_json(node);
    }

    json edges = json::array();
    for (const auto& edge : dag.edges)
    {
        edges.push_back(json{
            {"from_node_id", edge.from_node_id},
            {"to_node_id", edge.to_node_id},
            {"choice_id", edge.choice_id},
        });
    }

    return json{
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)},
        {"start_node_id", dag.start_node_id},
        {"convergence_points", dag.convergence_points},
    };
}

json diagnostics_to_json(const ReconstructionDiagnostics& diagnostics)
{
    json arr = json::array();
    for (const auto& item : diagnostics.warnings())
    {
        json j{
            {"category", to_string(item.category)},
            {"message", item.message},
        };
        put_optional(j, "step_index", item.step_index);
        put_optional(j, "node_id", item.node_id);
        put_optional(j, "choice_id", item.choice_id);
        arr.push_back(std::move(j));
    }
    return arr;
}

json report_to_json(const ValidationReport& report)
{
    json warnings = json::array();
    for (const auto& w : report.warnings)
    {
        json j{
            {"kind", to_string(w.kind)},
            {"count", w.count},
            {"message", w.message},
        };
        if (!w.involved_nodes.empty())
        {
            j["involved_nodes"] = w.involved_nodes;
        }
        if (!w.involved_edges.empty())
        {
            j["involved_edges"] = w.involved_edges;
        }
        warnings.push_back(std::move(j));
    }

    const ValidationStats& s = report.stats;
    return json{
        {"valid", report.valid},
        {"warnings", std::move(warnings)},
        {"stats",
         {
             {"node_count", s.node_count},
             {"edge_count", s.edge_count},
             {"convergence_point_count", s.convergence_point_count},
             {"orphan_node_count", s.orphan_node_count},
             {"dead_end_node_count", s.dead_end_node_count},
             {"dangling_edge_count", s.dangling_edge_count},
         }},
    };
}

json steps_to_json(const std::vector<StepRecord>& steps)
{
    json arr = json::array();
    for (const auto& step : steps)
    {
        json j = json::object();
        j["step_order"] = step.step_order;

        if (step.content_reference)
        {
            json ref = json::object();
            put_optional(ref, "temp_node_id", step.content_reference->temp_node_id);
            if (const auto& content = step.content_reference->content)
            {
                json c = json::object();
                put_optional(c, "text", content->text);
                if (content->choices)
                {
                    c["choices"] = choices_to_json(*content->choices);
                }
                if (content->educational_content)
                {
                    c["educational_content"] = educational_to_json(*content->educational_content);
                }
                put_optional(c, "convergence_point", content->convergence_point);
                ref["content"] = std::move(c);
            }
            j["content_reference"] = std::move(ref);
        }

        if (step.metadata)
        {
            json m = json::object();
            put_optional(m, "node_id", step.metadata->node_id);
            put_optional(m, "convergence_point", step.metadata->convergence_point);
            put_optional(m, "incoming_edges", step.metadata->incoming_edges);
            put_optional(m, "outgoing_edges", step.metadata->outgoing_edges);
            put_optional(m, "timestamp", step.metadata->timestamp);
            put_optional(m, "llm_model", step.metadata->llm_model);
            j["metadata"] = std::move(m);
        }

        arr.push_back(std::move(j));
    }
    return arr;
}

} // namespace trailgraph

/**
 * @file dag_reconstructor.cpp
 */
#include "trailgraph/reconstruction/dag_reconstructor.hpp"

#include <algorithm>
#include <cctype>

namespace trailgraph
{

namespace
{

bool is_blank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string quoted(const std::string& s)
{
    return "\"" + s + "\"";
}

ContentNode make_node(const std::string& node_id,
                      const StepContent& content,
                      const std::optional<StepMetadata>& metadata)
{
    ContentNode node;
    node.id = node_id;
    node.content.text = content.text.value_or(std::string{});
    if (content.choices)
    {
        node.content.choices = *content.choices;
    }
    if (metadata)
    {
        node.incoming_edges = metadata->incoming_edges.value_or(0);
        node.outgoing_edges = metadata->outgoing_edges.value_or(0);
    }
    if (content.educational_content)
    {
        GenerationMetadata gen;
        gen.educational = *content.educational_content;
        if (metadata)
        {
            gen.timestamp = metadata->timestamp;
            gen.llm_model = metadata->llm_model;
        }
        node.generation_metadata = std::move(gen);
    }
    return node;
}

bool is_flagged_convergence(const StepContent& content, const std::optional<StepMetadata>& metadata)
{
    if (metadata && metadata->convergence_point.value_or(false))
    {
        return true;
    }
    return content.convergence_point.value_or(false);
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

DagReconstructor::DagReconstructor(ReconstructorOptions options)
    : m_options(std::move(options))
{
}

// ============================================================================
// Reconstruction
// ============================================================================

ReconstructionResult DagReconstructor::reconstruct(const std::vector<StepRecord>& steps,
                                                   const std::string& start_node_id) const
{
    if (steps.empty())
    {
        throw ConfigurationError(
            ConfigurationErrorCode::EmptyInput,
            "Cannot reconstruct DAG: empty input (no trail steps)");
    }
    if (start_node_id.empty() || is_blank(start_node_id))
    {
        throw ConfigurationError(
            ConfigurationErrorCode::MissingStartNode,
            "Cannot reconstruct DAG: missing start node id");
    }

    auto dag = std::make_shared<TrailDag>();
    auto diagnostics = std::make_shared<ReconstructionDiagnostics>();
    dag->start_node_id = start_node_id;

    std::unordered_set<std::string> convergence_seen;

    for (size_t step_idx = 0; step_idx < steps.size(); ++step_idx)
    {
        const StepRecord& step = steps[step_idx];
        const std::string step_label =
            "Step " + std::to_string(step_idx) + " (step_order " + std::to_string(step.step_order) + ")";

        // Phase 1: locate node id and content
        if (!step.content_reference)
        {
            DiagnosticItem item;
            item.category = DiagnosticCategory::MissingContentReference;
            item.message = step_label + " has no content reference; skipped";
            item.step_index = step_idx;
            report(*diagnostics, std::move(item));
            continue;
        }

        const ContentReference& ref = *step.content_reference;
        if (!ref.temp_node_id || ref.temp_node_id->empty())
        {
            DiagnosticItem item;
            item.category = DiagnosticCategory::InvalidContentReference;
            item.message = step_label + " has no temp_node_id; skipped";
            item.step_index = step_idx;
            report(*diagnostics, std::move(item));
            continue;
        }
        const std::string& node_id = *ref.temp_node_id;

        if (!ref.content)
        {
            DiagnosticItem item;
            item.category = DiagnosticCategory::InvalidContentReference;
            item.message = step_label + " for node " + quoted(node_id) + " has no content; skipped";
            item.step_index = step_idx;
            item.node_id = node_id;
            report(*diagnostics, std::move(item));
            continue;
        }
        const StepContent& content = *ref.content;

        // Phase 2: insert node, honoring the duplicate policy
        if (dag->has_node(node_id))
        {
            const bool keep_first = m_options.duplicate_policy == DuplicateNodePolicy::FirstWriteWins;
            DiagnosticItem item;
            item.category = DiagnosticCategory::DuplicateNodeId;
            item.message = step_label + " repeats node id " + quoted(node_id) +
                           (keep_first ? "; keeping earlier node and skipping step"
                                       : "; replacing earlier node");
            item.step_index = step_idx;
            item.node_id = node_id;
            report(*diagnostics, std::move(item));
            if (keep_first)
            {
                continue;
            }
        }
        dag->nodes[node_id] = make_node(node_id, content, step.metadata);

        // Phase 3: edges from linkable choices
        if (content.choices)
        {
            const auto& choices = *content.choices;
            for (size_t choice_pos = 0; choice_pos < choices.size(); ++choice_pos)
            {
                const Choice& choice = choices[choice_pos];
                if (!choice.id || choice.id->empty())
                {
                    DiagnosticItem item;
                    item.category = DiagnosticCategory::ChoiceMissingId;
                    item.message = "Choice at position " + std::to_string(choice_pos) +
                                   " in node " + quoted(node_id) + " has no id; no edge created";
                    item.step_index = step_idx;
                    item.node_id = node_id;
                    report(*diagnostics, std::move(item));
                    continue;
                }
                if (!choice.next_node_id || choice.next_node_id->empty())
                {
                    DiagnosticItem item;
                    item.category = DiagnosticCategory::ChoiceMissingNextNode;
                    item.message = "Choice " + quoted(*choice.id) + " in node " + quoted(node_id) +
                                   " has missing or empty next_node_id; no edge created";
                    item.step_index = step_idx;
                    item.node_id = node_id;
                    item.choice_id = *choice.id;
                    report(*diagnostics, std::move(item));
                    continue;
                }
                dag->edges.push_back(Edge{node_id, *choice.next_node_id, *choice.id});
            }
        }

        // Phase 4: convergence points
        if (is_flagged_convergence(content, step.metadata) &&
            convergence_seen.insert(node_id).second)
        {
            dag->convergence_points.push_back(node_id);
        }
    }

    if (!dag->has_node(start_node_id))
    {
        DiagnosticItem item;
        item.category = DiagnosticCategory::StartNodeNotFound;
        item.message = "Start node " + quoted(start_node_id) + " not found among " +
                       std::to_string(dag->nodes.size()) + " reconstructed nodes";
        item.node_id = start_node_id;
        report(*diagnostics, std::move(item));
    }

    return ReconstructionResult{std::move(dag), std::move(diagnostics)};
}

void DagReconstructor::report(ReconstructionDiagnostics& diagnostics, DiagnosticItem item) const
{
    if (m_options.log_sink)
    {
        m_options.log_sink->write(LogLevel::Warning, item.message);
    }
    diagnostics.m_warnings.push_back(std::move(item));
}

std::shared_ptr<const TrailDag> reconstruct_dag(const std::vector<StepRecord>& steps,
                                                const std::string& start_node_id)
{
    return DagReconstructor{}.reconstruct(steps, start_node_id).dag;
}

} // namespace trailgraph

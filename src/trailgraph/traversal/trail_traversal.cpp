/**
 * @file trail_traversal.cpp
 */
#include "trailgraph/traversal/trail_traversal.hpp"

#include <queue>
#include <sstream>

namespace trailgraph
{

namespace
{

/// Successors of each node, in edge-list order, restricted to known nodes.
std::unordered_map<std::string, std::vector<std::string>> successor_lists(const TrailDag& dag)
{
    std::unordered_map<std::string, std::vector<std::string>> successors;
    for (const auto& edge : dag.edges)
    {
        if (dag.has_node(edge.to_node_id))
        {
            successors[edge.from_node_id].push_back(edge.to_node_id);
        }
    }
    return successors;
}

StepRecord make_step(const ContentNode& node, int64_t step_order, bool is_convergence)
{
    StepContent content;
    content.text = node.content.text;
    content.choices = node.content.choices;
    content.convergence_point = is_convergence;

    StepMetadata metadata;
    metadata.node_id = node.id;
    metadata.convergence_point = is_convergence;
    metadata.incoming_edges = node.incoming_edges;
    metadata.outgoing_edges = node.outgoing_edges;

    if (node.generation_metadata)
    {
        content.educational_content = node.generation_metadata->educational;
        metadata.timestamp = node.generation_metadata->timestamp;
        metadata.llm_model = node.generation_metadata->llm_model;
    }

    StepRecord step;
    step.step_order = step_order;
    step.content_reference = ContentReference{node.id, std::move(content)};
    step.metadata = std::move(metadata);
    return step;
}

} // namespace

// ============================================================================
// Linear reading order
// ============================================================================

std::vector<std::string> linear_reading_order(const TrailDag& dag)
{
    std::vector<std::string> order;
    if (!dag.has_node(dag.start_node_id))
    {
        return order;
    }

    const auto successors = successor_lists(dag);
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack{dag.start_node_id};

    while (!stack.empty())
    {
        std::string node_id = std::move(stack.back());
        stack.pop_back();
        if (!visited.insert(node_id).second)
        {
            continue;
        }
        order.push_back(node_id);

        auto it = successors.find(node_id);
        if (it == successors.end())
        {
            continue;
        }
        // Reverse push so that the first edge is explored first.
        for (auto succ = it->second.rbegin(); succ != it->second.rend(); ++succ)
        {
            if (visited.count(*succ) == 0)
            {
                stack.push_back(*succ);
            }
        }
    }
    return order;
}

// ============================================================================
// Flattening
// ============================================================================

std::vector<StepRecord> flatten_to_steps(const TrailDag& dag)
{
    std::vector<StepRecord> steps;
    if (!dag.has_node(dag.start_node_id))
    {
        return steps;
    }

    const auto successors = successor_lists(dag);
    const std::unordered_set<std::string> convergence(dag.convergence_points.begin(),
                                                      dag.convergence_points.end());

    std::unordered_set<std::string> visited{dag.start_node_id};
    std::queue<std::string> ready;
    ready.push(dag.start_node_id);

    while (!ready.empty())
    {
        std::string node_id = std::move(ready.front());
        ready.pop();

        const ContentNode& node = dag.nodes.at(node_id);
        steps.push_back(make_step(node,
                                  static_cast<int64_t>(steps.size()) + 1,
                                  convergence.count(node_id) != 0));

        auto it = successors.find(node_id);
        if (it == successors.end())
        {
            continue;
        }
        for (const auto& succ : it->second)
        {
            if (visited.insert(succ).second)
            {
                ready.push(succ);
            }
        }
    }
    return steps;
}

// ============================================================================
// Step sequence helpers
// ============================================================================

size_t count_total_words(const std::vector<StepRecord>& steps)
{
    size_t total = 0;
    for (const auto& step : steps)
    {
        if (!step.content_reference || !step.content_reference->content ||
            !step.content_reference->content->text)
        {
            continue;
        }
        std::istringstream words(*step.content_reference->content->text);
        std::string word;
        while (words >> word)
        {
            ++total;
        }
    }
    return total;
}

const StepRecord* find_step_by_node_id(const std::vector<StepRecord>& steps,
                                       const std::string& node_id)
{
    for (const auto& step : steps)
    {
        if (step.content_reference && step.content_reference->temp_node_id == node_id)
        {
            return &step;
        }
    }
    return nullptr;
}

} // namespace trailgraph

/**
 * @file dag_validator.cpp
 */
#include "trailgraph/validation/dag_validator.hpp"

#include <algorithm>

namespace trailgraph
{

const char* to_string(ValidationWarningKind kind) noexcept
{
    switch (kind)
    {
    case ValidationWarningKind::StartNodeMissing:
        return "start_node_missing";
    case ValidationWarningKind::OrphanNodes:
        return "orphan_nodes";
    case ValidationWarningKind::DanglingEdges:
        return "dangling_edges";
    case ValidationWarningKind::DeadEnds:
        return "dead_ends";
    }
    return "unknown";
}

DagValidator::DagValidator(ValidatorOptions options)
    : m_options(options)
{
}

ValidationReport DagValidator::validate(const TrailDag& dag) const
{
    ValidationReport report;
    report.stats.node_count = dag.nodes.size();
    report.stats.edge_count = dag.edges.size();
    report.stats.convergence_point_count = dag.convergence_points.size();

    // =========================================================================
    // Start node
    // =========================================================================

    if (!dag.has_node(dag.start_node_id))
    {
        ValidationWarning w;
        w.kind = ValidationWarningKind::StartNodeMissing;
        w.count = 1;
        w.message = "Start node \"" + dag.start_node_id + "\" not found in DAG nodes";
        w.involved_nodes.push_back(dag.start_node_id);
        report.warnings.push_back(std::move(w));
    }

    // =========================================================================
    // Orphans and dead ends
    // =========================================================================

    std::unordered_set<std::string> has_incoming;
    std::unordered_set<std::string> has_outgoing;
    for (const auto& edge : dag.edges)
    {
        has_incoming.insert(edge.to_node_id);
        has_outgoing.insert(edge.from_node_id);
    }

    std::vector<std::string> orphans;
    std::vector<std::string> dead_ends;
    for (const auto& [node_id, node] : dag.nodes)
    {
        if (node_id != dag.start_node_id && has_incoming.count(node_id) == 0)
        {
            orphans.push_back(node_id);
        }
        if (has_outgoing.count(node_id) == 0)
        {
            dead_ends.push_back(node_id);
        }
    }
    report.stats.orphan_node_count = orphans.size();
    report.stats.dead_end_node_count = dead_ends.size();

    if (!orphans.empty())
    {
        ValidationWarning w;
        w.kind = ValidationWarningKind::OrphanNodes;
        w.count = orphans.size();
        w.message = "Found " + std::to_string(orphans.size()) + " orphan nodes with no incoming edges";
        w.involved_nodes = std::move(orphans);
        report.warnings.push_back(std::move(w));
    }

    // =========================================================================
    // Dangling edges
    // =========================================================================

    std::vector<size_t> dangling;
    for (size_t edge_idx = 0; edge_idx < dag.edges.size(); ++edge_idx)
    {
        const Edge& edge = dag.edges[edge_idx];
        if (!dag.has_node(edge.from_node_id) || !dag.has_node(edge.to_node_id))
        {
            dangling.push_back(edge_idx);
        }
    }
    report.stats.dangling_edge_count = dangling.size();

    if (!dangling.empty())
    {
        ValidationWarning w;
        w.kind = ValidationWarningKind::DanglingEdges;
        w.count = dangling.size();
        w.message = "Found " + std::to_string(dangling.size()) + " edges with invalid node references";
        w.involved_edges = std::move(dangling);
        report.warnings.push_back(std::move(w));
    }

    if (m_options.report_dead_ends && !dead_ends.empty())
    {
        ValidationWarning w;
        w.kind = ValidationWarningKind::DeadEnds;
        w.count = dead_ends.size();
        w.message = "Found " + std::to_string(dead_ends.size()) + " dead-end nodes with no outgoing edges";
        w.involved_nodes = std::move(dead_ends);
        report.warnings.push_back(std::move(w));
    }

    report.valid = std::none_of(report.warnings.begin(), report.warnings.end(),
                                [](const ValidationWarning& w) { return is_blocking(w.kind); });
    return report;
}

ValidationReport validate_dag(const TrailDag& dag)
{
    return DagValidator{}.validate(dag);
}

} // namespace trailgraph

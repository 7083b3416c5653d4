/**
 * @file validation_report.hpp
 */
#pragma once
#include "trailgraph/common/common.hpp"

namespace trailgraph
{

/**
 * @brief Kind of a structural finding reported by DagValidator.
 *
 * @details
 * `DeadEnds` is the only non-blocking kind: dead ends are legitimate story
 * endings. Every other kind makes the report invalid.
 */
enum class ValidationWarningKind
{
    StartNodeMissing,  ///< The start node id is not a node of the DAG.
    OrphanNodes,       ///< Non-start nodes with no incoming edge.
    DanglingEdges,     ///< Edges whose endpoints are not nodes of the DAG.
    DeadEnds           ///< Nodes with no outgoing edge.
};

/**
 * @brief Get a stable snake_case name for a warning kind.
 */
const char* to_string(ValidationWarningKind kind) noexcept;

/**
 * @brief Check whether a warning kind blocks validity.
 */
inline bool is_blocking(ValidationWarningKind kind) noexcept
{
    return kind != ValidationWarningKind::DeadEnds;
}

/**
 * @brief One aggregate finding of a validation pass.
 */
struct ValidationWarning
{
    ValidationWarningKind kind;

    /// Number of offending nodes or edges (1 for StartNodeMissing).
    size_t count{0};

    std::string message;

    /// Node ids involved (orphans, dead ends, or the missing start node).
    std::vector<std::string> involved_nodes;

    /// Indices into `TrailDag::edges` of dangling edges.
    std::vector<size_t> involved_edges;
};

/**
 * @brief Counts gathered by a validation pass.
 */
struct ValidationStats
{
    size_t node_count{0};
    size_t edge_count{0};
    size_t convergence_point_count{0};
    size_t orphan_node_count{0};
    size_t dead_end_node_count{0};
    size_t dangling_edge_count{0};
};

/**
 * @brief Result of validating a reconstructed DAG.
 *
 * @details
 * `valid` is true if and only if no warning has a blocking kind.
 */
struct ValidationReport
{
    bool valid{true};
    std::vector<ValidationWarning> warnings;
    ValidationStats stats;

    /**
     * @brief Find the first warning of a given kind.
     * @return Pointer into `warnings`, or nullptr if absent.
     */
    const ValidationWarning* find(ValidationWarningKind kind) const noexcept
    {
        for (const auto& w : warnings)
        {
            if (w.kind == kind)
            {
                return &w;
            }
        }
        return nullptr;
    }
};

} // namespace trailgraph

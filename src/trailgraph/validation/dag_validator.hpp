/**
 * @file dag_validator.hpp
 * @brief Post-hoc structural checks on a reconstructed TrailDag.
 */
#pragma once
#include "trailgraph/common/common.hpp"
#include "trailgraph/common/trail_types.hpp"
#include "trailgraph/validation/validation_report.hpp"

namespace trailgraph
{

/**
 * @brief Options for DagValidator.
 */
struct ValidatorOptions
{
    /// Emit a (non-blocking) DeadEnds warning when dead ends exist.
    /// Dead ends are always counted in the stats.
    bool report_dead_ends{false};
};

/**
 * @brief Read-only analysis of a reconstructed DAG.
 *
 * @details
 * Checks the start node, orphan nodes, dead-end nodes and dangling edges.
 * Findings are aggregated: at most one warning per kind. The validator never
 * throws for data problems and never mutates the DAG.
 *
 * @par Validity
 * A report is valid when every warning is of kind `DeadEnds`. A missing start
 * node, orphans, or dangling edges each make it invalid.
 *
 * @par Thread safety
 * - Stateless apart from its options; `validate()` is safe to call
 *   concurrently.
 */
class DagValidator
{
public:
    explicit DagValidator(ValidatorOptions options = {});

    /**
     * @brief Validate a DAG.
     * @param dag The DAG to analyze.
     * @return The report with warnings and statistics.
     */
    ValidationReport validate(const TrailDag& dag) const;

private:
    ValidatorOptions m_options;
};

/**
 * @brief Validate a DAG with default options.
 */
ValidationReport validate_dag(const TrailDag& dag);

} // namespace trailgraph

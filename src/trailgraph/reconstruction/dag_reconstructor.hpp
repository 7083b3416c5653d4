/**
 * @file dag_reconstructor.hpp
 * @brief Rebuilds a TrailDag from a flat sequence of step records.
 */
#pragma once
#include "trailgraph/common/common.hpp"
#include "trailgraph/common/log_sink.hpp"
#include "trailgraph/common/trail_diagnostics.hpp"
#include "trailgraph/common/trail_exceptions.hpp"
#include "trailgraph/common/trail_types.hpp"

namespace trailgraph
{

/**
 * @brief What to do when a step repeats a node id seen in an earlier step.
 *
 * @details
 * Either way a `DuplicateNodeId` diagnostic is recorded.
 * - `LastWriteWins`: the later node replaces the earlier one; edges and
 *   convergence flags from both steps are kept.
 * - `FirstWriteWins`: the later step is skipped entirely.
 */
enum class DuplicateNodePolicy
{
    LastWriteWins,
    FirstWriteWins
};

/**
 * @brief Options for DagReconstructor.
 */
struct ReconstructorOptions
{
    DuplicateNodePolicy duplicate_policy{DuplicateNodePolicy::LastWriteWins};

    /// Receives every diagnostic at warning level. May be null.
    std::shared_ptr<LogSink> log_sink{};
};

/**
 * @brief Output of one reconstruction: the DAG and the anomalies found.
 */
struct ReconstructionResult
{
    std::shared_ptr<const TrailDag> dag;
    std::shared_ptr<const ReconstructionDiagnostics> diagnostics;
};

/**
 * @brief Converts ordered step records into a TrailDag.
 *
 * @details
 * Reconstruction is a single linear pass over the steps and their choices.
 * It is lenient: malformed records and choices are skipped and recorded as
 * diagnostics, and a start node id that names no reconstructed node is
 * also only a diagnostic. The only failures are the two caller-contract
 * violations, which throw `ConfigurationError`.
 *
 * @par Ordering
 * - Edges follow step order, then choice order within a step.
 * - Convergence points are deduplicated and keep first-seen order.
 *
 * @par Thread safety
 * - `reconstruct()` is const and keeps no state between calls; one instance
 *   may be used from several threads provided the log sink is thread-safe.
 */
class DagReconstructor
{
public:
    explicit DagReconstructor(ReconstructorOptions options = {});

    /**
     * @brief Rebuild the DAG.
     * @param steps The flat step sequence, in generation order.
     * @param start_node_id The id of the node where reading begins.
     * @return The DAG and the diagnostics collected while building it.
     * @throw ConfigurationError with `EmptyInput` if `steps` is empty, or
     *        `MissingStartNode` if `start_node_id` is empty or blank.
     */
    ReconstructionResult reconstruct(const std::vector<StepRecord>& steps,
                                     const std::string& start_node_id) const;

    const ReconstructorOptions& options() const noexcept
    {
        return m_options;
    }

private:
    ReconstructorOptions m_options;

    /// Record a diagnostic and forward it to the log sink.
    void report(ReconstructionDiagnostics& diagnostics, DiagnosticItem item) const;
};

/**
 * @brief Rebuild the DAG with default options.
 * @throw ConfigurationError as for `DagReconstructor::reconstruct()`.
 */
std::shared_ptr<const TrailDag> reconstruct_dag(const std::vector<StepRecord>& steps,
                                                const std::string& start_node_id);

} // namespace trailgraph

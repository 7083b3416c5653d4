/**
 * @file trail_diagnostics.hpp
 */
#pragma once
#include "trailgraph/common/common.hpp"

namespace trailgraph
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of a data-quality anomaly found during reconstruction.
 */
enum class DiagnosticCategory
{
    MissingContentReference,  ///< Step has no content reference; skipped.
    InvalidContentReference,  ///< Node id or content missing; step skipped.
    DuplicateNodeId,          ///< Node id seen in an earlier step.
    ChoiceMissingId,          ///< Choice has no id; no edge produced.
    ChoiceMissingNextNode,    ///< Choice has no next node id; no edge produced.
    StartNodeNotFound         ///< Start node id is not among the nodes.
};

/**
 * @brief Get a stable snake_case name for a diagnostic category.
 */
const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief A single reconstruction anomaly.
 *
 * @details
 * `step_index` is the 0-based position of the offending record in the input
 * sequence, and is absent for whole-graph findings such as
 * `StartNodeNotFound`.
 */
struct DiagnosticItem
{
    DiagnosticCategory category;
    std::string message;
    std::optional<size_t> step_index;
    std::optional<std::string> node_id;
    std::optional<std::string> choice_id;
};

// ============================================================================
// ReconstructionDiagnostics
// ============================================================================

/**
 * @brief All anomalies collected during one reconstruction.
 *
 * @details
 * Produced by `DagReconstructor::reconstruct()` alongside the DAG. None of
 * these anomalies abort reconstruction; they are reported so that callers can
 * inspect or surface them instead of relying on the log side channel.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class ReconstructionDiagnostics
{
public:
    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Count the warnings of one category.
     */
    size_t count(DiagnosticCategory category) const noexcept
    {
        size_t n = 0;
        for (const auto& item : m_warnings)
        {
            if (item.category == category)
            {
                ++n;
            }
        }
        return n;
    }

    // Allow DagReconstructor to populate diagnostics
    friend class DagReconstructor;

private:
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace trailgraph

/**
 * @file trail_diagnostics.cpp
 */
#include "trailgraph/common/trail_diagnostics.hpp"

namespace trailgraph
{

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::MissingContentReference:
        return "missing_content_reference";
    case DiagnosticCategory::InvalidContentReference:
        return "invalid_content_reference";
    case DiagnosticCategory::DuplicateNodeId:
        return "duplicate_node_id";
    case DiagnosticCategory::ChoiceMissingId:
        return "choice_missing_id";
    case DiagnosticCategory::ChoiceMissingNextNode:
        return "choice_missing_next_node";
    case DiagnosticCategory::StartNodeNotFound:
        return "start_node_not_found";
    }
    return "unknown";
}

} // namespace trailgraph

/**
 * @file trail_json.hpp
 * @brief JSON reading of trail step documents and writing of results.
 */
#pragma once
#include "trailgraph/common/common.hpp"
#include "trailgraph/common/trail_diagnostics.hpp"
#include "trailgraph/common/trail_exceptions.hpp"
#include "trailgraph/common/trail_types.hpp"
#include "trailgraph/validation/validation_report.hpp"

#include <nlohmann/json.hpp>

namespace trailgraph
{

/**
 * @brief A parsed trail document: its steps and, if given, its start node id.
 */
struct TrailDocument
{
    std::vector<StepRecord> steps;
    std::optional<std::string> start_node_id;
};

/**
 * @brief Parse a JSON array of step records.
 *
 * @details
 * Parsing is lenient below the array level: a field that is missing or has
 * the wrong JSON type is left absent, so that the reconstructor can report
 * it. A step that is not an object becomes a step with no content reference.
 *
 * @throw TrailFormatError if `json` is not an array.
 */
std::vector<StepRecord> parse_trail_steps(const nlohmann::json& json);

/**
 * @brief Parse a trail document from JSON text.
 *
 * @details
 * Accepts either a bare step array, or an object with a `trail_steps` array.
 * For objects the start node id is taken from the first of `start_node_id`,
 * `trail.metadata.start_node_id` and
 * `trail.metadata.generation_params.start_node_id` that is a string.
 *
 * @throw TrailFormatError for invalid JSON or a missing `trail_steps` array.
 */
TrailDocument parse_trail_document(const std::string& payload);

/// Serialize a DAG (nodes keyed by id, edges, start node, convergence points).
nlohmann::json dag_to_json(const TrailDag& dag);

/// Serialize reconstruction diagnostics as an array of objects.
nlohmann::json diagnostics_to_json(const ReconstructionDiagnostics& diagnostics);

/// Serialize a validation report.
nlohmann::json report_to_json(const ValidationReport& report);

/// Serialize step records in the same shape `parse_trail_steps()` reads.
nlohmann::json steps_to_json(const std::vector<StepRecord>& steps);

} // namespace trailgraph

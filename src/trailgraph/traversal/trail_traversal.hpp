/**
 * @file trail_traversal.hpp
 * @brief Walks over a reconstructed DAG and helpers over step sequences.
 */
#pragma once
#include "trailgraph/common/common.hpp"
#include "trailgraph/common/trail_types.hpp"

namespace trailgraph
{

/**
 * @brief Page order for linear reading.
 *
 * @details
 * Depth-first preorder starting at the start node. Outgoing edges of a node
 * are followed in edge-list order; every node appears at most once, and edge
 * targets that are not nodes of the DAG are skipped.
 *
 * @return Node ids in reading order, or an empty vector if the start node is
 *         not a node of the DAG.
 */
std::vector<std::string> linear_reading_order(const TrailDag& dag);

/**
 * @brief Flatten a DAG back into persisted step records.
 *
 * @details
 * Breadth-first from the start node, following edges in edge-list order.
 * `step_order` is 1-indexed in visit order. Nodes unreachable from the start
 * node are not emitted. Reconstructing the result with the same start node
 * reproduces the reachable part of the DAG.
 */
std::vector<StepRecord> flatten_to_steps(const TrailDag& dag);

/**
 * @brief Count whitespace-separated words over all step texts.
 */
size_t count_total_words(const std::vector<StepRecord>& steps);

/**
 * @brief Find the first step whose content reference names `node_id`.
 * @return Pointer into `steps`, or nullptr if no step matches.
 */
const StepRecord* find_step_by_node_id(const std::vector<StepRecord>& steps,
                                       const std::string& node_id);

} // namespace trailgraph

/**
 * @file trail_types.hpp
 * @brief Input step records and the reconstructed DAG value types.
 */
#pragma once
#include "trailgraph/common/common.hpp"

namespace trailgraph
{

// ============================================================================
// Input records
// ============================================================================

/**
 * @brief A reader choice inside a node's content.
 *
 * @details
 * All fields are optional because the records are produced by a
 * non-deterministic upstream generator. A choice is linkable (produces an
 * edge) only if both `id` and `next_node_id` are present and non-empty.
 */
struct Choice
{
    std::optional<std::string> id;
    std::optional<std::string> text;
    std::optional<std::string> next_node_id;

    /**
     * @brief Check whether this choice can produce an edge.
     */
    bool is_linkable() const noexcept
    {
        return id.has_value() && !id->empty() &&
               next_node_id.has_value() && !next_node_id->empty();
    }
};

/**
 * @brief Educational payload attached to generated content.
 */
struct EducationalContent
{
    std::optional<std::string> topic;
    std::vector<std::string> vocabulary_words;
    std::vector<std::string> educational_facts;
    std::optional<std::string> learning_objective;
};

/**
 * @brief The content body of one step.
 */
struct StepContent
{
    std::optional<std::string> text;
    std::optional<std::vector<Choice>> choices;
    std::optional<EducationalContent> educational_content;
    std::optional<bool> convergence_point;
};

/**
 * @brief Identifies the node a step describes, and carries its content.
 */
struct ContentReference
{
    std::optional<std::string> temp_node_id;
    std::optional<StepContent> content;
};

/**
 * @brief Optional per-step metadata bag.
 */
struct StepMetadata
{
    std::optional<std::string> node_id;
    std::optional<bool> convergence_point;
    std::optional<int64_t> incoming_edges;
    std::optional<int64_t> outgoing_edges;
    std::optional<std::string> timestamp;
    std::optional<std::string> llm_model;
};

/**
 * @brief One persisted, order-tagged unit of generated content.
 *
 * @note `step_order` is informational; reconstruction never uses it to
 * determine graph shape.
 */
struct StepRecord
{
    int64_t step_order{0};
    std::optional<ContentReference> content_reference;
    std::optional<StepMetadata> metadata;
};

// ============================================================================
// Reconstructed graph
// ============================================================================

/**
 * @brief Text and choices of a reconstructed node.
 *
 * @details `choices` holds every choice of the source step, including ones
 * that did not produce an edge.
 */
struct NodeContent
{
    std::string text;
    std::vector<Choice> choices;
};

/**
 * @brief Educational content merged with the generation timestamp and model.
 */
struct GenerationMetadata
{
    EducationalContent educational;
    std::optional<std::string> timestamp;
    std::optional<std::string> llm_model;
};

/**
 * @brief A node of the reconstructed DAG.
 *
 * @details
 * `incoming_edges` and `outgoing_edges` are carried through from the step
 * metadata and are not recomputed from the edge list.
 */
struct ContentNode
{
    std::string id;
    NodeContent content;
    int64_t incoming_edges{0};
    int64_t outgoing_edges{0};
    std::optional<GenerationMetadata> generation_metadata;
};

/**
 * @brief A directed edge produced by one linkable choice.
 */
struct Edge
{
    std::string from_node_id;
    std::string to_node_id;
    std::string choice_id;

    bool operator==(const Edge& other) const
    {
        return from_node_id == other.from_node_id &&
               to_node_id == other.to_node_id &&
               choice_id == other.choice_id;
    }

    bool operator!=(const Edge& other) const
    {
        return !(*this == other);
    }
};

/**
 * @brief The reconstructed trail graph.
 *
 * @details
 * `TrailDag` is produced by `DagReconstructor::reconstruct()` and handed out
 * as a pointer to const; downstream readers and visualizers treat it as
 * read-only.
 *
 * @par Data model
 * - **nodes**: keyed by node id. Ordered, so that iteration and serialized
 *   output are deterministic.
 * - **edges**: in step processing order, then choice order within a step.
 * - **start_node_id**: supplied by the caller. May name a node absent from
 *   `nodes`; this is reported by the validator, not at construction.
 * - **convergence_points**: node ids where branches rejoin. No duplicates,
 *   first-seen order.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable; concurrent reads are safe.
 */
struct TrailDag
{
    std::map<std::string, ContentNode> nodes;
    std::vector<Edge> edges;
    std::string start_node_id;
    std::vector<std::string> convergence_points;

    /**
     * @brief Check whether a node id is present in `nodes`.
     */
    bool has_node(const std::string& node_id) const
    {
        return nodes.find(node_id) != nodes.end();
    }
};

} // namespace trailgraph

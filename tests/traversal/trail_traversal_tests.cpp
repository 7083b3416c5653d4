/**
 * @file trail_traversal_tests.cpp
 * @brief Unit tests for linear reading order, flattening and step helpers.
 */
#include <gtest/gtest.h>
#include "trailgraph/reconstruction/dag_reconstructor.hpp"
#include "trailgraph/traversal/trail_traversal.hpp"
#include "trail_test_helpers.hpp"
#include <algorithm>

using namespace trailgraph;
using namespace trailgraph::test_support;

// ============================================================================
// Linear reading order
// ============================================================================

TEST(TrailTraversalTests, ReadingOrder_LinearStory)
{
    auto dag = reconstruct_dag(linear_story(), "node1");
    EXPECT_EQ(linear_reading_order(*dag), (std::vector<std::string>{"node1", "node2", "node3"}));
}

TEST(TrailTraversalTests, ReadingOrder_DepthFirstInEdgeOrder)
{
    auto dag = reconstruct_dag(diamond_story(), "start");

    // left branch is explored to the end before right; merge appears once.
    EXPECT_EQ(linear_reading_order(*dag),
              (std::vector<std::string>{"start", "left", "merge", "end", "right"}));
}

TEST(TrailTraversalTests, ReadingOrder_SkipsMissingTargetsAndUnreachable)
{
    std::vector<StepRecord> steps{
        make_step("A", "a", {make_choice("c1", "ghost"), make_choice("c2", "B")}),
        make_step("B", "b", {}),
        make_step("island", "not reachable", {}),
    };
    auto dag = reconstruct_dag(steps, "A");

    EXPECT_EQ(linear_reading_order(*dag), (std::vector<std::string>{"A", "B"}));
}

TEST(TrailTraversalTests, ReadingOrder_EmptyWhenStartMissing)
{
    auto dag = reconstruct_dag(linear_story(), "nope");
    EXPECT_TRUE(linear_reading_order(*dag).empty());
}

TEST(TrailTraversalTests, ReadingOrder_TerminatesOnCycle)
{
    std::vector<StepRecord> steps{
        make_step("A", "a", {make_choice("c1", "B")}),
        make_step("B", "b", {make_choice("c2", "A")}),
    };
    auto dag = reconstruct_dag(steps, "A");

    EXPECT_EQ(linear_reading_order(*dag), (std::vector<std::string>{"A", "B"}));
}

// ============================================================================
// Flattening
// ============================================================================

TEST(TrailTraversalTests, Flatten_BreadthFirstOneIndexed)
{
    auto dag = reconstruct_dag(diamond_story(), "start");
    auto steps = flatten_to_steps(*dag);

    ASSERT_EQ(steps.size(), 5u);
    std::vector<std::string> ids;
    for (size_t i = 0; i < steps.size(); ++i)
    {
        EXPECT_EQ(steps[i].step_order, static_cast<int64_t>(i + 1));
        ASSERT_TRUE(steps[i].content_reference.has_value());
        ids.push_back(steps[i].content_reference->temp_node_id.value());
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"start", "left", "right", "merge", "end"}));
}

TEST(TrailTraversalTests, Flatten_CarriesConvergenceAndMetadata)
{
    auto source = diamond_story();
    source[3].metadata->incoming_edges = 2;
    source[3].metadata->outgoing_edges = 1;
    auto dag = reconstruct_dag(source, "start");

    auto steps = flatten_to_steps(*dag);
    const StepRecord* merge = find_step_by_node_id(steps, "merge");

    ASSERT_NE(merge, nullptr);
    ASSERT_TRUE(merge->metadata.has_value());
    EXPECT_EQ(merge->metadata->node_id, "merge");
    EXPECT_EQ(merge->metadata->convergence_point, true);
    EXPECT_EQ(merge->metadata->incoming_edges, 2);
    EXPECT_EQ(merge->content_reference->content->convergence_point, true);

    const StepRecord* left = find_step_by_node_id(steps, "left");
    ASSERT_NE(left, nullptr);
    EXPECT_EQ(left->metadata->convergence_point, false);
}

TEST(TrailTraversalTests, Flatten_ThenReconstruct_ReproducesReachableGraph)
{
    auto source = diamond_story();
    EducationalContent edu;
    edu.topic = "Forests";
    source[0].content_reference->content->educational_content = edu;
    source[0].metadata->llm_model = "test-model";
    source.push_back(make_step("island", "unreachable", {}));

    auto original = reconstruct_dag(source, "start");
    auto rebuilt = reconstruct_dag(flatten_to_steps(*original), "start");

    EXPECT_EQ(rebuilt->nodes.size(), original->nodes.size() - 1);
    EXPECT_FALSE(rebuilt->has_node("island"));
    EXPECT_EQ(rebuilt->convergence_points, original->convergence_points);
    EXPECT_EQ(rebuilt->edges.size(), original->edges.size());
    for (const auto& edge : original->edges)
    {
        EXPECT_NE(std::find(rebuilt->edges.begin(), rebuilt->edges.end(), edge), rebuilt->edges.end());
    }

    const auto& gen = rebuilt->nodes.at("start").generation_metadata;
    ASSERT_TRUE(gen.has_value());
    EXPECT_EQ(gen->educational.topic, "Forests");
    EXPECT_EQ(gen->llm_model, "test-model");
}

TEST(TrailTraversalTests, Flatten_EmptyWhenStartMissing)
{
    auto dag = reconstruct_dag(linear_story(), "nope");
    EXPECT_TRUE(flatten_to_steps(*dag).empty());
}

// ============================================================================
// Step helpers
// ============================================================================

TEST(TrailTraversalTests, CountTotalWords)
{
    std::vector<StepRecord> steps{
        make_step("A", "One two  three", {}),
        make_step("B", "  four\tfive\n", {}),
        make_step_without_reference(),
        make_step("C", "", {}),
    };
    EXPECT_EQ(count_total_words(steps), 5u);
}

TEST(TrailTraversalTests, FindStepByNodeId)
{
    auto steps = linear_story();
    steps.insert(steps.begin(), make_step_without_reference());

    const StepRecord* found = find_step_by_node_id(steps, "node2");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->step_order, 2);

    EXPECT_EQ(find_step_by_node_id(steps, "absent"), nullptr);
}

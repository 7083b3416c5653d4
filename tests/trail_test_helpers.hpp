/**
 * @file trail_test_helpers.hpp
 * @brief Builders for step records used across the test suites.
 */
#pragma once
#include "trailgraph/common/trail_types.hpp"

namespace trailgraph::test_support
{

inline Choice make_choice(const std::string& id, const std::string& next_node_id,
                          const std::string& text = "Continue")
{
    Choice choice;
    choice.id = id;
    choice.text = text;
    choice.next_node_id = next_node_id;
    return choice;
}

/**
 * @brief A well-formed step for `node_id` with the given text and choices.
 */
inline StepRecord make_step(const std::string& node_id,
                            const std::string& text,
                            std::vector<Choice> choices,
                            int64_t step_order = 1)
{
    StepContent content;
    content.text = text;
    content.choices = std::move(choices);

    StepRecord step;
    step.step_order = step_order;
    step.content_reference = ContentReference{node_id, std::move(content)};
    step.metadata = StepMetadata{};
    return step;
}

/**
 * @brief A step with no content reference at all.
 */
inline StepRecord make_step_without_reference(int64_t step_order = 1)
{
    StepRecord step;
    step.step_order = step_order;
    return step;
}

/**
 * @brief Three-node linear story: node1 -> node2 -> node3.
 */
inline std::vector<StepRecord> linear_story()
{
    return {
        make_step("node1", "Beginning of the story", {make_choice("choice1", "node2")}, 1),
        make_step("node2", "Middle of the story", {make_choice("choice2", "node3")}, 2),
        make_step("node3", "End of the story", {}, 3),
    };
}

/**
 * @brief Diamond: start branches to left/right, both rejoin at merge.
 */
inline std::vector<StepRecord> diamond_story()
{
    auto merge = make_step("merge", "The paths meet again", {make_choice("c5", "end")}, 4);
    merge.metadata->convergence_point = true;
    return {
        make_step("start", "You are at a crossroads",
                  {make_choice("c1", "left", "Go left"), make_choice("c2", "right", "Go right")}, 1),
        make_step("left", "You went left", {make_choice("c3", "merge")}, 2),
        make_step("right", "You went right", {make_choice("c4", "merge")}, 3),
        std::move(merge),
        make_step("end", "The end", {}, 5),
    };
}

} // namespace trailgraph::test_support

/*
 * SPDX-FileCopyrightText: Copyright (c) 2025 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file layout_tests.cpp
 * @brief Unit tests for level, row and column assignment and edge routing
 */

#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "display/grid.hpp"
#include "display/layout.hpp"
#include "display/routing.hpp"
#include "graph/priority.hpp"
#include "graph/task_graph.hpp"
#include "task_fixtures.hpp"

namespace {

namespace md = ::mont::display;
namespace mg = ::mont::graph;
using mg::testing::must_form;
using mg::testing::TaskBuilder;

using Ids = std::vector<std::string>;

class DiamondLayoutTest : public ::testing::Test {
protected:
    // a -> {b, c} -> d, plus the redundant a -> d
    mg::TaskGraph graph_ = must_form({
            TaskBuilder("a"),
            TaskBuilder("b").after({"a"}),
            TaskBuilder("c").after({"a"}),
            TaskBuilder("d").after({"b", "c", "a"}),
    });
    mg::EffectivePriorities priorities_{graph_};
    Ids ids_{"a", "b", "c", "d"};
};

TEST_F(DiamondLayoutTest, LevelsRowsAndColumns) {
    const auto layout = md::compute_layout(graph_, ids_, priorities_);

    EXPECT_EQ(layout.order, (Ids{"a", "b", "c", "d"}));
    EXPECT_EQ(layout.levels.at("a"), 0U);
    EXPECT_EQ(layout.levels.at("b"), 1U);
    EXPECT_EQ(layout.levels.at("c"), 1U);
    EXPECT_EQ(layout.levels.at("d"), 2U);

    EXPECT_EQ(layout.columns.at("a"), 0U);
    EXPECT_EQ(layout.columns.at("b"), 0U);
    EXPECT_EQ(layout.columns.at("c"), 1U);
    EXPECT_EQ(layout.columns.at("d"), 0U);
}

TEST_F(DiamondLayoutTest, RedundantEdgeIsNotDrawn) {
    const auto layout = md::compute_layout(graph_, ids_, priorities_);
    EXPECT_EQ(layout.edges.size(), 4U);
    for (const auto &edge : layout.edges) {
        EXPECT_FALSE(edge.from == "a" && edge.to == "d");
    }
}

TEST_F(DiamondLayoutTest, EdgesOutsideTheSubsetAreIgnored) {
    const Ids subset{"b", "d"};
    const auto layout = md::compute_layout(graph_, subset, priorities_);
    EXPECT_EQ(layout.order, subset);
    ASSERT_EQ(layout.edges.size(), 1U);
    EXPECT_EQ(layout.edges.front().from, "b");
    EXPECT_EQ(layout.edges.front().to, "d");
}

TEST_F(DiamondLayoutTest, RoutedGridDetoursAroundTasks) {
    const auto layout = md::compute_layout(graph_, ids_, priorities_);
    const auto routed = md::route_edges(md::build_grid(layout), layout);
    EXPECT_EQ(routed.height(), 7U);
    EXPECT_EQ(md::debug_render(routed), "a.\n├╮\nb│\n││\n│c\n├╯\nd.\n");

    const auto pruned = md::prune_rows(routed);
    EXPECT_EQ(md::debug_render(pruned), "a.\n├╮\nb│\n│c\n├╯\nd.\n");
}

TEST(Layout, InProgressAndUrgentTasksComeFirstWithinALevel) {
    const auto graph = must_form({
            TaskBuilder("a"),
            TaskBuilder("b").priority(2),
            TaskBuilder("c").active(),
    });
    const mg::EffectivePriorities priorities(graph);

    EXPECT_EQ(md::position_tier(graph.at("a"), priorities), md::PositionTier::Ordinary);
    EXPECT_EQ(md::position_tier(graph.at("b"), priorities), md::PositionTier::Urgent);
    EXPECT_EQ(md::position_tier(graph.at("c"), priorities), md::PositionTier::InProgress);

    const auto layout = md::compute_layout(graph, Ids{"a", "b", "c"}, priorities);
    EXPECT_EQ(layout.order, (Ids{"c", "b", "a"}));
    EXPECT_EQ(layout.columns.at("c"), 0U);
    EXPECT_EQ(layout.columns.at("b"), 1U);
    EXPECT_EQ(layout.columns.at("a"), 2U);
}

TEST(Layout, EmptyInputGivesEmptyGrid) {
    const auto graph = must_form({});
    const mg::EffectivePriorities priorities(graph);
    const auto layout = md::compute_layout(graph, Ids{}, priorities);
    EXPECT_TRUE(layout.order.empty());
    EXPECT_TRUE(md::route_edges(md::build_grid(layout), layout).empty());
}

TEST(Routing, LanePrefersTargetThenNearestRight) {
    EXPECT_EQ(md::choose_lane(1, {}), 1U);
    EXPECT_EQ(md::choose_lane(1, {1}), 2U);
    EXPECT_EQ(md::choose_lane(1, {1, 2}), 0U);
    EXPECT_EQ(md::choose_lane(0, {0, 1}), 2U);
}

TEST(Routing, PruneKeepsRowsWithTurnsOrTasks) {
    md::Grid grid(3, 2);
    grid.set(0, 0, md::TaskCell{"a"});
    grid.set_connection_flag(1, 0, md::Direction::Up);
    grid.set_connection_flag(1, 0, md::Direction::Down);
    grid.set_connection_flag(2, 0, md::Direction::Up);
    grid.set_connection_flag(2, 0, md::Direction::Right);
    grid.set_connection_flag(2, 1, md::Direction::Left);

    const auto pruned = md::prune_rows(grid);
    EXPECT_EQ(pruned.height(), 2U);
    EXPECT_EQ(md::debug_render(pruned), "a.\n╰╴\n");
}

} // namespace

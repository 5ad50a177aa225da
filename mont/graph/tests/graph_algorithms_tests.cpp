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
 * @file graph_algorithms_tests.cpp
 * @brief Unit tests for ordering, reduction, levels and components
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include "graph/graph_algorithms.hpp"

namespace {

namespace mg = ::mont::graph;

using Ids = std::vector<std::string>;
using Edges = std::vector<mg::Edge>;

TEST(TopologicalOrder, DependenciesComeFirstAndTiesBreakById) {
    const Ids nodes{"d", "c", "b", "a"};
    const Edges edges{{"c", "a"}, {"d", "b"}};

    // c and d are sources; smallest available id wins at every step
    EXPECT_EQ(mg::topological_order(nodes, edges), (Ids{"c", "a", "d", "b"}));
}

TEST(TopologicalOrder, IgnoresEdgesOutsideNodeSetAndDuplicates) {
    const Ids nodes{"a", "b"};
    const Edges edges{{"a", "b"}, {"a", "b"}, {"x", "a"}, {"b", "y"}};
    EXPECT_EQ(mg::topological_order(nodes, edges), (Ids{"a", "b"}));
}

TEST(TopologicalOrder, CycleThrows) {
    const Ids nodes{"a", "b", "c"};
    const Edges edges{{"a", "b"}, {"b", "a"}};
    EXPECT_THROW(std::ignore = mg::topological_order(nodes, edges), std::runtime_error);
}

TEST(TransitiveReduction, DropsShortcutEdges) {
    const Ids nodes{"a", "b", "c", "d"};
    const Edges edges{{"a", "b"}, {"b", "c"}, {"a", "c"}, {"c", "d"}, {"a", "d"}};
    EXPECT_EQ(mg::transitive_reduction(nodes, edges), (Edges{{"a", "b"}, {"b", "c"}, {"c", "d"}}));
}

TEST(TransitiveReduction, KeepsParallelBranches) {
    const Ids nodes{"a", "b", "c", "d"};
    const Edges edges{{"a", "b"}, {"a", "c"}, {"b", "d"}, {"c", "d"}};
    EXPECT_EQ(mg::transitive_reduction(nodes, edges), edges);
}

TEST(LongestPathLevels, UsesDeepestPredecessor) {
    const Ids nodes{"a", "b", "c", "d", "e"};
    const Edges edges{{"a", "b"}, {"b", "c"}, {"a", "c"}, {"d", "c"}};
    const auto levels = mg::longest_path_levels(nodes, edges);

    EXPECT_EQ(levels.at("a"), 0U);
    EXPECT_EQ(levels.at("b"), 1U);
    EXPECT_EQ(levels.at("c"), 2U);
    EXPECT_EQ(levels.at("d"), 0U);
    EXPECT_EQ(levels.at("e"), 0U);
}

TEST(ConnectedComponents, GroupsIgnoringDirection) {
    const Ids nodes{"z", "b", "a", "y", "c"};
    const Edges edges{{"c", "a"}, {"y", "z"}};
    const auto components = mg::connected_components(nodes, edges);

    ASSERT_EQ(components.size(), 3U);
    EXPECT_EQ(components[0], (Ids{"a", "c"}));
    EXPECT_EQ(components[1], (Ids{"b"}));
    EXPECT_EQ(components[2], (Ids{"y", "z"}));
}

TEST(ConnectedComponents, EmptyInput) {
    EXPECT_TRUE(mg::connected_components(Ids{}, Edges{}).empty());
    EXPECT_TRUE(mg::topological_order(Ids{}, Edges{}).empty());
}

} // namespace

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
 * @file task_graph_tests.cpp
 * @brief Unit tests for graph validation and construction
 */

#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "task_fixtures.hpp"

namespace {

namespace mg = ::mont::graph;
using mg::testing::TaskBuilder;

using Ids = std::vector<std::string>;

std::error_code rejection(std::vector<mg::Task> tasks) {
    const auto graph = mg::form_graph(std::move(tasks));
    if (graph) {
        return {};
    }
    return graph.error().code;
}

TEST(FormGraph, EmptyGraphIsValid) {
    const auto graph = mg::form_graph({});
    ASSERT_TRUE(graph.has_value());
    EXPECT_TRUE(graph->empty());
    EXPECT_TRUE(graph->topological_order().empty());
}

TEST(FormGraph, BeforeAndAfterNormaliseToOneEdgeSet) {
    const auto graph = mg::testing::must_form({
            TaskBuilder("design").before({"build"}),
            TaskBuilder("build").after({"design"}),
            TaskBuilder("ship").after({"build"}),
            TaskBuilder("docs").before({"ship"}),
    });

    EXPECT_EQ(graph.edges().size(), 3U);
    EXPECT_EQ(Ids(graph.dependencies_of("ship").begin(), graph.dependencies_of("ship").end()),
              (Ids{"build", "docs"}));
    EXPECT_EQ(Ids(graph.dependents_of("design").begin(), graph.dependents_of("design").end()),
              (Ids{"build"}));
    EXPECT_EQ(graph.topological_order(), (Ids{"design", "build", "docs", "ship"}));
    EXPECT_TRUE(graph.dependencies_of("missing").empty());
}

TEST(FormGraph, LookupAndRecords) {
    const auto graph = mg::testing::must_form({TaskBuilder("b").title("Bee"), TaskBuilder("a")});

    ASSERT_NE(graph.find("b"), nullptr);
    EXPECT_EQ(graph.find("b")->title, "Bee");
    EXPECT_EQ(graph.find("c"), nullptr);
    EXPECT_TRUE(graph.contains("a"));
    EXPECT_THROW(std::ignore = graph.at("c"), std::out_of_range);

    Ids ids;
    for (const auto &[id, task] : graph.tasks()) {
        ids.push_back(id);
    }
    EXPECT_EQ(ids, (Ids{"a", "b"}));
}

TEST(FormGraph, DuplicateIdsRejected) {
    const auto graph = mg::form_graph({TaskBuilder("x"), TaskBuilder("y"), TaskBuilder("x")});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, mg::GraphErrc::DuplicateTaskId);
    EXPECT_EQ(graph.error().task_id, "x");
}

TEST(FormGraph, UnresolvedBeforeIsInvalidParent) {
    const auto graph = mg::form_graph({TaskBuilder("a").before({"ghost"})});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, mg::GraphErrc::InvalidParent);
    EXPECT_EQ(graph.error().task_id, "a");
    EXPECT_EQ(graph.error().related_id, "ghost");
}

TEST(FormGraph, UnresolvedAfterIsInvalidPrecondition) {
    EXPECT_EQ(rejection({TaskBuilder("a").after({"ghost"})}), mg::GraphErrc::InvalidPrecondition);
}

TEST(FormGraph, ValidatorWithDependenciesRejected) {
    EXPECT_EQ(
            rejection({TaskBuilder("a"), TaskBuilder("lint").validator().after({"a"})}),
            mg::GraphErrc::ValidatorHasDependencies);
}

TEST(FormGraph, ValidatorInAfterRejected) {
    const auto graph = mg::form_graph({TaskBuilder("lint").validator(), TaskBuilder("a").after({"lint"})});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, mg::GraphErrc::AfterIsValidator);
    EXPECT_EQ(graph.error().task_id, "a");
    EXPECT_EQ(graph.error().related_id, "lint");
}

TEST(FormGraph, ValidatorMayContainTasks) {
    EXPECT_FALSE(rejection({TaskBuilder("checks").validator().before({"release"}), TaskBuilder("release")}));
}

TEST(FormGraph, JotWithGatesOrCompletionRejected) {
    EXPECT_EQ(rejection({TaskBuilder("idea").jot().gate("review")}), mg::GraphErrc::InvalidJot);
    EXPECT_EQ(rejection({TaskBuilder("idea").jot().complete()}), mg::GraphErrc::InvalidJot);
}

TEST(FormGraph, ValidationsMustNameRootValidators) {
    EXPECT_EQ(
            rejection({TaskBuilder("a").validations({"ghost"})}), mg::GraphErrc::InvalidValidation);
    EXPECT_EQ(
            rejection({TaskBuilder("a").validations({"b"}), TaskBuilder("b")}),
            mg::GraphErrc::InvalidValidation);
    EXPECT_EQ(
            rejection({
                    TaskBuilder("a").validations({"child"}),
                    TaskBuilder("suite").validator(),
                    TaskBuilder("child").validator().before({"suite"}),
            }),
            mg::GraphErrc::ValidationNotRootValidator);
    EXPECT_FALSE(rejection({TaskBuilder("a").validations({"lint"}), TaskBuilder("lint").validator()}));
}

TEST(FormGraph, FirstViolationInIdOrderWins) {
    const auto graph = mg::form_graph({
            TaskBuilder("zeta").after({"missing"}),
            TaskBuilder("alpha").before({"nowhere"}),
    });
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().task_id, "alpha");
    EXPECT_EQ(graph.error().code, mg::GraphErrc::InvalidParent);
}

TEST(FormGraph, CycleReportsPath) {
    const auto graph = mg::form_graph({
            TaskBuilder("a").after({"c"}),
            TaskBuilder("b").after({"a"}),
            TaskBuilder("c").after({"b"}),
            TaskBuilder("d"),
    });
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().code, mg::GraphErrc::CycleDetected);
    EXPECT_EQ(graph.error().path, (Ids{"a", "b", "c", "a"}));
    EXPECT_NE(graph.error().to_string().find("a -> b -> c -> a"), std::string::npos);
}

TEST(FormGraph, CycleThroughMixedSpellings) {
    // a before b, and a after b
    EXPECT_EQ(
            rejection({TaskBuilder("a").before({"b"}).after({"b"}), TaskBuilder("b")}),
            mg::GraphErrc::CycleDetected);
}

TEST(FormGraph, SelfDependencyIsCycle) {
    const auto graph = mg::form_graph({TaskBuilder("a").after({"a"})});
    ASSERT_FALSE(graph.has_value());
    EXPECT_EQ(graph.error().path, (Ids{"a", "a"}));
}

TEST(GraphErrors, CategoriesNamesAndMessages) {
    const std::error_code ec = mg::GraphErrc::CycleDetected;
    EXPECT_STREQ(ec.category().name(), "mont::graph");
    EXPECT_STREQ(mg::get_error_name(ec), "CycleDetected");
    EXPECT_NE(ec.message().find("cycle"), std::string::npos);

    const std::error_code gate = mg::GateErrc::GateNotFound;
    EXPECT_STREQ(mg::get_error_name(gate), "GateNotFound");
    EXPECT_EQ(gate.default_error_condition(), std::errc::no_such_file_or_directory);

    EXPECT_STREQ(mg::get_error_name(mg::CompletionErrc::GatesPending), "GatesPending");
    EXPECT_STREQ(mg::get_error_name(mg::LifecycleErrc::NotActionable), "NotActionable");
    EXPECT_STREQ(mg::get_error_name(std::make_error_code(std::errc::io_error)), "unknown");
    EXPECT_FALSE(std::error_code{mg::GraphErrc::Success});
}

TEST(GraphErrors, ViolationTextNamesIds) {
    const auto violation = mg::make_violation(mg::GraphErrc::InvalidParent, "a", "ghost");
    const auto text = violation.to_string();
    EXPECT_NE(text.find("'a'"), std::string::npos);
    EXPECT_NE(text.find("'ghost'"), std::string::npos);
}

} // namespace

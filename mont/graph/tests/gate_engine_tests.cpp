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
 * @file gate_engine_tests.cpp
 * @brief Unit tests for effective gates, gate transitions and completion
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "graph/gate_engine.hpp"
#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "task_fixtures.hpp"

namespace {

namespace mg = ::mont::graph;
using mg::testing::TaskBuilder;

using Ids = std::vector<std::string>;

std::vector<std::string> gate_names(const std::vector<mg::GateEntry> &gates) {
    std::vector<std::string> names;
    for (const auto &gate : gates) {
        names.push_back(gate.name);
    }
    return names;
}

TEST(EffectiveGates, DefaultsThenValidationsThenOwnGatesDeduplicated) {
    const Ids defaults{"ci", "review"};
    const mg::Task task = TaskBuilder("t")
                                  .validations({"perf", "ci"})
                                  .gate("manual")
                                  .gate("review", mg::GateStatus::Passed);

    const auto gates = mg::effective_gates(task, defaults);
    EXPECT_EQ(gate_names(gates), (Ids{"ci", "review", "perf", "manual"}));
    EXPECT_EQ(gates[0].status, mg::GateStatus::Pending);
    EXPECT_EQ(gates[1].status, mg::GateStatus::Passed);
}

TEST(EffectiveGates, JotsHaveNone) {
    const Ids defaults{"ci"};
    EXPECT_TRUE(mg::effective_gates(TaskBuilder("j").jot(), defaults).empty());
}

TEST(UnlockGate, PassesDefaultGateAndRecordsItOnTheTask) {
    const Ids defaults{"ci"};
    const auto unlocked = mg::unlock_gate(TaskBuilder("t"), "ci", defaults);
    ASSERT_TRUE(unlocked.has_value());
    ASSERT_EQ(unlocked->gates.size(), 1U);
    EXPECT_EQ(unlocked->gates[0], (mg::GateEntry{"ci", mg::GateStatus::Passed}));

    // Unlocking again changes nothing
    const auto again = mg::unlock_gate(*unlocked, "ci", defaults);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *unlocked);
}

TEST(UnlockGate, FailedAndSkippedBecomePassed) {
    const mg::Task task = TaskBuilder("t")
                                  .gate("a", mg::GateStatus::Failed)
                                  .gate("b", mg::GateStatus::Skipped);
    auto result = mg::unlock_gate(task, "a", {});
    ASSERT_TRUE(result.has_value());
    result = mg::unlock_gate(*result, "b", {});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->gates[0].status, mg::GateStatus::Passed);
    EXPECT_EQ(result->gates[1].status, mg::GateStatus::Passed);
}

TEST(UnlockGate, UnknownGateAndJotRejected) {
    const auto missing = mg::unlock_gate(TaskBuilder("t"), "nope", {});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, mg::GateErrc::GateNotFound);
    EXPECT_EQ(missing.error().related_id, "nope");

    const Ids defaults{"ci"};
    const auto jot = mg::unlock_gate(TaskBuilder("j").jot(), "ci", defaults);
    ASSERT_FALSE(jot.has_value());
    EXPECT_EQ(jot.error().code, mg::GateErrc::CannotGateJot);
}

TEST(LockGate, OnlyPassedGatesCanBeLocked) {
    const mg::Task task = TaskBuilder("t").gate("a", mg::GateStatus::Passed).gate("b");

    const auto locked = mg::lock_gate(task, "a", {});
    ASSERT_TRUE(locked.has_value());
    EXPECT_EQ(locked->gates[0].status, mg::GateStatus::Pending);

    const auto pending = mg::lock_gate(task, "b", {});
    ASSERT_FALSE(pending.has_value());
    EXPECT_EQ(pending.error().code, mg::GateErrc::GateNotPassed);

    EXPECT_EQ(mg::lock_gate(task, "zzz", {}).error().code, mg::GateErrc::GateNotFound);
    EXPECT_EQ(mg::lock_gate(TaskBuilder("j").jot(), "a", {}).error().code, mg::GateErrc::CannotGateJot);
}

TEST(FinishWork, RequiresActiveSession) {
    const auto finished = mg::finish_work(TaskBuilder("t").active());
    ASSERT_TRUE(finished.has_value());
    EXPECT_EQ(finished->work_state, mg::WorkState::AwaitingGates);

    EXPECT_EQ(mg::finish_work(TaskBuilder("t")).error().code, mg::CompletionErrc::NotInProgress);
    EXPECT_EQ(mg::finish_work(TaskBuilder("j").jot()).error().code, mg::CompletionErrc::CannotCompleteJot);
}

TEST(CompleteTask, BlockedUntilEveryGatePasses) {
    const Ids defaults{"ci"};
    const mg::Task task = TaskBuilder("t").active(2).gate("review", mg::GateStatus::Skipped);

    const auto blocked = mg::complete_task(task, defaults);
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, mg::CompletionErrc::GatesPending);
    EXPECT_EQ(blocked.error().path, (Ids{"ci", "review"}));

    auto ready = mg::unlock_gate(task, "ci", defaults);
    ASSERT_TRUE(ready.has_value());
    ready = mg::unlock_gate(*ready, "review", defaults);
    ASSERT_TRUE(ready.has_value());

    const auto done = mg::complete_task(*ready, defaults);
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done->complete);
    EXPECT_EQ(done->work_state, mg::WorkState::Idle);
    EXPECT_EQ(done->in_progress, 2U);
}

TEST(CompleteTask, AwaitingGatesTaskCompletes) {
    const auto done = mg::complete_task(TaskBuilder("t").awaiting_gates(), {});
    ASSERT_TRUE(done.has_value());
    EXPECT_TRUE(done->complete);
}

TEST(CompleteTask, RejectsByKindAndState) {
    EXPECT_EQ(mg::complete_task(TaskBuilder("t"), {}).error().code, mg::CompletionErrc::NotInProgress);
    EXPECT_EQ(
            mg::complete_task(TaskBuilder("j").jot(), {}).error().code,
            mg::CompletionErrc::CannotCompleteJot);
    EXPECT_EQ(
            mg::complete_task(TaskBuilder("v").validator(), {}).error().code,
            mg::CompletionErrc::NotCompletable);
}

TEST(CompleteTask, AlreadyCompleteIsNoOp) {
    const mg::Task task = TaskBuilder("t").complete().gate("x");
    const auto again = mg::complete_task(task, {});
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, task);
}

} // namespace

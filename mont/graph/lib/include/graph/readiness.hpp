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
 * @file readiness.hpp
 * @brief Task status derivation and work session transitions
 */

#ifndef MONT_GRAPH_READINESS_HPP
#define MONT_GRAPH_READINESS_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>
#include <wise_enum.h>

#include "graph/graph_errors.hpp"
#include "graph/priority.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"

namespace mont::graph {

/**
 * Derived status of a task
 */
enum class StatusKind : std::uint8_t {
    NotStarted,   //!< Validator; never worked on
    Ready,        //!< All dependencies complete, can be started
    Blocked,      //!< At least one dependency is incomplete
    InProgress,   //!< Work session open
    GatesPending, //!< Work done, waiting for gates
    Complete      //!< Done
};

} // namespace mont::graph

WISE_ENUM_ADAPT(
        mont::graph::StatusKind, NotStarted, Ready, Blocked, InProgress, GatesPending, Complete)

namespace mont::graph {

/**
 * Status plus the session count for in-progress tasks
 */
struct TaskStatus final {
    StatusKind kind{StatusKind::NotStarted}; //!< Status
    std::uint32_t sessions{0};               //!< Session counter, set for InProgress

    bool operator==(const TaskStatus &) const = default;
};

/**
 * Derive the status of a task
 *
 * Rules apply in order: complete, active, awaiting gates, blocked by an
 * incomplete dependency, not actionable (jot/validator), ready.
 *
 * @param[in] graph Graph snapshot
 * @param[in] id Task id
 * @return Status
 * @throws std::out_of_range for unknown ids
 */
[[nodiscard]] TaskStatus status_of(const TaskGraph &graph, std::string_view id);

/**
 * @param[in] graph Graph snapshot
 * @param[in] id Task id
 * @return true if every dependency of the task is complete, validators excepted
 */
[[nodiscard]] bool dependencies_complete(const TaskGraph &graph, std::string_view id);

/**
 * Ready task ids in id order
 *
 * @param[in] graph Graph snapshot
 * @return Ids of ready tasks
 */
[[nodiscard]] std::vector<std::string> ready_tasks(const TaskGraph &graph);

/**
 * Ready task ids, highest effective priority first, then by id
 *
 * @param[in] graph Graph snapshot
 * @param[in] priorities Effective priorities of the same snapshot
 * @return Ids of ready tasks
 */
[[nodiscard]] std::vector<std::string>
ready_tasks(const TaskGraph &graph, const EffectivePriorities &priorities);

/**
 * Check whether a task and everything it transitively blocks is complete
 *
 * @param[in] graph Graph snapshot
 * @param[in] id Task id
 * @return true if the whole group is complete
 * @throws std::out_of_range for unknown ids
 */
[[nodiscard]] bool is_group_complete(const TaskGraph &graph, std::string_view id);

/**
 * Open a work session
 *
 * Increments the session counter. A task awaiting gates may be reopened.
 *
 * @param[in] graph Graph snapshot
 * @param[in] id Task id
 * @return Updated task or a LifecycleErrc violation
 */
[[nodiscard]] tl::expected<Task, Violation> start_task(const TaskGraph &graph, std::string_view id);

/**
 * Close a work session without completing
 *
 * The session counter is kept.
 *
 * @param[in] graph Graph snapshot
 * @param[in] id Task id
 * @return Updated task, LifecycleErrc::TaskNotFound or CompletionErrc::NotInProgress
 */
[[nodiscard]] tl::expected<Task, Violation> stop_task(const TaskGraph &graph, std::string_view id);

} // namespace mont::graph

#endif // MONT_GRAPH_READINESS_HPP

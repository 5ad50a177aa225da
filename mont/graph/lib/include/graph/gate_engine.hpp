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
 * @file gate_engine.hpp
 * @brief Effective gate computation, gate transitions and task completion
 *
 * A task's effective gates combine the configured default gates, its
 * `validations` and its own gate snapshot. Every function here works on a
 * single task value and returns the edited copy; the caller commits it.
 */

#ifndef MONT_GRAPH_GATE_ENGINE_HPP
#define MONT_GRAPH_GATE_ENGINE_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"

namespace mont::graph {

/**
 * Ordered gate list that decides whether a task can complete
 *
 * Order is default gates, then `validations`, then the task's own gates,
 * keeping the first occurrence of each name. Status comes from the task's
 * snapshot and defaults to Pending. Jots have no gates.
 *
 * @param[in] task Task to inspect
 * @param[in] default_gates Configured default gate ids
 * @return Effective gates
 */
[[nodiscard]] std::vector<GateEntry>
effective_gates(const Task &task, std::span<const std::string> default_gates);

/**
 * Mark a gate as passed
 *
 * Passing an already passed gate is a no-op.
 *
 * @param[in] task Task owning the gate
 * @param[in] gate_name Gate to pass
 * @param[in] default_gates Configured default gate ids
 * @return Updated task, or GateErrc::CannotGateJot / GateErrc::GateNotFound
 */
[[nodiscard]] tl::expected<Task, Violation>
unlock_gate(Task task, std::string_view gate_name, std::span<const std::string> default_gates);

/**
 * Return a passed gate to pending
 *
 * @param[in] task Task owning the gate
 * @param[in] gate_name Gate to reset
 * @param[in] default_gates Configured default gate ids
 * @return Updated task, or GateErrc::CannotGateJot / GateErrc::GateNotFound /
 *         GateErrc::GateNotPassed
 */
[[nodiscard]] tl::expected<Task, Violation>
lock_gate(Task task, std::string_view gate_name, std::span<const std::string> default_gates);

/**
 * Close the work session and wait for gates
 *
 * @param[in] task Active task
 * @return Task in WorkState::AwaitingGates
 */
[[nodiscard]] tl::expected<Task, Violation> finish_work(Task task);

/**
 * Mark a task complete once every effective gate has passed
 *
 * Completing an already complete task succeeds without changes. On
 * CompletionErrc::GatesPending the violation path lists the blocking gates.
 *
 * @param[in] task Task to complete
 * @param[in] default_gates Configured default gate ids
 * @return Completed task or the reason it cannot complete
 */
[[nodiscard]] tl::expected<Task, Violation>
complete_task(Task task, std::span<const std::string> default_gates);

/**
 * Names of effective gates that are not passed
 *
 * @param[in] task Task to inspect
 * @param[in] default_gates Configured default gate ids
 * @return Blocking gate names in effective order
 */
[[nodiscard]] std::vector<std::string>
blocking_gates(const Task &task, std::span<const std::string> default_gates);

} // namespace mont::graph

#endif // MONT_GRAPH_GATE_ENGINE_HPP

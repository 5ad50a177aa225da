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
 * @file task.hpp
 * @brief Task record model shared by the graph engines, the store and the renderer
 */

#ifndef MONT_GRAPH_TASK_HPP
#define MONT_GRAPH_TASK_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <wise_enum.h>

namespace mont::graph {

/**
 * Kind of record
 */
enum class TaskKind : std::uint8_t {
    Jot,      //!< Unrefined idea, waiting to be distilled into tasks
    Task,     //!< Actionable unit of work
    Validator //!< Reusable completion criterion
};

/**
 * State of one gate on one task
 */
enum class GateStatus : std::uint8_t {
    Pending, //!< Not yet evaluated
    Passed,  //!< Criterion satisfied
    Failed,  //!< Criterion evaluated and not satisfied
    Skipped  //!< Explicitly skipped; does not satisfy the gate
};

/**
 * Work lifecycle marker
 */
enum class WorkState : std::uint8_t {
    Idle,         //!< No open work session
    Active,       //!< Work session open
    AwaitingGates //!< Work finished, waiting for gates to pass
};

} // namespace mont::graph

WISE_ENUM_ADAPT(mont::graph::TaskKind, Jot, Task, Validator)
WISE_ENUM_ADAPT(mont::graph::GateStatus, Pending, Passed, Failed, Skipped)
WISE_ENUM_ADAPT(mont::graph::WorkState, Idle, Active, AwaitingGates)

namespace mont::graph {

/**
 * Named gate with its status, local to the owning task
 */
struct GateEntry final {
    std::string name;                      //!< Validator id the gate refers to
    GateStatus status{GateStatus::Pending}; //!< Status on the owning task

    bool operator==(const GateEntry &) const = default;
};

/**
 * One work item as stored in a record
 *
 * `before` lists the ids this task blocks and `after` the ids it depends on.
 * Both spell the same dependency relation from opposite ends.
 */
struct Task final {
    std::string id;                           //!< Unique identifier
    std::string title;                        //!< One-line title, may be empty
    TaskKind kind{TaskKind::Task};            //!< Record kind
    std::string description;                  //!< Markdown body
    std::vector<std::string> before;          //!< Tasks blocked by this one
    std::vector<std::string> after;           //!< Tasks this one depends on
    std::vector<std::string> validations;     //!< Validators this task must satisfy
    std::vector<GateEntry> gates;             //!< Gate snapshot in stored order
    bool complete{false};                     //!< Completion flag
    std::optional<std::uint32_t> in_progress; //!< Work session counter
    WorkState work_state{WorkState::Idle};    //!< Lifecycle marker
    std::int64_t priority{0};                 //!< Own priority

    bool operator==(const Task &) const = default;
};

[[nodiscard]] inline bool is_jot(const Task &task) noexcept { return task.kind == TaskKind::Jot; }

[[nodiscard]] inline bool is_validator(const Task &task) noexcept {
    return task.kind == TaskKind::Validator;
}

/**
 * Jots and validators are never worked on directly
 *
 * @param[in] task Task to check
 * @return true for ordinary tasks
 */
[[nodiscard]] inline bool is_actionable(const Task &task) noexcept {
    return task.kind == TaskKind::Task;
}

/**
 * A root validator has no containing parent
 *
 * @param[in] task Task to check
 * @return true if the task is a validator with empty `before`
 */
[[nodiscard]] inline bool is_root_validator(const Task &task) noexcept {
    return is_validator(task) && task.before.empty();
}

// Persisted spellings ("jot", "passed", "gates-pending", ...)
[[nodiscard]] std::string_view to_string(TaskKind kind) noexcept;
[[nodiscard]] std::string_view to_string(GateStatus status) noexcept;
[[nodiscard]] std::string_view to_string(WorkState state) noexcept;

[[nodiscard]] std::optional<TaskKind> parse_task_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<GateStatus> parse_gate_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<WorkState> parse_work_state(std::string_view text) noexcept;

/**
 * Check an id against the record naming rules
 *
 * Ids are non-empty, contain no whitespace or path separators and never
 * equal the reserved picker placeholder `?`.
 *
 * @param[in] id Candidate id
 * @return true if the id can name a record
 */
[[nodiscard]] bool is_valid_task_id(std::string_view id) noexcept;

inline constexpr std::string_view PICKER_PLACEHOLDER = "?"; //!< Reserved "ask the user" id

} // namespace mont::graph

#endif // MONT_GRAPH_TASK_HPP

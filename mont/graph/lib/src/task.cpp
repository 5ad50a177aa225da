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
 * @file task.cpp
 * @brief Persisted names of the task enumerations
 */

#include <algorithm>
#include <optional>
#include <string_view>

#include "graph/task.hpp"

namespace mont::graph {

std::string_view to_string(const TaskKind kind) noexcept {
    switch (kind) {
    case TaskKind::Jot:
        return "jot";
    case TaskKind::Task:
        return "task";
    case TaskKind::Validator:
        return "validator";
    }
    return "task";
}

std::string_view to_string(const GateStatus status) noexcept {
    switch (status) {
    case GateStatus::Pending:
        return "pending";
    case GateStatus::Passed:
        return "passed";
    case GateStatus::Failed:
        return "failed";
    case GateStatus::Skipped:
        return "skipped";
    }
    return "pending";
}

std::string_view to_string(const WorkState state) noexcept {
    switch (state) {
    case WorkState::Idle:
        return "idle";
    case WorkState::Active:
        return "active";
    case WorkState::AwaitingGates:
        return "gates-pending";
    }
    return "idle";
}

std::optional<TaskKind> parse_task_kind(const std::string_view text) noexcept {
    for (const auto kind : {TaskKind::Jot, TaskKind::Task, TaskKind::Validator}) {
        if (to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<GateStatus> parse_gate_status(const std::string_view text) noexcept {
    for (const auto status :
         {GateStatus::Pending, GateStatus::Passed, GateStatus::Failed, GateStatus::Skipped}) {
        if (to_string(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<WorkState> parse_work_state(const std::string_view text) noexcept {
    for (const auto state : {WorkState::Idle, WorkState::Active, WorkState::AwaitingGates}) {
        if (to_string(state) == text) {
            return state;
        }
    }
    return std::nullopt;
}

bool is_valid_task_id(const std::string_view id) noexcept {
    if (id.empty() || id == PICKER_PLACEHOLDER) {
        return false;
    }
    return std::none_of(id.begin(), id.end(), [](const char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '/' || c == '\\';
    });
}

} // namespace mont::graph

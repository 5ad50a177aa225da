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
 * @file gate_engine.cpp
 * @brief Gate transitions and completion checks
 */

#include <algorithm>
#include <format>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "graph/gate_engine.hpp"
#include "graph/graph_errors.hpp"
#include "graph/graph_log.hpp"
#include "graph/task.hpp"
#include "log/log_macros.hpp"

namespace mont::graph {

namespace {

GateEntry *find_gate(std::vector<GateEntry> &gates, const std::string_view name) {
    const auto it = std::find_if(gates.begin(), gates.end(), [name](const GateEntry &gate) {
        return gate.name == name;
    });
    return it == gates.end() ? nullptr : &*it;
}

const GateEntry *find_gate(const std::vector<GateEntry> &gates, const std::string_view name) {
    const auto it = std::find_if(gates.begin(), gates.end(), [name](const GateEntry &gate) {
        return gate.name == name;
    });
    return it == gates.end() ? nullptr : &*it;
}

/**
 * Write a status into the task's own snapshot, appending when absent
 */
void set_gate_status(Task &task, const std::string_view name, const GateStatus status) {
    if (auto *gate = find_gate(task.gates, name); gate != nullptr) {
        gate->status = status;
        return;
    }
    task.gates.push_back(GateEntry{std::string{name}, status});
}

} // anonymous namespace

std::vector<GateEntry>
effective_gates(const Task &task, const std::span<const std::string> default_gates) {
    std::vector<GateEntry> gates;
    if (is_jot(task)) {
        return gates;
    }

    const auto add = [&gates, &task](const std::string &name) {
        if (find_gate(gates, name) != nullptr) {
            return;
        }
        const auto *own = find_gate(task.gates, name);
        gates.push_back(GateEntry{name, own != nullptr ? own->status : GateStatus::Pending});
    };

    std::for_each(default_gates.begin(), default_gates.end(), add);
    std::for_each(task.validations.begin(), task.validations.end(), add);
    for (const auto &gate : task.gates) {
        add(gate.name);
    }
    return gates;
}

std::vector<std::string>
blocking_gates(const Task &task, const std::span<const std::string> default_gates) {
    std::vector<std::string> blocking;
    for (const auto &gate : effective_gates(task, default_gates)) {
        if (gate.status != GateStatus::Passed) {
            blocking.push_back(gate.name);
        }
    }
    return blocking;
}

tl::expected<Task, Violation> unlock_gate(
        Task task, const std::string_view gate_name, const std::span<const std::string> default_gates) {
    if (is_jot(task)) {
        return tl::unexpected(
                make_violation(GateErrc::CannotGateJot, task.id, std::string{gate_name}));
    }

    const auto gates = effective_gates(task, default_gates);
    const auto *gate = find_gate(gates, gate_name);
    if (gate == nullptr) {
        return tl::unexpected(
                make_violation(GateErrc::GateNotFound, task.id, std::string{gate_name}));
    }

    if (gate->status != GateStatus::Passed) {
        set_gate_status(task, gate_name, GateStatus::Passed);
        MONT_LOGC_INFO(GraphLog::Gates, "Gate '{}' passed on task '{}'", gate_name, task.id);
    }
    return task;
}

tl::expected<Task, Violation> lock_gate(
        Task task, const std::string_view gate_name, const std::span<const std::string> default_gates) {
    if (is_jot(task)) {
        return tl::unexpected(
                make_violation(GateErrc::CannotGateJot, task.id, std::string{gate_name}));
    }

    const auto gates = effective_gates(task, default_gates);
    const auto *gate = find_gate(gates, gate_name);
    if (gate == nullptr) {
        return tl::unexpected(
                make_violation(GateErrc::GateNotFound, task.id, std::string{gate_name}));
    }
    if (gate->status != GateStatus::Passed) {
        return tl::unexpected(make_violation(
                GateErrc::GateNotPassed,
                task.id,
                std::string{gate_name},
                std::format("gate is {}", to_string(gate->status))));
    }

    set_gate_status(task, gate_name, GateStatus::Pending);
    MONT_LOGC_INFO(GraphLog::Gates, "Gate '{}' reset to pending on task '{}'", gate_name, task.id);
    return task;
}

tl::expected<Task, Violation> finish_work(Task task) {
    if (is_jot(task)) {
        return tl::unexpected(make_violation(CompletionErrc::CannotCompleteJot, task.id));
    }
    if (task.work_state != WorkState::Active) {
        return tl::unexpected(make_violation(CompletionErrc::NotInProgress, task.id));
    }

    task.work_state = WorkState::AwaitingGates;
    MONT_LOGC_DEBUG(GraphLog::Gates, "Task '{}' finished work, awaiting gates", task.id);
    return task;
}

tl::expected<Task, Violation>
complete_task(Task task, const std::span<const std::string> default_gates) {
    if (task.complete) {
        return task;
    }

    switch (task.kind) {
    case TaskKind::Jot:
        return tl::unexpected(make_violation(CompletionErrc::CannotCompleteJot, task.id));
    case TaskKind::Validator:
        return tl::unexpected(make_violation(CompletionErrc::NotCompletable, task.id));
    case TaskKind::Task:
        break;
    }

    if (task.work_state == WorkState::Idle) {
        return tl::unexpected(make_violation(CompletionErrc::NotInProgress, task.id));
    }

    if (auto blocking = blocking_gates(task, default_gates); !blocking.empty()) {
        Violation violation = make_violation(CompletionErrc::GatesPending, task.id);
        violation.path = std::move(blocking);
        MONT_LOGC_DEBUG(GraphLog::Gates, "Task '{}' blocked by {} gates", task.id, violation.path.size());
        return tl::unexpected(std::move(violation));
    }

    task.complete = true;
    task.work_state = WorkState::Idle;
    MONT_LOGC_INFO(GraphLog::Gates, "Task '{}' completed", task.id);
    return task;
}

} // namespace mont::graph

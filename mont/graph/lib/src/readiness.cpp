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
 * @file readiness.cpp
 * @brief Status rules and start/stop transitions
 */

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_errors.hpp"
#include "graph/graph_log.hpp"
#include "graph/priority.hpp"
#include "graph/readiness.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"
#include "utils/string_hash.hpp"

namespace mont::graph {

namespace {

/**
 * First dependency that still holds the task back
 *
 * Validators are criteria rather than work and never complete, so a
 * validator listing a task in `before` only groups it and does not block it.
 */
const std::string *first_incomplete_dependency(const TaskGraph &graph, const std::string_view id) {
    for (const auto &dependency : graph.dependencies_of(id)) {
        const Task &task = graph.at(dependency);
        if (!task.complete && !is_validator(task)) {
            return &dependency;
        }
    }
    return nullptr;
}

} // anonymous namespace

bool dependencies_complete(const TaskGraph &graph, const std::string_view id) {
    return first_incomplete_dependency(graph, id) == nullptr;
}

TaskStatus status_of(const TaskGraph &graph, const std::string_view id) {
    const Task &task = graph.at(id);

    if (task.complete) {
        return {StatusKind::Complete, 0};
    }

    switch (task.work_state) {
    case WorkState::Active:
        return {StatusKind::InProgress, task.in_progress.value_or(1)};
    case WorkState::AwaitingGates:
        return {StatusKind::GatesPending, 0};
    case WorkState::Idle:
        break;
    }

    if (!dependencies_complete(graph, id)) {
        return {StatusKind::Blocked, 0};
    }
    if (is_validator(task)) {
        return {StatusKind::NotStarted, 0};
    }
    return {StatusKind::Ready, 0};
}

std::vector<std::string> ready_tasks(const TaskGraph &graph) {
    std::vector<std::string> ready;
    for (const auto &[id, task] : graph.tasks()) {
        if (status_of(graph, id).kind == StatusKind::Ready) {
            ready.push_back(id);
        }
    }
    return ready;
}

std::vector<std::string>
ready_tasks(const TaskGraph &graph, const EffectivePriorities &priorities) {
    auto ready = ready_tasks(graph);
    // Input is id-sorted, so a stable sort keeps ids ascending within equal priority
    std::stable_sort(
            ready.begin(), ready.end(), [&priorities](const std::string &a, const std::string &b) {
                return priorities.of(a) > priorities.of(b);
            });
    return ready;
}

bool is_group_complete(const TaskGraph &graph, const std::string_view id) {
    std::vector<std::string_view> pending{id};
    utils::IdSet seen;

    while (!pending.empty()) {
        const std::string_view current = pending.back();
        pending.pop_back();
        if (!seen.emplace(current).second) {
            continue;
        }

        const Task &task = graph.at(current);
        if (!task.complete) {
            return false;
        }
        for (const auto &target : task.before) {
            pending.emplace_back(target);
        }
    }
    return true;
}

tl::expected<Task, Violation> start_task(const TaskGraph &graph, const std::string_view id) {
    const Task *found = graph.find(id);
    if (found == nullptr) {
        return tl::unexpected(make_violation(LifecycleErrc::TaskNotFound, std::string{id}));
    }

    Task task = *found;
    if (task.complete) {
        return tl::unexpected(make_violation(LifecycleErrc::AlreadyComplete, task.id));
    }
    if (task.work_state == WorkState::Active) {
        return tl::unexpected(make_violation(LifecycleErrc::AlreadyInProgress, task.id));
    }

    switch (task.kind) {
    case TaskKind::Jot:
    case TaskKind::Validator:
        return tl::unexpected(make_violation(
                LifecycleErrc::NotActionable, task.id, {}, std::string{to_string(task.kind)}));
    case TaskKind::Task:
        break;
    }

    if (const auto *dependency = first_incomplete_dependency(graph, id); dependency != nullptr) {
        return tl::unexpected(
                make_violation(LifecycleErrc::DependenciesIncomplete, task.id, *dependency));
    }

    task.work_state = WorkState::Active;
    task.in_progress = task.in_progress.value_or(0) + 1;
    MONT_LOGC_INFO(
            GraphLog::Readiness, "Task '{}' started, session {}", task.id, *task.in_progress);
    return task;
}

tl::expected<Task, Violation> stop_task(const TaskGraph &graph, const std::string_view id) {
    const Task *found = graph.find(id);
    if (found == nullptr) {
        return tl::unexpected(make_violation(LifecycleErrc::TaskNotFound, std::string{id}));
    }

    Task task = *found;
    if (task.work_state == WorkState::Idle) {
        return tl::unexpected(make_violation(CompletionErrc::NotInProgress, task.id));
    }

    task.work_state = WorkState::Idle;
    MONT_LOGC_INFO(GraphLog::Readiness, "Task '{}' stopped", task.id);
    return task;
}

} // namespace mont::graph

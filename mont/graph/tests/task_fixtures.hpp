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
 * @file task_fixtures.hpp
 * @brief Compact task builders for graph, display and store tests
 */

#ifndef MONT_GRAPH_TESTS_TASK_FIXTURES_HPP
#define MONT_GRAPH_TESTS_TASK_FIXTURES_HPP

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "graph/task.hpp"
#include "graph/task_graph.hpp"

namespace mont::graph::testing {

/**
 * Fluent builder for one task record
 */
class TaskBuilder final {
public:
    explicit TaskBuilder(std::string id) { task_.id = std::move(id); }

    TaskBuilder &title(std::string value) {
        task_.title = std::move(value);
        return *this;
    }
    TaskBuilder &kind(const TaskKind value) {
        task_.kind = value;
        return *this;
    }
    TaskBuilder &jot() { return kind(TaskKind::Jot); }
    TaskBuilder &validator() { return kind(TaskKind::Validator); }
    TaskBuilder &after(std::initializer_list<std::string> ids) {
        task_.after.insert(task_.after.end(), ids);
        return *this;
    }
    TaskBuilder &before(std::initializer_list<std::string> ids) {
        task_.before.insert(task_.before.end(), ids);
        return *this;
    }
    TaskBuilder &validations(std::initializer_list<std::string> ids) {
        task_.validations.insert(task_.validations.end(), ids);
        return *this;
    }
    TaskBuilder &gate(std::string name, const GateStatus status = GateStatus::Pending) {
        task_.gates.push_back(GateEntry{std::move(name), status});
        return *this;
    }
    TaskBuilder &complete(const bool value = true) {
        task_.complete = value;
        return *this;
    }
    TaskBuilder &active(const std::uint32_t sessions = 1) {
        task_.work_state = WorkState::Active;
        task_.in_progress = sessions;
        return *this;
    }
    TaskBuilder &awaiting_gates() {
        task_.work_state = WorkState::AwaitingGates;
        task_.in_progress = task_.in_progress.value_or(1);
        return *this;
    }
    TaskBuilder &priority(const std::int64_t value) {
        task_.priority = value;
        return *this;
    }

    [[nodiscard]] Task build() const { return task_; }
    // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
    operator Task() const { return task_; }

private:
    Task task_;
};

/**
 * Build a graph that the test expects to be valid
 *
 * @param[in] tasks Records
 * @return Graph
 * @throws std::runtime_error with the violation text otherwise
 */
inline TaskGraph must_form(std::vector<Task> tasks) {
    auto graph = form_graph(std::move(tasks));
    if (!graph) {
        throw std::runtime_error(graph.error().to_string());
    }
    return std::move(*graph);
}

} // namespace mont::graph::testing

#endif // MONT_GRAPH_TESTS_TASK_FIXTURES_HPP

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
 * @file task_graph.hpp
 * @brief Validated, immutable task graph and its builder
 *
 * A TaskGraph only exists in a valid state: form_graph() checks every
 * structural rule before one is produced and reports the first violation
 * otherwise. Graphs are never edited in place; mutations rebuild a new graph
 * from edited records.
 */

#ifndef MONT_GRAPH_TASK_GRAPH_HPP
#define MONT_GRAPH_TASK_GRAPH_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_algorithms.hpp"
#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "utils/string_hash.hpp"

namespace mont::graph {

class TaskGraph;

/**
 * Validate records and build a graph from them
 *
 * Checks, first failure wins:
 * - duplicate ids
 * - per task in id order: `before`, `after`, validator dependencies, jot
 *   contents, then `validations`
 * - cycles over the normalised dependency edges
 *
 * @param[in] tasks Records to assemble
 * @return The graph, or the first violation found
 */
[[nodiscard]] tl::expected<TaskGraph, Violation> form_graph(std::vector<Task> tasks);

/**
 * Immutable snapshot of all tasks and their dependency structure
 */
class TaskGraph final {
public:
    using TaskMap = std::map<std::string, Task, std::less<>>; //!< Tasks in id order

    TaskGraph() = default;

    /**
     * Find a task
     *
     * @param[in] id Task id
     * @return Pointer to the task, or nullptr when absent
     */
    [[nodiscard]] const Task *find(std::string_view id) const;

    /**
     * Get a task that must exist
     *
     * @param[in] id Task id
     * @return The task
     * @throws std::out_of_range when absent
     */
    [[nodiscard]] const Task &at(std::string_view id) const;

    [[nodiscard]] bool contains(std::string_view id) const;
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }
    [[nodiscard]] const TaskMap &tasks() const noexcept { return tasks_; }

    /**
     * Ids a task depends on, from both its `after` list and other tasks' `before`
     *
     * @param[in] id Task id
     * @return Sorted dependency ids, empty for unknown ids
     */
    [[nodiscard]] std::span<const std::string> dependencies_of(std::string_view id) const;

    /**
     * Ids that depend on a task
     *
     * @param[in] id Task id
     * @return Sorted dependent ids, empty for unknown ids
     */
    [[nodiscard]] std::span<const std::string> dependents_of(std::string_view id) const;

    /**
     * @return Every task id, dependencies first, ties by id
     */
    [[nodiscard]] const std::vector<std::string> &topological_order() const noexcept {
        return order_;
    }

    /**
     * @return Sorted, deduplicated dependency edges
     */
    [[nodiscard]] const std::vector<Edge> &edges() const noexcept { return edges_; }

private:
    friend tl::expected<TaskGraph, Violation> form_graph(std::vector<Task> tasks);

    TaskMap tasks_;
    utils::IdMap<std::vector<std::string>> dependencies_;
    utils::IdMap<std::vector<std::string>> dependents_;
    std::vector<Edge> edges_;
    std::vector<std::string> order_;
};

/**
 * Normalise the dependency edges declared by a set of records
 *
 * `after: [d]` on t yields d -> t and `before: [b]` on t yields t -> b.
 * Edges touching unknown ids are kept; callers filter as needed.
 *
 * @param[in] tasks Records
 * @return Sorted, deduplicated edges
 */
[[nodiscard]] std::vector<Edge> dependency_edges(std::span<const Task> tasks);

} // namespace mont::graph

#endif // MONT_GRAPH_TASK_GRAPH_HPP

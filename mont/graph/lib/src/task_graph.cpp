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
 * @file task_graph.cpp
 * @brief Graph validation and construction
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_algorithms.hpp"
#include "graph/graph_errors.hpp"
#include "graph/graph_log.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"
#include "utils/string_hash.hpp"

namespace mont::graph {

namespace {

enum class VisitColor : std::uint8_t {
    White, //!< Not visited yet
    Gray,  //!< On the current DFS path
    Black  //!< Fully explored
};

/**
 * Check references and per-kind rules of one task
 *
 * @param[in] task Task to check
 * @param[in] tasks All tasks by id
 * @return The first violation, if any
 */
tl::expected<void, Violation> check_task(const Task &task, const TaskGraph::TaskMap &tasks) {
    for (const auto &target : task.before) {
        if (!tasks.contains(target)) {
            return tl::unexpected(make_violation(GraphErrc::InvalidParent, task.id, target));
        }
    }

    for (const auto &dependency : task.after) {
        const auto it = tasks.find(dependency);
        if (it == tasks.end()) {
            return tl::unexpected(
                    make_violation(GraphErrc::InvalidPrecondition, task.id, dependency));
        }
        if (!is_validator(task) && is_validator(it->second)) {
            return tl::unexpected(
                    make_violation(GraphErrc::AfterIsValidator, task.id, dependency));
        }
    }

    if (is_validator(task) && !task.after.empty()) {
        return tl::unexpected(make_violation(
                GraphErrc::ValidatorHasDependencies, task.id, task.after.front()));
    }

    if (is_jot(task) && (!task.gates.empty() || task.complete)) {
        return tl::unexpected(make_violation(
                GraphErrc::InvalidJot,
                task.id,
                {},
                task.complete ? "jot is marked complete" : "jot carries gates"));
    }

    for (const auto &validator_id : task.validations) {
        const auto it = tasks.find(validator_id);
        if (it == tasks.end()) {
            return tl::unexpected(
                    make_violation(GraphErrc::InvalidValidation, task.id, validator_id));
        }
        if (!is_validator(it->second)) {
            return tl::unexpected(make_violation(
                    GraphErrc::InvalidValidation,
                    task.id,
                    validator_id,
                    std::format("'{}' is a {}", validator_id, to_string(it->second.kind))));
        }
        if (!is_root_validator(it->second)) {
            return tl::unexpected(make_violation(
                    GraphErrc::ValidationNotRootValidator, task.id, validator_id));
        }
    }
    return {};
}

/**
 * Find the first cycle reachable by a DFS rooted in id order
 *
 * @param[in] ids Sorted task ids
 * @param[in] dependents Sorted successors per id
 * @return Cycle path starting and ending at the same id, empty if acyclic
 */
std::vector<std::string> find_cycle(
        const std::vector<std::string> &ids,
        const utils::IdMap<std::vector<std::string>> &dependents) {
    utils::IdMap<VisitColor> color;
    for (const auto &id : ids) {
        color.emplace(id, VisitColor::White);
    }

    struct Frame final {
        std::string_view id;
        std::size_t next_child{};
    };

    const auto successors = [&dependents](const std::string_view id) -> const std::vector<std::string> & {
        static const std::vector<std::string> none{};
        const auto it = dependents.find(id);
        return it == dependents.end() ? none : it->second;
    };

    for (const auto &root : ids) {
        if (color[root] != VisitColor::White) {
            continue;
        }

        std::vector<Frame> stack{Frame{root, 0}};
        color[root] = VisitColor::Gray;

        while (!stack.empty()) {
            Frame &frame = stack.back();
            const auto &children = successors(frame.id);
            if (frame.next_child == children.size()) {
                color.find(frame.id)->second = VisitColor::Black;
                stack.pop_back();
                continue;
            }

            const std::string &child = children[frame.next_child++];
            const auto child_it = color.find(child);
            if (child_it->second == VisitColor::Gray) {
                std::vector<std::string> path;
                const auto start = std::find_if(stack.begin(), stack.end(), [&child](const Frame &f) {
                    return f.id == child;
                });
                for (auto it = start; it != stack.end(); ++it) {
                    path.emplace_back(it->id);
                }
                path.push_back(child);
                return path;
            }
            if (child_it->second == VisitColor::White) {
                child_it->second = VisitColor::Gray;
                stack.push_back(Frame{child, 0});
            }
        }
    }
    return {};
}

} // anonymous namespace

const Task *TaskGraph::find(const std::string_view id) const {
    const auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

const Task &TaskGraph::at(const std::string_view id) const {
    const auto *task = find(id);
    if (task == nullptr) {
        log_and_throw<std::out_of_range>(GraphLog::Builder, "Task '{}' not found in graph", id);
    }
    return *task;
}

bool TaskGraph::contains(const std::string_view id) const { return tasks_.contains(id); }

std::span<const std::string> TaskGraph::dependencies_of(const std::string_view id) const {
    const auto it = dependencies_.find(id);
    if (it == dependencies_.end()) {
        return {};
    }
    return it->second;
}

std::span<const std::string> TaskGraph::dependents_of(const std::string_view id) const {
    const auto it = dependents_.find(id);
    if (it == dependents_.end()) {
        return {};
    }
    return it->second;
}

std::vector<Edge> dependency_edges(const std::span<const Task> tasks) {
    std::vector<Edge> edges;
    for (const auto &task : tasks) {
        for (const auto &dependency : task.after) {
            edges.push_back(Edge{dependency, task.id});
        }
        for (const auto &target : task.before) {
            edges.push_back(Edge{task.id, target});
        }
    }
    std::sort(edges.begin(), edges.end());
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

tl::expected<TaskGraph, Violation> form_graph(std::vector<Task> tasks) {
    std::stable_sort(tasks.begin(), tasks.end(), [](const Task &a, const Task &b) {
        return a.id < b.id;
    });

    const auto duplicate = std::adjacent_find(tasks.begin(), tasks.end(), [](const Task &a, const Task &b) {
        return a.id == b.id;
    });
    if (duplicate != tasks.end()) {
        MONT_LOGC_DEBUG(GraphLog::Builder, "Duplicate task id '{}'", duplicate->id);
        return tl::unexpected(make_violation(GraphErrc::DuplicateTaskId, duplicate->id));
    }

    TaskGraph graph{};
    graph.edges_ = dependency_edges(tasks);

    for (auto &task : tasks) {
        std::string id = task.id;
        graph.tasks_.emplace(std::move(id), std::move(task));
    }

    for (const auto &[id, task] : graph.tasks_) {
        if (auto checked = check_task(task, graph.tasks_); !checked) {
            MONT_LOGC_DEBUG(GraphLog::Builder, "Rejected graph: {}", checked.error().to_string());
            return tl::unexpected(std::move(checked.error()));
        }
    }

    std::vector<std::string> ids;
    ids.reserve(graph.tasks_.size());
    for (const auto &[id, task] : graph.tasks_) {
        ids.push_back(id);
        graph.dependencies_.emplace(id, std::vector<std::string>{});
        graph.dependents_.emplace(id, std::vector<std::string>{});
    }

    // Edges are sorted by (from, to), so both adjacency lists come out sorted
    for (const auto &edge : graph.edges_) {
        graph.dependents_[edge.from].push_back(edge.to);
        graph.dependencies_[edge.to].push_back(edge.from);
    }

    if (auto cycle = find_cycle(ids, graph.dependents_); !cycle.empty()) {
        Violation violation = make_violation(GraphErrc::CycleDetected, cycle.front());
        violation.path = std::move(cycle);
        MONT_LOGC_DEBUG(GraphLog::Builder, "Rejected graph: {}", violation.to_string());
        return tl::unexpected(std::move(violation));
    }

    graph.order_ = topological_order(ids, graph.edges_);

    MONT_LOGC_DEBUG(
            GraphLog::Builder,
            "Formed graph with {} tasks and {} dependency edges",
            graph.tasks_.size(),
            graph.edges_.size());
    return graph;
}

} // namespace mont::graph

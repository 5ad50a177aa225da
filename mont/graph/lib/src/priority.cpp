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
 * @file priority.cpp
 * @brief Effective priority propagation
 */

#include <algorithm>
#include <cstdint>
#include <string_view>

#include "graph/graph_log.hpp"
#include "graph/priority.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"

namespace mont::graph {

EffectivePriorities::EffectivePriorities(const TaskGraph &graph) {
    effective_.reserve(graph.size());
    const auto &order = graph.topological_order();

    // Dependents come later in topological order, so walking backwards
    // visits every dependent before the tasks it depends on
    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        std::int64_t value = graph.at(*it).priority;
        for (const auto &dependent : graph.dependents_of(*it)) {
            value = std::max(value, effective_.at(dependent));
        }
        effective_.emplace(*it, value);
        if (value != 0) {
            MONT_LOGC_TRACE_L1(GraphLog::Priority, "Task '{}' effective priority {}", *it, value);
        }
    }
}

std::int64_t EffectivePriorities::of(const std::string_view id) const {
    const auto it = effective_.find(id);
    return it == effective_.end() ? 0 : it->second;
}

} // namespace mont::graph

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
 * @file priority.hpp
 * @brief Effective priority propagation along dependency edges
 */

#ifndef MONT_GRAPH_PRIORITY_HPP
#define MONT_GRAPH_PRIORITY_HPP

#include <cstdint>
#include <string_view>

#include "graph/task_graph.hpp"
#include "utils/string_hash.hpp"

namespace mont::graph {

/**
 * Effective priority of every task in one graph snapshot
 *
 * A task inherits the highest priority of anything that transitively
 * depends on it: effective(t) = max(own(t), effective(u) for each dependent u).
 * Computed once on construction in reverse topological order.
 */
class EffectivePriorities final {
public:
    explicit EffectivePriorities(const TaskGraph &graph);

    /**
     * @param[in] id Task id
     * @return Effective priority, 0 for unknown ids
     */
    [[nodiscard]] std::int64_t of(std::string_view id) const;

    /**
     * @param[in] id Task id
     * @return true if the effective priority is above zero
     */
    [[nodiscard]] bool is_urgent(std::string_view id) const { return of(id) > 0; }

private:
    utils::IdMap<std::int64_t> effective_;
};

} // namespace mont::graph

#endif // MONT_GRAPH_PRIORITY_HPP

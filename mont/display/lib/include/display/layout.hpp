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
 * @file layout.hpp
 * @brief Level, row and column assignment for the DAG diagram
 *
 * The layout pipeline runs on one connected component at a time:
 * transitive reduction of the component's edges, longest-path levels,
 * ordering within levels by tier and id, then column assignment that keeps
 * tasks under their leftmost predecessor.
 */

#ifndef MONT_DISPLAY_LAYOUT_HPP
#define MONT_DISPLAY_LAYOUT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <vector>

#include <wise_enum.h>

#include "display/grid.hpp"
#include "graph/graph_algorithms.hpp"
#include "graph/priority.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"

namespace mont::display {

/**
 * Ordering class of a task within its level, lowest first
 */
enum class PositionTier : std::uint8_t {
    InProgress, //!< Active or awaiting gates
    Urgent,     //!< Effective priority above zero
    Ordinary    //!< Everything else
};

} // namespace mont::display

WISE_ENUM_ADAPT(mont::display::PositionTier, InProgress, Urgent, Ordinary)

namespace mont::display {

using IdIndex = std::map<std::string, std::size_t, std::less<>>;     //!< Number per task id
using TierMap = std::map<std::string, PositionTier, std::less<>>; //!< Tier per task id

/**
 * Positioned tasks of one component
 */
struct Layout final {
    std::vector<std::string> order;  //!< One task per row, top to bottom
    IdIndex levels;                  //!< Longest-path level per task
    IdIndex columns;                 //!< Column per task
    std::vector<graph::Edge> edges;  //!< Reduced edges to draw
};

/**
 * @param[in] task Task to classify
 * @param[in] priorities Effective priorities of the snapshot
 * @return Tier of the task
 */
[[nodiscard]] PositionTier
position_tier(const graph::Task &task, const graph::EffectivePriorities &priorities);

/**
 * Longest-path level of every task, computed breadth-first from sources
 *
 * @param[in] ids Task ids
 * @param[in] edges Acyclic edges among the ids
 * @return Level per id
 */
[[nodiscard]] IdIndex assign_levels(std::span<const std::string> ids, std::span<const graph::Edge> edges);

/**
 * Row order: by level, then tier, then id
 *
 * @param[in] levels Level per id
 * @param[in] tiers Tier per id, Ordinary when absent
 * @return Ids top to bottom
 */
[[nodiscard]] std::vector<std::string> position_tasks(const IdIndex &levels, const TierMap &tiers);

/**
 * Column per task
 *
 * Level 0 fills columns left to right in row order. Every later task asks
 * for the leftmost column among its predecessors; requests are served by
 * (preferred column, tier, id) and shift right past columns already taken
 * in the same level.
 *
 * @param[in] order Ids in row order
 * @param[in] levels Level per id
 * @param[in] edges Edges among the ids
 * @param[in] tiers Tier per id
 * @return Column per id
 */
[[nodiscard]] IdIndex assign_columns(
        const std::vector<std::string> &order,
        const IdIndex &levels,
        std::span<const graph::Edge> edges,
        const TierMap &tiers);

/**
 * Full layout of a set of tasks
 *
 * @param[in] graph Snapshot holding the tasks
 * @param[in] ids Tasks to lay out; edges to tasks outside the set are ignored
 * @param[in] priorities Effective priorities of the snapshot
 * @return Layout
 */
[[nodiscard]] Layout compute_layout(
        const graph::TaskGraph &graph,
        std::span<const std::string> ids,
        const graph::EffectivePriorities &priorities);

/**
 * Grid with one task cell per row at the task's column
 *
 * @param[in] layout Layout to place
 * @return Grid of task and empty cells
 */
[[nodiscard]] Grid build_grid(const Layout &layout);

} // namespace mont::display

#endif // MONT_DISPLAY_LAYOUT_HPP

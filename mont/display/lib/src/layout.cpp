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
 * @file layout.cpp
 * @brief Level, row and column assignment
 */

#include <algorithm>
#include <cstddef>
#include <limits>
#include <set>
#include <span>
#include <string>
#include <tuple>
#include <vector>

#include "display/display_log.hpp"
#include "display/grid.hpp"
#include "display/layout.hpp"
#include "graph/graph_algorithms.hpp"
#include "graph/priority.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"
#include "utils/string_hash.hpp"

namespace mont::display {

namespace {

PositionTier tier_of(const TierMap &tiers, const std::string &id) {
    const auto it = tiers.find(id);
    return it == tiers.end() ? PositionTier::Ordinary : it->second;
}

} // anonymous namespace

PositionTier
position_tier(const graph::Task &task, const graph::EffectivePriorities &priorities) {
    if (task.work_state != graph::WorkState::Idle) {
        return PositionTier::InProgress;
    }
    if (priorities.is_urgent(task.id)) {
        return PositionTier::Urgent;
    }
    return PositionTier::Ordinary;
}

IdIndex assign_levels(const std::span<const std::string> ids, const std::span<const graph::Edge> edges) {
    return graph::longest_path_levels(ids, edges);
}

std::vector<std::string> position_tasks(const IdIndex &levels, const TierMap &tiers) {
    std::vector<std::string> order;
    order.reserve(levels.size());
    for (const auto &[id, level] : levels) {
        order.push_back(id);
    }

    std::sort(order.begin(), order.end(), [&levels, &tiers](const std::string &a, const std::string &b) {
        const std::size_t level_a = levels.at(a);
        const std::size_t level_b = levels.at(b);
        const PositionTier tier_a = tier_of(tiers, a);
        const PositionTier tier_b = tier_of(tiers, b);
        return std::tie(level_a, tier_a, a) < std::tie(level_b, tier_b, b);
    });
    return order;
}

IdIndex assign_columns(
        const std::vector<std::string> &order,
        const IdIndex &levels,
        const std::span<const graph::Edge> edges,
        const TierMap &tiers) {
    utils::IdMap<std::vector<std::string>> predecessors;
    for (const auto &edge : edges) {
        predecessors[edge.to].push_back(edge.from);
    }

    std::vector<std::vector<std::string>> by_level;
    for (const auto &id : order) {
        const std::size_t level = levels.at(id);
        if (by_level.size() <= level) {
            by_level.resize(level + 1);
        }
        by_level[level].push_back(id);
    }

    IdIndex columns;
    for (std::size_t level = 0; level < by_level.size(); ++level) {
        if (level == 0) {
            for (std::size_t col = 0; col < by_level[0].size(); ++col) {
                columns.emplace(by_level[0][col], col);
            }
            continue;
        }

        struct Request final {
            std::size_t preferred{};
            PositionTier tier{PositionTier::Ordinary};
            std::string id;
        };

        std::vector<Request> requests;
        for (const auto &id : by_level[level]) {
            std::size_t preferred = std::numeric_limits<std::size_t>::max();
            if (const auto it = predecessors.find(id); it != predecessors.end()) {
                for (const auto &pred : it->second) {
                    if (const auto col = columns.find(pred); col != columns.end()) {
                        preferred = std::min(preferred, col->second);
                    }
                }
            }
            if (preferred == std::numeric_limits<std::size_t>::max()) {
                preferred = 0;
            }
            requests.push_back(Request{preferred, tier_of(tiers, id), id});
        }

        std::sort(requests.begin(), requests.end(), [](const Request &a, const Request &b) {
            return std::tie(a.preferred, a.tier, a.id) < std::tie(b.preferred, b.tier, b.id);
        });

        std::set<std::size_t> used;
        for (const auto &request : requests) {
            std::size_t col = request.preferred;
            while (used.contains(col)) {
                ++col;
            }
            used.insert(col);
            columns.emplace(request.id, col);
        }
    }
    return columns;
}

Layout compute_layout(
        const graph::TaskGraph &graph,
        const std::span<const std::string> ids,
        const graph::EffectivePriorities &priorities) {
    Layout layout{};
    if (ids.empty()) {
        return layout;
    }

    const utils::IdSet members(ids.begin(), ids.end());
    std::vector<graph::Edge> edges;
    for (const auto &edge : graph.edges()) {
        if (members.contains(edge.from) && members.contains(edge.to)) {
            edges.push_back(edge);
        }
    }

    layout.edges = graph::transitive_reduction(ids, edges);
    layout.levels = assign_levels(ids, layout.edges);

    TierMap tiers;
    for (const auto &id : ids) {
        tiers.emplace(id, position_tier(graph.at(id), priorities));
    }

    layout.order = position_tasks(layout.levels, tiers);
    layout.columns = assign_columns(layout.order, layout.levels, layout.edges, tiers);

    MONT_LOGC_DEBUG(
            DisplayLog::Layout,
            "Laid out {} tasks with {} edges ({} before reduction)",
            layout.order.size(),
            layout.edges.size(),
            edges.size());
    return layout;
}

Grid build_grid(const Layout &layout) {
    std::size_t width = 0;
    for (const auto &[id, col] : layout.columns) {
        width = std::max(width, col + 1);
    }

    Grid grid(layout.order.size(), width);
    for (std::size_t row = 0; row < layout.order.size(); ++row) {
        const auto &id = layout.order[row];
        grid.set(row, layout.columns.at(id), TaskCell{id});
    }
    return grid;
}

} // namespace mont::display

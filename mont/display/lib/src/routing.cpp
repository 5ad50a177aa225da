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
 * @file routing.cpp
 * @brief Edge routing and row pruning
 */

#include <algorithm>
#include <cstddef>
#include <set>
#include <utility>
#include <variant>
#include <vector>

#include "display/display_log.hpp"
#include "display/grid.hpp"
#include "display/layout.hpp"
#include "display/routing.hpp"
#include "log/log_macros.hpp"
#include "utils/string_hash.hpp"

namespace mont::display {

namespace {

using Point = std::pair<std::size_t, std::size_t>; //!< (row, column)

/**
 * Append unit steps from the path's last point to the target point
 *
 * Moves along a single axis; callers only request straight segments.
 */
void walk_to(std::vector<Point> &path, const Point target) {
    while (path.back() != target) {
        auto [row, col] = path.back();
        if (row < target.first) {
            ++row;
        } else if (row > target.first) {
            --row;
        } else if (col < target.second) {
            ++col;
        } else {
            --col;
        }
        path.emplace_back(row, col);
    }
}

/**
 * Set matching flags on both cells of every step along the path
 */
void draw_path(Grid &grid, const std::vector<Point> &path) {
    for (std::size_t i = 1; i < path.size(); ++i) {
        const auto [r0, c0] = path[i - 1];
        const auto [r1, c1] = path[i];
        if (r1 > r0) {
            grid.set_connection_flag(r0, c0, Direction::Down);
            grid.set_connection_flag(r1, c1, Direction::Up);
        } else if (c1 > c0) {
            grid.set_connection_flag(r0, c0, Direction::Right);
            grid.set_connection_flag(r1, c1, Direction::Left);
        } else if (c1 < c0) {
            grid.set_connection_flag(r0, c0, Direction::Left);
            grid.set_connection_flag(r1, c1, Direction::Right);
        }
    }
}

} // anonymous namespace

std::size_t choose_lane(const std::size_t target_col, const std::set<std::size_t> &occupied) {
    if (!occupied.contains(target_col)) {
        return target_col;
    }
    for (std::size_t distance = 1;; ++distance) {
        if (!occupied.contains(target_col + distance)) {
            return target_col + distance;
        }
        if (distance <= target_col && !occupied.contains(target_col - distance)) {
            return target_col - distance;
        }
    }
}

Grid route_edges(const Grid &grid, const Layout &layout) {
    if (grid.empty()) {
        return grid;
    }

    Grid routed(grid.height() * 2 - 1, grid.width());
    for (std::size_t row = 0; row < grid.height(); ++row) {
        for (std::size_t col = 0; col < grid.width(); ++col) {
            routed.set(row * 2, col, grid.at(row, col));
        }
    }

    utils::IdMap<std::size_t> row_of;
    for (std::size_t row = 0; row < layout.order.size(); ++row) {
        row_of.emplace(layout.order[row], row);
    }

    for (const auto &edge : layout.edges) {
        const auto from_it = row_of.find(edge.from);
        const auto to_it = row_of.find(edge.to);
        if (from_it == row_of.end() || to_it == row_of.end()) {
            continue;
        }

        const std::size_t from_row = from_it->second;
        const std::size_t to_row = to_it->second;
        if (from_row >= to_row) {
            MONT_LOGC_WARN(
                    DisplayLog::Routing, "Skipping upward edge {} -> {}", edge.from, edge.to);
            continue;
        }

        const std::size_t from_col = layout.columns.at(edge.from);
        const std::size_t to_col = layout.columns.at(edge.to);

        std::set<std::size_t> occupied;
        for (std::size_t row = from_row + 1; row < to_row; ++row) {
            occupied.insert(layout.columns.at(layout.order[row]));
        }
        const std::size_t lane = choose_lane(to_col, occupied);
        if (lane != to_col) {
            MONT_LOGC_DEBUG(
                    DisplayLog::Routing,
                    "Edge {} -> {} detours through column {}",
                    edge.from,
                    edge.to,
                    lane);
        }

        const std::size_t first_turn = from_row * 2 + 1;
        const std::size_t last_turn = to_row * 2 - 1;

        std::vector<Point> path{{from_row * 2, from_col}};
        walk_to(path, {first_turn, from_col});
        walk_to(path, {first_turn, lane});
        walk_to(path, {last_turn, lane});
        walk_to(path, {last_turn, to_col});
        walk_to(path, {to_row * 2, to_col});
        draw_path(routed, path);
    }
    return routed;
}

Grid prune_rows(const Grid &grid) {
    Grid pruned{};
    for (std::size_t row = 0; row < grid.height(); ++row) {
        const auto &cells = grid.row(row);
        const bool redundant = std::all_of(cells.begin(), cells.end(), [](const Cell &cell) {
            if (std::holds_alternative<EmptyCell>(cell)) {
                return true;
            }
            const auto *connection = std::get_if<ConnectionCell>(&cell);
            return connection != nullptr && connection->is_vertical();
        });
        if (!redundant) {
            pruned.append_row(cells);
        }
    }
    return pruned;
}

} // namespace mont::display

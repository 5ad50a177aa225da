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
 * @file routing.hpp
 * @brief Edge routing between task rows of a laid-out grid
 */

#ifndef MONT_DISPLAY_ROUTING_HPP
#define MONT_DISPLAY_ROUTING_HPP

#include <cstddef>
#include <set>

#include "display/grid.hpp"
#include "display/layout.hpp"

namespace mont::display {

/**
 * Draw every layout edge as connection cells
 *
 * The result interleaves a connection row between consecutive task rows,
 * so task row r of the input becomes row 2r. An edge leaves its source
 * downward, turns in the connection row below the source towards its lane,
 * runs down the lane and turns again in the connection row above the target.
 * The lane is the target's column unless a task in an intermediate task row
 * sits there; then the nearest free column is used, preferring the right.
 *
 * @param[in] grid Grid from build_grid()
 * @param[in] layout Layout the grid was built from
 * @return Routed grid
 */
[[nodiscard]] Grid route_edges(const Grid &grid, const Layout &layout);

/**
 * Choose the column an edge runs down
 *
 * @param[in] target_col Column of the edge's target
 * @param[in] occupied Columns holding tasks in the rows the edge passes
 * @return target_col if free, else the nearest free column (right first)
 */
[[nodiscard]] std::size_t choose_lane(std::size_t target_col, const std::set<std::size_t> &occupied);

/**
 * Remove connection rows that only continue vertical lines
 *
 * Rows without task cells whose cells are all empty or plain vertical
 * segments carry no information and are dropped.
 *
 * @param[in] grid Routed grid
 * @return Grid without redundant rows
 */
[[nodiscard]] Grid prune_rows(const Grid &grid);

} // namespace mont::display

#endif // MONT_DISPLAY_ROUTING_HPP

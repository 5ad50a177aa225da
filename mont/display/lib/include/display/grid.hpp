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
 * @file grid.hpp
 * @brief Cell grid used to lay out and route the DAG diagram
 */

#ifndef MONT_DISPLAY_GRID_HPP
#define MONT_DISPLAY_GRID_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace mont::display {

/**
 * Cell with nothing drawn in it
 */
struct EmptyCell final {
    bool operator==(const EmptyCell &) const = default;
};

/**
 * Cell holding a task node
 */
struct TaskCell final {
    std::string id; //!< Task id

    bool operator==(const TaskCell &) const = default;
};

/**
 * Line segment cell, described by the sides it connects to
 */
struct ConnectionCell final {
    bool up{};    //!< Connects to the cell above
    bool down{};  //!< Connects to the cell below
    bool left{};  //!< Connects to the cell on the left
    bool right{}; //!< Connects to the cell on the right

    bool operator==(const ConnectionCell &) const = default;

    /**
     * @return true for a plain vertical segment
     */
    [[nodiscard]] bool is_vertical() const noexcept { return up && down && !left && !right; }
};

using Cell = std::variant<EmptyCell, TaskCell, ConnectionCell>;

/**
 * Side of a cell
 */
enum class Direction : std::uint8_t { Up, Down, Left, Right };

/**
 * Rectangular grid of cells, addressed as (row, column)
 */
class Grid final {
public:
    Grid() = default;

    /**
     * Create a grid filled with empty cells
     *
     * @param[in] rows Row count
     * @param[in] cols Column count
     */
    Grid(std::size_t rows, std::size_t cols);

    [[nodiscard]] std::size_t height() const noexcept { return rows_.size(); }
    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    /**
     * Grow the grid to at least the given size, padding with empty cells
     *
     * @param[in] rows Minimum row count
     * @param[in] cols Minimum column count
     */
    void ensure_size(std::size_t rows, std::size_t cols);

    /**
     * @param[in] row Row index
     * @param[in] col Column index
     * @return The cell
     * @throws std::out_of_range outside the grid
     */
    [[nodiscard]] const Cell &at(std::size_t row, std::size_t col) const;

    /**
     * Replace a cell, growing the grid when needed
     *
     * @param[in] row Row index
     * @param[in] col Column index
     * @param[in] cell New cell
     */
    void set(std::size_t row, std::size_t col, Cell cell);

    /**
     * Add a connection side to a cell
     *
     * Empty cells become connection cells. Task cells are never modified.
     *
     * @param[in] row Row index
     * @param[in] col Column index
     * @param[in] direction Side to connect
     */
    void set_connection_flag(std::size_t row, std::size_t col, Direction direction);

    /**
     * @param[in] row Row index
     * @return Cells of the row
     * @throws std::out_of_range outside the grid
     */
    [[nodiscard]] const std::vector<Cell> &row(std::size_t row) const;

    /**
     * Append a row, padding it (or every other row) to a common width
     *
     * @param[in] cells Row cells
     */
    void append_row(std::vector<Cell> cells);

private:
    std::vector<std::vector<Cell>> rows_;
    std::size_t width_{};
};

/**
 * One character per cell: first letter of task ids, '.' for empty cells,
 * box drawing characters for connections
 *
 * @param[in] grid Grid to draw
 * @return Multi-line text, one line per row
 */
[[nodiscard]] std::string debug_render(const Grid &grid);

} // namespace mont::display

#endif // MONT_DISPLAY_GRID_HPP

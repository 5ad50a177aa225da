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
 * @file grid.cpp
 * @brief Grid storage and connection flag updates
 */

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "display/grid.hpp"
#include "display/symbols.hpp"

namespace mont::display {

Grid::Grid(const std::size_t rows, const std::size_t cols)
        : rows_(rows, std::vector<Cell>(cols, EmptyCell{})), width_{cols} {}

void Grid::ensure_size(const std::size_t rows, const std::size_t cols) {
    if (rows_.size() < rows) {
        rows_.resize(rows, std::vector<Cell>(width_, EmptyCell{}));
    }
    width_ = std::max(width_, cols);
    for (auto &cells : rows_) {
        cells.resize(width_, EmptyCell{});
    }
}

const Cell &Grid::at(const std::size_t row, const std::size_t col) const {
    return rows_.at(row).at(col);
}

void Grid::set(const std::size_t row, const std::size_t col, Cell cell) {
    ensure_size(row + 1, col + 1);
    rows_[row][col] = std::move(cell);
}

void Grid::set_connection_flag(const std::size_t row, const std::size_t col, const Direction direction) {
    ensure_size(row + 1, col + 1);
    Cell &cell = rows_[row][col];
    if (std::holds_alternative<TaskCell>(cell)) {
        return;
    }
    if (std::holds_alternative<EmptyCell>(cell)) {
        cell = ConnectionCell{};
    }

    auto &connection = std::get<ConnectionCell>(cell);
    switch (direction) {
    case Direction::Up:
        connection.up = true;
        break;
    case Direction::Down:
        connection.down = true;
        break;
    case Direction::Left:
        connection.left = true;
        break;
    case Direction::Right:
        connection.right = true;
        break;
    }
}

const std::vector<Cell> &Grid::row(const std::size_t row) const { return rows_.at(row); }

void Grid::append_row(std::vector<Cell> cells) {
    width_ = std::max(width_, cells.size());
    rows_.push_back(std::move(cells));
    for (auto &existing : rows_) {
        existing.resize(width_, EmptyCell{});
    }
}

std::string debug_render(const Grid &grid) {
    std::string text;
    for (std::size_t r = 0; r < grid.height(); ++r) {
        for (const auto &cell : grid.row(r)) {
            if (const auto *task = std::get_if<TaskCell>(&cell)) {
                text += task->id.empty() ? '?' : task->id.front();
            } else if (const auto *connection = std::get_if<ConnectionCell>(&cell)) {
                // First code point of the two-column glyph
                const auto glyph = connection_glyph(*connection);
                const auto lead = static_cast<unsigned char>(glyph.front());
                const std::size_t length = lead < 0x80U ? 1 : (lead < 0xE0U ? 2 : (lead < 0xF0U ? 3 : 4));
                text += glyph.substr(0, length);
            } else {
                text += '.';
            }
        }
        text += '\n';
    }
    return text;
}

} // namespace mont::display

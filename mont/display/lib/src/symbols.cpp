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
 * @file symbols.cpp
 * @brief Connection glyph lookup
 */

#include <array>
#include <cstddef>
#include <string_view>

#include "display/grid.hpp"
#include "display/symbols.hpp"

namespace mont::display {

namespace {

// Indexed by up | down << 1 | left << 2 | right << 3
constexpr std::array<std::string_view, 16> GLYPHS{
        "  ", // none
        "╵ ", // up
        "╷ ", // down
        "│ ", // up down
        "╴ ", // left
        "╯ ", // up left
        "╮ ", // down left
        "┤ ", // up down left
        "╶─", // right
        "╰─", // up right
        "╭─", // down right
        "├─", // up down right
        "──", // left right
        "┴─", // up left right
        "┬─", // down left right
        "┼─", // all
};

} // anonymous namespace

std::string_view connection_glyph(const ConnectionCell &cell) noexcept {
    const std::size_t index = (cell.up ? 1U : 0U) | (cell.down ? 2U : 0U) |
                              (cell.left ? 4U : 0U) | (cell.right ? 8U : 0U);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
    return GLYPHS[index];
}

} // namespace mont::display

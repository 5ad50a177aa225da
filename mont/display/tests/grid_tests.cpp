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
 * @file grid_tests.cpp
 * @brief Unit tests for grid cells, connection flags and glyph lookup
 */

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "display/grid.hpp"
#include "display/symbols.hpp"

namespace {

namespace md = ::mont::display;

md::ConnectionCell from_index(const std::size_t index) {
    return md::ConnectionCell{
            (index & 1U) != 0, (index & 2U) != 0, (index & 4U) != 0, (index & 8U) != 0};
}

TEST(Symbols, EveryFlagCombinationHasAGlyph) {
    constexpr std::array<std::string_view, 16> expected{
            "  ", "╵ ", "╷ ", "│ ", "╴ ", "╯ ", "╮ ", "┤ ",
            "╶─", "╰─", "╭─", "├─", "──", "┴─", "┬─", "┼─"};
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(md::connection_glyph(from_index(i)), expected[i]) << "index " << i;
    }
}

TEST(Grid, StartsEmptyAndGrowsOnSet) {
    md::Grid grid(1, 1);
    EXPECT_EQ(grid.height(), 1U);
    EXPECT_EQ(grid.width(), 1U);
    EXPECT_TRUE(std::holds_alternative<md::EmptyCell>(grid.at(0, 0)));

    grid.set(2, 3, md::TaskCell{"a"});
    EXPECT_EQ(grid.height(), 3U);
    EXPECT_EQ(grid.width(), 4U);
    EXPECT_EQ(grid.row(0).size(), 4U);
    EXPECT_EQ(grid.at(2, 3), md::Cell{md::TaskCell{"a"}});
}

TEST(Grid, AtOutsideThrows) {
    const md::Grid grid(2, 2);
    EXPECT_THROW(std::ignore = grid.at(2, 0), std::out_of_range);
    EXPECT_THROW(std::ignore = grid.at(0, 2), std::out_of_range);
}

TEST(Grid, ConnectionFlagsAccumulate) {
    md::Grid grid(1, 1);
    grid.set_connection_flag(0, 0, md::Direction::Up);
    grid.set_connection_flag(0, 0, md::Direction::Right);

    const auto *connection = std::get_if<md::ConnectionCell>(&grid.at(0, 0));
    ASSERT_NE(connection, nullptr);
    EXPECT_EQ(*connection, (md::ConnectionCell{true, false, false, true}));
    EXPECT_FALSE(connection->is_vertical());
}

TEST(Grid, ConnectionFlagsNeverTouchTasks) {
    md::Grid grid(1, 1);
    grid.set(0, 0, md::TaskCell{"a"});
    grid.set_connection_flag(0, 0, md::Direction::Down);
    EXPECT_EQ(grid.at(0, 0), md::Cell{md::TaskCell{"a"}});
}

TEST(Grid, AppendRowPadsToCommonWidth) {
    md::Grid grid{};
    grid.append_row({md::EmptyCell{}});
    grid.append_row({md::EmptyCell{}, md::EmptyCell{}, md::TaskCell{"b"}});
    EXPECT_EQ(grid.width(), 3U);
    EXPECT_EQ(grid.row(0).size(), 3U);
    EXPECT_EQ(md::debug_render(grid), "...\n..b\n");
}

TEST(Grid, DebugRenderShowsGlyphHeads) {
    md::Grid grid(2, 2);
    grid.set(0, 0, md::TaskCell{"root"});
    grid.set_connection_flag(1, 0, md::Direction::Up);
    grid.set_connection_flag(1, 0, md::Direction::Right);
    grid.set_connection_flag(1, 1, md::Direction::Left);
    EXPECT_EQ(md::debug_render(grid), "r.\n╰╴\n");
}

} // namespace

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
 * @file symbols.hpp
 * @brief Glyph table for connection cells
 */

#ifndef MONT_DISPLAY_SYMBOLS_HPP
#define MONT_DISPLAY_SYMBOLS_HPP

#include <string_view>

#include "display/grid.hpp"

namespace mont::display {

/**
 * Two-column glyph for a connection cell
 *
 * Every one of the 16 flag combinations maps to a fixed glyph: bars, rounded
 * corners, tees, a cross, half-lines for dangling ends, and blank for a
 * cell with no sides. Glyphs that continue to the right fill the second
 * column with a horizontal bar.
 *
 * @param[in] cell Connection cell
 * @return UTF-8 glyph two terminal columns wide
 */
[[nodiscard]] std::string_view connection_glyph(const ConnectionCell &cell) noexcept;

} // namespace mont::display

#endif // MONT_DISPLAY_SYMBOLS_HPP

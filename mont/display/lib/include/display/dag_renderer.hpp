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
 * @file dag_renderer.hpp
 * @brief Terminal rendering of a task graph as a sectioned DAG diagram
 */

#ifndef MONT_DISPLAY_DAG_RENDERER_HPP
#define MONT_DISPLAY_DAG_RENDERER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <NamedType/named_type.hpp>
#include <wise_enum.h>

#include "display/grid.hpp"
#include "graph/priority.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"

namespace mont::display {

using ShowCompleted = fluent::NamedType<bool, struct ShowCompletedTag>; //!< Include completed section
using UseColor = fluent::NamedType<bool, struct UseColorTag>;           //!< Emit ANSI styling

inline constexpr std::size_t MAX_TITLE_LEN = 60; //!< Longest title shown, in code points

/**
 * Visual state of a task line, decides marker and colour
 */
enum class LineTone : std::uint8_t {
    Validator,  //!< ◈ magenta
    Complete,   //!< ● bright black
    InProgress, //!< ◐ yellow (active or awaiting gates)
    Jot,        //!< ◇ yellow
    Ready,      //!< ◉ bright green
    Urgent,     //!< ◉ red, ready with positive effective priority
    Waiting     //!< ○ bright black, blocked or not started
};

} // namespace mont::display

WISE_ENUM_ADAPT(
        mont::display::LineTone, Validator, Complete, InProgress, Jot, Ready, Urgent, Waiting)

namespace mont::display {

/**
 * Shorten a title to MAX_TITLE_LEN code points
 *
 * Longer titles keep MAX_TITLE_LEN - 1 code points followed directly by "…".
 *
 * @param[in] title UTF-8 title
 * @return Title that fits
 */
[[nodiscard]] std::string truncate_title(std::string_view title);

/**
 * @param[in] tone Line tone
 * @return Marker glyph for the tone
 */
[[nodiscard]] std::string_view tone_marker(LineTone tone) noexcept;

/**
 * Renders one graph snapshot
 *
 * Output sections, separated by a blank line: active tasks, jots,
 * validators, and completed tasks when requested. Each section is split
 * into connected components drawn one after another.
 *
 * The renderer keeps a reference to the graph; the graph must outlive it.
 */
class DagRenderer final {
public:
    explicit DagRenderer(const graph::TaskGraph &graph);

    /**
     * Render the whole graph
     *
     * @param[in] show_completed Include the completed section
     * @param[in] use_color Emit ANSI styling
     * @return Diagram text, empty for an empty graph
     */
    [[nodiscard]] std::string render(ShowCompleted show_completed, UseColor use_color) const;

    /**
     * Render a set of tasks as one or more components, drawing only edges among them
     *
     * @param[in] ids Tasks to draw
     * @param[in] use_color Emit ANSI styling
     * @return Diagram lines
     */
    [[nodiscard]] std::string render_section(std::span<const std::string> ids, UseColor use_color) const;

    /**
     * Marker, id, title and kind suffix of a task without any graph prefix
     *
     * @param[in] id Task id
     * @param[in] use_color Emit ANSI styling
     * @return Single line without trailing newline
     * @throws std::out_of_range for unknown ids
     */
    [[nodiscard]] std::string task_line(std::string_view id, UseColor use_color) const;

    /**
     * @param[in] task Task to classify
     * @return Tone used for the task's marker and text
     */
    [[nodiscard]] LineTone tone_of(const graph::Task &task) const;

private:
    [[nodiscard]] std::string render_grid(const Grid &grid, UseColor use_color) const;
    [[nodiscard]] std::string label(const graph::Task &task, UseColor use_color) const;
    [[nodiscard]] std::string marker(const graph::Task &task, UseColor use_color) const;

    const graph::TaskGraph &graph_;
    graph::EffectivePriorities priorities_;
};

} // namespace mont::display

#endif // MONT_DISPLAY_DAG_RENDERER_HPP

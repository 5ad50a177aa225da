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
 * @file dag_renderer.cpp
 * @brief Section split, per-component pipeline and line formatting
 */

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/color.h>
#include <fmt/format.h>

#include "display/dag_renderer.hpp"
#include "display/display_log.hpp"
#include "display/grid.hpp"
#include "display/layout.hpp"
#include "display/routing.hpp"
#include "display/symbols.hpp"
#include "graph/graph_algorithms.hpp"
#include "graph/readiness.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"

namespace mont::display {

namespace {

fmt::text_style tone_style(const LineTone tone) {
    switch (tone) {
    case LineTone::Validator:
        return fmt::fg(fmt::terminal_color::magenta);
    case LineTone::InProgress:
    case LineTone::Jot:
        return fmt::fg(fmt::terminal_color::yellow);
    case LineTone::Ready:
        return fmt::fg(fmt::terminal_color::bright_green);
    case LineTone::Urgent:
        return fmt::fg(fmt::terminal_color::red);
    case LineTone::Complete:
    case LineTone::Waiting:
        return fmt::fg(fmt::terminal_color::bright_black);
    }
    return {};
}

std::string paint(const std::string_view text, const fmt::text_style style, const UseColor use_color) {
    if (!use_color.get() || text.empty()) {
        return std::string{text};
    }
    return fmt::format(style, "{}", text);
}

bool is_continuation_byte(const char c) noexcept {
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

void trim_trailing_spaces(std::string &line) {
    const auto end = line.find_last_not_of(' ');
    line.erase(end == std::string::npos ? 0 : end + 1);
}

} // anonymous namespace

std::string truncate_title(const std::string_view title) {
    std::size_t code_points = 0;
    std::size_t cut = title.size();
    for (std::size_t i = 0; i < title.size(); ++i) {
        if (is_continuation_byte(title[i])) {
            continue;
        }
        if (code_points == MAX_TITLE_LEN - 1) {
            cut = i;
        }
        ++code_points;
    }

    if (code_points <= MAX_TITLE_LEN) {
        return std::string{title};
    }
    return std::string{title.substr(0, cut)} + "…";
}

std::string_view tone_marker(const LineTone tone) noexcept {
    switch (tone) {
    case LineTone::Validator:
        return "◈";
    case LineTone::Complete:
        return "●";
    case LineTone::InProgress:
        return "◐";
    case LineTone::Jot:
        return "◇";
    case LineTone::Ready:
    case LineTone::Urgent:
        return "◉";
    case LineTone::Waiting:
        return "○";
    }
    return "○";
}

DagRenderer::DagRenderer(const graph::TaskGraph &graph) : graph_{graph}, priorities_{graph} {}

LineTone DagRenderer::tone_of(const graph::Task &task) const {
    if (graph::is_validator(task)) {
        return LineTone::Validator;
    }
    if (task.complete) {
        return LineTone::Complete;
    }
    if (task.work_state != graph::WorkState::Idle) {
        return LineTone::InProgress;
    }
    if (graph::is_jot(task)) {
        return LineTone::Jot;
    }
    if (graph::status_of(graph_, task.id).kind == graph::StatusKind::Ready) {
        return priorities_.is_urgent(task.id) ? LineTone::Urgent : LineTone::Ready;
    }
    return LineTone::Waiting;
}

std::string DagRenderer::marker(const graph::Task &task, const UseColor use_color) const {
    const LineTone tone = tone_of(task);
    return paint(tone_marker(tone), tone_style(tone), use_color);
}

std::string DagRenderer::label(const graph::Task &task, const UseColor use_color) const {
    const auto style = tone_style(tone_of(task));
    std::string text = paint(task.id, style | fmt::emphasis::bold, use_color);

    if (!task.title.empty()) {
        text += ' ';
        text += paint(truncate_title(task.title), style, use_color);
    }

    switch (task.kind) {
    case graph::TaskKind::Jot:
        text += ' ';
        text += paint("[jot]", style, use_color);
        break;
    case graph::TaskKind::Validator:
        text += ' ';
        text += paint("[validator]", style, use_color);
        break;
    case graph::TaskKind::Task:
        break;
    }
    return text;
}

std::string DagRenderer::task_line(const std::string_view id, const UseColor use_color) const {
    const auto &task = graph_.at(id);
    return marker(task, use_color) + " " + label(task, use_color);
}

std::string DagRenderer::render_grid(const Grid &grid, const UseColor use_color) const {
    std::string text;
    for (std::size_t r = 0; r < grid.height(); ++r) {
        const auto &cells = grid.row(r);

        std::size_t used = 0;
        for (std::size_t c = 0; c < cells.size(); ++c) {
            if (!std::holds_alternative<EmptyCell>(cells[c])) {
                used = c + 1;
            }
        }

        std::string line;
        const graph::Task *task = nullptr;
        for (std::size_t c = 0; c < used; ++c) {
            const Cell &cell = cells[c];
            if (const auto *task_cell = std::get_if<TaskCell>(&cell)) {
                task = &graph_.at(task_cell->id);
                line += marker(*task, use_color);
                line += ' ';
            } else if (const auto *connection = std::get_if<ConnectionCell>(&cell)) {
                line += connection_glyph(*connection);
            } else {
                line += "  ";
            }
        }

        if (task != nullptr) {
            line += label(*task, use_color);
        } else {
            trim_trailing_spaces(line);
        }
        text += line;
        text += '\n';
    }
    return text;
}

std::string
DagRenderer::render_section(const std::span<const std::string> ids, const UseColor use_color) const {
    std::string text;
    for (const auto &component : graph::connected_components(ids, graph_.edges())) {
        const Layout layout = compute_layout(graph_, component, priorities_);
        const Grid routed = prune_rows(route_edges(build_grid(layout), layout));
        MONT_LOGC_TRACE_L1(
                DisplayLog::Render, "Component of {} tasks:\n{}", component.size(), debug_render(routed));
        text += render_grid(routed, use_color);
    }
    return text;
}

std::string DagRenderer::render(const ShowCompleted show_completed, const UseColor use_color) const {
    std::vector<std::string> active;
    std::vector<std::string> jots;
    std::vector<std::string> validators;
    std::vector<std::string> completed;

    for (const auto &[id, task] : graph_.tasks()) {
        switch (task.kind) {
        case graph::TaskKind::Jot:
            jots.push_back(id);
            break;
        case graph::TaskKind::Validator:
            validators.push_back(id);
            break;
        case graph::TaskKind::Task:
            // A finished part of an unfinished group stays beside its group
            (graph::is_group_complete(graph_, id) ? completed : active).push_back(id);
            break;
        }
    }

    std::vector<const std::vector<std::string> *> sections{&active, &jots, &validators};
    if (show_completed.get()) {
        sections.push_back(&completed);
    }

    std::string text;
    for (const auto *section : sections) {
        if (section->empty()) {
            continue;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += render_section(*section, use_color);
    }

    MONT_LOGC_DEBUG(
            DisplayLog::Render,
            "Rendered {} active, {} jots, {} validators, {} completed{}",
            active.size(),
            jots.size(),
            validators.size(),
            completed.size(),
            show_completed.get() ? "" : " (hidden)");
    return text;
}

} // namespace mont::display

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
 * @file commands.hpp
 * @brief Operations behind every mont subcommand
 */

#ifndef MONT_APP_COMMANDS_HPP
#define MONT_APP_COMMANDS_HPP

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "app/picker.hpp"
#include "display/dag_renderer.hpp"
#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "store/task_store.hpp"

namespace mont::app {

/**
 * Collaborators shared by all commands
 *
 * Commands read a fresh snapshot from the store, write human readable output
 * to `out` and resolve "?" ids through the picker.
 */
struct CommandContext final {
    store::TaskStore &store;                   //!< Record access
    IPicker &picker;                           //!< Resolves "?" arguments
    std::ostream &out;                         //!< Command output
    display::UseColor use_color{false};        //!< Emit ANSI styling
};

using CommandResult = tl::expected<void, graph::Violation>;

/**
 * Fields of a task created from the command line
 */
struct NewTaskArgs final {
    std::string id;                           //!< Required, mont does not generate ids
    std::string title;                        //!< Optional title
    std::string description;                  //!< Optional markdown body
    graph::TaskKind kind{graph::TaskKind::Task};
    std::vector<std::string> before;          //!< Tasks blocked by the new one
    std::vector<std::string> after;           //!< Tasks the new one depends on
    std::vector<std::string> validations;     //!< Validators to satisfy
    std::int64_t priority{0};
};

/**
 * Create the tasks directory and a default config file
 *
 * Runs without a store; existing files are left untouched.
 *
 * @param[in] out Command output
 * @param[in] tasks_dir Directory holding the task records
 * @param[in] config_path Config file to create when missing
 */
[[nodiscard]] CommandResult
init(std::ostream &out, const std::filesystem::path &tasks_dir, const std::filesystem::path &config_path);

/**
 * Add a task record, validated against the rest of the graph before it is written
 */
[[nodiscard]] CommandResult new_task(CommandContext &ctx, NewTaskArgs args);

/**
 * Validate the graph and print its topological order
 */
[[nodiscard]] CommandResult build_graph(CommandContext &ctx);

/**
 * Draw the graph
 *
 * @param[in] ctx Command context
 * @param[in] show_completed Include the completed section
 */
[[nodiscard]] CommandResult list_tasks(CommandContext &ctx, display::ShowCompleted show_completed);

/**
 * Print ready tasks, most urgent first
 */
[[nodiscard]] CommandResult ready(CommandContext &ctx);

/**
 * Summarise current work: tasks in progress with their gates, the tasks
 * waiting directly on them, and counts per state
 */
[[nodiscard]] CommandResult status(CommandContext &ctx);

/**
 * Print every field of one task together with its derived status
 *
 * @param[in] ctx Command context
 * @param[in] id Task id or "?"
 */
[[nodiscard]] CommandResult show(CommandContext &ctx, std::string_view id);

/**
 * Validate the whole graph, optionally confirming one task exists
 *
 * @param[in] ctx Command context
 * @param[in] id Task id, "?" or std::nullopt for the whole graph
 */
[[nodiscard]] CommandResult check(CommandContext &ctx, std::optional<std::string_view> id);

/**
 * Open a work session on a task
 */
[[nodiscard]] CommandResult start(CommandContext &ctx, std::string_view id);

/**
 * Close the work session of a task without completing it
 */
[[nodiscard]] CommandResult stop(CommandContext &ctx, std::string_view id);

/**
 * Mark gates of a task as passed
 *
 * All gates are applied to the task before anything is written; one unknown
 * gate leaves the task unchanged.
 *
 * @param[in] ctx Command context
 * @param[in] id Task id or "?"
 * @param[in] gates Gate names, each may be "?"
 */
[[nodiscard]] CommandResult unlock(CommandContext &ctx, std::string_view id, std::span<const std::string> gates);

/**
 * Reset passed gates of a task to pending
 */
[[nodiscard]] CommandResult lock(CommandContext &ctx, std::string_view id, std::span<const std::string> gates);

/**
 * Finish the work session of a task and complete it
 *
 * When gates are still pending the task is left awaiting gates and the
 * GatesPending violation lists the blocking gates.
 */
[[nodiscard]] CommandResult complete(CommandContext &ctx, std::string_view id);

/**
 * Delete a task and every reference to it
 */
[[nodiscard]] CommandResult delete_task(CommandContext &ctx, std::string_view id);

/**
 * Replace a jot with the task records read from a file
 *
 * @param[in] ctx Command context
 * @param[in] id Jot id or "?"
 * @param[in] source File holding one or more '---' delimited records
 */
[[nodiscard]] CommandResult distill(CommandContext &ctx, std::string_view id, const std::filesystem::path &source);

} // namespace mont::app

#endif // MONT_APP_COMMANDS_HPP

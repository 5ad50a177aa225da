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
 * @file mont.cpp
 * @brief mont command line entry point
 */

#include <cstdlib>    // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception>  // for exception
#include <filesystem> // for path
#include <format>     // for format
#include <iostream>   // for cout, cerr, cin
#include <map>        // for map
#include <optional>   // for nullopt
#include <stdexcept>  // for logic_error
#include <string>     // for string
#include <utility>    // for move
#include <vector>     // for vector

#include <tl/expected.hpp> // for expected, unexpected
#include <unistd.h>        // for isatty, STDOUT_FILENO, STDERR_FILENO

#include <CLI/CLI.hpp> // for App, CheckedTransformer, ParseError

#include "app/app_log.hpp"              // for AppLog
#include "app/commands.hpp"             // for CommandContext, CommandResult
#include "app/error_report.hpp"         // for make_report, print_report
#include "app/picker.hpp"               // for StdinPicker
#include "display/dag_renderer.hpp"     // for ShowCompleted, UseColor
#include "display/display_log.hpp"      // for DisplayLog
#include "graph/task.hpp"               // for TaskKind
#include "graph/graph_log.hpp"          // for GraphLog
#include "internal_use_only/config.hpp" // for project_name, project_version
#include "log/components.hpp"           // for register_component
#include "log/log_macros.hpp"           // for MONT_LOGC_DEBUG
#include "log/logger.hpp"               // for Logger, LoggerConfig, LogLevel
#include "store/record_backend.hpp"     // for DirectoryBackend
#include "store/settings.hpp"           // for load_config, CONFIG_FILE_NAME
#include "store/store_log.hpp"          // for StoreLog
#include "store/task_store.hpp"         // for TaskStore

namespace {

namespace ma = mont::app;
namespace ml = mont::log;
namespace fs = std::filesystem;

enum class ColorMode { Auto, Always, Never };

/**
 * Global options
 */
struct CliOptions final {
    std::string tasks_dir{".tasks"};
    std::string config_path;
    ml::LogLevel log_level{ml::LogLevel::Warn};
    std::string log_file;
    ColorMode color{ColorMode::Auto};
};

/**
 * Subcommand arguments, only the fields of the chosen subcommand are set
 */
struct CommandArgs final {
    std::string id;
    std::vector<std::string> gates;
    bool completed{false};
    std::string from;
    ma::NewTaskArgs task;
};

struct Invocation final {
    CliOptions options;
    CommandArgs args;
    std::string command;
};

/**
 * Parse command line arguments
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return Parsed invocation on success, empty string if --help or --version shown, error message
 * on failure
 */
tl::expected<Invocation, std::string> parse_arguments(const int argc, const char **argv) {
    CLI::App app{std::format(
            "{} - task graph manager, version {}",
            mont::cmake::project_name,
            mont::cmake::project_version)};

    Invocation inv{};
    auto &opts = inv.options;
    auto &args = inv.args;

    const std::map<std::string, ml::LogLevel> log_levels{
            {"trace", ml::LogLevel::TraceL1},
            {"debug", ml::LogLevel::Debug},
            {"info", ml::LogLevel::Info},
            {"notice", ml::LogLevel::Notice},
            {"warn", ml::LogLevel::Warn},
            {"error", ml::LogLevel::Error},
            {"critical", ml::LogLevel::Critical}};
    const std::map<std::string, mont::graph::TaskKind> task_kinds{
            {"task", mont::graph::TaskKind::Task},
            {"jot", mont::graph::TaskKind::Jot},
            {"validator", mont::graph::TaskKind::Validator}};
    const std::map<std::string, ColorMode> color_modes{
            {"auto", ColorMode::Auto}, {"always", ColorMode::Always}, {"never", ColorMode::Never}};

    app.add_option("-d,--tasks-dir", opts.tasks_dir, "Directory holding the task records")
            ->capture_default_str();
    app.add_option("-c,--config", opts.config_path, "Global config file (default <tasks-dir>/config.yml)");
    app.add_option("--log-level", opts.log_level, "Minimum log level")
            ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));
    app.add_option("--log-file", opts.log_file, "Write logs to this file instead of the console");
    app.add_option("--color", opts.color, "Colour output: auto, always or never")
            ->transform(CLI::CheckedTransformer(color_modes, CLI::ignore_case));

    app.set_version_flag(
            "--version", std::string{mont::cmake::project_version}, "Show version information");
    app.require_subcommand(1);

    app.add_subcommand("init", "Create the tasks directory and a default config file");

    auto *create = app.add_subcommand("new", "Create a task");
    create->add_option("id", args.task.id, "Id of the new task")->required();
    create->add_option("-t,--title", args.task.title, "One-line title");
    create->add_option("--description", args.task.description, "Markdown body");
    create->add_option("--type", args.task.kind, "Kind: task, jot or validator")
            ->transform(CLI::CheckedTransformer(task_kinds, CLI::ignore_case));
    create->add_option("--before", args.task.before, "Tasks blocked by the new one");
    create->add_option("--after", args.task.after, "Tasks the new one depends on");
    create->add_option("--validation", args.task.validations, "Validators the new task must satisfy");
    create->add_option("-p,--priority", args.task.priority, "Own priority");

    app.add_subcommand("status", "Show tasks in progress and what waits on them");

    app.add_subcommand("build-graph", "Validate the graph and print its topological order");

    auto *list = app.add_subcommand("list", "Draw the task graph");
    list->add_flag("--completed", args.completed, "Include completed tasks");

    app.add_subcommand("ready", "List tasks that can be started");

    app.add_subcommand("show", "Show one task")
            ->add_option("id", args.id, "Task id, or ? to pick")
            ->required();

    app.add_subcommand("check", "Validate the graph, or confirm one task")
            ->add_option("id", args.id, "Task id, or ? to pick");

    app.add_subcommand("start", "Open a work session on a task")
            ->add_option("id", args.id, "Task id, or ? to pick")
            ->required();

    app.add_subcommand("stop", "Close the work session of a task")
            ->add_option("id", args.id, "Task id, or ? to pick")
            ->required();

    auto *unlock = app.add_subcommand("unlock", "Mark gates of a task as passed");
    unlock->add_option("id", args.id, "Task id, or ? to pick")->required();
    unlock->add_option("gates", args.gates, "Gate names, or ? to pick")->required();

    auto *lock = app.add_subcommand("lock", "Reset passed gates of a task to pending");
    lock->add_option("id", args.id, "Task id, or ? to pick")->required();
    lock->add_option("gates", args.gates, "Gate names, or ? to pick")->required();

    app.add_subcommand("complete", "Finish a task once its gates have passed")
            ->add_option("id", args.id, "Task id, or ? to pick")
            ->required();

    app.add_subcommand("delete", "Delete a task and every reference to it")
            ->add_option("id", args.id, "Task id, or ? to pick")
            ->required();

    auto *distill = app.add_subcommand("distill", "Replace a jot with tasks read from a file");
    distill->add_option("id", args.id, "Jot id, or ? to pick")->required();
    distill->add_option("--from", args.from, "File with '---' delimited task records")
            ->required()
            ->check(CLI::ExistingFile);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        const int exit_code = app.exit(e);
        if (exit_code == 0) {
            // Success codes (--help or --version) - return empty error string
            return tl::unexpected("");
        }
        return tl::unexpected(std::format("Argument parsing failed: {}", e.what()));
    }

    inv.command = app.get_subcommands().front()->get_name();
    return inv;
}

void setup_logging(const CliOptions &options) {
    const auto config = options.log_file.empty()
                                ? ml::LoggerConfig::console(options.log_level)
                                : ml::LoggerConfig::file(options.log_file, options.log_level);
    ml::Logger::configure(config);
    ml::register_component<ma::AppLog>(options.log_level);
    ml::register_component<mont::graph::GraphLog>(options.log_level);
    ml::register_component<mont::display::DisplayLog>(options.log_level);
    ml::register_component<mont::store::StoreLog>(options.log_level);
}

bool use_color(const ColorMode mode, const int fd) {
    switch (mode) {
    case ColorMode::Always:
        return true;
    case ColorMode::Never:
        return false;
    case ColorMode::Auto:
        return isatty(fd) != 0;
    }
    return false;
}

ma::CommandResult run_command(const Invocation &inv, ma::CommandContext &ctx) {
    const auto &name = inv.command;
    const auto &args = inv.args;

    if (name == "new") {
        return ma::new_task(ctx, args.task);
    }
    if (name == "status") {
        return ma::status(ctx);
    }
    if (name == "build-graph") {
        return ma::build_graph(ctx);
    }
    if (name == "list") {
        return ma::list_tasks(ctx, mont::display::ShowCompleted{args.completed});
    }
    if (name == "ready") {
        return ma::ready(ctx);
    }
    if (name == "show") {
        return ma::show(ctx, args.id);
    }
    if (name == "check") {
        return args.id.empty() ? ma::check(ctx, std::nullopt) : ma::check(ctx, args.id);
    }
    if (name == "start") {
        return ma::start(ctx, args.id);
    }
    if (name == "stop") {
        return ma::stop(ctx, args.id);
    }
    if (name == "unlock") {
        return ma::unlock(ctx, args.id, args.gates);
    }
    if (name == "lock") {
        return ma::lock(ctx, args.id, args.gates);
    }
    if (name == "complete") {
        return ma::complete(ctx, args.id);
    }
    if (name == "delete") {
        return ma::delete_task(ctx, args.id);
    }
    if (name == "distill") {
        return ma::distill(ctx, args.id, fs::path{args.from});
    }
    throw std::logic_error(std::format("Unhandled subcommand '{}'", name));
}

} // namespace

/**
 * Main application entry point
 *
 * @param[in] argc Number of command line arguments
 * @param[in] argv Array of command line argument strings
 * @return EXIT_SUCCESS when the command succeeded, EXIT_FAILURE otherwise
 */
int main(int argc, const char **argv) {
    try {
        const auto invocation = parse_arguments(argc, argv);
        if (!invocation.has_value()) {
            // Empty error string means --help or --version was shown (success)
            if (!invocation.error().empty()) {
                std::cerr << invocation.error() << '\n';
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        const auto &options = invocation->options;
        setup_logging(options);

        const fs::path tasks_dir{options.tasks_dir};
        const fs::path config_path = options.config_path.empty()
                                             ? tasks_dir / mont::store::CONFIG_FILE_NAME
                                             : fs::path{options.config_path};
        const mont::display::UseColor out_color{use_color(options.color, STDOUT_FILENO)};
        const mont::display::UseColor err_color{use_color(options.color, STDERR_FILENO)};

        MONT_LOGC_DEBUG(
                ma::AppLog::Cli,
                "Running '{}' in {} with config {}",
                invocation->command,
                tasks_dir.string(),
                config_path.string());

        ma::CommandResult result{};
        if (invocation->command == "init") {
            result = ma::init(std::cout, tasks_dir, config_path);
        } else if (auto config = mont::store::load_config(config_path); !config) {
            result = tl::unexpected(std::move(config.error()));
        } else {
            mont::store::DirectoryBackend backend{tasks_dir};
            mont::store::TaskStore store{backend, std::move(*config)};
            ma::StdinPicker picker{std::cin, std::cerr};
            ma::CommandContext ctx{store, picker, std::cout, out_color};
            result = run_command(*invocation, ctx);
        }

        if (!result) {
            ma::print_report(std::cerr, ma::make_report(result.error(), tasks_dir.string()), err_color);
            ml::Logger::flush();
            return EXIT_FAILURE;
        }
        ml::Logger::flush();
        return EXIT_SUCCESS;
    } catch (const std::exception &e) {
        std::cerr << std::format("Unhandled exception: {}\n", e.what());
        return EXIT_FAILURE;
    }
}

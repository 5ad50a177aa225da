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
 * @file commands.cpp
 * @brief Subcommand implementations on top of the store and graph engines
 */

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "app/app_errors.hpp"
#include "app/app_log.hpp"
#include "app/commands.hpp"
#include "app/picker.hpp"
#include "display/dag_renderer.hpp"
#include "graph/gate_engine.hpp"
#include "graph/graph_errors.hpp"
#include "graph/priority.hpp"
#include "graph/readiness.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"
#include "store/record_codec.hpp"
#include "store/settings.hpp"
#include "store/store_errors.hpp"
#include "store/task_store.hpp"

namespace mont::app {

namespace {

using graph::Violation;
using TaskFilter = std::function<bool(const graph::Task &)>;

inline constexpr std::size_t LABEL_WIDTH = 14;

tl::unexpected<Violation> failure(const std::error_code code, std::string task_id, std::string related_id = {}) {
    return tl::unexpected(graph::make_violation(code, std::move(task_id), std::move(related_id)));
}

bool any_task(const graph::Task & /*task*/) { return true; }

std::string join(std::span<const std::string> items, const std::string_view separator) {
    std::string text;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            text += separator;
        }
        text += items[i];
    }
    return text;
}

std::string_view plural(const std::size_t count, const std::string_view one, const std::string_view many) {
    return count == 1 ? one : many;
}

/**
 * Turn an id argument into a concrete id, asking the picker for "?"
 *
 * @param[in] ctx Command context
 * @param[in] graph Snapshot to offer candidates from
 * @param[in] arg Id argument
 * @param[in] prompt Picker prompt
 * @param[in] eligible Candidate filter
 * @return Resolved id, not checked for existence
 */
tl::expected<std::string, Violation> resolve_id(
        CommandContext &ctx,
        const graph::TaskGraph &graph,
        const std::string_view arg,
        const std::string_view prompt,
        const TaskFilter &eligible) {
    if (arg != graph::PICKER_PLACEHOLDER) {
        return std::string{arg};
    }

    std::vector<PickerItem> items;
    for (const auto &[id, task] : graph.tasks()) {
        if (eligible(task)) {
            items.push_back(PickerItem{id, task.title});
        }
    }
    if (items.empty()) {
        return failure(AppErrc::NoCandidates, {}, std::string{prompt});
    }

    auto choice = ctx.picker.pick(prompt, items);
    if (!choice) {
        return failure(AppErrc::PickerCancelled, {});
    }
    return std::move(*choice);
}

/**
 * Turn a gate argument into a gate name, asking the picker for "?"
 */
tl::expected<std::string, Violation> resolve_gate(
        CommandContext &ctx,
        const graph::Task &task,
        const std::span<const std::string> default_gates,
        const std::string_view arg,
        const std::function<bool(const graph::GateEntry &)> &eligible) {
    if (arg != graph::PICKER_PLACEHOLDER) {
        return std::string{arg};
    }

    std::vector<PickerItem> items;
    for (const auto &gate : graph::effective_gates(task, default_gates)) {
        if (eligible(gate)) {
            items.push_back(PickerItem{gate.name, std::string{graph::to_string(gate.status)}});
        }
    }
    if (items.empty()) {
        return failure(AppErrc::NoCandidates, task.id);
    }

    auto choice = ctx.picker.pick(std::format("Gate of '{}':", task.id), items);
    if (!choice) {
        return failure(AppErrc::PickerCancelled, task.id);
    }
    return std::move(*choice);
}

tl::expected<const graph::Task *, Violation>
find_task(const graph::TaskGraph &graph, const std::string_view id) {
    const auto *task = graph.find(id);
    if (task == nullptr) {
        return failure(graph::LifecycleErrc::TaskNotFound, std::string{id});
    }
    return task;
}

std::string describe_status(const graph::TaskStatus &status) {
    switch (status.kind) {
    case graph::StatusKind::NotStarted:
        return "not started";
    case graph::StatusKind::Ready:
        return "ready";
    case graph::StatusKind::Blocked:
        return "blocked";
    case graph::StatusKind::InProgress:
        return std::format("in progress (session {})", status.sessions);
    case graph::StatusKind::GatesPending:
        return "gates pending";
    case graph::StatusKind::Complete:
        return "complete";
    }
    return "unknown";
}

void print_field(
        std::ostream &out,
        const std::string_view label,
        const std::string_view value,
        const std::string_view indent = {}) {
    out << std::format("{}{:<{}} {}\n", indent, label, LABEL_WIDTH, value);
}

/**
 * Identity, status, relations and gates of one task, one field per line
 */
void print_task_fields(
        std::ostream &out,
        const graph::TaskGraph &graph,
        const graph::Task &task,
        const std::span<const std::string> default_gates,
        const std::string_view indent = {}) {
    print_field(out, "Id", task.id, indent);
    if (!task.title.empty()) {
        print_field(out, "Title", task.title, indent);
    }
    print_field(out, "Status", describe_status(graph::status_of(graph, task.id)), indent);
    print_field(out, "Type", graph::to_string(task.kind), indent);

    const graph::EffectivePriorities priorities{graph};
    const auto effective = priorities.of(task.id);
    if (task.priority != 0 || effective != 0) {
        print_field(out, "Priority", std::format("{} (effective {})", task.priority, effective), indent);
    }
    if (!task.before.empty()) {
        print_field(out, "Before", join(task.before, ", "), indent);
    }
    if (!task.after.empty()) {
        print_field(out, "After", join(task.after, ", "), indent);
    }
    if (!task.validations.empty()) {
        print_field(out, "Validations", join(task.validations, ", "), indent);
    }

    const auto gates = graph::effective_gates(task, default_gates);
    if (!gates.empty()) {
        std::vector<std::string> entries;
        entries.reserve(gates.size());
        for (const auto &gate : gates) {
            entries.push_back(std::format("{} ({})", gate.name, graph::to_string(gate.status)));
        }
        print_field(out, "Gates", join(entries, ", "), indent);
    }
}

bool in_session(const graph::Task &task) {
    return task.work_state != graph::WorkState::Idle && !task.complete;
}

/**
 * Apply one gate transition to every named gate, then persist the task once
 */
CommandResult update_gates(
        CommandContext &ctx,
        const std::string_view id_arg,
        const std::span<const std::string> gates,
        const bool unlocking) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    auto id = resolve_id(ctx, snap->graph, id_arg, "Task:", [](const graph::Task &task) {
        return !graph::is_jot(task) && !task.complete;
    });
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }
    auto found = find_task(snap->graph, *id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }

    const auto &defaults = snap->config.default_gates;
    graph::Task task = **found;
    std::vector<std::string> names;
    for (const auto &arg : gates) {
        auto name = resolve_gate(ctx, task, defaults, arg, [unlocking](const graph::GateEntry &gate) {
            return unlocking != (gate.status == graph::GateStatus::Passed);
        });
        if (!name) {
            return tl::unexpected(std::move(name.error()));
        }
        auto updated = unlocking ? graph::unlock_gate(std::move(task), *name, defaults)
                                 : graph::lock_gate(std::move(task), *name, defaults);
        if (!updated) {
            return tl::unexpected(std::move(updated.error()));
        }
        task = std::move(*updated);
        names.push_back(std::move(*name));
    }

    if (names.empty()) {
        ctx.out << "No gates updated\n";
        return {};
    }
    if (auto saved = ctx.store.update_task(*id, std::move(task)); !saved) {
        return saved;
    }

    ctx.out << std::format(
            "{} {} {}\n",
            join(names, ", "),
            plural(names.size(), "gate", "gates"),
            unlocking ? "marked as passed" : "reset to pending");
    return {};
}

tl::expected<std::string, Violation> read_source(const std::filesystem::path &source) {
    std::ifstream file(source);
    if (!file) {
        return tl::unexpected(graph::make_violation(
                store::StoreErrc::ReadFailed, {}, source.string(), "cannot open file"));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

CommandResult build_graph(CommandContext &ctx) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    const auto &graph = snap->graph;
    if (graph.size() == 0) {
        ctx.out << "No tasks found\n";
        return {};
    }

    const auto order = graph.topological_order();
    ctx.out << std::format("Graph valid: {} {}\n", graph.size(), plural(graph.size(), "task", "tasks"));
    for (std::size_t i = 0; i < order.size(); ++i) {
        ctx.out << std::format("{:>4}. {}\n", i + 1, order[i]);
    }
    return {};
}

CommandResult list_tasks(CommandContext &ctx, const display::ShowCompleted show_completed) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    if (snap->graph.size() == 0) {
        ctx.out << "No tasks found\n";
        return {};
    }

    const display::DagRenderer renderer{snap->graph};
    ctx.out << renderer.render(show_completed, ctx.use_color);
    return {};
}

CommandResult ready(CommandContext &ctx) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }

    const graph::EffectivePriorities priorities{snap->graph};
    const auto ids = graph::ready_tasks(snap->graph, priorities);
    if (ids.empty()) {
        ctx.out << "No ready tasks\n";
        return {};
    }

    std::vector<std::string> tasks;
    std::vector<std::string> jots;
    for (const auto &id : ids) {
        (graph::is_jot(snap->graph.at(id)) ? jots : tasks).push_back(id);
    }

    const display::DagRenderer renderer{snap->graph};
    for (const auto &id : tasks) {
        ctx.out << renderer.task_line(id, ctx.use_color) << '\n';
    }
    if (!jots.empty()) {
        if (!tasks.empty()) {
            ctx.out << '\n';
        }
        ctx.out << "Jots:\n";
        for (const auto &id : jots) {
            ctx.out << renderer.task_line(id, ctx.use_color) << '\n';
        }
    }
    return {};
}

CommandResult status(CommandContext &ctx) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    const auto &graph = snap->graph;
    if (graph.size() == 0) {
        ctx.out << "No tasks found\n";
        return {};
    }

    std::vector<const graph::Task *> working;
    for (const auto &[id, task] : graph.tasks()) {
        if (in_session(task)) {
            working.push_back(&task);
        }
    }

    auto &out = ctx.out;
    out << "Tasks in progress\n";
    if (working.empty()) {
        out << "  None\n";
    }
    for (std::size_t i = 0; i < working.size(); ++i) {
        if (i > 0) {
            out << '\n';
        }
        print_task_fields(out, graph, *working[i], snap->config.default_gates, "  ");
    }

    // Tasks that wait directly on a task in progress
    const auto waits_on_working = [&working](const graph::Task &task) {
        for (const auto *current : working) {
            const auto &after = task.after;
            const auto &before = current->before;
            if (std::find(after.begin(), after.end(), current->id) != after.end() ||
                std::find(before.begin(), before.end(), task.id) != before.end()) {
                return true;
            }
        }
        return false;
    };

    const display::DagRenderer renderer{graph};
    out << "\nUp next\n";
    bool any_next = false;
    for (const auto &[id, task] : graph.tasks()) {
        if (in_session(task) || task.complete || graph::is_validator(task) || !waits_on_working(task)) {
            continue;
        }
        out << "  " << renderer.task_line(id, ctx.use_color) << '\n';
        any_next = true;
    }
    if (!any_next) {
        out << "  None\n";
    }

    std::size_t ready_count = 0;
    std::size_t jot_count = 0;
    std::size_t validator_count = 0;
    std::size_t complete_count = 0;
    for (const auto &[id, task] : graph.tasks()) {
        if (graph::is_validator(task)) {
            ++validator_count;
        } else if (task.complete) {
            ++complete_count;
        } else if (graph::is_jot(task)) {
            ++jot_count;
        } else if (graph::status_of(graph, id).kind == graph::StatusKind::Ready) {
            ++ready_count;
        }
    }

    out << "\nInfo\n";
    out << std::format("  {:<4} tasks ready for work\n", ready_count);
    out << std::format("  {:<4} jots needing distillation\n", jot_count);
    out << std::format("  {:<4} validators\n", validator_count);
    out << std::format("  {:<4} completed\n", complete_count);
    return {};
}

CommandResult show(CommandContext &ctx, const std::string_view id_arg) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    const auto &graph = snap->graph;
    auto id = resolve_id(ctx, graph, id_arg, "Show task:", any_task);
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }
    auto found = find_task(graph, *id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }
    const graph::Task &task = **found;

    print_task_fields(ctx.out, graph, task, snap->config.default_gates);

    if (!task.description.empty()) {
        ctx.out << '\n' << task.description << '\n';
    }
    return {};
}

CommandResult check(CommandContext &ctx, const std::optional<std::string_view> id_arg) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    const auto &graph = snap->graph;

    if (!id_arg) {
        if (graph.size() == 0) {
            ctx.out << "No tasks found\n";
        } else {
            ctx.out << std::format("ok: {} tasks validated\n", graph.size());
        }
        return {};
    }

    auto id = resolve_id(ctx, graph, *id_arg, "Check task:", any_task);
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }
    if (auto found = find_task(graph, *id); !found) {
        return tl::unexpected(std::move(found.error()));
    }
    ctx.out << std::format("ok: task '{}' is valid\n", *id);
    return {};
}

CommandResult start(CommandContext &ctx, const std::string_view id_arg) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    const auto &graph = snap->graph;
    auto id = resolve_id(ctx, graph, id_arg, "Start task:", [&graph](const graph::Task &task) {
        if (graph::is_jot(task)) {
            return false;
        }
        const auto kind = graph::status_of(graph, task.id).kind;
        return kind == graph::StatusKind::Ready || kind == graph::StatusKind::GatesPending;
    });
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }

    auto started = graph::start_task(graph, *id);
    if (!started) {
        return tl::unexpected(std::move(started.error()));
    }
    const auto sessions = started->in_progress.value_or(1);
    if (auto saved = ctx.store.update_task(*id, std::move(*started)); !saved) {
        return saved;
    }

    MONT_LOGC_INFO(AppLog::Commands, "Started '{}' (session {})", *id, sessions);
    ctx.out << std::format("Started task '{}'\n", *id);
    return {};
}

CommandResult stop(CommandContext &ctx, const std::string_view id_arg) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    auto id = resolve_id(ctx, snap->graph, id_arg, "Stop task:", [](const graph::Task &task) {
        return task.work_state != graph::WorkState::Idle;
    });
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }

    auto stopped = graph::stop_task(snap->graph, *id);
    if (!stopped) {
        return tl::unexpected(std::move(stopped.error()));
    }
    if (auto saved = ctx.store.update_task(*id, std::move(*stopped)); !saved) {
        return saved;
    }
    ctx.out << std::format("Stopped task '{}'\n", *id);
    return {};
}

CommandResult unlock(CommandContext &ctx, const std::string_view id, const std::span<const std::string> gates) {
    return update_gates(ctx, id, gates, true);
}

CommandResult lock(CommandContext &ctx, const std::string_view id, const std::span<const std::string> gates) {
    return update_gates(ctx, id, gates, false);
}

CommandResult complete(CommandContext &ctx, const std::string_view id_arg) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    auto id = resolve_id(ctx, snap->graph, id_arg, "Complete task:", in_session);
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }
    auto found = find_task(snap->graph, *id);
    if (!found) {
        return tl::unexpected(std::move(found.error()));
    }

    const graph::Task &original = **found;
    if (original.complete) {
        MONT_LOGC_DEBUG(AppLog::Commands, "'{}' was already complete", *id);
        ctx.out << std::format("Marked '{}' as complete\n", *id);
        return {};
    }

    graph::Task finished = original;
    if (finished.work_state == graph::WorkState::Active) {
        auto awaiting = graph::finish_work(std::move(finished));
        if (!awaiting) {
            return tl::unexpected(std::move(awaiting.error()));
        }
        finished = std::move(*awaiting);
    }

    const auto &defaults = snap->config.default_gates;
    auto completed = graph::complete_task(finished, defaults);
    if (!completed) {
        if (completed.error().code == graph::CompletionErrc::GatesPending && finished != original) {
            if (auto saved = ctx.store.update_task(*id, std::move(finished)); !saved) {
                return saved;
            }
            MONT_LOGC_INFO(AppLog::Commands, "'{}' is now awaiting gates", *id);
        }
        return tl::unexpected(std::move(completed.error()));
    }

    if (auto saved = ctx.store.update_task(*id, std::move(*completed)); !saved) {
        return saved;
    }
    ctx.out << std::format("Marked '{}' as complete\n", *id);
    return {};
}

CommandResult new_task(CommandContext &ctx, NewTaskArgs args) {
    graph::Task task{};
    task.id = std::move(args.id);
    task.title = std::move(args.title);
    task.kind = args.kind;
    task.description = std::move(args.description);
    task.before = std::move(args.before);
    task.after = std::move(args.after);
    task.validations = std::move(args.validations);
    task.priority = args.priority;

    const std::string id = task.id;
    if (auto inserted = ctx.store.insert_task(std::move(task)); !inserted) {
        return inserted;
    }
    MONT_LOGC_INFO(AppLog::Commands, "Created '{}'", id);
    ctx.out << std::format("Created task '{}'\n", id);
    return {};
}

CommandResult
init(std::ostream &out, const std::filesystem::path &tasks_dir, const std::filesystem::path &config_path) {
    auto outcome = store::init_tasks_directory(tasks_dir, config_path);
    if (!outcome) {
        return tl::unexpected(std::move(outcome.error()));
    }

    if (outcome->created_directory) {
        out << std::format("Created {}\n", tasks_dir.string());
    }
    if (outcome->created_config) {
        out << std::format("Created {}\n", config_path.string());
    }
    if (!outcome->created_directory && !outcome->created_config) {
        out << std::format("Already initialised: {}\n", tasks_dir.string());
    }
    return {};
}

CommandResult delete_task(CommandContext &ctx, const std::string_view id_arg) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    auto id = resolve_id(ctx, snap->graph, id_arg, "Delete task:", any_task);
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }

    if (auto deleted = ctx.store.delete_task(*id); !deleted) {
        return deleted;
    }
    ctx.out << std::format("Deleted task '{}'\n", *id);
    return {};
}

CommandResult
distill(CommandContext &ctx, const std::string_view id_arg, const std::filesystem::path &source) {
    auto snap = ctx.store.snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    auto id = resolve_id(ctx, snap->graph, id_arg, "Distill jot:", [](const graph::Task &task) {
        return graph::is_jot(task);
    });
    if (!id) {
        return tl::unexpected(std::move(id.error()));
    }

    auto text = read_source(source);
    if (!text) {
        return tl::unexpected(std::move(text.error()));
    }
    auto tasks = store::parse_record_stream(*text);
    if (!tasks) {
        Violation violation = std::move(tasks.error());
        if (violation.detail.empty()) {
            violation.detail = std::format("in {}", source.string());
        }
        return tl::unexpected(std::move(violation));
    }
    if (tasks->empty()) {
        return failure(AppErrc::EmptyInput, *id, source.string());
    }

    auto created = ctx.store.distill(*id, std::move(*tasks));
    if (!created) {
        return tl::unexpected(std::move(created.error()));
    }
    ctx.out << std::format("Distilled '{}' into {}\n", *id, join(*created, ", "));
    return {};
}

} // namespace mont::app

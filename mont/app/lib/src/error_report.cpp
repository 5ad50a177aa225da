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
 * @file error_report.cpp
 * @brief Remediation hints for every error category
 */

#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/color.h>
#include <fmt/format.h>

#include "app/app_errors.hpp"
#include "app/error_report.hpp"
#include "graph/graph_errors.hpp"
#include "store/settings.hpp"
#include "store/store_errors.hpp"

namespace mont::app {

namespace {

/**
 * Names the record file of an id for hints
 */
class HintContext final {
public:
    HintContext(const graph::Violation &violation, const std::string_view tasks_dir)
            : violation_{violation}, tasks_dir_{tasks_dir} {}

    [[nodiscard]] const std::string &task() const noexcept { return violation_.task_id; }
    [[nodiscard]] const std::string &related() const noexcept { return violation_.related_id; }

    [[nodiscard]] std::string record(const std::string_view id) const {
        return std::format("{}/{}.md", tasks_dir_, id);
    }
    [[nodiscard]] std::string task_record() const { return record(task()); }
    [[nodiscard]] std::string config_file() const {
        return std::format("{}/{}", tasks_dir_, store::CONFIG_FILE_NAME);
    }

private:
    const graph::Violation &violation_;
    std::string_view tasks_dir_;
};

std::string graph_hint(const graph::GraphErrc errc, const HintContext &h) {
    switch (errc) {
    case graph::GraphErrc::Success:
        return {};
    case graph::GraphErrc::InvalidParent:
        return std::format(
                "create {} or remove '{}' from before in {}",
                h.record(h.related()),
                h.related(),
                h.task_record());
    case graph::GraphErrc::InvalidPrecondition:
        return std::format(
                "create {} or remove '{}' from after in {}",
                h.record(h.related()),
                h.related(),
                h.task_record());
    case graph::GraphErrc::InvalidValidation:
        return std::format(
                "point validations in {} at a task with 'type: validator'", h.task_record());
    case graph::GraphErrc::ValidationNotRootValidator:
        return std::format(
                "reference the top-level validator instead of '{}', or clear its before list",
                h.related());
    case graph::GraphErrc::CycleDetected:
        return "remove one before/after link along the cycle";
    case graph::GraphErrc::DuplicateTaskId:
        return std::format("give one of the records using '{}' a different id", h.task());
    case graph::GraphErrc::ValidatorHasDependencies:
        return std::format(
                "remove the after field from {} or change its type to task", h.task_record());
    case graph::GraphErrc::InvalidJot:
        return std::format(
                "jots cannot carry gates or be complete; distill '{}' into tasks first", h.task());
    case graph::GraphErrc::AfterIsValidator:
        return std::format(
                "move '{}' from after to validations in {}", h.related(), h.task_record());
    }
    return {};
}

std::string gate_hint(const graph::GateErrc errc, const HintContext &h) {
    switch (errc) {
    case graph::GateErrc::Success:
        return {};
    case graph::GateErrc::GateNotFound:
        return std::format("run 'mont show {}' to list its gates", h.task());
    case graph::GateErrc::GateNotPassed:
        return "only passed gates can be locked";
    case graph::GateErrc::CannotGateJot:
        return std::format("distill the jot with 'mont distill {} --from <file>'", h.task());
    }
    return {};
}

std::string completion_hint(const graph::CompletionErrc errc, const HintContext &h) {
    switch (errc) {
    case graph::CompletionErrc::Success:
        return {};
    case graph::CompletionErrc::GatesPending:
        return std::format("pass the blocking gates with 'mont unlock {} <gate>...'", h.task());
    case graph::CompletionErrc::NotInProgress:
        return std::format("start it first with 'mont start {}'", h.task());
    case graph::CompletionErrc::CannotCompleteJot:
        return std::format("distill the jot with 'mont distill {} --from <file>'", h.task());
    case graph::CompletionErrc::NotCompletable:
        return "validators are criteria; unlock them as gates on the tasks that use them";
    }
    return {};
}

std::string lifecycle_hint(const graph::LifecycleErrc errc, const HintContext &h) {
    switch (errc) {
    case graph::LifecycleErrc::Success:
        return {};
    case graph::LifecycleErrc::TaskNotFound:
        return "run 'mont list' to see the available ids";
    case graph::LifecycleErrc::AlreadyComplete:
        return "run 'mont ready' to find the next task";
    case graph::LifecycleErrc::AlreadyInProgress:
        return std::format("finish it with 'mont complete {0}' or pause it with 'mont stop {0}'", h.task());
    case graph::LifecycleErrc::NotActionable:
        return "only tasks can be started; distill jots and unlock validators as gates";
    case graph::LifecycleErrc::DependenciesIncomplete:
        return std::format("complete its dependencies first, see 'mont show {}'", h.task());
    }
    return {};
}

std::string parse_hint(const store::ParseErrc errc, const HintContext &h) {
    switch (errc) {
    case store::ParseErrc::Success:
        return {};
    case store::ParseErrc::MissingFrontmatter:
        return std::format("start {} with a '---' delimited block holding at least 'id:'", h.task_record());
    case store::ParseErrc::InvalidYaml:
    case store::ParseErrc::InvalidField:
        return std::format("fix the frontmatter of {}", h.task_record());
    case store::ParseErrc::EmptyId:
    case store::ParseErrc::InvalidId:
    case store::ParseErrc::ReservedId:
        return "use an id without whitespace or path separators that matches the file name";
    case store::ParseErrc::InvalidKind:
        return "set type to jot, task or validator";
    case store::ParseErrc::InvalidGateEntry:
        return "list gates as '- name' or '- name: status'";
    case store::ParseErrc::InvalidGateStatus:
        return "use pending, passed, failed or skipped";
    }
    return {};
}

std::string store_hint(const store::StoreErrc errc, const HintContext &h) {
    switch (errc) {
    case store::StoreErrc::Success:
        return {};
    case store::StoreErrc::TaskNotFound:
        return "run 'mont list' to see the available ids";
    case store::StoreErrc::TaskAlreadyExists:
        return std::format("choose an id other than '{}'", h.task());
    case store::StoreErrc::ReadFailed:
        return "check that the path exists and is readable";
    case store::StoreErrc::WriteFailed:
    case store::StoreErrc::RemoveFailed:
        return "check permissions and free space; no records were changed";
    case store::StoreErrc::NotAJot:
        return "only jots can be distilled";
    case store::StoreErrc::EmptyDistill:
        return "provide at least one task record";
    case store::StoreErrc::ConfigParseFailed:
        return std::format(
                "fix {}; default_gates must be a list of validator ids",
                h.related().empty() ? h.config_file() : h.related());
    case store::StoreErrc::DefaultGateNotFound:
        return std::format("create validator '{}' or remove it from {}", h.task(), h.config_file());
    case store::StoreErrc::DefaultGateNotValidator:
        return std::format(
                "set 'type: validator' in {} or remove it from {}", h.task_record(), h.config_file());
    case store::StoreErrc::DefaultGateNotRoot:
        return std::format("use '{}' instead in {}", h.related(), h.config_file());
    }
    return {};
}

std::string app_hint(const AppErrc errc, const HintContext &h) {
    switch (errc) {
    case AppErrc::Success:
        return {};
    case AppErrc::PickerCancelled:
        return "pass the id explicitly instead of '?'";
    case AppErrc::NoCandidates:
        return "nothing matches; pass an id explicitly";
    case AppErrc::EmptyInput:
        return std::format("add '---' delimited task records to {}", h.related());
    }
    return {};
}

std::string hint_for(const std::error_code &code, const HintContext &h) {
    const auto &category = code.category();
    const int value = code.value();
    if (category == graph::graph_category()) {
        return graph_hint(static_cast<graph::GraphErrc>(value), h);
    }
    if (category == graph::gate_category()) {
        return gate_hint(static_cast<graph::GateErrc>(value), h);
    }
    if (category == graph::completion_category()) {
        return completion_hint(static_cast<graph::CompletionErrc>(value), h);
    }
    if (category == graph::lifecycle_category()) {
        return lifecycle_hint(static_cast<graph::LifecycleErrc>(value), h);
    }
    if (category == store::parse_category()) {
        return parse_hint(static_cast<store::ParseErrc>(value), h);
    }
    if (category == store::store_category()) {
        return store_hint(static_cast<store::StoreErrc>(value), h);
    }
    if (category == app_category()) {
        return app_hint(static_cast<AppErrc>(value), h);
    }
    return {};
}

} // anonymous namespace

ErrorReport make_report(const graph::Violation &violation, const std::string_view tasks_dir) {
    const HintContext context{violation, tasks_dir};
    return ErrorReport{violation.to_string(), hint_for(violation.code, context)};
}

void print_report(std::ostream &out, const ErrorReport &report, const display::UseColor use_color) {
    const auto label = [&use_color](const std::string_view text, const fmt::text_style style) {
        return use_color.get() ? fmt::format(style, "{}", text) : std::string{text};
    };

    out << label("error", fmt::emphasis::bold | fmt::fg(fmt::terminal_color::red)) << ": "
        << report.message << '\n';
    if (!report.hint.empty()) {
        out << label("hint", fmt::emphasis::bold | fmt::fg(fmt::terminal_color::cyan)) << ": "
            << report.hint << '\n';
    }
}

} // namespace mont::app

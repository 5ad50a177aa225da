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
 * @file graph_errors.hpp
 * @brief Error codes for graph validation, gates, completion and lifecycle operations
 *
 * Provides type-safe error codes compatible with std::error_code, plus the
 * Violation value returned by every fallible engine operation.
 */

#ifndef MONT_GRAPH_GRAPH_ERRORS_HPP
#define MONT_GRAPH_GRAPH_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

#include <wise_enum.h>

namespace mont::graph {

/**
 * Structural graph validation errors
 */
// clang-format off
enum class GraphErrc : std::uint8_t {
    Success,                    //!< Graph is valid
    InvalidParent,              //!< A `before` entry does not resolve
    InvalidPrecondition,        //!< An `after` entry does not resolve
    InvalidValidation,          //!< A `validations` entry is missing or not a validator
    ValidationNotRootValidator, //!< A referenced validator has a containing parent
    CycleDetected,              //!< The dependency graph contains a cycle
    DuplicateTaskId,            //!< Two records share one id
    ValidatorHasDependencies,   //!< A validator declares `after` dependencies
    InvalidJot,                 //!< A jot carries gates or is marked complete
    AfterIsValidator            //!< A non-validator lists a validator in `after`
};

/**
 * Per-task gate manipulation errors
 */
enum class GateErrc : std::uint8_t {
    Success,      //!< Gate updated
    GateNotFound, //!< Gate is not in the task's effective list
    GateNotPassed,//!< Gate cannot be locked because it is not passed
    CannotGateJot //!< Jots have no gates
};

/**
 * Task completion errors
 */
enum class CompletionErrc : std::uint8_t {
    Success,           //!< Task completed
    GatesPending,      //!< At least one effective gate is not passed
    NotInProgress,     //!< Task has no active work session
    CannotCompleteJot, //!< Jots must be distilled, not completed
    NotCompletable     //!< Validators are criteria, not work
};

/**
 * Work lifecycle errors (start/stop and lookups)
 */
enum class LifecycleErrc : std::uint8_t {
    Success,               //!< Transition applied
    TaskNotFound,          //!< No task with the requested id
    AlreadyComplete,       //!< Task is already complete
    AlreadyInProgress,     //!< Task already has an active session
    NotActionable,         //!< Jots and validators cannot be worked on
    DependenciesIncomplete //!< At least one dependency is not complete
};
// clang-format on

static_assert(
        static_cast<std::uint32_t>(GraphErrc::AfterIsValidator) <=
                std::numeric_limits<std::uint8_t>::max(),
        "GraphErrc enumerator values must fit in std::uint8_t");

} // namespace mont::graph

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        mont::graph::GraphErrc,
        Success,
        InvalidParent,
        InvalidPrecondition,
        InvalidValidation,
        ValidationNotRootValidator,
        CycleDetected,
        DuplicateTaskId,
        ValidatorHasDependencies,
        InvalidJot,
        AfterIsValidator)

WISE_ENUM_ADAPT(mont::graph::GateErrc, Success, GateNotFound, GateNotPassed, CannotGateJot)

WISE_ENUM_ADAPT(
        mont::graph::CompletionErrc,
        Success,
        GatesPending,
        NotInProgress,
        CannotCompleteJot,
        NotCompletable)

WISE_ENUM_ADAPT(
        mont::graph::LifecycleErrc,
        Success,
        TaskNotFound,
        AlreadyComplete,
        AlreadyInProgress,
        NotActionable,
        DependenciesIncomplete)

// Register the enums as error code enums to enable implicit conversion to
// std::error_code
// NOTE: This MUST come before any functions that use them with std::error_code
namespace std {
template <> struct is_error_code_enum<mont::graph::GraphErrc> : true_type {};
template <> struct is_error_code_enum<mont::graph::GateErrc> : true_type {};
template <> struct is_error_code_enum<mont::graph::CompletionErrc> : true_type {};
template <> struct is_error_code_enum<mont::graph::LifecycleErrc> : true_type {};
} // namespace std

namespace mont::graph {

/**
 * Error category for structural graph validation
 */
class GraphErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 10> KMESSAGES{
            "Success: Graph is valid",
            "Invalid parent: A 'before' reference does not name an existing task",
            "Invalid precondition: An 'after' reference does not name an existing task",
            "Invalid validation: A 'validations' reference must name an existing validator",
            "Validation not root validator: A referenced validator must not have a containing "
            "parent",
            "Cycle detected: Task dependencies form a cycle",
            "Duplicate task id: Two records share the same id",
            "Validator has dependencies: Validators cannot declare 'after' dependencies",
            "Invalid jot: Jots cannot carry gates or be marked complete",
            "After is validator: Validators are referenced through 'validations', not 'after'"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<GraphErrc>,
            "KMESSAGES array size must match the number of GraphErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::graph"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown graph error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<GraphErrc>(condition)) {
        case GraphErrc::Success:
            return {};
        case GraphErrc::InvalidParent:
        case GraphErrc::InvalidPrecondition:
        case GraphErrc::InvalidValidation:
            return std::errc::no_such_file_or_directory;
        case GraphErrc::DuplicateTaskId:
            return std::errc::file_exists;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Error category for gate manipulation
 */
class GateErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 4> KMESSAGES{
            "Success: Gate updated",
            "Gate not found: The gate is not in the task's effective gate list",
            "Gate not passed: Only a passed gate can be locked",
            "Cannot gate jot: Jots have no gates"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<GateErrc>,
            "KMESSAGES array size must match the number of GateErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::gate"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown gate error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<GateErrc>(condition)) {
        case GateErrc::Success:
            return {};
        case GateErrc::GateNotFound:
            return std::errc::no_such_file_or_directory;
        case GateErrc::CannotGateJot:
            return std::errc::operation_not_supported;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Error category for task completion
 */
class CompletionErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 5> KMESSAGES{
            "Success: Task completed",
            "Gates pending: Every gate must be passed before completion",
            "Not in progress: The task has no active work session",
            "Cannot complete jot: Jots must be distilled into tasks instead",
            "Not completable: Validators describe criteria and cannot be completed"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<CompletionErrc>,
            "KMESSAGES array size must match the number of CompletionErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::completion"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown completion error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<CompletionErrc>(condition)) {
        case CompletionErrc::Success:
            return {};
        case CompletionErrc::CannotCompleteJot:
        case CompletionErrc::NotCompletable:
            return std::errc::operation_not_supported;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

/**
 * Error category for work lifecycle transitions
 */
class LifecycleErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 6> KMESSAGES{
            "Success: Transition applied",
            "Task not found: No task has the requested id",
            "Already complete: The task is already complete",
            "Already in progress: The task already has an active work session",
            "Not actionable: Jots and validators cannot be worked on",
            "Dependencies incomplete: Every dependency must be complete first"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<LifecycleErrc>,
            "KMESSAGES array size must match the number of LifecycleErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::lifecycle"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown lifecycle error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<LifecycleErrc>(condition)) {
        case LifecycleErrc::Success:
            return {};
        case LifecycleErrc::TaskNotFound:
            return std::errc::no_such_file_or_directory;
        case LifecycleErrc::AlreadyInProgress:
            return std::errc::operation_in_progress;
        case LifecycleErrc::NotActionable:
            return std::errc::operation_not_supported;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

[[nodiscard]] inline const GraphErrorCategory &graph_category() noexcept {
    static const GraphErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline const GateErrorCategory &gate_category() noexcept {
    static const GateErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline const CompletionErrorCategory &completion_category() noexcept {
    static const CompletionErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline const LifecycleErrorCategory &lifecycle_category() noexcept {
    static const LifecycleErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline std::error_code make_error_code(const GraphErrc errc) noexcept {
    return {static_cast<int>(errc), graph_category()};
}

[[nodiscard]] inline std::error_code make_error_code(const GateErrc errc) noexcept {
    return {static_cast<int>(errc), gate_category()};
}

[[nodiscard]] inline std::error_code make_error_code(const CompletionErrc errc) noexcept {
    return {static_cast<int>(errc), completion_category()};
}

[[nodiscard]] inline std::error_code make_error_code(const LifecycleErrc errc) noexcept {
    return {static_cast<int>(errc), lifecycle_category()};
}

/**
 * Get the enumerator name behind an error code of one of the engine categories
 *
 * @param[in] ec The error code
 * @return The enum name, or "unknown" for foreign categories
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() == graph_category()) {
        return ::wise_enum::to_string(static_cast<GraphErrc>(ec.value())).data();
    }
    if (ec.category() == gate_category()) {
        return ::wise_enum::to_string(static_cast<GateErrc>(ec.value())).data();
    }
    if (ec.category() == completion_category()) {
        return ::wise_enum::to_string(static_cast<CompletionErrc>(ec.value())).data();
    }
    if (ec.category() == lifecycle_category()) {
        return ::wise_enum::to_string(static_cast<LifecycleErrc>(ec.value())).data();
    }
    return "unknown";
}

/**
 * A rule violation reported by a fallible engine, store or command operation
 *
 * Carries the error code plus the ids needed to tell the user which record
 * broke which rule.
 */
struct Violation final {
    std::error_code code;          //!< What rule was violated
    std::string task_id;           //!< Offending task id (may be empty for global errors)
    std::string related_id;        //!< Other id involved (missing reference, gate, validator)
    std::string detail;            //!< Free-form context such as a parser message
    std::vector<std::string> path; //!< Cycle members or blocking gates, in order

    /**
     * Render a one-line description naming the ids involved
     *
     * @return Human readable description
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * Build a Violation
 *
 * @param[in] code Violated rule
 * @param[in] task_id Offending task id
 * @param[in] related_id Other id involved
 * @param[in] detail Extra context
 * @return The violation
 */
[[nodiscard]] Violation make_violation(
        std::error_code code,
        std::string task_id,
        std::string related_id = {},
        std::string detail = {});

} // namespace mont::graph

#endif // MONT_GRAPH_GRAPH_ERRORS_HPP

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
 * @file store_errors.hpp
 * @brief Error codes for record parsing and task store operations
 */

#ifndef MONT_STORE_STORE_ERRORS_HPP
#define MONT_STORE_STORE_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <wise_enum.h>

namespace mont::store {

/**
 * Record parsing errors
 */
// clang-format off
enum class ParseErrc : std::uint8_t {
    Success,            //!< Record parsed
    MissingFrontmatter, //!< No `---` delimited frontmatter block
    InvalidYaml,        //!< Frontmatter is not a YAML mapping
    EmptyId,            //!< The id field is missing or empty
    InvalidId,          //!< The id contains whitespace or path separators
    ReservedId,         //!< The id is the picker placeholder
    InvalidKind,        //!< Unknown `type` value
    InvalidGateEntry,   //!< Gate item is neither a name nor a single-key map
    InvalidGateStatus,  //!< Unknown gate status value
    InvalidField        //!< A field has the wrong shape or value
};

/**
 * Task store errors
 */
enum class StoreErrc : std::uint8_t {
    Success,                 //!< Operation completed
    TaskNotFound,            //!< No record with the requested id
    TaskAlreadyExists,       //!< A record with the id already exists
    ReadFailed,              //!< A record or config file could not be read
    WriteFailed,             //!< A record could not be written
    RemoveFailed,            //!< A record could not be removed
    NotAJot,                 //!< Only jots can be distilled
    EmptyDistill,            //!< Distilling needs at least one replacement task
    ConfigParseFailed,       //!< The global config is malformed
    DefaultGateNotFound,     //!< A default gate does not name a task
    DefaultGateNotValidator, //!< A default gate names a non-validator task
    DefaultGateNotRoot       //!< A default gate names a validator with a parent
};
// clang-format on

} // namespace mont::store

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(
        mont::store::ParseErrc,
        Success,
        MissingFrontmatter,
        InvalidYaml,
        EmptyId,
        InvalidId,
        ReservedId,
        InvalidKind,
        InvalidGateEntry,
        InvalidGateStatus,
        InvalidField)

WISE_ENUM_ADAPT(
        mont::store::StoreErrc,
        Success,
        TaskNotFound,
        TaskAlreadyExists,
        ReadFailed,
        WriteFailed,
        RemoveFailed,
        NotAJot,
        EmptyDistill,
        ConfigParseFailed,
        DefaultGateNotFound,
        DefaultGateNotValidator,
        DefaultGateNotRoot)

namespace std {
template <> struct is_error_code_enum<mont::store::ParseErrc> : true_type {};
template <> struct is_error_code_enum<mont::store::StoreErrc> : true_type {};
} // namespace std

namespace mont::store {

/**
 * Error category for record parsing
 */
class ParseErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 10> KMESSAGES{
            "Success: Record parsed",
            "Missing frontmatter: The record must start with a '---' delimited YAML block",
            "Invalid YAML: The frontmatter could not be parsed",
            "Empty id: Every record needs a non-empty id",
            "Invalid id: Ids cannot contain whitespace or path separators",
            "Reserved id: '?' is reserved for the interactive picker",
            "Invalid kind: The type must be jot, task or validator",
            "Invalid gate entry: Gates are a name or a single 'name: status' pair",
            "Invalid gate status: Gate status must be pending, passed, failed or skipped",
            "Invalid field: A field has the wrong shape or value"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<ParseErrc>,
            "KMESSAGES array size must match the number of ParseErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::parse"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown parse error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<ParseErrc>(condition)) {
        case ParseErrc::Success:
            return {};
        default:
            return std::errc::invalid_argument;
        }
    }
};

/**
 * Error category for the task store
 */
class StoreErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 12> KMESSAGES{
            "Success: Operation completed",
            "Task not found: No record has the requested id",
            "Task already exists: A record with this id already exists",
            "Read failed: A record or config file could not be read",
            "Write failed: A record could not be written, changes were rolled back",
            "Remove failed: A record could not be removed, changes were rolled back",
            "Not a jot: Only jots can be distilled",
            "Empty distill: Distilling needs at least one replacement task",
            "Config parse failed: The global config could not be parsed",
            "Default gate not found: A default gate does not name an existing task",
            "Default gate not validator: A default gate must name a validator",
            "Default gate not root: A default gate must name a validator without a parent"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<StoreErrc>,
            "KMESSAGES array size must match the number of StoreErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::store"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown store error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<StoreErrc>(condition)) {
        case StoreErrc::Success:
            return {};
        case StoreErrc::TaskNotFound:
        case StoreErrc::DefaultGateNotFound:
            return std::errc::no_such_file_or_directory;
        case StoreErrc::TaskAlreadyExists:
            return std::errc::file_exists;
        case StoreErrc::ReadFailed:
        case StoreErrc::WriteFailed:
        case StoreErrc::RemoveFailed:
            return std::errc::io_error;
        default:
            return std::error_condition{condition, *this};
        }
    }
};

[[nodiscard]] inline const ParseErrorCategory &parse_category() noexcept {
    static const ParseErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline const StoreErrorCategory &store_category() noexcept {
    static const StoreErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline std::error_code make_error_code(const ParseErrc errc) noexcept {
    return {static_cast<int>(errc), parse_category()};
}

[[nodiscard]] inline std::error_code make_error_code(const StoreErrc errc) noexcept {
    return {static_cast<int>(errc), store_category()};
}

/**
 * Get the enumerator name behind a parse or store error code
 *
 * @param[in] ec The error code
 * @return The enum name, or "unknown" for foreign categories
 */
[[nodiscard]] inline const char *get_error_name(const std::error_code &ec) noexcept {
    if (ec.category() == parse_category()) {
        return ::wise_enum::to_string(static_cast<ParseErrc>(ec.value())).data();
    }
    if (ec.category() == store_category()) {
        return ::wise_enum::to_string(static_cast<StoreErrc>(ec.value())).data();
    }
    return "unknown";
}

} // namespace mont::store

#endif // MONT_STORE_STORE_ERRORS_HPP

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
 * @file app_errors.hpp
 * @brief Error codes raised by the command layer itself
 */

#ifndef MONT_APP_APP_ERRORS_HPP
#define MONT_APP_APP_ERRORS_HPP

#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <wise_enum.h>

namespace mont::app {

/**
 * Command layer errors
 */
enum class AppErrc : std::uint8_t {
    Success,         //!< Command finished
    PickerCancelled, //!< The interactive picker was closed without a choice
    NoCandidates,    //!< Nothing to pick from
    EmptyInput       //!< A distill source contains no records
};

} // namespace mont::app

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(mont::app::AppErrc, Success, PickerCancelled, NoCandidates, EmptyInput)

namespace std {
template <> struct is_error_code_enum<mont::app::AppErrc> : true_type {};
} // namespace std

namespace mont::app {

/**
 * Error category for the command layer
 */
class AppErrorCategory final : public std::error_category {
private:
    static constexpr std::array<std::string_view, 4> KMESSAGES{
            "Success: Command finished",
            "Picker cancelled: No task was selected",
            "No candidates: There is nothing to choose from",
            "Empty input: The source file contains no task records"};

    static_assert(
            KMESSAGES.size() == ::wise_enum::size<AppErrc>,
            "KMESSAGES array size must match the number of AppErrc enum values");

public:
    [[nodiscard]] const char *name() const noexcept override { return "mont::app"; }

    [[nodiscard]] std::string message(const int condition) const override {
        const auto idx = static_cast<std::size_t>(condition);
        if (idx < KMESSAGES.size()) {
            return std::string{*std::next(KMESSAGES.begin(), static_cast<std::ptrdiff_t>(idx))};
        }
        return std::format("Unknown app error: {}", condition);
    }

    [[nodiscard]] std::error_condition
    default_error_condition(const int condition) const noexcept override {
        switch (static_cast<AppErrc>(condition)) {
        case AppErrc::Success:
            return {};
        case AppErrc::PickerCancelled:
            return std::errc::operation_canceled;
        default:
            return std::errc::invalid_argument;
        }
    }
};

[[nodiscard]] inline const AppErrorCategory &app_category() noexcept {
    static const AppErrorCategory instance{};
    return instance;
}

[[nodiscard]] inline std::error_code make_error_code(const AppErrc errc) noexcept {
    return {static_cast<int>(errc), app_category()};
}

} // namespace mont::app

#endif // MONT_APP_APP_ERRORS_HPP

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
 * @file picker.cpp
 * @brief Line based implementation of the interactive picker
 */

#include <charconv>
#include <cstddef>
#include <format>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "app/app_log.hpp"
#include "app/picker.hpp"
#include "log/log_macros.hpp"

namespace mont::app {

namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

/**
 * Match an answer against the list
 *
 * @return Index of the chosen item
 */
std::optional<std::size_t> match_answer(const std::string_view answer, std::span<const PickerItem> items) {
    std::size_t number{};
    const auto [end, ec] = std::from_chars(answer.data(), answer.data() + answer.size(), number);
    if (ec == std::errc{} && end == answer.data() + answer.size() && number >= 1 &&
        number <= items.size()) {
        return number - 1;
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].id == answer) {
            return i;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

StdinPicker::StdinPicker(std::istream &in, std::ostream &out) : in_{in}, out_{out} {}

std::optional<std::string>
StdinPicker::pick(const std::string_view prompt, std::span<const PickerItem> items) {
    if (items.empty()) {
        return std::nullopt;
    }

    out_ << prompt << '\n';
    const auto width = std::to_string(items.size()).size();
    for (std::size_t i = 0; i < items.size(); ++i) {
        out_ << std::format("  {:>{}}) {}", i + 1, width, items[i].id);
        if (!items[i].label.empty()) {
            out_ << "  " << items[i].label;
        }
        out_ << '\n';
    }

    std::string line;
    while (true) {
        out_ << "> " << std::flush;
        if (!std::getline(in_, line)) {
            MONT_LOGC_DEBUG(AppLog::Picker, "Input closed, selection cancelled");
            return std::nullopt;
        }
        const auto answer = trim(line);
        if (answer.empty()) {
            return std::nullopt;
        }
        if (const auto index = match_answer(answer, items)) {
            MONT_LOGC_DEBUG(AppLog::Picker, "Picked '{}'", items[*index].id);
            return items[*index].id;
        }
        out_ << std::format("'{}' is not one of the choices\n", answer);
    }
}

} // namespace mont::app

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
 * @file scripted_picker.hpp
 * @brief Picker that replays canned answers
 */

#ifndef MONT_APP_TESTS_SCRIPTED_PICKER_HPP
#define MONT_APP_TESTS_SCRIPTED_PICKER_HPP

#include <deque>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "app/picker.hpp"

namespace mont::app::testing {

/**
 * Returns queued answers in order and remembers what it was offered
 *
 * A std::nullopt answer, or running out of answers, cancels the pick.
 */
class ScriptedPicker final : public IPicker {
public:
    void answer(std::optional<std::string> choice) { answers_.push_back(std::move(choice)); }

    [[nodiscard]] std::optional<std::string>
    pick(const std::string_view prompt, std::span<const PickerItem> items) override {
        prompts_.emplace_back(prompt);
        offered_.clear();
        for (const auto &item : items) {
            offered_.push_back(item.id);
        }
        if (answers_.empty()) {
            return std::nullopt;
        }
        auto choice = std::move(answers_.front());
        answers_.pop_front();
        return choice;
    }

    [[nodiscard]] const std::vector<std::string> &prompts() const noexcept { return prompts_; }

    /**
     * Ids offered by the most recent pick
     */
    [[nodiscard]] const std::vector<std::string> &offered() const noexcept { return offered_; }

private:
    std::deque<std::optional<std::string>> answers_;
    std::vector<std::string> prompts_;
    std::vector<std::string> offered_;
};

} // namespace mont::app::testing

#endif // MONT_APP_TESTS_SCRIPTED_PICKER_HPP

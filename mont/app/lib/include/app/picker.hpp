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
 * @file picker.hpp
 * @brief Interactive selection used to resolve "?" arguments
 */

#ifndef MONT_APP_PICKER_HPP
#define MONT_APP_PICKER_HPP

#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace mont::app {

/**
 * One selectable entry
 */
struct PickerItem final {
    std::string id;    //!< Value returned when chosen
    std::string label; //!< Text shown next to the id, may be empty
};

/**
 * Chooses one item from a list
 *
 * Implementations may block for user input.
 */
class IPicker {
public:
    IPicker() = default;
    virtual ~IPicker() = default;

    IPicker(IPicker &&) = default;
    IPicker &operator=(IPicker &&) = default;

    IPicker(const IPicker &) = delete;
    IPicker &operator=(const IPicker &) = delete;

    /**
     * Ask for one item
     *
     * @param[in] prompt Question shown above the list
     * @param[in] items Non-empty list of choices
     * @return Chosen id, or std::nullopt if the user cancelled
     */
    [[nodiscard]] virtual std::optional<std::string>
    pick(std::string_view prompt, std::span<const PickerItem> items) = 0;
};

/**
 * Numbered list on an output stream, answer read line by line
 *
 * An answer is either the item number or its exact id. An empty line or end
 * of input cancels; anything else asks again.
 */
class StdinPicker final : public IPicker {
public:
    /**
     * @param[in] in Answer stream
     * @param[in] out Stream the list and prompt are written to
     */
    StdinPicker(std::istream &in, std::ostream &out);

    [[nodiscard]] std::optional<std::string>
    pick(std::string_view prompt, std::span<const PickerItem> items) override;

private:
    std::istream &in_;
    std::ostream &out_;
};

} // namespace mont::app

#endif // MONT_APP_PICKER_HPP

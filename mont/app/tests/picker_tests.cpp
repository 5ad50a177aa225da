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
 * @file picker_tests.cpp
 * @brief Unit tests for the line based picker
 */

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "app/picker.hpp"

namespace {

namespace ma = ::mont::app;

const std::vector<ma::PickerItem> ITEMS{{"a", "Alpha"}, {"b", ""}};

TEST(StdinPicker, ChoosesByNumber) {
    std::istringstream in{"2\n"};
    std::ostringstream out;
    ma::StdinPicker picker{in, out};

    EXPECT_EQ(picker.pick("Pick:", ITEMS), std::optional<std::string>{"b"});
    EXPECT_EQ(out.str(), "Pick:\n  1) a  Alpha\n  2) b\n> ");
}

TEST(StdinPicker, ChoosesById) {
    std::istringstream in{"  a \n"};
    std::ostringstream out;
    ma::StdinPicker picker{in, out};

    EXPECT_EQ(picker.pick("Pick:", ITEMS), std::optional<std::string>{"a"});
}

TEST(StdinPicker, AsksAgainAfterBadAnswer) {
    std::istringstream in{"9\nzzz\nb\n"};
    std::ostringstream out;
    ma::StdinPicker picker{in, out};

    EXPECT_EQ(picker.pick("Pick:", ITEMS), std::optional<std::string>{"b"});
    EXPECT_NE(out.str().find("'9' is not one of the choices\n"), std::string::npos);
    EXPECT_NE(out.str().find("'zzz' is not one of the choices\n"), std::string::npos);
}

TEST(StdinPicker, EmptyLineOrEndOfInputCancels) {
    std::ostringstream out;

    std::istringstream blank{"\n1\n"};
    ma::StdinPicker blank_picker{blank, out};
    EXPECT_FALSE(blank_picker.pick("Pick:", ITEMS).has_value());

    std::istringstream closed{""};
    ma::StdinPicker closed_picker{closed, out};
    EXPECT_FALSE(closed_picker.pick("Pick:", ITEMS).has_value());
}

TEST(StdinPicker, NothingToPick) {
    std::istringstream in{"1\n"};
    std::ostringstream out;
    ma::StdinPicker picker{in, out};

    EXPECT_FALSE(picker.pick("Pick:", {}).has_value());
    EXPECT_TRUE(out.str().empty());
}

} // namespace

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
 * @file error_report_tests.cpp
 * @brief Unit tests for error messages and remediation hints
 */

#include <future>
#include <sstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <wise_enum.h>

#include "app/app_errors.hpp"
#include "app/error_report.hpp"
#include "display/dag_renderer.hpp"
#include "graph/graph_errors.hpp"
#include "store/store_errors.hpp"

namespace {

namespace ma = ::mont::app;
namespace md = ::mont::display;
namespace mg = ::mont::graph;
namespace ms = ::mont::store;

template <typename Errc> void expect_hint_for_every_failure() {
    for (const auto &entry : ::wise_enum::range<Errc>) {
        const auto violation = mg::make_violation(entry.value, "t", "r");
        const auto report = ma::make_report(violation, ".tasks");
        EXPECT_EQ(report.message, violation.to_string());
        if (entry.value == Errc::Success) {
            EXPECT_TRUE(report.hint.empty()) << entry.name;
        } else {
            EXPECT_FALSE(report.hint.empty()) << entry.name;
        }
    }
}

TEST(ErrorReport, EveryFailureHasHint) {
    expect_hint_for_every_failure<mg::GraphErrc>();
    expect_hint_for_every_failure<mg::GateErrc>();
    expect_hint_for_every_failure<mg::CompletionErrc>();
    expect_hint_for_every_failure<mg::LifecycleErrc>();
    expect_hint_for_every_failure<ms::ParseErrc>();
    expect_hint_for_every_failure<ms::StoreErrc>();
    expect_hint_for_every_failure<ma::AppErrc>();
}

TEST(ErrorReport, HintNamesRecordFiles) {
    const auto report = ma::make_report(
            mg::make_violation(mg::GraphErrc::InvalidPrecondition, "b", "a"), ".tasks");
    EXPECT_EQ(report.hint, "create .tasks/a.md or remove 'a' from after in .tasks/b.md");

    const auto pending = ma::make_report(
            mg::make_violation(mg::CompletionErrc::GatesPending, "t"), ".tasks");
    EXPECT_EQ(pending.hint, "pass the blocking gates with 'mont unlock t <gate>...'");

    const auto misplaced = ma::make_report(
            mg::make_violation(mg::GraphErrc::AfterIsValidator, "a", "lint"), ".tasks");
    EXPECT_EQ(misplaced.hint, "move 'lint' from after to validations in .tasks/a.md");
}

TEST(ErrorReport, ForeignCategoryHasNoHint) {
    const auto report = ma::make_report(
            mg::make_violation(std::make_error_code(std::future_errc::no_state), "t"), ".tasks");
    EXPECT_FALSE(report.message.empty());
    EXPECT_TRUE(report.hint.empty());
}

TEST(PrintReport, PlainText) {
    std::ostringstream out;
    ma::print_report(out, ma::ErrorReport{"boom", "fix it"}, md::UseColor{false});
    EXPECT_EQ(out.str(), "error: boom\nhint: fix it\n");

    std::ostringstream bare;
    ma::print_report(bare, ma::ErrorReport{"boom", ""}, md::UseColor{false});
    EXPECT_EQ(bare.str(), "error: boom\n");
}

TEST(PrintReport, ColouredLabels) {
    std::ostringstream out;
    ma::print_report(out, ma::ErrorReport{"boom", "fix it"}, md::UseColor{true});
    const auto text = out.str();
    EXPECT_NE(text.find("\x1b["), std::string::npos);
    EXPECT_NE(text.find(": boom\n"), std::string::npos);
    EXPECT_NE(text.find(": fix it\n"), std::string::npos);
}

TEST(AppErrors, CategoryAndConditions) {
    const std::error_code cancelled = ma::AppErrc::PickerCancelled;
    EXPECT_STREQ(cancelled.category().name(), "mont::app");
    EXPECT_EQ(cancelled, std::errc::operation_canceled);
    EXPECT_EQ(std::error_code{ma::AppErrc::EmptyInput}, std::errc::invalid_argument);
    EXPECT_FALSE(std::error_code{ma::AppErrc::Success});
}

} // namespace

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
 * @file settings_tests.cpp
 * @brief Unit tests for global config parsing and validation
 */

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "store/settings.hpp"
#include "store/store_errors.hpp"
#include "task_fixtures.hpp"
#include "temp_directory.hpp"

namespace {

namespace mg = ::mont::graph;
namespace ms = ::mont::store;
using mg::testing::must_form;
using mg::testing::TaskBuilder;

TEST(ParseConfig, EmptyDocumentGivesDefaults) {
    const auto config = ms::parse_config("");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, ms::GlobalConfig{});

    const auto null_gates = ms::parse_config("default_gates:\n");
    ASSERT_TRUE(null_gates.has_value());
    EXPECT_TRUE(null_gates->default_gates.empty());
}

TEST(ParseConfig, ReadsDefaultGatesInOrder) {
    const auto config = ms::parse_config("default_gates:\n  - tests\n  - lint\nfuture_key: 3\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->default_gates, (std::vector<std::string>{"tests", "lint"}));
}

TEST(ParseConfig, RejectsMalformedDocuments) {
    for (const char *text :
         {"- just\n- a list\n",
          "default_gates: tests\n",
          "default_gates:\n  - [nested]\n",
          "default_gates: [unclosed\n"}) {
        const auto config = ms::parse_config(text);
        ASSERT_FALSE(config.has_value()) << text;
        EXPECT_EQ(config.error().code, ms::StoreErrc::ConfigParseFailed) << text;
    }
}

TEST(InitTasksDirectory, CreatesDirectoryAndDefaultConfig) {
    const mont::utils::TempDirectory dir;
    const auto tasks_dir = dir.path() / ".tasks";
    const auto config_path = tasks_dir / ms::CONFIG_FILE_NAME;

    const auto first = ms::init_tasks_directory(tasks_dir, config_path);
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->created_directory);
    EXPECT_TRUE(first->created_config);
    EXPECT_EQ(mont::utils::read_file_contents(config_path), ms::DEFAULT_CONFIG_TEXT);

    const auto loaded = ms::load_config(config_path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, ms::GlobalConfig{});
}

TEST(InitTasksDirectory, KeepsExistingConfig) {
    const mont::utils::TempDirectory dir;
    const auto config_path = dir.file(ms::CONFIG_FILE_NAME);
    mont::utils::write_file_contents(config_path, "default_gates:\n  - review\n");

    const auto outcome = ms::init_tasks_directory(dir.path(), config_path);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->created_directory);
    EXPECT_FALSE(outcome->created_config);
    EXPECT_EQ(mont::utils::read_file_contents(config_path), "default_gates:\n  - review\n");
}

TEST(InitTasksDirectory, FileInPlaceOfDirectoryFails) {
    const mont::utils::TempDirectory dir;
    const auto blocker = dir.file("blocker");
    mont::utils::write_file_contents(blocker, "not a directory\n");

    const auto outcome = ms::init_tasks_directory(blocker, blocker / ms::CONFIG_FILE_NAME);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ms::StoreErrc::WriteFailed);
    EXPECT_EQ(outcome.error().related_id, blocker.string());
}

TEST(LoadConfig, MissingFileGivesDefaults) {
    const mont::utils::TempDirectory dir;
    const auto config = ms::load_config(dir.file(ms::CONFIG_FILE_NAME));
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->default_gates.empty());
}

TEST(LoadConfig, ReadsFileAndNamesItOnError) {
    const mont::utils::TempDirectory dir;
    const auto path = dir.file(ms::CONFIG_FILE_NAME);

    mont::utils::write_file_contents(path, "default_gates:\n  - review\n");
    const auto config = ms::load_config(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->default_gates, (std::vector<std::string>{"review"}));

    mont::utils::write_file_contents(path, "default_gates: 7\n");
    const auto broken = ms::load_config(path);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, ms::StoreErrc::ConfigParseFailed);
    EXPECT_EQ(broken.error().related_id, path.string());
}

class ValidateConfigTest : public ::testing::Test {
protected:
    mg::TaskGraph graph_ = must_form({
            TaskBuilder("lint").validator(),
            TaskBuilder("lint-docs").validator().before({"lint"}),
            TaskBuilder("work"),
    });
};

TEST_F(ValidateConfigTest, AcceptsRootValidators) {
    EXPECT_TRUE(ms::validate_config(ms::GlobalConfig{{"lint"}}, graph_).has_value());
    EXPECT_TRUE(ms::validate_config(ms::GlobalConfig{}, graph_).has_value());
}

TEST_F(ValidateConfigTest, RejectsUnknownGate) {
    const auto result = ms::validate_config(ms::GlobalConfig{{"lint", "ghost"}}, graph_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ms::StoreErrc::DefaultGateNotFound);
    EXPECT_EQ(result.error().task_id, "ghost");
}

TEST_F(ValidateConfigTest, RejectsNonValidatorGate) {
    const auto result = ms::validate_config(ms::GlobalConfig{{"work"}}, graph_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ms::StoreErrc::DefaultGateNotValidator);
    EXPECT_EQ(result.error().task_id, "work");
}

TEST_F(ValidateConfigTest, RejectsNestedValidatorGate) {
    const auto result = ms::validate_config(ms::GlobalConfig{{"lint-docs"}}, graph_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ms::StoreErrc::DefaultGateNotRoot);
    EXPECT_EQ(result.error().related_id, "lint");
}

} // namespace

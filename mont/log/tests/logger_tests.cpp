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
 * @file logger_tests.cpp
 * @brief Unit tests for the process-wide logger and component filtering
 */

#include <filesystem>    // for exists
#include <stdexcept>     // for invalid_argument
#include <string>        // for string
#include <unordered_map> // for unordered_map
#include <vector>        // for vector

#include <gtest/gtest.h>

#include "log/components.hpp"
#include "log/log_macros.hpp"
#include "log/logger.hpp"
#include "temp_directory.hpp"

namespace {

namespace ml = ::mont::log;

DECLARE_LOG_COMPONENT(TestComponent, Parser, Writer, Layout);
DECLARE_LOG_EVENT(TestEvent, Loaded, Saved);

struct Point final {
    int x{};
    int y{};
};

} // namespace

MONT_LOGGABLE_DEFERRED_FORMAT(Point, "Point({}, {})", obj.x, obj.y)

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        ml::Logger::configure(ml::LoggerConfig::console(ml::LogLevel::Debug));
        ml::register_component<TestComponent>(ml::LogLevel::Info);
    }

    mont::utils::TempDirectory dir_{"mont_log"};
};

TEST_F(LoggerTest, FileSinkReceivesMessages) {
    const std::string log_file = dir_.file("file.log").string();
    ml::Logger::configure(ml::LoggerConfig::file(log_file, ml::LogLevel::Debug));

    MONT_LOG_DEBUG("debug value {}", 42);
    MONT_LOG_INFO("info value {}", "text");
    MONT_LOG_WARN("warning line");
    ml::Logger::flush();

    const std::string actual = ml::Logger::get_actual_log_file();
    ASSERT_TRUE(std::filesystem::exists(actual));
    const std::string contents = mont::utils::read_file_contents(actual);
    EXPECT_NE(contents.find("debug value 42"), std::string::npos);
    EXPECT_NE(contents.find("info value text"), std::string::npos);
    EXPECT_NE(contents.find("warning line"), std::string::npos);
    EXPECT_EQ(ml::Logger::get_sink_type(), ml::SinkType::File);
}

TEST_F(LoggerTest, GlobalLevelFiltersMessages) {
    const std::string log_file = dir_.file("level.log").string();
    ml::Logger::configure(ml::LoggerConfig::file(log_file, ml::LogLevel::Warn));

    MONT_LOG_INFO("hidden info");
    MONT_LOG_ERROR("visible error");
    ml::Logger::flush();

    const std::string contents = mont::utils::read_file_contents(ml::Logger::get_actual_log_file());
    EXPECT_EQ(contents.find("hidden info"), std::string::npos);
    EXPECT_NE(contents.find("visible error"), std::string::npos);
    EXPECT_EQ(ml::Logger::get_current_level(), ml::LogLevel::Warn);

    ml::Logger::set_level(ml::LogLevel::Debug);
    EXPECT_EQ(ml::Logger::get_current_level(), ml::LogLevel::Debug);
}

TEST_F(LoggerTest, ComponentLevelsFilterIndependently) {
    const std::string log_file = dir_.file("component.log").string();
    ml::Logger::configure(ml::LoggerConfig::file(log_file, ml::LogLevel::Debug));

    ml::register_component<TestComponent>(std::unordered_map<TestComponent, ml::LogLevel>{
            {TestComponent::Parser, ml::LogLevel::Debug},
            {TestComponent::Writer, ml::LogLevel::Error}});

    MONT_LOGC_DEBUG(TestComponent::Parser, "parser detail {}", 7);
    MONT_LOGC_INFO(TestComponent::Writer, "writer chatter");
    MONT_LOGC_ERROR(TestComponent::Writer, "writer failure");
    ml::Logger::flush();

    const std::string contents = mont::utils::read_file_contents(ml::Logger::get_actual_log_file());
    EXPECT_NE(contents.find("[Parser] parser detail 7"), std::string::npos);
    EXPECT_EQ(contents.find("writer chatter"), std::string::npos);
    EXPECT_NE(contents.find("[Writer] writer failure"), std::string::npos);

    EXPECT_EQ(ml::get_component_level(TestComponent::Parser), ml::LogLevel::Debug);
    EXPECT_EQ(ml::get_component_level(TestComponent::Writer), ml::LogLevel::Error);
}

TEST_F(LoggerTest, EventsAndCustomTypesAreFormatted) {
    const std::string log_file = dir_.file("event.log").string();
    ml::Logger::configure(ml::LoggerConfig::file(log_file, ml::LogLevel::Debug));
    ml::register_component<TestComponent>(ml::LogLevel::Debug);

    MONT_LOGEC_INFO(TestComponent::Layout, TestEvent::Saved, "stored {}", Point{3, 4});
    ml::Logger::flush();

    const std::string contents = mont::utils::read_file_contents(ml::Logger::get_actual_log_file());
    EXPECT_NE(contents.find("[Layout] EVENT [Saved] stored Point(3, 4)"), std::string::npos);
}

TEST(LoggerConfig, FactoriesAndFluentSetters) {
    auto config = ml::LoggerConfig::json_file("out.json", ml::LogLevel::Error)
                          .with_timestamps(false)
                          .with_file_line();
    EXPECT_EQ(config.sink_type, ml::SinkType::JsonFile);
    EXPECT_EQ(config.log_file, "out.json");
    EXPECT_EQ(config.min_level, ml::LogLevel::Error);
    EXPECT_FALSE(config.enable_timestamps);
    EXPECT_TRUE(config.enable_file_line);

    const auto console = ml::LoggerConfig::console(ml::LogLevel::Warn, false);
    EXPECT_EQ(console.sink_type, ml::SinkType::Console);
    EXPECT_FALSE(console.enable_colors);
}

TEST(LoggerConfig, FileSinkWithoutPathThrows) {
    EXPECT_THROW(ml::Logger::configure(ml::LoggerConfig::file("")), std::invalid_argument);
    ml::Logger::configure(ml::LoggerConfig::console(ml::LogLevel::Debug));
}

TEST(EnumRegistry, NamesComeFromWiseEnum) {
    EXPECT_EQ(ml::format_component_name(TestComponent::Writer), "Writer");
    EXPECT_EQ(ml::format_event_name(TestEvent::Loaded), "Loaded");
    EXPECT_TRUE(ml::EnumRegistry<TestComponent>::is_valid(TestComponent::Layout));
    EXPECT_FALSE(ml::EnumRegistry<TestComponent>::is_valid(static_cast<TestComponent>(9)));
    EXPECT_EQ(ml::EnumRegistry<TestComponent>::get_name(static_cast<TestComponent>(9)), "UNKNOWN");
}

} // namespace

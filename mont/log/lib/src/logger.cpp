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
 * @file logger.cpp
 * @brief Process-wide quill logger implementation
 */

#include <atomic>    // for atomic
#include <chrono>    // for milliseconds, microseconds
#include <memory>    // for shared_ptr, unique_ptr
#include <mutex>     // for mutex, lock_guard
#include <stdexcept> // for invalid_argument
#include <string>    // for string, to_string
#include <utility>   // for move
#include <vector>    // for vector

#include <quill/Backend.h>                      // for Backend
#include <quill/LogMacros.h>                    // for QUILL_LOG_DEBUG
#include <quill/backend/BackendOptions.h>       // for BackendOptions
#include <quill/core/Common.h>                  // for Timezone
#include <quill/core/LogLevel.h>                // for LogLevel
#include <quill/core/PatternFormatterOptions.h> // for PatternFormatterOptions
#include <quill/sinks/ConsoleSink.h>            // for ConsoleSink
#include <quill/sinks/FileSink.h>               // for FileSink
#include <quill/sinks/JsonSink.h>               // for JsonFileSink, JsonConsoleSink
#include <quill/sinks/Sink.h>                   // for Sink

#include <wise_enum.h> // for to_string

#include "log/components.hpp" // for LogLevel
#include "log/logger.hpp"     // for Logger, LoggerConfig

namespace mont::log {

namespace {

LoggerConfig make_config(
        const SinkType sink_type, const LogLevel level, const bool colors, std::string path = {}) {
    LoggerConfig config{};
    config.sink_type = sink_type;
    config.min_level = level;
    config.enable_colors = colors;
    config.log_file = std::move(path);
    return config;
}

/**
 * Build the quill pattern from the enabled prefix fields
 *
 * @param[in] config Logger configuration
 * @return Quill pattern string
 */
std::string build_pattern(const LoggerConfig &config) {
    std::vector<std::string> parts;
    if (config.enable_timestamps) {
        parts.emplace_back("%(time)");
    }
    if (config.enable_log_level) {
        parts.emplace_back("[%(log_level)]");
    }
    if (config.enable_file_line) {
        parts.emplace_back("[%(short_source_location)]");
    }
    parts.emplace_back("%(message)");

    std::string pattern;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            pattern += " ";
        }
        pattern += parts[i];
    }
    return pattern;
}

bool is_file_sink(const SinkType sink_type) noexcept {
    return sink_type == SinkType::File || sink_type == SinkType::JsonFile;
}

} // anonymous namespace

LoggerConfig LoggerConfig::console(const LogLevel level, const bool colors) {
    return make_config(SinkType::Console, level, colors);
}

LoggerConfig LoggerConfig::file(std::string path, const LogLevel level) {
    return make_config(SinkType::File, level, false, std::move(path));
}

LoggerConfig LoggerConfig::json_file(std::string path, const LogLevel level) {
    return make_config(SinkType::JsonFile, level, false, std::move(path));
}

LoggerConfig LoggerConfig::json_console(const LogLevel level) {
    return make_config(SinkType::JsonConsole, level, false);
}

LoggerConfig &LoggerConfig::with_file_line(const bool enable) {
    enable_file_line = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_timestamps(const bool enable) {
    enable_timestamps = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_log_level(const bool enable) {
    enable_log_level = enable;
    return *this;
}

LoggerConfig &LoggerConfig::with_colors(const bool enable) {
    enable_colors = enable;
    return *this;
}

Logger::Logger(const LoggerConfig &config) : sink_type_{config.sink_type} {
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }

    quill::BackendOptions backend_options;
    backend_options.thread_name = "MontLogBackend";
    backend_options.enable_yield_when_idle = true;
    backend_options.sleep_duration = std::chrono::milliseconds{1};
    backend_options.log_timestamp_ordering_grace_period = std::chrono::microseconds{0};
    quill::Backend::start(backend_options);

    auto sink = create_sink(config);
    const std::string pattern = build_pattern(config);

    const quill::PatternFormatterOptions formatter_opts{
            pattern, "%H:%M:%S.%Qms", quill::Timezone::LocalTime};

    static std::atomic<int> logger_counter{0};
    const std::string logger_name = "mont_logger_" + std::to_string(logger_counter.fetch_add(1));

    quill_logger_ = CliFrontend::create_or_get_logger(logger_name, std::move(sink), formatter_opts);
    quill_logger_->set_log_level(to_quill_level(config.min_level));

    QUILL_LOG_DEBUG(
            quill_logger_,
            "Logger configured - Sink: {}, Level: {}, File: '{}'",
            ::wise_enum::to_string(config.sink_type),
            ::wise_enum::to_string(config.min_level),
            actual_log_file_.empty() ? "none" : actual_log_file_);
}

Logger::~Logger() noexcept {
    if (quill_logger_ != nullptr) {
        quill_logger_->flush_log();
    }
    if (quill::Backend::is_running()) {
        quill::Backend::stop();
    }
}

std::unique_ptr<Logger> &Logger::get_instance() {
    static std::unique_ptr<Logger> instance =
            std::unique_ptr<Logger>(new Logger(LoggerConfig::console()));
    return instance;
}

void Logger::configure(const LoggerConfig &config) {
    // Reject before tearing down the current logger so it stays usable
    if (is_file_sink(config.sink_type) && config.log_file.empty()) {
        throw std::invalid_argument(std::string{::wise_enum::to_string(config.sink_type)} +
                                    " sink requires a log file path");
    }

    static std::mutex configure_mutex;
    const std::lock_guard<std::mutex> lock(configure_mutex);
    auto &instance = get_instance();
    instance.reset();
    instance = std::unique_ptr<Logger>(new Logger(config));
}

void Logger::set_level(const LogLevel level) {
    auto &instance = get_instance();
    if (instance->quill_logger_ != nullptr) {
        instance->quill_logger_->set_log_level(to_quill_level(level));
    }
}

void Logger::flush() {
    auto &instance = get_instance();
    if (instance->quill_logger_ != nullptr) {
        instance->quill_logger_->flush_log();
    }
}

SinkType Logger::get_sink_type() { return get_instance()->sink_type_; }

LogLevel Logger::get_current_level() {
    const auto &instance = get_instance();
    if (instance->quill_logger_ == nullptr) {
        return get_logger_default_level();
    }
    return from_quill_level(instance->quill_logger_->get_log_level());
}

std::string Logger::get_actual_log_file() { return get_instance()->actual_log_file_; }

std::shared_ptr<quill::Sink> Logger::create_sink(const LoggerConfig &config) {
    switch (config.sink_type) {
    case SinkType::Console: {
        quill::ConsoleSinkConfig console_config;
        console_config.set_colour_mode(
                config.enable_colors ? quill::ConsoleSinkConfig::ColourMode::Automatic
                                     : quill::ConsoleSinkConfig::ColourMode::Never);
        actual_log_file_.clear();
        return std::make_shared<quill::ConsoleSink>(console_config);
    }

    case SinkType::File: {
        quill::FileSinkConfig file_config;
        file_config.set_open_mode('a');
        auto file_sink = std::make_shared<quill::FileSink>(
                config.log_file, file_config, quill::FileEventNotifier{});
        actual_log_file_ = file_sink->get_filename().string();
        return file_sink;
    }

    case SinkType::JsonFile: {
        quill::FileSinkConfig file_config;
        file_config.set_open_mode('a');
        auto json_sink = std::make_shared<quill::JsonFileSink>(config.log_file, file_config);
        actual_log_file_ = json_sink->get_filename().string();
        return json_sink;
    }

    case SinkType::JsonConsole:
        actual_log_file_.clear();
        return CliFrontend::create_or_get_sink<quill::JsonConsoleSink>("mont_json_console");
    }

    throw std::invalid_argument("Unknown sink type");
}

quill::LogLevel Logger::to_quill_level(const LogLevel level) {
    switch (level) {
    case LogLevel::TraceL1:
        return quill::LogLevel::TraceL1;
    case LogLevel::Debug:
        return quill::LogLevel::Debug;
    case LogLevel::Info:
        return quill::LogLevel::Info;
    case LogLevel::Notice:
        return quill::LogLevel::Notice;
    case LogLevel::Warn:
        return quill::LogLevel::Warning;
    case LogLevel::Error:
        return quill::LogLevel::Error;
    case LogLevel::Critical:
        return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

LogLevel Logger::from_quill_level(const quill::LogLevel level) {
    switch (level) {
    case quill::LogLevel::TraceL3:
    case quill::LogLevel::TraceL2:
    case quill::LogLevel::TraceL1:
        return LogLevel::TraceL1;
    case quill::LogLevel::Debug:
        return LogLevel::Debug;
    case quill::LogLevel::Info:
        return LogLevel::Info;
    case quill::LogLevel::Notice:
        return LogLevel::Notice;
    case quill::LogLevel::Warning:
        return LogLevel::Warn;
    case quill::LogLevel::Error:
        return LogLevel::Error;
    case quill::LogLevel::Critical:
        return LogLevel::Critical;
    default:
        return LogLevel::Info;
    }
}

LogLevel get_logger_default_level() { return LogLevel::Info; }

namespace detail {
CliLogger *get_quill_logger() { return Logger::get_instance()->quill_logger_; }
} // namespace detail

} // namespace mont::log

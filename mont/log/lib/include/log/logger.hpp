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
 * @file logger.hpp
 * @brief Process-wide quill logger used by the mont libraries and CLI
 */

#ifndef MONT_LOG_LOGGER_HPP
#define MONT_LOG_LOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Disable Quill's non-prefixed macros to avoid conflicts
#define QUILL_DISABLE_NON_PREFIXED_MACROS

#include <quill/Backend.h>
#include <quill/DeferredFormatCodec.h>
#include <quill/DirectFormatCodec.h>
#include <quill/Frontend.h>
#include <quill/HelperMacros.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/JsonSink.h>
#include <quill/std/Vector.h>

#include <wise_enum.h>

#include "log/components.hpp"

namespace mont::log {

/**
 * Frontend options for a short-lived command line process
 *
 * Messages must never be dropped: a command may log a handful of lines and
 * exit immediately, so the queue blocks instead of discarding.
 */
struct CliFrontendOptions final {
    static constexpr quill::QueueType queue_type = // NOLINT(readability-identifier-naming)
            quill::QueueType::UnboundedBlocking;
    static constexpr std::uint32_t initial_queue_capacity = // NOLINT(readability-identifier-naming)
            128U * 1024U;
    static constexpr std::uint32_t
            blocking_queue_retry_interval_ns = // NOLINT(readability-identifier-naming)
            800;
    static constexpr std::size_t unbounded_queue_max_capacity = // NOLINT(readability-identifier-naming)
            64U * 1024U * 1024U;
    static constexpr quill::HugePagesPolicy
            huge_pages_policy = // NOLINT(readability-identifier-naming)
            quill::HugePagesPolicy::Never;
};

using CliFrontend = quill::FrontendImpl<CliFrontendOptions>;
using CliLogger = quill::LoggerImpl<CliFrontendOptions>;

/**
 * Supported log output destinations
 */
enum class SinkType {
    Console,    //!< Coloured console output
    File,       //!< Plain text file
    JsonFile,   //!< JSON lines file
    JsonConsole //!< JSON lines on the console
};

} // namespace mont::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(mont::log::SinkType, Console, File, JsonFile, JsonConsole)

namespace mont::log {

/**
 * Logger configuration
 */
struct LoggerConfig final {
    SinkType sink_type{SinkType::Console}; //!< Output destination
    std::string log_file;                  //!< Path for file-based sinks
    LogLevel min_level{LogLevel::Info};    //!< Minimum level processed by the logger
    bool enable_colors{true};              //!< Colour console output
    bool enable_file_line{false};          //!< Append file:line to every message
    bool enable_timestamps{true};          //!< Prefix messages with a timestamp
    bool enable_log_level{true};           //!< Prefix messages with the level name

    /**
     * Create a console configuration
     *
     * @param[in] level Minimum log level
     * @param[in] colors Enable colour output
     * @return Console configuration
     */
    static LoggerConfig console(LogLevel level = LogLevel::Info, bool colors = true);

    /**
     * Create a text file configuration
     *
     * @param[in] path Log file path
     * @param[in] level Minimum log level
     * @return File configuration
     */
    static LoggerConfig file(std::string path, LogLevel level = LogLevel::Info);

    /**
     * Create a JSON file configuration
     *
     * @param[in] path Log file path
     * @param[in] level Minimum log level
     * @return JSON file configuration
     */
    static LoggerConfig json_file(std::string path, LogLevel level = LogLevel::Info);

    /**
     * Create a JSON console configuration
     *
     * @param[in] level Minimum log level
     * @return JSON console configuration
     */
    static LoggerConfig json_console(LogLevel level = LogLevel::Info);

    LoggerConfig &with_file_line(bool enable = true);
    LoggerConfig &with_timestamps(bool enable = true);
    LoggerConfig &with_log_level(bool enable = true);
    LoggerConfig &with_colors(bool enable = true);
};

namespace detail {
/**
 * Get the underlying quill logger of the process-wide Logger
 *
 * @return Quill logger pointer
 */
CliLogger *get_quill_logger();
} // namespace detail

/**
 * Process-wide logger
 *
 * Wraps a single quill logger and its backend thread. The first use creates a
 * console logger at Info level; configure() replaces it.
 */
class Logger final {
public:
    /**
     * Replace the process-wide logger
     *
     * Not meant for concurrent use with logging calls: configure once at
     * start-up before work begins.
     *
     * @param[in] config Logger configuration
     * @throws std::invalid_argument if a file sink has no path
     */
    static void configure(const LoggerConfig &config);

    /**
     * Set the minimum level of the process-wide logger
     *
     * @param[in] level New level
     */
    static void set_level(LogLevel level);

    /**
     * Block until every queued message has been written
     */
    static void flush();

    [[nodiscard]] static SinkType get_sink_type();
    [[nodiscard]] static LogLevel get_current_level();

    /**
     * Get the path of the file being written
     *
     * @return Resolved log file path, empty for console sinks
     */
    [[nodiscard]] static std::string get_actual_log_file();

    ~Logger() noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

private:
    explicit Logger(const LoggerConfig &config);

    [[nodiscard]] static std::unique_ptr<Logger> &get_instance();

    [[nodiscard]] static quill::LogLevel to_quill_level(LogLevel level);
    [[nodiscard]] static LogLevel from_quill_level(quill::LogLevel level);

    [[nodiscard]] std::shared_ptr<quill::Sink> create_sink(const LoggerConfig &config);

    SinkType sink_type_{SinkType::Console}; //!< Configured sink type
    std::string actual_log_file_;           //!< Resolved log file path
    CliLogger *quill_logger_{nullptr};      //!< Underlying quill logger

    friend CliLogger *detail::get_quill_logger();
};

} // namespace mont::log

#endif // MONT_LOG_LOGGER_HPP

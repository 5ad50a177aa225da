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
 * @file log_macros.hpp
 * @brief Component-filtered logging macros over the process-wide logger
 */

#ifndef MONT_LOG_LOG_MACROS_HPP
#define MONT_LOG_LOG_MACROS_HPP

#include <quill/LogMacros.h>

#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while,clang-diagnostic-gnu-zero-variadic-macro-arguments)

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wgnu-zero-variadic-macro-arguments"
#endif

#define MONT_GET_LOGGER() ::mont::log::detail::get_quill_logger()

/**
 * Log through the default logger when the component level allows it
 *
 * @param level_enum mont log level enumerator
 * @param quill_level Matching quill macro suffix
 * @param component Component enumerator
 * @param message Format string
 * @param ... Format arguments
 */
#define MONT_LOGC_HELPER(level_enum, quill_level, component, message, ...)                         \
    do {                                                                                           \
        if (::mont::log::ComponentLevelStorage<decltype(component)>::should_log(                   \
                    component, ::mont::log::LogLevel::level_enum)) {                               \
            QUILL_LOG_##quill_level(                                                               \
                    MONT_GET_LOGGER(),                                                             \
                    "[{}] " message,                                                               \
                    ::mont::log::format_component_name(component),                                 \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Component logging tagged with an event
 *
 * @param level_enum mont log level enumerator
 * @param quill_level Matching quill macro suffix
 * @param component Component enumerator
 * @param event Event enumerator
 * @param message Format string
 * @param ... Format arguments
 */
#define MONT_LOGEC_HELPER(level_enum, quill_level, component, event, message, ...)                 \
    do {                                                                                           \
        if (::mont::log::ComponentLevelStorage<decltype(component)>::should_log(                   \
                    component, ::mont::log::LogLevel::level_enum)) {                               \
            QUILL_LOG_##quill_level(                                                               \
                    MONT_GET_LOGGER(),                                                             \
                    "[{}] EVENT [{}] " message,                                                    \
                    ::mont::log::format_component_name(component),                                \
                    ::mont::log::format_event_name(event),                                         \
                    ##__VA_ARGS__);                                                                \
        }                                                                                          \
    } while (0)

/**
 * Make a value type loggable
 *
 * The value is copied into the queue and formatted on the backend thread, so
 * the type must own all of its data.
 *
 * @code
 * MONT_LOGGABLE_DEFERRED_FORMAT(mont::graph::GateEntry, "{}={}", obj.name, obj.status)
 * @endcode
 *
 * @param type Type to make loggable
 * @param format_str Format string for the members
 * @param ... Member expressions, using `obj` for the value
 */
#define MONT_LOGGABLE_DEFERRED_FORMAT(type, format_str, ...)                                       \
    template <> struct fmtquill::formatter<type> {                                                 \
        constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {                 \
            return ctx.begin();                                                                    \
        }                                                                                          \
                                                                                                   \
        template <typename FormatContext>                                                          \
        auto format(const type &obj, FormatContext &ctx) const -> decltype(ctx.out()) {            \
            return fmtquill::format_to(ctx.out(), format_str, __VA_ARGS__);                        \
        }                                                                                          \
    };                                                                                             \
                                                                                                   \
    template <> struct quill::Codec<type> : quill::DeferredFormatCodec<type> {};

// Plain messages
#define MONT_LOG_TRACE_L1(fmt, ...) QUILL_LOG_TRACE_L1(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define MONT_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define MONT_LOG_INFO(fmt, ...) QUILL_LOG_INFO(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define MONT_LOG_NOTICE(fmt, ...) QUILL_LOG_NOTICE(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define MONT_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define MONT_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)
#define MONT_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(MONT_GET_LOGGER(), fmt, ##__VA_ARGS__)

// Component messages
#define MONT_LOGC_TRACE_L1(c, m, ...) MONT_LOGC_HELPER(TraceL1, TRACE_L1, c, m, ##__VA_ARGS__)
#define MONT_LOGC_DEBUG(c, m, ...) MONT_LOGC_HELPER(Debug, DEBUG, c, m, ##__VA_ARGS__)
#define MONT_LOGC_INFO(c, m, ...) MONT_LOGC_HELPER(Info, INFO, c, m, ##__VA_ARGS__)
#define MONT_LOGC_NOTICE(c, m, ...) MONT_LOGC_HELPER(Notice, NOTICE, c, m, ##__VA_ARGS__)
#define MONT_LOGC_WARN(c, m, ...) MONT_LOGC_HELPER(Warn, WARNING, c, m, ##__VA_ARGS__)
#define MONT_LOGC_ERROR(c, m, ...) MONT_LOGC_HELPER(Error, ERROR, c, m, ##__VA_ARGS__)
#define MONT_LOGC_CRITICAL(c, m, ...) MONT_LOGC_HELPER(Critical, CRITICAL, c, m, ##__VA_ARGS__)

// Component messages tagged with an event
#define MONT_LOGEC_DEBUG(c, e, m, ...) MONT_LOGEC_HELPER(Debug, DEBUG, c, e, m, ##__VA_ARGS__)
#define MONT_LOGEC_INFO(c, e, m, ...) MONT_LOGEC_HELPER(Info, INFO, c, e, m, ##__VA_ARGS__)
#define MONT_LOGEC_WARN(c, e, m, ...) MONT_LOGEC_HELPER(Warn, WARNING, c, e, m, ##__VA_ARGS__)
#define MONT_LOGEC_ERROR(c, e, m, ...) MONT_LOGEC_HELPER(Error, ERROR, c, e, m, ##__VA_ARGS__)

#ifdef __clang__
#pragma clang diagnostic pop
#endif

// NOLINTEND(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while,clang-diagnostic-gnu-zero-variadic-macro-arguments)

#endif // MONT_LOG_LOG_MACROS_HPP

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
 * @file components.hpp
 * @brief Log levels, component and event registries for component-filtered logging
 */

#ifndef MONT_LOG_COMPONENTS_HPP
#define MONT_LOG_COMPONENTS_HPP

#include <array>
#include <cstddef>
#include <mutex>
#include <string_view>
#include <unordered_map>

#include <wise_enum.h>

namespace mont::log {

/**
 * Severity levels, from most verbose to most critical
 */
enum class LogLevel {
    TraceL1, //!< Fine-grained algorithm tracing
    Debug,   //!< Debug messages
    Info,    //!< Informational messages
    Notice,  //!< Notice messages
    Warn,    //!< Warning messages
    Error,   //!< Error messages
    Critical //!< Critical error messages
};

} // namespace mont::log

// WISE_ENUM_ADAPT must be called at global namespace scope for ADL to work
WISE_ENUM_ADAPT(mont::log::LogLevel, TraceL1, Debug, Info, Notice, Warn, Error, Critical)

namespace mont::log {

/**
 * Level assigned to components that were never registered explicitly
 *
 * @return Default log level
 */
LogLevel get_logger_default_level();

/**
 * Name lookup for contiguous wise_enum enumerations
 *
 * Component and event enums are declared through WISE_ENUM_CLASS, so their
 * values are contiguous from zero and can index a name table directly.
 *
 * @tparam EnumType Enumeration declared with wise_enum
 */
template <typename EnumType> struct EnumRegistry final {
    static constexpr std::size_t NUM_VALUES = ::wise_enum::size<EnumType>; //!< Enumerator count

    /**
     * Get the enumerator name
     *
     * @param[in] value Enumerator
     * @return Enumerator name, or "UNKNOWN" when out of range
     */
    static std::string_view get_name(const EnumType value) {
        static const std::array<std::string_view, NUM_VALUES> table = [] {
            std::array<std::string_view, NUM_VALUES> names{};
            std::size_t idx = 0;
            for (const auto value_and_name : ::wise_enum::range<EnumType>) {
                // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
                names[idx++] =
                        std::string_view{value_and_name.name.data(), value_and_name.name.size()};
            }
            return names;
        }();

        const auto idx = static_cast<std::size_t>(value);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return idx < NUM_VALUES ? table[idx] : std::string_view{"UNKNOWN"};
    }

    /**
     * Check that an enumerator lies inside the declared range
     *
     * @param[in] value Enumerator
     * @return true if the value is valid
     */
    static constexpr bool is_valid(const EnumType value) noexcept {
        return static_cast<std::size_t>(value) < NUM_VALUES;
    }
};

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * Declare a log component enumeration
 *
 * @param ComponentType Name of the component enum type
 * @param ... Component values
 */
#define DECLARE_LOG_COMPONENT(ComponentType, ...) WISE_ENUM_CLASS(ComponentType, __VA_ARGS__)

/**
 * Declare a log event enumeration
 *
 * @param EventType Name of the event enum type
 * @param ... Event values
 */
#define DECLARE_LOG_EVENT(EventType, ...) WISE_ENUM_CLASS(EventType, __VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)

/**
 * Per-component minimum levels, indexed by enumerator value
 *
 * @tparam ComponentType The component enum type
 */
template <typename ComponentType> class ComponentLevelStorage final {
private:
    static constexpr std::size_t NUM_COMPONENTS = ::wise_enum::size<ComponentType>;
    static std::array<LogLevel, NUM_COMPONENTS> levels; //!< Level per component
    static std::once_flag init_flag;                    //!< Guards default initialization

public:
    /**
     * Fill every component with the default level on first use
     */
    static void initialize() {
        std::call_once(init_flag, []() { levels.fill(get_logger_default_level()); });
    }

    /**
     * Get the level configured for a component
     *
     * @param[in] component Component to query
     * @return Minimum level logged for the component
     */
    static LogLevel get_level(const ComponentType component) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
        return idx < NUM_COMPONENTS ? levels[idx] : get_logger_default_level();
    }

    /**
     * Set the level for one component
     *
     * @param[in] component Component to configure
     * @param[in] level New minimum level
     */
    static void set_level(const ComponentType component, const LogLevel level) {
        initialize();
        const auto idx = static_cast<std::size_t>(component);
        if (idx < NUM_COMPONENTS) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
            levels[idx] = level;
        }
    }

    /**
     * Set the same level for every component
     *
     * @param[in] level New minimum level
     */
    static void set_all_levels(const LogLevel level) {
        initialize();
        levels.fill(level);
    }

    /**
     * Check whether a message passes the component filter
     *
     * @param[in] component Component being logged to
     * @param[in] message_level Level of the message
     * @return true if the message should be logged
     */
    static bool should_log(const ComponentType component, const LogLevel message_level) {
        return message_level >= get_level(component);
    }
};

template <typename ComponentType>
std::array<LogLevel, ComponentLevelStorage<ComponentType>::NUM_COMPONENTS>
        ComponentLevelStorage<ComponentType>::levels;

template <typename ComponentType> std::once_flag ComponentLevelStorage<ComponentType>::init_flag;

/**
 * Get the printable name of a component
 *
 * @tparam ComponentType Component enum type
 * @param[in] component Component value
 * @return Component name
 */
template <typename ComponentType>
std::string_view format_component_name(const ComponentType component) {
    return EnumRegistry<ComponentType>::get_name(component);
}

/**
 * Get the printable name of an event
 *
 * @tparam EventType Event enum type
 * @param[in] event Event value
 * @return Event name
 */
template <typename EventType> std::string_view format_event_name(const EventType event) {
    return EnumRegistry<EventType>::get_name(event);
}

/**
 * Register components with individual log levels
 *
 * @tparam ComponentType Component enum type
 * @param[in] component_levels Level per component
 */
template <typename ComponentType>
void register_component(const std::unordered_map<ComponentType, LogLevel> &component_levels) {
    for (const auto &[component, level] : component_levels) {
        ComponentLevelStorage<ComponentType>::set_level(component, level);
    }
}

/**
 * Register every component of an enum with the same log level
 *
 * @tparam ComponentType Component enum type
 * @param[in] level Level assigned to all components
 */
template <typename ComponentType> void register_component(const LogLevel level) {
    ComponentLevelStorage<ComponentType>::set_all_levels(level);
}

/**
 * Get the current level of a component
 *
 * @tparam ComponentType Component enum type
 * @param[in] component Component to query
 * @return Current level
 */
template <typename ComponentType>
[[nodiscard]] LogLevel get_component_level(const ComponentType component) {
    return ComponentLevelStorage<ComponentType>::get_level(component);
}

} // namespace mont::log

#endif // MONT_LOG_COMPONENTS_HPP

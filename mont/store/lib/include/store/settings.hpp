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
 * @file settings.hpp
 * @brief Global configuration shared by every task in a tasks directory
 */

#ifndef MONT_STORE_SETTINGS_HPP
#define MONT_STORE_SETTINGS_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_errors.hpp"
#include "graph/task_graph.hpp"

namespace mont::store {

inline constexpr std::string_view CONFIG_FILE_NAME = "config.yml"; //!< Default config file name
inline constexpr std::string_view DEFAULT_CONFIG_TEXT =
        "# mont configuration\n\ndefault_gates: []\n"; //!< Written by init_tasks_directory

/**
 * Settings loaded from the tasks directory's config file
 */
struct GlobalConfig final {
    std::vector<std::string> default_gates; //!< Validator ids applied to every task, in order

    bool operator==(const GlobalConfig &) const = default;
};

/**
 * What init_tasks_directory had to create
 */
struct InitOutcome final {
    bool created_directory{false}; //!< The tasks directory was missing
    bool created_config{false};    //!< The config file was missing
};

/**
 * Parse config text
 *
 * An empty document yields the defaults. Unknown keys are logged and ignored.
 *
 * @param[in] content YAML text
 * @return Config or a ConfigParseFailed violation
 */
[[nodiscard]] tl::expected<GlobalConfig, graph::Violation> parse_config(std::string_view content);

/**
 * Load the config file
 *
 * @param[in] path Config file path
 * @return Config (defaults when the file does not exist) or a violation
 */
[[nodiscard]] tl::expected<GlobalConfig, graph::Violation>
load_config(const std::filesystem::path &path);

/**
 * Check that every default gate names a root validator in the graph
 *
 * @param[in] config Config to check
 * @param[in] graph Graph snapshot
 * @return Nothing on success, else the first offending default gate
 */
[[nodiscard]] tl::expected<void, graph::Violation>
validate_config(const GlobalConfig &config, const graph::TaskGraph &graph);

/**
 * Create the tasks directory and a default config file, keeping what exists
 *
 * @param[in] tasks_dir Directory holding the task records
 * @param[in] config_path Config file to create when missing
 * @return What was created, or a WriteFailed violation naming the path
 */
[[nodiscard]] tl::expected<InitOutcome, graph::Violation>
init_tasks_directory(const std::filesystem::path &tasks_dir, const std::filesystem::path &config_path);

} // namespace mont::store

#endif // MONT_STORE_SETTINGS_HPP

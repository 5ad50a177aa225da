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
 * @file settings.cpp
 * @brief Global config loading and validation
 */

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <tl/expected.hpp>
#include <yaml-cpp/yaml.h>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"
#include "store/settings.hpp"
#include "store/store_errors.hpp"
#include "store/store_log.hpp"

namespace mont::store {

namespace {

tl::unexpected<graph::Violation> config_failure(std::string detail) {
    return tl::unexpected(
            graph::make_violation(StoreErrc::ConfigParseFailed, {}, {}, std::move(detail)));
}

tl::unexpected<graph::Violation> write_failure(const std::filesystem::path &path, std::string detail) {
    return tl::unexpected(
            graph::make_violation(StoreErrc::WriteFailed, {}, path.string(), std::move(detail)));
}

} // anonymous namespace

tl::expected<GlobalConfig, graph::Violation> parse_config(const std::string_view content) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{content});
    } catch (const YAML::Exception &e) {
        return config_failure(e.what());
    }

    GlobalConfig config{};
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return config_failure("config must be a mapping");
    }

    for (const auto &field : root) {
        const std::string key = field.first.IsScalar() ? field.first.Scalar() : std::string{};
        const YAML::Node &value = field.second;

        if (key == "default_gates") {
            if (value.IsNull()) {
                continue;
            }
            if (!value.IsSequence()) {
                return config_failure("'default_gates' must be a list of validator ids");
            }
            for (const auto &gate : value) {
                if (!gate.IsScalar() || gate.Scalar().empty()) {
                    return config_failure("'default_gates' entries must be validator ids");
                }
                config.default_gates.push_back(gate.Scalar());
            }
        } else {
            MONT_LOGC_WARN(StoreLog::Config, "Ignoring unknown config key '{}'", key);
        }
    }
    return config;
}

tl::expected<GlobalConfig, graph::Violation> load_config(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return tl::unexpected(
                    graph::make_violation(StoreErrc::ReadFailed, {}, path.string(), ec.message()));
        }
        MONT_LOGC_DEBUG(StoreLog::Config, "No config at {}, using defaults", path.string());
        return GlobalConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        return tl::unexpected(graph::make_violation(
                StoreErrc::ReadFailed, {}, path.string(), "cannot open config file"));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (!config) {
        config.error().related_id = path.string();
        return config;
    }
    MONT_LOGC_DEBUG(
            StoreLog::Config,
            "Loaded {} with {} default gates",
            path.string(),
            config->default_gates.size());
    return config;
}

tl::expected<void, graph::Violation>
validate_config(const GlobalConfig &config, const graph::TaskGraph &graph) {
    for (const auto &gate : config.default_gates) {
        const auto *task = graph.find(gate);
        if (task == nullptr) {
            return tl::unexpected(graph::make_violation(StoreErrc::DefaultGateNotFound, gate));
        }
        if (!graph::is_validator(*task)) {
            return tl::unexpected(graph::make_violation(
                    StoreErrc::DefaultGateNotValidator,
                    gate,
                    {},
                    std::format("'{}' is a {}", gate, graph::to_string(task->kind))));
        }
        if (!graph::is_root_validator(*task)) {
            return tl::unexpected(graph::make_violation(
                    StoreErrc::DefaultGateNotRoot, gate, task->before.front()));
        }
    }
    return {};
}

tl::expected<InitOutcome, graph::Violation>
init_tasks_directory(const std::filesystem::path &tasks_dir, const std::filesystem::path &config_path) {
    InitOutcome outcome{};

    std::error_code ec;
    outcome.created_directory = std::filesystem::create_directories(tasks_dir, ec);
    if (ec) {
        return write_failure(tasks_dir, ec.message());
    }

    const bool config_exists = std::filesystem::exists(config_path, ec);
    if (ec) {
        return write_failure(config_path, ec.message());
    }
    if (!config_exists) {
        std::ofstream file(config_path);
        file << DEFAULT_CONFIG_TEXT;
        if (!file) {
            return write_failure(config_path, "cannot write config file");
        }
        outcome.created_config = true;
    }

    MONT_LOGC_INFO(
            StoreLog::Config,
            "Initialised {} (directory {}, config {})",
            tasks_dir.string(),
            outcome.created_directory ? "created" : "kept",
            outcome.created_config ? "created" : "kept");
    return outcome;
}

} // namespace mont::store

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
 * @file graph_errors.cpp
 * @brief Violation formatting
 */

#include <format>
#include <string>
#include <system_error>
#include <utility>

#include "graph/graph_errors.hpp"

namespace mont::graph {

std::string Violation::to_string() const {
    std::string text = code.message();

    if (!task_id.empty()) {
        text += std::format(" (task '{}'", task_id);
        if (!related_id.empty()) {
            text += std::format(", '{}'", related_id);
        }
        text += ")";
    } else if (!related_id.empty()) {
        text += std::format(" ('{}')", related_id);
    }

    if (!path.empty()) {
        text += " [";
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (i > 0) {
                text += code == make_error_code(GraphErrc::CycleDetected) ? " -> " : ", ";
            }
            text += path[i];
        }
        text += "]";
    }

    if (!detail.empty()) {
        text += ": ";
        text += detail;
    }
    return text;
}

Violation make_violation(
        const std::error_code code,
        std::string task_id,
        std::string related_id,
        std::string detail) {
    Violation violation{};
    violation.code = code;
    violation.task_id = std::move(task_id);
    violation.related_id = std::move(related_id);
    violation.detail = std::move(detail);
    return violation;
}

} // namespace mont::graph

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
 * @file error_report.hpp
 * @brief User facing messages and remediation hints for violations
 */

#ifndef MONT_APP_ERROR_REPORT_HPP
#define MONT_APP_ERROR_REPORT_HPP

#include <iosfwd>
#include <string>
#include <string_view>

#include "display/dag_renderer.hpp"
#include "graph/graph_errors.hpp"

namespace mont::app {

/**
 * What went wrong and how to fix it
 */
struct ErrorReport final {
    std::string message; //!< Violation naming the ids involved
    std::string hint;    //!< Suggested fix, empty when there is none
};

/**
 * Build the report for a violation
 *
 * @param[in] violation Failure returned by a command
 * @param[in] tasks_dir Tasks directory, used to name record files
 * @return Message and hint
 */
[[nodiscard]] ErrorReport make_report(const graph::Violation &violation, std::string_view tasks_dir);

/**
 * Write "error: ..." and, when present, "hint: ..." lines
 *
 * @param[in] out Destination stream
 * @param[in] report Report to print
 * @param[in] use_color Emit ANSI styling
 */
void print_report(std::ostream &out, const ErrorReport &report, display::UseColor use_color);

} // namespace mont::app

#endif // MONT_APP_ERROR_REPORT_HPP

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
 * @file record_codec.hpp
 * @brief Markdown record with YAML frontmatter to Task conversion
 *
 * A record is a `---` line, a YAML mapping, a closing `---` line, a blank
 * line and a free-form Markdown description:
 *
 * @code
 * ---
 * id: build
 * title: Build the thing
 * after:
 *   - setup
 * gates:
 *   - tests
 *   - review: passed
 * ---
 *
 * Longer description.
 * @endcode
 */

#ifndef MONT_STORE_RECORD_CODEC_HPP
#define MONT_STORE_RECORD_CODEC_HPP

#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"

namespace mont::store {

/**
 * Parse one record
 *
 * Gate items may be a bare name (pending) or a single `name: status` pair;
 * both become GateEntry values in declaration order. The legacy `parent`
 * field is appended to `before` and legacy `subtasks` to `after`, after the
 * explicit entries and without duplicates. Legacy `status` spellings
 * (`inprogress`, `stopped`, `complete`) map onto the work state and the
 * complete flag.
 *
 * Structural graph rules (dangling references, validator dependencies, jot
 * gates) are checked by graph::form_graph, not here.
 *
 * @param[in] content Record text
 * @return Parsed task or a ParseErrc violation
 */
[[nodiscard]] tl::expected<graph::Task, graph::Violation> parse_record(std::string_view content);

/**
 * Parse a document holding several records back to back
 *
 * Delimiter lines alternate between opening and closing a frontmatter block,
 * so descriptions inside a stream cannot contain a bare `---` line.
 *
 * @param[in] content Concatenated records
 * @return Tasks in document order (empty for a blank document) or the first violation
 */
[[nodiscard]] tl::expected<std::vector<graph::Task>, graph::Violation>
parse_record_stream(std::string_view content);

/**
 * Serialize a task into its record form
 *
 * Fields are written in a fixed order (id, title, type, status, complete,
 * in_progress, priority, before, after, validations, gates). Default values
 * are omitted.
 *
 * @param[in] task Task to write
 * @return Record text ending with a newline
 * @throws std::logic_error if the YAML emitter rejects the document
 */
[[nodiscard]] std::string serialize_record(const graph::Task &task);

} // namespace mont::store

#endif // MONT_STORE_RECORD_CODEC_HPP

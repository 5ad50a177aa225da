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
 * @file record_codec.cpp
 * @brief Frontmatter splitting, field decoding and canonical emission
 */

#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>
#include <yaml-cpp/yaml.h>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "log/log_macros.hpp"
#include "store/record_codec.hpp"
#include "store/store_errors.hpp"
#include "store/store_log.hpp"

namespace mont::store {

namespace {

using graph::Violation;

constexpr std::string_view DELIMITER = "---";
constexpr std::string_view WHITESPACE = " \t\r\n";

struct RawRecord final {
    std::string frontmatter;
    std::string description;
};

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_lines(const std::string_view content) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        const auto end = content.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

bool is_delimiter(const std::string_view line) { return trim(line) == DELIMITER; }

tl::unexpected<Violation> parse_failure(
        const ParseErrc errc,
        std::string task_id,
        std::string related_id = {},
        std::string detail = {}) {
    return tl::unexpected(graph::make_violation(
            errc, std::move(task_id), std::move(related_id), std::move(detail)));
}

tl::expected<RawRecord, Violation> split_record(const std::string_view content) {
    const auto lines = split_lines(content);

    std::size_t i = 0;
    while (i < lines.size() && trim(lines[i]).empty()) {
        ++i;
    }
    if (i == lines.size() || !is_delimiter(lines[i])) {
        return parse_failure(ParseErrc::MissingFrontmatter, {});
    }

    RawRecord raw{};
    for (++i; i < lines.size() && !is_delimiter(lines[i]); ++i) {
        raw.frontmatter.append(lines[i]);
        raw.frontmatter += '\n';
    }
    if (i == lines.size()) {
        return parse_failure(ParseErrc::MissingFrontmatter, {}, {}, "frontmatter is not closed");
    }

    for (++i; i < lines.size(); ++i) {
        raw.description.append(lines[i]);
        raw.description += '\n';
    }
    return raw;
}

tl::expected<std::vector<std::string>, Violation>
read_id_list(const YAML::Node &node, const std::string_view key, const std::string &id) {
    if (!node.IsSequence()) {
        return parse_failure(
                ParseErrc::InvalidField, id, {}, std::format("'{}' must be a list of ids", key));
    }
    std::vector<std::string> ids;
    ids.reserve(node.size());
    for (const auto &item : node) {
        if (!item.IsScalar()) {
            return parse_failure(
                    ParseErrc::InvalidField, id, {}, std::format("'{}' entries must be ids", key));
        }
        ids.push_back(item.Scalar());
    }
    return ids;
}

tl::expected<std::vector<graph::GateEntry>, Violation>
read_gates(const YAML::Node &node, const std::string &id) {
    if (!node.IsSequence()) {
        return parse_failure(ParseErrc::InvalidField, id, {}, "'gates' must be a list");
    }

    std::vector<graph::GateEntry> gates;
    gates.reserve(node.size());
    for (const auto &item : node) {
        if (item.IsScalar() && !item.Scalar().empty()) {
            gates.push_back(graph::GateEntry{item.Scalar(), graph::GateStatus::Pending});
            continue;
        }
        if (!item.IsMap() || item.size() != 1) {
            return parse_failure(ParseErrc::InvalidGateEntry, id);
        }

        const auto entry = *item.begin();
        if (!entry.first.IsScalar() || entry.first.Scalar().empty()) {
            return parse_failure(ParseErrc::InvalidGateEntry, id);
        }
        const std::string name = entry.first.Scalar();
        const auto status = entry.second.IsScalar() ? graph::parse_gate_status(entry.second.Scalar())
                                                    : std::nullopt;
        if (!status) {
            return parse_failure(ParseErrc::InvalidGateStatus, id, name);
        }
        gates.push_back(graph::GateEntry{name, *status});
    }
    return gates;
}

template <typename T>
tl::expected<T, Violation>
read_scalar(const YAML::Node &node, const std::string_view key, const std::string &id) {
    if (!node.IsScalar()) {
        return parse_failure(
                ParseErrc::InvalidField, id, {}, std::format("'{}' must be a scalar", key));
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion &e) {
        return parse_failure(ParseErrc::InvalidField, id, {}, std::format("'{}': {}", key, e.what()));
    }
}

tl::expected<void, Violation>
apply_status(graph::Task &task, const std::string_view value) {
    if (const auto state = graph::parse_work_state(value)) {
        task.work_state = *state;
        return {};
    }
    // Older records stored the lifecycle as a single status string
    if (value == "inprogress") {
        task.work_state = graph::WorkState::Active;
    } else if (value == "stopped") {
        task.work_state = graph::WorkState::Idle;
    } else if (value == "complete") {
        task.complete = true;
    } else {
        return parse_failure(
                ParseErrc::InvalidField, task.id, {}, std::format("unknown status '{}'", value));
    }
    return {};
}

void append_missing(std::vector<std::string> &ids, const std::vector<std::string> &extra) {
    for (const auto &id : extra) {
        if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
            ids.push_back(id);
        }
    }
}

tl::expected<graph::Task, Violation> decode(const RawRecord &raw) {
    YAML::Node root;
    try {
        root = YAML::Load(raw.frontmatter);
    } catch (const YAML::Exception &e) {
        return parse_failure(ParseErrc::InvalidYaml, {}, {}, e.what());
    }

    if (root.IsNull()) {
        return parse_failure(ParseErrc::EmptyId, {});
    }
    if (!root.IsMap()) {
        return parse_failure(ParseErrc::InvalidYaml, {}, {}, "frontmatter must be a mapping");
    }

    const YAML::Node &fields = root;
    const YAML::Node id_node = fields["id"];
    if (!id_node || !id_node.IsScalar() || id_node.Scalar().empty()) {
        return parse_failure(ParseErrc::EmptyId, {});
    }

    graph::Task task{};
    task.id = id_node.Scalar();
    if (task.id == graph::PICKER_PLACEHOLDER) {
        return parse_failure(ParseErrc::ReservedId, task.id);
    }
    if (!graph::is_valid_task_id(task.id)) {
        return parse_failure(ParseErrc::InvalidId, task.id);
    }

    std::vector<std::string> legacy_before;
    std::vector<std::string> legacy_after;

    for (const auto &field : fields) {
        if (!field.first.IsScalar()) {
            return parse_failure(ParseErrc::InvalidYaml, task.id, {}, "field names must be scalars");
        }
        const std::string key = field.first.Scalar();
        const YAML::Node &value = field.second;
        if (key == "id" || value.IsNull()) {
            continue;
        }

        if (key == "title") {
            auto title = read_scalar<std::string>(value, key, task.id);
            if (!title) {
                return tl::unexpected(std::move(title.error()));
            }
            task.title = std::move(*title);
        } else if (key == "type") {
            auto text = read_scalar<std::string>(value, key, task.id);
            if (!text) {
                return tl::unexpected(std::move(text.error()));
            }
            // "gate" is the older spelling of "validator"
            const auto kind = *text == "gate" ? std::optional{graph::TaskKind::Validator}
                                              : graph::parse_task_kind(*text);
            if (!kind) {
                return parse_failure(ParseErrc::InvalidKind, task.id, *text);
            }
            task.kind = *kind;
        } else if (key == "status") {
            auto text = read_scalar<std::string>(value, key, task.id);
            if (!text) {
                return tl::unexpected(std::move(text.error()));
            }
            if (auto applied = apply_status(task, *text); !applied) {
                return tl::unexpected(std::move(applied.error()));
            }
        } else if (key == "complete") {
            auto complete = read_scalar<bool>(value, key, task.id);
            if (!complete) {
                return tl::unexpected(std::move(complete.error()));
            }
            task.complete = task.complete || *complete;
        } else if (key == "in_progress") {
            auto sessions = read_scalar<std::uint32_t>(value, key, task.id);
            if (!sessions) {
                return tl::unexpected(std::move(sessions.error()));
            }
            task.in_progress = *sessions;
        } else if (key == "priority") {
            auto priority = read_scalar<std::int64_t>(value, key, task.id);
            if (!priority) {
                return tl::unexpected(std::move(priority.error()));
            }
            task.priority = *priority;
        } else if (key == "before" || key == "after" || key == "validations" || key == "subtasks") {
            auto ids = read_id_list(value, key, task.id);
            if (!ids) {
                return tl::unexpected(std::move(ids.error()));
            }
            if (key == "before") {
                task.before = std::move(*ids);
            } else if (key == "after") {
                task.after = std::move(*ids);
            } else if (key == "validations") {
                task.validations = std::move(*ids);
            } else {
                legacy_after = std::move(*ids);
            }
        } else if (key == "parent") {
            auto parent = read_scalar<std::string>(value, key, task.id);
            if (!parent) {
                return tl::unexpected(std::move(parent.error()));
            }
            legacy_before.push_back(std::move(*parent));
        } else if (key == "gates") {
            auto gates = read_gates(value, task.id);
            if (!gates) {
                return tl::unexpected(std::move(gates.error()));
            }
            task.gates = std::move(*gates);
        } else {
            MONT_LOGC_WARN(StoreLog::Codec, "Ignoring unknown field '{}' in '{}'", key, task.id);
        }
    }

    append_missing(task.before, legacy_before);
    append_missing(task.after, legacy_after);
    task.description = std::string{trim(raw.description)};
    return task;
}

void write_ids(YAML::Emitter &out, const char *key, const std::vector<std::string> &ids) {
    if (ids.empty()) {
        return;
    }
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto &id : ids) {
        out << id;
    }
    out << YAML::EndSeq;
}

} // anonymous namespace

tl::expected<graph::Task, Violation> parse_record(const std::string_view content) {
    auto raw = split_record(content);
    if (!raw) {
        return tl::unexpected(std::move(raw.error()));
    }
    return decode(*raw);
}

tl::expected<std::vector<graph::Task>, Violation>
parse_record_stream(const std::string_view content) {
    enum class Section : std::uint8_t { Outside, Frontmatter, Description };

    std::vector<RawRecord> raws;
    Section section = Section::Outside;
    for (const auto line : split_lines(content)) {
        const bool delimiter = is_delimiter(line);
        switch (section) {
        case Section::Outside:
            if (delimiter) {
                raws.emplace_back();
                section = Section::Frontmatter;
            } else if (!trim(line).empty()) {
                return parse_failure(ParseErrc::MissingFrontmatter, {});
            }
            break;
        case Section::Frontmatter:
            if (delimiter) {
                section = Section::Description;
            } else {
                raws.back().frontmatter.append(line);
                raws.back().frontmatter += '\n';
            }
            break;
        case Section::Description:
            if (delimiter) {
                raws.emplace_back();
                section = Section::Frontmatter;
            } else {
                raws.back().description.append(line);
                raws.back().description += '\n';
            }
            break;
        }
    }
    if (section == Section::Frontmatter) {
        return parse_failure(ParseErrc::MissingFrontmatter, {}, {}, "frontmatter is not closed");
    }

    std::vector<graph::Task> tasks;
    tasks.reserve(raws.size());
    for (const auto &raw : raws) {
        auto task = decode(raw);
        if (!task) {
            return tl::unexpected(std::move(task.error()));
        }
        tasks.push_back(std::move(*task));
    }
    MONT_LOGC_DEBUG(StoreLog::Codec, "Parsed {} records from stream", tasks.size());
    return tasks;
}

std::string serialize_record(const graph::Task &task) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << task.id;
    if (!task.title.empty()) {
        out << YAML::Key << "title" << YAML::Value << task.title;
    }
    if (task.kind != graph::TaskKind::Task) {
        out << YAML::Key << "type" << YAML::Value << std::string{graph::to_string(task.kind)};
    }
    if (task.work_state != graph::WorkState::Idle) {
        out << YAML::Key << "status" << YAML::Value << std::string{graph::to_string(task.work_state)};
    }
    if (task.complete) {
        out << YAML::Key << "complete" << YAML::Value << true;
    }
    if (task.in_progress) {
        out << YAML::Key << "in_progress" << YAML::Value << *task.in_progress;
    }
    if (task.priority != 0) {
        out << YAML::Key << "priority" << YAML::Value << task.priority;
    }
    write_ids(out, "before", task.before);
    write_ids(out, "after", task.after);
    write_ids(out, "validations", task.validations);

    if (!task.gates.empty()) {
        out << YAML::Key << "gates" << YAML::Value << YAML::BeginSeq;
        for (const auto &gate : task.gates) {
            if (gate.status == graph::GateStatus::Pending) {
                out << gate.name;
            } else {
                out << YAML::BeginMap << YAML::Key << gate.name << YAML::Value
                    << std::string{graph::to_string(gate.status)} << YAML::EndMap;
            }
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        log_and_throw<std::logic_error>(
                StoreLog::Codec, "Failed to emit record '{}': {}", task.id, out.GetLastError());
    }

    std::string text = std::format("{}\n{}\n{}\n", DELIMITER, out.c_str(), DELIMITER);
    const auto description = trim(task.description);
    if (!description.empty()) {
        text += '\n';
        text.append(description);
        text += '\n';
    }
    return text;
}

} // namespace mont::store

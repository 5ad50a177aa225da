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
 * @file task_store.cpp
 * @brief Snapshot loading, reference rewriting and transactional commits
 */

#include <algorithm>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "log/log_macros.hpp"
#include "store/record_backend.hpp"
#include "store/record_codec.hpp"
#include "store/settings.hpp"
#include "store/store_errors.hpp"
#include "store/store_log.hpp"
#include "store/task_store.hpp"
#include "utils/string_hash.hpp"

namespace mont::store {

namespace {

using graph::Violation;
using RecordMap = std::map<std::string, graph::Task, std::less<>>;
using TextMap = std::map<std::string, std::string, std::less<>>;

/**
 * Parsed records plus the exact text they were read from
 */
struct RecordSet final {
    RecordMap tasks;
    TextMap texts;
};

tl::unexpected<Violation> store_failure(
        const StoreErrc errc,
        std::string task_id,
        std::string related_id = {},
        std::string detail = {}) {
    return tl::unexpected(graph::make_violation(
            errc, std::move(task_id), std::move(related_id), std::move(detail)));
}

tl::expected<RecordSet, Violation> load_records(const IRecordBackend &backend) {
    auto ids = backend.list_ids();
    if (!ids) {
        return store_failure(StoreErrc::ReadFailed, {}, {}, ids.error().message());
    }

    RecordSet records{};
    for (const auto &file_id : *ids) {
        auto text = backend.read(file_id);
        if (!text) {
            return store_failure(StoreErrc::ReadFailed, file_id, {}, text.error().message());
        }

        auto task = parse_record(*text);
        if (!task) {
            Violation violation = std::move(task.error());
            if (violation.task_id.empty()) {
                violation.task_id = file_id;
            }
            return tl::unexpected(std::move(violation));
        }
        if (task->id != file_id) {
            return tl::unexpected(graph::make_violation(
                    ParseErrc::InvalidId,
                    task->id,
                    file_id,
                    std::format("record is stored as '{}{}'", file_id, RECORD_EXTENSION)));
        }

        records.texts.emplace(file_id, std::move(*text));
        records.tasks.emplace(file_id, std::move(*task));
    }
    return records;
}

tl::expected<graph::TaskGraph, Violation>
validate(const RecordMap &tasks, const GlobalConfig &config) {
    std::vector<graph::Task> values;
    values.reserve(tasks.size());
    for (const auto &[id, task] : tasks) {
        values.push_back(task);
    }

    auto graph = graph::form_graph(std::move(values));
    if (!graph) {
        return graph;
    }
    if (auto checked = validate_config(config, *graph); !checked) {
        return tl::unexpected(std::move(checked.error()));
    }
    return graph;
}

tl::expected<void, Violation> check_new_id(const std::string &id) {
    if (id.empty()) {
        return tl::unexpected(graph::make_violation(ParseErrc::EmptyId, id));
    }
    if (id == graph::PICKER_PLACEHOLDER) {
        return tl::unexpected(graph::make_violation(ParseErrc::ReservedId, id));
    }
    if (!graph::is_valid_task_id(id)) {
        return tl::unexpected(graph::make_violation(ParseErrc::InvalidId, id));
    }
    return {};
}

/**
 * Rename or drop one id inside a list, keeping the first occurrence of each id
 */
bool rewrite_ids(
        std::vector<std::string> &ids,
        const std::string_view old_id,
        const std::optional<std::string_view> new_id) {
    if (std::find(ids.begin(), ids.end(), old_id) == ids.end()) {
        return false;
    }

    std::vector<std::string> rewritten;
    rewritten.reserve(ids.size());
    for (auto &id : ids) {
        std::string mapped = id == old_id ? std::string{new_id.value_or("")} : std::move(id);
        if (!mapped.empty() && std::find(rewritten.begin(), rewritten.end(), mapped) == rewritten.end()) {
            rewritten.push_back(std::move(mapped));
        }
    }
    ids = std::move(rewritten);
    return true;
}

bool rewrite_gates(
        std::vector<graph::GateEntry> &gates,
        const std::string_view old_id,
        const std::optional<std::string_view> new_id) {
    const auto named = [](const std::string_view name) {
        return [name](const graph::GateEntry &gate) { return gate.name == name; };
    };
    if (std::none_of(gates.begin(), gates.end(), named(old_id))) {
        return false;
    }

    std::vector<graph::GateEntry> rewritten;
    rewritten.reserve(gates.size());
    for (auto &gate : gates) {
        if (gate.name == old_id) {
            if (!new_id) {
                continue;
            }
            gate.name = std::string{*new_id};
        }
        if (std::none_of(rewritten.begin(), rewritten.end(), named(gate.name))) {
            rewritten.push_back(std::move(gate));
        }
    }
    gates = std::move(rewritten);
    return true;
}

bool rewrite_task(
        graph::Task &task,
        const std::string_view old_id,
        const std::optional<std::string_view> new_id) {
    bool changed = rewrite_ids(task.before, old_id, new_id);
    changed = rewrite_ids(task.after, old_id, new_id) || changed;
    changed = rewrite_ids(task.validations, old_id, new_id) || changed;
    changed = rewrite_gates(task.gates, old_id, new_id) || changed;
    return changed;
}

const std::string &op_id(const StoreOp &op) {
    if (const auto *upsert = std::get_if<UpsertOp>(&op)) {
        return upsert->task.id;
    }
    return std::get<DeleteOp>(op).id;
}

/**
 * Put every touched record back the way it was before the commit started
 */
void roll_back(
        IRecordBackend &backend,
        const TextMap &original,
        const std::vector<std::string> &written,
        const std::vector<std::string> &removed) {
    const auto restore = [&backend, &original](const std::string &id) {
        const auto it = original.find(id);
        const std::error_code ec =
                it != original.end() ? backend.write(id, it->second) : backend.remove(id);
        if (ec) {
            MONT_LOGC_ERROR(StoreLog::Store, "Failed to restore '{}': {}", id, ec.message());
        }
    };
    std::for_each(removed.rbegin(), removed.rend(), restore);
    std::for_each(written.rbegin(), written.rend(), restore);
}

} // anonymous namespace

void Transaction::upsert(graph::Task task) {
    if (auto *pending = pending_upsert(task.id); pending != nullptr) {
        *pending = std::move(task);
        return;
    }
    ops_.emplace_back(UpsertOp{std::move(task)});
}

void Transaction::remove(std::string id) { ops_.emplace_back(DeleteOp{std::move(id)}); }

graph::Task *Transaction::pending_upsert(const std::string_view id) {
    for (auto it = ops_.rbegin(); it != ops_.rend(); ++it) {
        if (op_id(*it) != id) {
            continue;
        }
        auto *upsert = std::get_if<UpsertOp>(&*it);
        return upsert != nullptr ? &upsert->task : nullptr;
    }
    return nullptr;
}

void Transaction::rewrite_references(
        const graph::TaskGraph &snapshot,
        const std::string_view old_id,
        const std::optional<std::string_view> new_id) {
    utils::IdSet touched;
    for (auto &op : ops_) {
        touched.insert(op_id(op));
        if (auto *upsert = std::get_if<UpsertOp>(&op);
            upsert != nullptr && upsert->task.id != old_id) {
            rewrite_task(upsert->task, old_id, new_id);
        }
    }

    for (const auto &[id, task] : snapshot.tasks()) {
        if (id == old_id || touched.contains(id)) {
            continue;
        }
        graph::Task copy = task;
        if (rewrite_task(copy, old_id, new_id)) {
            ops_.emplace_back(UpsertOp{std::move(copy)});
        }
    }
}

TaskStore::TaskStore(IRecordBackend &backend, GlobalConfig config)
        : backend_{backend}, config_{std::move(config)} {}

tl::expected<Snapshot, Violation> TaskStore::snapshot() const {
    auto records = load_records(backend_);
    if (!records) {
        return tl::unexpected(std::move(records.error()));
    }
    auto graph = validate(records->tasks, config_);
    if (!graph) {
        return tl::unexpected(std::move(graph.error()));
    }
    MONT_LOGC_DEBUG(StoreLog::Store, "Loaded snapshot with {} tasks", graph->size());
    return Snapshot{std::move(*graph), config_};
}

tl::expected<void, Violation> TaskStore::commit(const Transaction &txn) {
    MONT_LOGEC_DEBUG(
            StoreLog::Store, StoreEvent::CommitStarted, "{} operations", txn.ops().size());

    auto records = load_records(backend_);
    if (!records) {
        return tl::unexpected(std::move(records.error()));
    }

    RecordMap next = records->tasks;
    std::vector<std::string> touched;
    for (const auto &op : txn.ops()) {
        if (const auto *upsert = std::get_if<UpsertOp>(&op)) {
            next.insert_or_assign(upsert->task.id, upsert->task);
        } else if (next.erase(std::get<DeleteOp>(op).id) == 0) {
            return store_failure(StoreErrc::TaskNotFound, std::get<DeleteOp>(op).id);
        }
        if (std::find(touched.begin(), touched.end(), op_id(op)) == touched.end()) {
            touched.push_back(op_id(op));
        }
    }
    std::sort(touched.begin(), touched.end());

    if (auto graph = validate(next, config_); !graph) {
        MONT_LOGC_DEBUG(
                StoreLog::Store, "Rejected transaction: {}", graph.error().to_string());
        return tl::unexpected(std::move(graph.error()));
    }

    std::vector<std::pair<std::string, std::string>> writes;
    std::vector<std::string> removals;
    for (const auto &id : touched) {
        const auto task = next.find(id);
        const auto original = records->texts.find(id);
        if (task == next.end()) {
            if (original != records->texts.end()) {
                removals.push_back(id);
            }
            continue;
        }
        std::string text = serialize_record(task->second);
        if (original == records->texts.end() || original->second != text) {
            writes.emplace_back(id, std::move(text));
        }
    }

    std::vector<std::string> written;
    std::vector<std::string> removed;
    for (const auto &[id, text] : writes) {
        if (const auto ec = backend_.write(id, text); ec) {
            roll_back(backend_, records->texts, written, removed);
            MONT_LOGEC_WARN(
                    StoreLog::Store,
                    StoreEvent::CommitRolledBack,
                    "write of '{}' failed: {}",
                    id,
                    ec.message());
            return store_failure(StoreErrc::WriteFailed, id, {}, ec.message());
        }
        written.push_back(id);
    }
    for (const auto &id : removals) {
        if (const auto ec = backend_.remove(id); ec) {
            roll_back(backend_, records->texts, written, removed);
            MONT_LOGEC_WARN(
                    StoreLog::Store,
                    StoreEvent::CommitRolledBack,
                    "removal of '{}' failed: {}",
                    id,
                    ec.message());
            return store_failure(StoreErrc::RemoveFailed, id, {}, ec.message());
        }
        removed.push_back(id);
    }

    MONT_LOGEC_INFO(
            StoreLog::Store,
            StoreEvent::CommitApplied,
            "{} written, {} removed",
            written.size(),
            removed.size());
    return {};
}

tl::expected<void, Violation> TaskStore::delete_task(const std::string_view id) {
    auto snap = snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    if (!snap->graph.contains(id)) {
        return store_failure(StoreErrc::TaskNotFound, std::string{id});
    }

    Transaction txn;
    txn.rewrite_references(snap->graph, id, std::nullopt);
    txn.remove(std::string{id});
    return commit(txn);
}

tl::expected<void, Violation> TaskStore::insert_task(graph::Task task) {
    if (auto checked = check_new_id(task.id); !checked) {
        return checked;
    }
    auto snap = snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    if (snap->graph.contains(task.id)) {
        return store_failure(StoreErrc::TaskAlreadyExists, task.id);
    }

    Transaction txn;
    txn.upsert(std::move(task));
    return commit(txn);
}

tl::expected<void, Violation> TaskStore::update_task(const std::string_view old_id, graph::Task task) {
    if (auto checked = check_new_id(task.id); !checked) {
        return checked;
    }
    auto snap = snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }
    if (!snap->graph.contains(old_id)) {
        return store_failure(StoreErrc::TaskNotFound, std::string{old_id});
    }

    Transaction txn;
    if (task.id == old_id) {
        txn.upsert(std::move(task));
        return commit(txn);
    }

    if (snap->graph.contains(task.id)) {
        return store_failure(StoreErrc::TaskAlreadyExists, task.id, std::string{old_id});
    }
    const std::string new_id = task.id;
    txn.remove(std::string{old_id});
    txn.upsert(std::move(task));
    txn.rewrite_references(snap->graph, old_id, new_id);
    MONT_LOGC_DEBUG(StoreLog::Store, "Renaming '{}' to '{}'", old_id, new_id);
    return commit(txn);
}

tl::expected<std::vector<std::string>, Violation>
TaskStore::distill(const std::string_view jot_id, std::vector<graph::Task> replacements) {
    auto snap = snapshot();
    if (!snap) {
        return tl::unexpected(std::move(snap.error()));
    }

    const auto *jot = snap->graph.find(jot_id);
    if (jot == nullptr) {
        return store_failure(StoreErrc::TaskNotFound, std::string{jot_id});
    }
    if (!graph::is_jot(*jot)) {
        return store_failure(
                StoreErrc::NotAJot,
                std::string{jot_id},
                {},
                std::format("'{}' is a {}", jot_id, graph::to_string(jot->kind)));
    }
    if (replacements.empty()) {
        return store_failure(StoreErrc::EmptyDistill, std::string{jot_id});
    }

    Transaction txn;
    std::vector<std::string> created;
    created.reserve(replacements.size());
    for (auto &task : replacements) {
        if (auto checked = check_new_id(task.id); !checked) {
            return tl::unexpected(std::move(checked.error()));
        }
        if (snap->graph.contains(task.id) ||
            std::find(created.begin(), created.end(), task.id) != created.end()) {
            return store_failure(StoreErrc::TaskAlreadyExists, task.id, std::string{jot_id});
        }
        created.push_back(task.id);
        txn.upsert(std::move(task));
    }
    txn.rewrite_references(snap->graph, jot_id, std::nullopt);
    txn.remove(std::string{jot_id});

    if (auto committed = commit(txn); !committed) {
        return tl::unexpected(std::move(committed.error()));
    }
    MONT_LOGC_INFO(
            StoreLog::Store, "Distilled '{}' into {} tasks", jot_id, created.size());
    return created;
}

} // namespace mont::store

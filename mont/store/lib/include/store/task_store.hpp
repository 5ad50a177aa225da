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
 * @file task_store.hpp
 * @brief Snapshot loading and all-or-nothing record transactions
 */

#ifndef MONT_STORE_TASK_STORE_HPP
#define MONT_STORE_TASK_STORE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <tl/expected.hpp>

#include "graph/graph_errors.hpp"
#include "graph/task.hpp"
#include "graph/task_graph.hpp"
#include "store/record_backend.hpp"
#include "store/settings.hpp"

namespace mont::store {

/**
 * Validated view of every record at one point in time
 */
struct Snapshot final {
    graph::TaskGraph graph; //!< Validated graph
    GlobalConfig config;    //!< Config validated against the graph
};

/**
 * Create or replace one record
 */
struct UpsertOp final {
    graph::Task task; //!< New record contents
};

/**
 * Remove one record
 */
struct DeleteOp final {
    std::string id; //!< Record to remove
};

using StoreOp = std::variant<UpsertOp, DeleteOp>;

/**
 * Ordered list of record edits committed together
 *
 * Later operations on the same id win. Nothing touches storage until
 * TaskStore::commit().
 */
class Transaction final {
public:
    /**
     * Queue a create-or-replace, replacing an earlier pending upsert of the same id
     *
     * @param[in] task New record contents
     */
    void upsert(graph::Task task);

    /**
     * Queue a removal
     *
     * @param[in] id Record to remove
     */
    void remove(std::string id);

    /**
     * Rewrite every reference to a task
     *
     * Every `before`, `after` and `validations` entry and every gate named
     * old_id, in the snapshot's tasks and in pending upserts, is renamed to
     * new_id, or dropped when new_id is empty. Renames never create
     * duplicates. Changed snapshot tasks are queued as upserts; the task
     * named old_id itself is left alone.
     *
     * @param[in] snapshot Graph the transaction was built against
     * @param[in] old_id Id being renamed or removed
     * @param[in] new_id Replacement id, std::nullopt to drop references
     */
    void rewrite_references(
            const graph::TaskGraph &snapshot,
            std::string_view old_id,
            std::optional<std::string_view> new_id);

    [[nodiscard]] const std::vector<StoreOp> &ops() const noexcept { return ops_; }
    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }

private:
    [[nodiscard]] graph::Task *pending_upsert(std::string_view id);

    std::vector<StoreOp> ops_;
};

/**
 * Reads and writes task records through a backend
 *
 * Every read builds a fresh snapshot; nothing is cached between calls.
 * Commits validate the complete resulting record set with graph::form_graph
 * and validate_config() before writing, and restore the previous contents of
 * every touched record if any write fails.
 */
class TaskStore final {
public:
    /**
     * @param[in] backend Record storage, must outlive the store
     * @param[in] config Global config applied to every snapshot
     */
    TaskStore(IRecordBackend &backend, GlobalConfig config);

    /**
     * Load, parse and validate every record
     *
     * @return Snapshot or the first violation
     */
    [[nodiscard]] tl::expected<Snapshot, graph::Violation> snapshot() const;

    /**
     * Apply a transaction atomically
     *
     * @param[in] txn Operations to apply
     * @return Nothing on success; a graph, config or store violation otherwise
     */
    [[nodiscard]] tl::expected<void, graph::Violation> commit(const Transaction &txn);

    /**
     * Remove a task and every reference to it
     *
     * @param[in] id Task to delete
     * @return Nothing on success, else a violation
     */
    [[nodiscard]] tl::expected<void, graph::Violation> delete_task(std::string_view id);

    /**
     * Add a new task
     *
     * @param[in] task Task to add
     * @return Nothing on success, TaskAlreadyExists for a taken id
     */
    [[nodiscard]] tl::expected<void, graph::Violation> insert_task(graph::Task task);

    /**
     * Replace a task, renaming references when its id changes
     *
     * @param[in] old_id Current id
     * @param[in] task New contents, possibly with a new id
     * @return Nothing on success, else a violation
     */
    [[nodiscard]] tl::expected<void, graph::Violation>
    update_task(std::string_view old_id, graph::Task task);

    /**
     * Replace a jot with concrete tasks
     *
     * The new tasks are inserted, references to the jot are dropped and the
     * jot is removed, all in one transaction.
     *
     * @param[in] jot_id Jot to distill
     * @param[in] replacements Tasks to create
     * @return Ids of the created tasks
     */
    [[nodiscard]] tl::expected<std::vector<std::string>, graph::Violation>
    distill(std::string_view jot_id, std::vector<graph::Task> replacements);

    [[nodiscard]] const GlobalConfig &config() const noexcept { return config_; }

private:
    IRecordBackend &backend_;
    GlobalConfig config_;
};

} // namespace mont::store

#endif // MONT_STORE_TASK_STORE_HPP

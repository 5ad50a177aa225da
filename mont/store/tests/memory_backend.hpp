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
 * @file memory_backend.hpp
 * @brief In-memory record backend with write failure injection
 */

#ifndef MONT_STORE_TESTS_MEMORY_BACKEND_HPP
#define MONT_STORE_TESTS_MEMORY_BACKEND_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "graph/task.hpp"
#include "store/record_backend.hpp"
#include "store/record_codec.hpp"

namespace mont::store::testing {

/**
 * Keeps records in a map and can be told to fail a given write
 *
 * Every write and remove call (failed or not) is appended to the journal as
 * "write:<id>" or "remove:<id>" so tests can check the order of effects.
 */
class MemoryBackend final : public IRecordBackend {
public:
    [[nodiscard]] tl::expected<std::vector<std::string>, std::error_code> list_ids() const override {
        std::vector<std::string> ids;
        ids.reserve(records_.size());
        for (const auto &[id, text] : records_) {
            ids.push_back(id);
        }
        return ids;
    }

    [[nodiscard]] tl::expected<std::string, std::error_code> read(const std::string_view id) const override {
        const auto it = records_.find(id);
        if (it == records_.end()) {
            return tl::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }
        return it->second;
    }

    [[nodiscard]] std::error_code write(const std::string_view id, const std::string_view content) override {
        journal_.push_back("write:" + std::string{id});
        if (fail_write_id_ && *fail_write_id_ == id) {
            fail_write_id_.reset();
            return std::make_error_code(std::errc::no_space_on_device);
        }
        records_.insert_or_assign(std::string{id}, std::string{content});
        return {};
    }

    [[nodiscard]] std::error_code remove(const std::string_view id) override {
        journal_.push_back("remove:" + std::string{id});
        if (fail_remove_id_ && *fail_remove_id_ == id) {
            fail_remove_id_.reset();
            return std::make_error_code(std::errc::permission_denied);
        }
        const auto it = records_.find(id);
        if (it == records_.end()) {
            return std::make_error_code(std::errc::no_such_file_or_directory);
        }
        records_.erase(it);
        return {};
    }

    /**
     * Store a task directly, bypassing any validation
     */
    void seed(const graph::Task &task) { records_.insert_or_assign(task.id, serialize_record(task)); }

    /**
     * Store raw text directly
     */
    void seed_text(const std::string &id, const std::string &text) { records_.insert_or_assign(id, text); }

    /**
     * Make the next write of the given id fail once
     */
    void fail_next_write_of(std::string id) { fail_write_id_ = std::move(id); }

    /**
     * Make the next removal of the given id fail once
     */
    void fail_next_remove_of(std::string id) { fail_remove_id_ = std::move(id); }

    [[nodiscard]] const std::map<std::string, std::string, std::less<>> &records() const noexcept {
        return records_;
    }
    [[nodiscard]] const std::vector<std::string> &journal() const noexcept { return journal_; }
    void clear_journal() { journal_.clear(); }

private:
    std::map<std::string, std::string, std::less<>> records_;
    std::vector<std::string> journal_;
    std::optional<std::string> fail_write_id_;
    std::optional<std::string> fail_remove_id_;
};

} // namespace mont::store::testing

#endif // MONT_STORE_TESTS_MEMORY_BACKEND_HPP

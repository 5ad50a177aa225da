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
 * @file record_backend.hpp
 * @brief Storage of raw record text keyed by task id
 */

#ifndef MONT_STORE_RECORD_BACKEND_HPP
#define MONT_STORE_RECORD_BACKEND_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <tl/expected.hpp>

namespace mont::store {

/**
 * @class IRecordBackend
 * @brief Interface for reading and writing record text by id
 *
 * Backends know nothing about the record format; the task store owns
 * parsing, validation and transactional behaviour.
 */
class IRecordBackend {
public:
    IRecordBackend() = default;
    virtual ~IRecordBackend() = default;
    IRecordBackend(IRecordBackend &&) = default;
    IRecordBackend &operator=(IRecordBackend &&) = default;
    IRecordBackend(const IRecordBackend &) = delete;
    IRecordBackend &operator=(const IRecordBackend &) = delete;

    /**
     * @return Every stored id, sorted
     */
    [[nodiscard]] virtual tl::expected<std::vector<std::string>, std::error_code> list_ids() const = 0;

    /**
     * @param[in] id Record id
     * @return Record text, or std::errc::no_such_file_or_directory when absent
     */
    [[nodiscard]] virtual tl::expected<std::string, std::error_code> read(std::string_view id) const = 0;

    /**
     * Create or replace a record
     *
     * @param[in] id Record id
     * @param[in] content Record text
     * @return Empty error code on success
     */
    [[nodiscard]] virtual std::error_code write(std::string_view id, std::string_view content) = 0;

    /**
     * Delete a record
     *
     * @param[in] id Record id
     * @return Empty error code on success, no_such_file_or_directory when absent
     */
    [[nodiscard]] virtual std::error_code remove(std::string_view id) = 0;
};

/**
 * Stores each record as `<root>/<id>.md`
 *
 * Writes go through a temporary file in the same directory followed by a
 * rename, so a reader never sees a partially written record. The directory
 * is created on first write; a missing directory lists as empty.
 */
class DirectoryBackend final : public IRecordBackend {
public:
    /**
     * @param[in] root Tasks directory
     */
    explicit DirectoryBackend(std::filesystem::path root);

    [[nodiscard]] tl::expected<std::vector<std::string>, std::error_code> list_ids() const override;
    [[nodiscard]] tl::expected<std::string, std::error_code> read(std::string_view id) const override;
    [[nodiscard]] std::error_code write(std::string_view id, std::string_view content) override;
    [[nodiscard]] std::error_code remove(std::string_view id) override;

    /**
     * @param[in] id Record id
     * @return Path of the record file
     */
    [[nodiscard]] std::filesystem::path record_path(std::string_view id) const;

    [[nodiscard]] const std::filesystem::path &root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

inline constexpr std::string_view RECORD_EXTENSION = ".md"; //!< Record file extension

} // namespace mont::store

#endif // MONT_STORE_RECORD_BACKEND_HPP

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
 * @file record_backend.cpp
 * @brief Directory-backed record storage
 */

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

#include "log/log_macros.hpp"
#include "store/record_backend.hpp"
#include "store/store_log.hpp"

namespace mont::store {

namespace fs = std::filesystem;

DirectoryBackend::DirectoryBackend(fs::path root) : root_{std::move(root)} {}

fs::path DirectoryBackend::record_path(const std::string_view id) const {
    return root_ / (std::string{id} + std::string{RECORD_EXTENSION});
}

tl::expected<std::vector<std::string>, std::error_code> DirectoryBackend::list_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        if (ec) {
            return tl::unexpected(ec);
        }
        return ids;
    }

    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto &path = it->path();
        if (path.extension() != RECORD_EXTENSION || !it->is_regular_file(ec)) {
            continue;
        }
        ids.push_back(path.stem().string());
    }
    if (ec) {
        MONT_LOGC_ERROR(StoreLog::Backend, "Failed to list {}: {}", root_.string(), ec.message());
        return tl::unexpected(ec);
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

tl::expected<std::string, std::error_code> DirectoryBackend::read(const std::string_view id) const {
    const auto path = record_path(id);
    std::ifstream file(path);
    if (!file) {
        std::error_code ec;
        if (!fs::exists(path, ec) && !ec) {
            return tl::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
        }
        return tl::unexpected(ec ? ec : std::make_error_code(std::errc::permission_denied));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return tl::unexpected(std::make_error_code(std::errc::io_error));
    }
    return buffer.str();
}

std::error_code DirectoryBackend::write(const std::string_view id, const std::string_view content) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        return ec;
    }

    const auto path = record_path(id);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file) {
            return std::make_error_code(std::errc::permission_denied);
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            fs::remove(temp_path, ec);
            return std::make_error_code(std::errc::io_error);
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(temp_path, cleanup);
        MONT_LOGC_ERROR(StoreLog::Backend, "Failed to replace {}: {}", path.string(), ec.message());
        return ec;
    }
    MONT_LOGC_TRACE_L1(StoreLog::Backend, "Wrote {} ({} bytes)", path.string(), content.size());
    return {};
}

std::error_code DirectoryBackend::remove(const std::string_view id) {
    std::error_code ec;
    const auto path = record_path(id);
    if (!fs::remove(path, ec) && !ec) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return ec;
}

} // namespace mont::store

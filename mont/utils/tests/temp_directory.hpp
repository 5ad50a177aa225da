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
 * @file temp_directory.hpp
 * @brief Scratch directory management for tests
 */

#ifndef MONT_UTILS_TESTS_TEMP_DIRECTORY_HPP
#define MONT_UTILS_TESTS_TEMP_DIRECTORY_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace mont::utils {

/**
 * @brief RAII scratch directory removed recursively on destruction
 *
 * Every instance creates its own uniquely named directory below the system
 * temporary directory.
 */
class TempDirectory final {
public:
    explicit TempDirectory(const std::string_view prefix = "mont_test") {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count();
        path_ = std::filesystem::temp_directory_path() /
                (std::string{prefix} + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            std::cerr << "Warning: Failed to remove temporary directory " << path_ << ": "
                      << ec.message() << '\n';
        }
    }

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;
    TempDirectory(TempDirectory &&) = delete;
    TempDirectory &operator=(TempDirectory &&) = delete;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    /**
     * @brief Path of a file inside the directory
     * @param name File name
     * @return Full path
     */
    [[nodiscard]] std::filesystem::path file(const std::string_view name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Read a whole file
 * @param filepath Path to read
 * @return File contents, empty if the file cannot be opened
 */
inline std::string read_file_contents(const std::filesystem::path &filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

/**
 * @brief Write a whole file, replacing any previous contents
 * @param filepath Path to write
 * @param contents Data to write
 */
inline void write_file_contents(const std::filesystem::path &filepath, const std::string_view contents) {
    std::ofstream file(filepath, std::ios::trunc);
    file << contents;
}

} // namespace mont::utils

#endif // MONT_UTILS_TESTS_TEMP_DIRECTORY_HPP

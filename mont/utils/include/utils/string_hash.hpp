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
 * @file string_hash.hpp
 * @brief Transparent string hashing for id-keyed hash maps
 */

#ifndef MONT_UTILS_STRING_HASH_HPP
#define MONT_UTILS_STRING_HASH_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace mont::utils {

/**
 * Transparent hash functor for string keys
 *
 * Lets id-keyed maps be probed with std::string_view or string literals
 * without building a temporary std::string. Pair with std::equal_to<>.
 */
struct TransparentStringHash final {
    // NOLINTNEXTLINE(readability-identifier-naming)
    using is_transparent = void; //!< Tag enabling heterogeneous lookup

    [[nodiscard]] std::size_t operator()(const std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }
};

/**
 * Flat hash map keyed by task id, probe-able with std::string_view
 *
 * @tparam Value Mapped type
 */
template <typename Value>
using IdMap = phmap::flat_hash_map<std::string, Value, TransparentStringHash, std::equal_to<>>;

/**
 * Flat hash set of task ids, probe-able with std::string_view
 */
using IdSet = phmap::flat_hash_set<std::string, TransparentStringHash, std::equal_to<>>;

} // namespace mont::utils

#endif // MONT_UTILS_STRING_HASH_HPP

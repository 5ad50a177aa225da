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
 * @file graph_algorithms.hpp
 * @brief Deterministic algorithms over id-labelled directed graphs
 *
 * All functions take a node set and an edge list. Edges whose endpoints are
 * not in the node set are ignored and duplicate edges count once. Results
 * never depend on input order: ties are always broken by id.
 */

#ifndef MONT_GRAPH_GRAPH_ALGORITHMS_HPP
#define MONT_GRAPH_GRAPH_ALGORITHMS_HPP

#include <compare>
#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace mont::graph {

/**
 * Directed edge `from -> to`: `to` depends on `from`
 */
struct Edge final {
    std::string from; //!< Dependency
    std::string to;   //!< Dependent

    auto operator<=>(const Edge &) const = default;
};

/**
 * Topological order with the smallest available id first
 *
 * @param[in] nodes Node ids
 * @param[in] edges Dependency edges
 * @return Every node, each after all of its predecessors
 * @throws std::runtime_error if the edges form a cycle
 */
[[nodiscard]] std::vector<std::string>
topological_order(std::span<const std::string> nodes, std::span<const Edge> edges);

/**
 * Remove every edge implied by a longer path
 *
 * Edge (a, c) is dropped when another path a -> ... -> c of length two or
 * more exists. Reachability is unchanged.
 *
 * @param[in] nodes Node ids
 * @param[in] edges Acyclic edge list
 * @return Sorted, minimal edge list
 * @throws std::runtime_error if the edges form a cycle
 */
[[nodiscard]] std::vector<Edge>
transitive_reduction(std::span<const std::string> nodes, std::span<const Edge> edges);

/**
 * Level of each node as the length of the longest path from any source
 *
 * Sources sit at level 0 and every other node one below its deepest
 * predecessor.
 *
 * @param[in] nodes Node ids
 * @param[in] edges Acyclic edge list
 * @return Level per node id
 * @throws std::runtime_error if the edges form a cycle
 */
[[nodiscard]] std::map<std::string, std::size_t, std::less<>>
longest_path_levels(std::span<const std::string> nodes, std::span<const Edge> edges);

/**
 * Weakly connected components
 *
 * @param[in] nodes Node ids
 * @param[in] edges Edge list, direction ignored
 * @return Components with sorted members, ordered by their smallest id
 */
[[nodiscard]] std::vector<std::vector<std::string>>
connected_components(std::span<const std::string> nodes, std::span<const Edge> edges);

} // namespace mont::graph

#endif // MONT_GRAPH_GRAPH_ALGORITHMS_HPP

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
 * @file graph_algorithms.cpp
 * @brief Topological ordering, transitive reduction, levels and components
 */

#include <algorithm>
#include <cstddef>
#include <functional>
#include <map>
#include <numeric>
#include <queue>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "graph/graph_algorithms.hpp"
#include "graph/graph_log.hpp"
#include "log/log_macros.hpp"
#include "utils/string_hash.hpp"

namespace mont::graph {

namespace {

/**
 * Index-based view of an id graph
 *
 * Node indices follow sorted id order, so comparing indices compares ids.
 */
struct IndexedGraph final {
    std::vector<std::string> ids;                   //!< Sorted unique node ids
    std::vector<std::vector<std::size_t>> children; //!< Sorted successor indices
    std::vector<std::vector<std::size_t>> parents;  //!< Sorted predecessor indices
};

IndexedGraph index_graph(const std::span<const std::string> nodes, const std::span<const Edge> edges) {
    IndexedGraph graph{};
    graph.ids.assign(nodes.begin(), nodes.end());
    std::sort(graph.ids.begin(), graph.ids.end());
    graph.ids.erase(std::unique(graph.ids.begin(), graph.ids.end()), graph.ids.end());

    utils::IdMap<std::size_t> index_of;
    index_of.reserve(graph.ids.size());
    for (std::size_t i = 0; i < graph.ids.size(); ++i) {
        index_of.emplace(graph.ids[i], i);
    }

    graph.children.resize(graph.ids.size());
    graph.parents.resize(graph.ids.size());
    for (const auto &edge : edges) {
        const auto from_it = index_of.find(edge.from);
        const auto to_it = index_of.find(edge.to);
        if (from_it == index_of.end() || to_it == index_of.end()) {
            continue;
        }
        graph.children[from_it->second].push_back(to_it->second);
        graph.parents[to_it->second].push_back(from_it->second);
    }

    const auto sort_unique = [](std::vector<std::size_t> &list) {
        std::sort(list.begin(), list.end());
        list.erase(std::unique(list.begin(), list.end()), list.end());
    };
    std::for_each(graph.children.begin(), graph.children.end(), sort_unique);
    std::for_each(graph.parents.begin(), graph.parents.end(), sort_unique);
    return graph;
}

/**
 * Kahn's algorithm with a min-heap so equal-rank nodes come out by id
 *
 * @param[in] graph Indexed graph
 * @return Node indices in topological order
 * @throws std::runtime_error on a cycle
 */
std::vector<std::size_t> ordered_indices(const IndexedGraph &graph) {
    const std::size_t num_nodes = graph.ids.size();
    std::vector<std::size_t> in_degree(num_nodes, 0);
    for (std::size_t i = 0; i < num_nodes; ++i) {
        in_degree[i] = graph.parents[i].size();
    }

    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready{};
    for (std::size_t i = 0; i < num_nodes; ++i) {
        if (in_degree[i] == 0) {
            ready.push(i);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(num_nodes);
    while (!ready.empty()) {
        const std::size_t current = ready.top();
        ready.pop();
        order.push_back(current);
        for (const std::size_t child : graph.children[current]) {
            if (--in_degree[child] == 0) {
                ready.push(child);
            }
        }
    }

    // Anything left with a positive in-degree sits on a cycle
    for (std::size_t i = 0; i < num_nodes; ++i) {
        if (in_degree[i] > 0) {
            log_and_throw(
                    GraphLog::Algorithms,
                    "Circular dependency detected involving task '{}'",
                    graph.ids[i]);
        }
    }
    return order;
}

} // anonymous namespace

std::vector<std::string>
topological_order(const std::span<const std::string> nodes, const std::span<const Edge> edges) {
    const auto graph = index_graph(nodes, edges);
    const auto order = ordered_indices(graph);

    std::vector<std::string> result;
    result.reserve(order.size());
    for (const std::size_t idx : order) {
        result.push_back(graph.ids[idx]);
    }
    return result;
}

std::vector<Edge>
transitive_reduction(const std::span<const std::string> nodes, const std::span<const Edge> edges) {
    const auto graph = index_graph(nodes, edges);
    const auto order = ordered_indices(graph);
    const std::size_t num_nodes = graph.ids.size();

    std::vector<std::size_t> position(num_nodes, 0);
    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        position[order[pos]] = pos;
    }

    // reach[u] holds every node reachable from u through at least one edge
    std::vector<std::vector<bool>> reach(num_nodes, std::vector<bool>(num_nodes, false));
    std::vector<Edge> reduced;

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        const std::size_t node = *it;
        std::vector<std::size_t> children = graph.children[node];
        // A child reachable through a sibling always has the sibling earlier in topological order
        std::sort(children.begin(), children.end(), [&position](const std::size_t a, const std::size_t b) {
            return position[a] < position[b];
        });

        for (const std::size_t child : children) {
            if (reach[node][child]) {
                MONT_LOGC_TRACE_L1(
                        GraphLog::Algorithms,
                        "Dropping implied edge {} -> {}",
                        graph.ids[node],
                        graph.ids[child]);
                continue;
            }
            reduced.push_back(Edge{graph.ids[node], graph.ids[child]});
            reach[node][child] = true;
            for (std::size_t k = 0; k < num_nodes; ++k) {
                if (reach[child][k]) {
                    reach[node][k] = true;
                }
            }
        }
    }

    std::sort(reduced.begin(), reduced.end());
    return reduced;
}

std::map<std::string, std::size_t, std::less<>>
longest_path_levels(const std::span<const std::string> nodes, const std::span<const Edge> edges) {
    const auto graph = index_graph(nodes, edges);
    const auto order = ordered_indices(graph);

    std::vector<std::size_t> levels(graph.ids.size(), 0);
    for (const std::size_t current : order) {
        for (const std::size_t child : graph.children[current]) {
            levels[child] = std::max(levels[child], levels[current] + 1);
        }
    }

    std::map<std::string, std::size_t, std::less<>> result;
    for (std::size_t i = 0; i < graph.ids.size(); ++i) {
        result.emplace(graph.ids[i], levels[i]);
    }
    return result;
}

std::vector<std::vector<std::string>>
connected_components(const std::span<const std::string> nodes, const std::span<const Edge> edges) {
    const auto graph = index_graph(nodes, edges);
    const std::size_t num_nodes = graph.ids.size();

    std::vector<std::size_t> parent(num_nodes);
    std::iota(parent.begin(), parent.end(), std::size_t{0});

    const auto find_root = [&parent](std::size_t node) {
        while (parent[node] != node) {
            parent[node] = parent[parent[node]];
            node = parent[node];
        }
        return node;
    };

    for (std::size_t i = 0; i < num_nodes; ++i) {
        for (const std::size_t child : graph.children[i]) {
            const std::size_t a = find_root(i);
            const std::size_t b = find_root(child);
            if (a != b) {
                // Smaller index stays the representative
                parent[std::max(a, b)] = std::min(a, b);
            }
        }
    }

    // Nodes are visited in id order, so components come out ordered by smallest member
    std::vector<std::vector<std::string>> components;
    std::vector<std::size_t> component_of_root(num_nodes, num_nodes);
    for (std::size_t i = 0; i < num_nodes; ++i) {
        const std::size_t root = find_root(i);
        if (component_of_root[root] == num_nodes) {
            component_of_root[root] = components.size();
            components.emplace_back();
        }
        components[component_of_root[root]].push_back(graph.ids[i]);
    }
    return components;
}

} // namespace mont::graph

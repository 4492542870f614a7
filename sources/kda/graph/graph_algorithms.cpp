//
// Created by gregorian-rayne on 2/9/26.
//

#include "kda/graph/graph_algorithms.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace kda::graph {

    namespace {

        const std::vector<std::string>& edges_of(const AdjacencyMap& adjacency, const std::string& node) {
            static const std::vector<std::string> none;
            const auto it = adjacency.find(node);
            return it != adjacency.end() ? it->second : none;
        }

        /**
         * One level of the depth-first search: the node being expanded and
         * the position of the next dependency to look at.
         */
        struct DfsFrame {
            std::string node;
            const std::vector<std::string>* dependencies;
            std::size_t next = 0;
        };

    }  // namespace

    // ============================================================================
    // Structural queries
    // ============================================================================

    std::vector<std::string> find_missing_dependencies(const DependencyGraph& graph) {
        std::vector<std::string> missing;
        std::unordered_set<std::string> seen;

        for (const auto& name : graph.component_names()) {
            for (const auto& dep : graph.dependencies(name)) {
                if (!graph.has_component(dep) && seen.insert(dep).second) {
                    missing.push_back(dep);
                }
            }
        }
        return missing;
    }

    std::vector<std::string> find_components_with_no_dependencies(const DependencyGraph& graph) {
        std::vector<std::string> result;
        for (const auto& name : graph.component_names()) {
            if (graph.dependencies(name).empty()) {
                result.push_back(name);
            }
        }
        return result;
    }

    std::unordered_map<std::string, std::size_t> calculate_dependency_counts(const DependencyGraph& graph) {
        std::unordered_map<std::string, std::size_t> counts;
        for (const auto& name : graph.component_names()) {
            counts[name] = graph.dependents(name).size();
        }
        return counts;
    }

    // ============================================================================
    // Cycles
    // ============================================================================

    std::vector<Cycle> detect_cycles(const DependencyGraph& graph) {
        return detect_cycles(graph.component_names(), graph.adjacency());
    }

    std::vector<Cycle> detect_cycles(const std::vector<std::string>& roots, const AdjacencyMap& adjacency) {
        std::vector<Cycle> cycles;
        std::unordered_set<std::string> visited;
        std::unordered_set<std::string> on_path;
        std::vector<std::string> path;
        std::vector<DfsFrame> frames;

        auto enter = [&](const std::string& node) {
            visited.insert(node);
            on_path.insert(node);
            path.push_back(node);
            frames.push_back(DfsFrame{node, &edges_of(adjacency, node), 0});
        };

        for (const auto& root : roots) {
            if (visited.contains(root)) {
                continue;
            }

            enter(root);
            while (!frames.empty()) {
                DfsFrame& frame = frames.back();

                if (frame.next == frame.dependencies->size()) {
                    on_path.erase(frame.node);
                    path.pop_back();
                    frames.pop_back();
                    continue;
                }

                const std::string& dep = (*frame.dependencies)[frame.next++];
                if (!visited.contains(dep)) {
                    // frame is invalidated by enter()
                    enter(dep);
                } else if (on_path.contains(dep)) {
                    const auto start = std::ranges::find(path, dep);
                    cycles.emplace_back(start, path.end());
                }
            }
        }

        return cycles;
    }

    Cycle canonical_rotation(const Cycle& cycle) {
        if (cycle.empty()) {
            return cycle;
        }
        Cycle rotated = cycle;
        const auto smallest = std::ranges::min_element(rotated);
        std::ranges::rotate(rotated, smallest);
        return rotated;
    }

    std::vector<Cycle> deduplicate_cycles(const std::vector<Cycle>& cycles) {
        std::vector<Cycle> unique;
        std::vector<Cycle> seen;

        for (const auto& cycle : cycles) {
            auto key = canonical_rotation(cycle);
            if (std::ranges::find(seen, key) != seen.end()) {
                continue;
            }
            seen.push_back(std::move(key));
            unique.push_back(cycle);
        }
        return unique;
    }

    // ============================================================================
    // Ordering
    // ============================================================================

    std::vector<std::string> topological_sort(const DependencyGraph& graph) {
        std::unordered_map<std::string, std::size_t> in_degree;
        for (const auto& name : graph.component_names()) {
            in_degree[name] = 0;
        }

        for (const auto& name : graph.component_names()) {
            for (const auto& dep : graph.dependencies(name)) {
                if (auto it = in_degree.find(dep); it != in_degree.end()) {
                    ++it->second;
                }
            }
        }

        std::queue<std::string> queue;
        for (const auto& name : graph.component_names()) {
            if (in_degree[name] == 0) {
                queue.push(name);
            }
        }

        std::vector<std::string> order;
        order.reserve(graph.component_count());

        while (!queue.empty()) {
            auto node = std::move(queue.front());
            queue.pop();

            for (const auto& dep : graph.dependencies(node)) {
                if (auto it = in_degree.find(dep); it != in_degree.end() && --it->second == 0) {
                    queue.push(dep);
                }
            }
            order.push_back(std::move(node));
        }

        return order;
    }

    Result<std::vector<std::string>> topological_sort_checked(const DependencyGraph& graph) {
        auto order = topological_sort(graph);
        if (order.size() != graph.component_count()) {
            return Result<std::vector<std::string>>::failure(
                Error::analysis_error("Graph contains cycles, topological order is incomplete",
                                      std::to_string(order.size()) + " of " +
                                      std::to_string(graph.component_count()) + " components ordered")
            );
        }
        return Result<std::vector<std::string>>::success(std::move(order));
    }

    bool is_valid_topological_order(const DependencyGraph& graph, const std::vector<std::string>& order) {
        if (order.size() != graph.component_count()) {
            return false;
        }

        std::unordered_set<std::string> emitted;
        for (const auto& name : order) {
            for (const auto& dependent : graph.dependents(name)) {
                if (!emitted.contains(dependent)) {
                    return false;
                }
            }
            if (!emitted.insert(name).second) {
                return false;
            }
        }
        return true;
    }

    // ============================================================================
    // Centrality
    // ============================================================================

    std::unordered_map<std::string, double> betweenness_centrality(const DependencyGraph& graph) {
        return betweenness_centrality(graph.component_names(), graph.adjacency());
    }

    std::unordered_map<std::string, double> betweenness_centrality(
        const std::vector<std::string>& nodes,
        const AdjacencyMap& adjacency) {

        std::vector<std::string> names;
        std::unordered_map<std::string, std::size_t> index;
        for (const auto& node : nodes) {
            if (index.try_emplace(node, names.size()).second) {
                names.push_back(node);
            }
        }

        const std::size_t n = names.size();
        std::vector<std::vector<std::size_t>> successors(n);
        for (std::size_t v = 0; v < n; ++v) {
            for (const auto& dep : edges_of(adjacency, names[v])) {
                const auto it = index.find(dep);
                if (it == index.end()) {
                    continue;
                }
                if (std::ranges::find(successors[v], it->second) == successors[v].end()) {
                    successors[v].push_back(it->second);
                }
            }
        }

        std::vector<double> centrality(n, 0.0);

        for (std::size_t s = 0; s < n; ++s) {
            std::vector<std::size_t> stack;
            std::vector<std::vector<std::size_t>> predecessors(n);
            std::vector<double> sigma(n, 0.0);
            std::vector<long long> distance(n, -1);
            std::vector<double> delta(n, 0.0);

            sigma[s] = 1.0;
            distance[s] = 0;

            std::queue<std::size_t> queue;
            queue.push(s);

            while (!queue.empty()) {
                const std::size_t v = queue.front();
                queue.pop();
                stack.push_back(v);

                for (const std::size_t w : successors[v]) {
                    if (distance[w] < 0) {
                        distance[w] = distance[v] + 1;
                        queue.push(w);
                    }
                    if (distance[w] == distance[v] + 1) {
                        sigma[w] += sigma[v];
                        predecessors[w].push_back(v);
                    }
                }
            }

            while (!stack.empty()) {
                const std::size_t w = stack.back();
                stack.pop_back();

                for (const std::size_t v : predecessors[w]) {
                    delta[v] += (sigma[v] / sigma[w]) * (1.0 + delta[w]);
                }
                if (w != s) {
                    centrality[w] += delta[w];
                }
            }
        }

        std::unordered_map<std::string, double> result;
        result.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            result.emplace(names[i], centrality[i]);
        }
        return result;
    }

    // ============================================================================
    // Strength and clustering
    // ============================================================================

    StrengthMap compute_dependency_strength(const std::vector<ModuleDependency>& edges) {
        StrengthMap strength;
        for (const auto& edge : edges) {
            strength[edge.from][edge.to] += 1.0;
        }
        return strength;
    }

    std::vector<std::vector<std::string>> group_by_strength(
        const std::vector<std::string>& components,
        const std::vector<ModuleDependency>& edges,
        const StrengthMap& strength,
        const double threshold) {

        AdjacencyMap outgoing;
        for (const auto& edge : edges) {
            auto& targets = outgoing[edge.from];
            if (std::ranges::find(targets, edge.to) == targets.end()) {
                targets.push_back(edge.to);
            }
        }

        std::vector<std::vector<std::string>> groups;
        std::unordered_set<std::string> assigned;

        for (const auto& component : components) {
            if (assigned.contains(component)) {
                continue;
            }

            const auto from_it = strength.find(component);
            if (from_it == strength.end()) {
                continue;
            }

            std::vector<std::string> strong;
            for (const auto& target : edges_of(outgoing, component)) {
                if (const auto it = from_it->second.find(target);
                    it != from_it->second.end() && it->second >= threshold) {
                    strong.push_back(target);
                }
            }
            if (strong.empty()) {
                continue;
            }

            std::vector<std::string> group{component};
            assigned.insert(component);
            for (const auto& target : strong) {
                if (assigned.insert(target).second) {
                    group.push_back(target);
                }
            }
            groups.push_back(std::move(group));
        }

        return groups;
    }

}  // namespace kda::graph

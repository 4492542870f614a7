//
// Created by gregorian-rayne on 2/9/26.
//

#include "kda/graph/dependency_graph.hpp"

#include <algorithm>
#include <ranges>

namespace kda::graph {

    namespace {
        const std::vector<std::string> EMPTY_LIST;
    }

    void DependencyGraph::add_component(Component component) {
        const std::string& name = component.name;

        if (const auto existing = adjacency_.find(name); existing == adjacency_.end()) {
            node_order_.push_back(name);
        } else {
            drop_reverse_edges(name, existing->second);
        }
        adjacency_[name] = component.dependencies;

        for (const auto& dep : component.dependencies) {
            reverse_adjacency_[dep].push_back(name);
        }

        component_index_[name] = components_.size();
        components_.push_back(std::move(component));
    }

    void DependencyGraph::drop_reverse_edges(const std::string& name, const std::vector<std::string>& old_dependencies) {
        for (const auto& dep : old_dependencies) {
            const auto it = reverse_adjacency_.find(dep);
            if (it == reverse_adjacency_.end()) {
                continue;
            }
            auto& users = it->second;
            if (const auto pos = std::ranges::find(users, name); pos != users.end()) {
                users.erase(pos);
            }
            if (users.empty()) {
                reverse_adjacency_.erase(it);
            }
        }
    }

    bool DependencyGraph::has_component(const std::string& name) const {
        return adjacency_.contains(name);
    }

    const Component* DependencyGraph::find_component(const std::string& name) const {
        const auto it = component_index_.find(name);
        if (it == component_index_.end()) {
            return nullptr;
        }
        return &components_[it->second];
    }

    const std::vector<std::string>& DependencyGraph::dependencies(const std::string& name) const {
        const auto it = adjacency_.find(name);
        return it != adjacency_.end() ? it->second : EMPTY_LIST;
    }

    const std::vector<std::string>& DependencyGraph::dependents(const std::string& name) const {
        const auto it = reverse_adjacency_.find(name);
        return it != reverse_adjacency_.end() ? it->second : EMPTY_LIST;
    }

    std::size_t DependencyGraph::edge_count() const noexcept {
        std::size_t total = 0;
        for (const auto& deps : adjacency_ | std::views::values) {
            total += deps.size();
        }
        return total;
    }

}  // namespace kda::graph

//
// Created by gregorian-rayne on 2/9/26.
//

#include "kda/graph/graph_builder.hpp"

#include <algorithm>
#include <unordered_set>

namespace kda::graph {

    Result<DependencyGraph> GraphBuilder::build(const std::vector<Component>& components) const {
        if (reject_duplicate_names_) {
            if (const auto duplicates = find_duplicate_names(components); !duplicates.empty()) {
                return Result<DependencyGraph>::failure(
                    Error::duplicate_component("Component name declared more than once", duplicates.front())
                );
            }
        }
        return Result<DependencyGraph>::success(build_dependency_graph(components));
    }

    DependencyGraph build_dependency_graph(const std::vector<Component>& components) {
        DependencyGraph graph;
        for (const auto& component : components) {
            graph.add_component(component);
        }
        return graph;
    }

    std::vector<std::string> find_duplicate_names(const std::vector<Component>& components) {
        std::unordered_set<std::string> seen;
        std::vector<std::string> duplicates;

        for (const auto& component : components) {
            if (!seen.insert(component.name).second &&
                std::ranges::find(duplicates, component.name) == duplicates.end()) {
                duplicates.push_back(component.name);
            }
        }
        return duplicates;
    }

}  // namespace kda::graph

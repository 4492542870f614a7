//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_DEPENDENCY_GRAPH_HPP
#define KDA_DEPENDENCY_GRAPH_HPP

/**
 * @file dependency_graph.hpp
 * @brief Forward and reverse adjacency built from kernel components.
 *
 * The graph keeps the component list it was built from together with:
 * - adjacency: component -> the names it depends on (declaration order)
 * - reverse adjacency: name -> components depending on it
 *
 * Dependency names that do not belong to any component are kept
 * verbatim. They appear in reverse adjacency but never as adjacency
 * keys, which is how missing dependencies are found downstream.
 */

#include "kda/types.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace kda::graph {

    using AdjacencyMap = std::unordered_map<std::string, std::vector<std::string>>;

    /**
     * Directed dependency graph over named components.
     *
     * Read operations are safe to call concurrently once construction
     * is finished.
     */
    class DependencyGraph {
    public:
        DependencyGraph() = default;

        /**
         * Adds a component and its dependency edges.
         *
         * A component whose name is already present replaces the earlier
         * declaration (last write wins). The earlier declaration's reverse
         * edges are removed.
         */
        void add_component(Component component);

        /**
         * Components in the order they were added, duplicates included.
         */
        [[nodiscard]] const std::vector<Component>& components() const noexcept {
            return components_;
        }

        /**
         * Unique component names in first-appearance order.
         */
        [[nodiscard]] const std::vector<std::string>& component_names() const noexcept {
            return node_order_;
        }

        [[nodiscard]] const AdjacencyMap& adjacency() const noexcept {
            return adjacency_;
        }

        [[nodiscard]] const AdjacencyMap& reverse_adjacency() const noexcept {
            return reverse_adjacency_;
        }

        /**
         * True if a component with this name was added.
         */
        [[nodiscard]] bool has_component(const std::string& name) const;

        /**
         * Returns the component registered under name, or nullptr.
         */
        [[nodiscard]] const Component* find_component(const std::string& name) const;

        /**
         * Names the component depends on; empty for unknown names.
         */
        [[nodiscard]] const std::vector<std::string>& dependencies(const std::string& name) const;

        /**
         * Components that list name as a dependency.
         */
        [[nodiscard]] const std::vector<std::string>& dependents(const std::string& name) const;

        [[nodiscard]] std::size_t component_count() const noexcept {
            return node_order_.size();
        }

        /**
         * Total number of adjacency entries, repeated names included.
         */
        [[nodiscard]] std::size_t edge_count() const noexcept;

        [[nodiscard]] bool empty() const noexcept {
            return node_order_.empty();
        }

    private:
        void drop_reverse_edges(const std::string& name, const std::vector<std::string>& old_dependencies);

        std::vector<Component> components_;
        std::vector<std::string> node_order_;
        AdjacencyMap adjacency_;
        AdjacencyMap reverse_adjacency_;
        std::unordered_map<std::string, std::size_t> component_index_;
    };

}  // namespace kda::graph

#endif //KDA_DEPENDENCY_GRAPH_HPP

//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_GRAPH_BUILDER_HPP
#define KDA_GRAPH_BUILDER_HPP

#include "kda/graph/dependency_graph.hpp"
#include "kda/result.hpp"

#include <vector>

namespace kda::graph {

    /**
     * @class GraphBuilder
     * Constructs dependency graphs from extracted components.
     *
     * By default building never fails: unknown dependency names are kept
     * and a repeated component name overwrites the earlier adjacency
     * entry. With duplicate rejection enabled, a repeated name fails the
     * build with ErrorCode::DuplicateComponent.
     */
    class GraphBuilder {
    public:
        GraphBuilder() = default;

        /**
         * Builds a graph from the given components.
         *
         * @param components Components in extractor order.
         * @return The graph, or a DuplicateComponent error in strict mode.
         */
        [[nodiscard]] Result<DependencyGraph> build(const std::vector<Component>& components) const;

        /**
         * Enables or disables rejection of repeated component names.
         */
        void set_reject_duplicate_names(bool reject) {
            reject_duplicate_names_ = reject;
        }

        [[nodiscard]] bool reject_duplicate_names() const noexcept {
            return reject_duplicate_names_;
        }

    private:
        bool reject_duplicate_names_ = false;
    };

    /**
     * Builds a dependency graph with last-write-wins duplicate handling.
     * Total function: accepts any component list, including an empty one.
     */
    [[nodiscard]] DependencyGraph build_dependency_graph(const std::vector<Component>& components);

    /**
     * Returns the names declared by more than one component, in the order
     * their second declaration appears.
     */
    [[nodiscard]] std::vector<std::string> find_duplicate_names(const std::vector<Component>& components);

}  // namespace kda::graph

#endif //KDA_GRAPH_BUILDER_HPP

//
// Created by gregorian-rayne on 2/9/26.
//

#ifndef KDA_GRAPH_ALGORITHMS_HPP
#define KDA_GRAPH_ALGORITHMS_HPP

/**
 * @file graph_algorithms.hpp
 * @brief Algorithms over the component dependency graph.
 *
 * All functions are pure and total. Structural problems (cycles,
 * undefined dependencies) are returned as data, never as errors; the
 * one exception is topological_sort_checked(), which exists for callers
 * that want a complete order or nothing.
 *
 * Most algorithms come in two forms: one taking a DependencyGraph and
 * one taking a node list plus adjacency map, which the enhanced
 * analyzer uses for graphs derived from explicit edge lists.
 */

#include "kda/graph/dependency_graph.hpp"
#include "kda/result.hpp"
#include "kda/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace kda::graph {

    /**
     * A closed dependency path. The last node depends on the first.
     */
    using Cycle = std::vector<std::string>;

    /**
     * Edge strength: from -> (to -> strength).
     */
    using StrengthMap = std::unordered_map<std::string, std::unordered_map<std::string, double>>;

    // ============================================================================
    // Structural queries
    // ============================================================================

    /**
     * Returns every dependency name that no analysed component carries.
     *
     * Deduplicated; names appear in the order they are first referenced.
     *
     * @param graph The dependency graph to inspect.
     * @return Names referenced but not defined.
     */
    [[nodiscard]] std::vector<std::string> find_missing_dependencies(const DependencyGraph& graph);

    /**
     * Returns the components whose dependency list is empty.
     */
    [[nodiscard]] std::vector<std::string> find_components_with_no_dependencies(const DependencyGraph& graph);

    /**
     * Computes the number of dependents (reverse in-degree) of each component.
     */
    [[nodiscard]] std::unordered_map<std::string, std::size_t> calculate_dependency_counts(
        const DependencyGraph& graph
    );

    // ============================================================================
    // Cycles
    // ============================================================================

    /**
     * Detects cycles with a depth-first search tracking the current path.
     *
     * Roots are taken in component order and dependency lists are walked
     * in declaration order. Whenever a dependency is found on the current
     * path, the path suffix starting at that dependency is reported. The
     * search uses an explicit stack, so chain length is not bounded by the
     * call stack.
     *
     * The same cycle can be reported more than once when a dependency
     * name is repeated in a list; see deduplicate_cycles().
     *
     * @param graph The dependency graph to search.
     * @return The cycles found, in discovery order.
     */
    [[nodiscard]] std::vector<Cycle> detect_cycles(const DependencyGraph& graph);

    /**
     * Cycle detection over an arbitrary adjacency map.
     *
     * @param roots Nodes to start searches from, in order.
     * @param adjacency Forward edges; nodes without an entry have no edges.
     */
    [[nodiscard]] std::vector<Cycle> detect_cycles(
        const std::vector<std::string>& roots,
        const AdjacencyMap& adjacency
    );

    /**
     * Rotates a cycle so that it starts at its lexicographically smallest node.
     */
    [[nodiscard]] Cycle canonical_rotation(const Cycle& cycle);

    /**
     * Drops cycles whose canonical rotation was already seen.
     * The first report of each cycle is kept, unrotated.
     */
    [[nodiscard]] std::vector<Cycle> deduplicate_cycles(const std::vector<Cycle>& cycles);

    // ============================================================================
    // Ordering
    // ============================================================================

    /**
     * Orders components with Kahn's algorithm.
     *
     * A component's in-degree is the number of components listing it as a
     * dependency, so components nothing depends on are emitted first and
     * every component is emitted after all of its dependents. Undefined
     * dependency names are not part of the order.
     *
     * When the graph has cycles the result only covers the acyclic part;
     * a result shorter than component_count() is the signal, not an error.
     *
     * @param graph The dependency graph to sort.
     * @return Component names, dependents first.
     */
    [[nodiscard]] std::vector<std::string> topological_sort(const DependencyGraph& graph);

    /**
     * Same as topological_sort(), but fails with AnalysisError when the
     * order does not cover every component.
     */
    [[nodiscard]] Result<std::vector<std::string>> topological_sort_checked(const DependencyGraph& graph);

    /**
     * Checks that every component appears after all of its dependents.
     */
    [[nodiscard]] bool is_valid_topological_order(
        const DependencyGraph& graph,
        const std::vector<std::string>& order
    );

    // ============================================================================
    // Centrality
    // ============================================================================

    /**
     * Betweenness centrality with Brandes' algorithm.
     *
     * The graph is treated as directed and unweighted. Scores are not
     * normalized and are only comparable within one run. Edges to
     * undefined names are ignored and repeated edges count once.
     *
     * @param graph The dependency graph.
     * @return A score for every component (0 when it is on no shortest path).
     */
    [[nodiscard]] std::unordered_map<std::string, double> betweenness_centrality(const DependencyGraph& graph);

    /**
     * Betweenness centrality restricted to the given nodes.
     */
    [[nodiscard]] std::unordered_map<std::string, double> betweenness_centrality(
        const std::vector<std::string>& nodes,
        const AdjacencyMap& adjacency
    );

    // ============================================================================
    // Strength and clustering
    // ============================================================================

    /**
     * Counts how often each (from, to) pair occurs in an edge list.
     */
    [[nodiscard]] StrengthMap compute_dependency_strength(const std::vector<ModuleDependency>& edges);

    /**
     * Greedy grouping of components joined by strong edges.
     *
     * Components are visited in order. An unclustered component with at
     * least one outgoing edge of strength >= threshold starts a group made
     * of itself and its still unclustered strong targets. Components
     * without strong edges belong to no group.
     *
     * @param components Component names in visiting order.
     * @param edges Edge list the strength map was computed from.
     * @param strength Edge strengths.
     * @param threshold Minimum strength of a strong edge.
     * @return Groups of component names; the first name is the seed.
     */
    [[nodiscard]] std::vector<std::vector<std::string>> group_by_strength(
        const std::vector<std::string>& components,
        const std::vector<ModuleDependency>& edges,
        const StrengthMap& strength,
        double threshold
    );

}  // namespace kda::graph

#endif //KDA_GRAPH_ALGORITHMS_HPP

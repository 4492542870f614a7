//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef KDA_DEPENDENCY_ANALYZER_HPP
#define KDA_DEPENDENCY_ANALYZER_HPP

/**
 * @file dependency_analyzer.hpp
 * @brief Whole-graph dependency analysis of kernel components.
 *
 * Runs every structural check over one component snapshot:
 * - Undefined (missing) dependencies
 * - Dependency cycles
 * - Components without dependencies
 * - Dependent counts per component
 * - Topological and build order (only when the graph is acyclic)
 *
 * Findings never abort the analysis; a cyclic graph still gets every
 * other field filled in.
 */

#include "kda/graph/dependency_graph.hpp"
#include "kda/graph/graph_algorithms.hpp"
#include "kda/result.hpp"
#include "kda/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace kda::analyzers {

    /**
     * Switches for the individual analysis steps.
     */
    struct AnalyzerOptions {
        bool enable_cycle_detection = true;
        bool enable_topological_sorting = true;
        bool enable_missing_dependency_check = true;

        /// Report each cycle once, whatever rotation it was found in
        bool deduplicate_cycles = true;

        /// Used by analyze_checked() only
        bool reject_duplicate_names = false;
    };

    /**
     * Snapshot of one analysis run.
     */
    struct DependencyAnalysisResult {
        graph::DependencyGraph graph;
        std::vector<graph::Cycle> cycles;
        std::vector<std::string> components_with_no_dependencies;
        std::vector<std::string> missing_dependencies;

        /// Number of components depending on each component
        std::unordered_map<std::string, std::size_t> dependency_counts;

        /// Dependents first; empty when cycles were found
        std::vector<std::string> topological_order;

        /// topological_order reversed: dependencies first
        std::vector<std::string> build_order;

        [[nodiscard]] bool has_cycles() const noexcept {
            return !cycles.empty();
        }

        [[nodiscard]] bool has_missing_dependencies() const noexcept {
            return !missing_dependencies.empty();
        }
    };

    /**
     * Analyzes dependencies between kernel components.
     *
     * Stateless apart from its options; one instance can serve
     * concurrent callers.
     */
    class DependencyAnalyzer {
    public:
        DependencyAnalyzer() = default;
        explicit DependencyAnalyzer(AnalyzerOptions options) : options_(options) {}

        /**
         * Analyzes a component list. Never fails.
         *
         * Duplicate component names are accepted; the last declaration
         * defines the component's dependencies.
         */
        [[nodiscard]] DependencyAnalysisResult analyze(const std::vector<Component>& components) const;

        /**
         * Like analyze(), but honours reject_duplicate_names and fails with
         * DuplicateComponent when a name is declared twice.
         */
        [[nodiscard]] Result<DependencyAnalysisResult> analyze_checked(
            const std::vector<Component>& components
        ) const;

        [[nodiscard]] const AnalyzerOptions& options() const noexcept {
            return options_;
        }

    private:
        [[nodiscard]] DependencyAnalysisResult analyze_graph(graph::DependencyGraph graph) const;

        AnalyzerOptions options_;
    };

}  // namespace kda::analyzers

#endif //KDA_DEPENDENCY_ANALYZER_HPP

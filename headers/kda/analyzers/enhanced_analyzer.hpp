//
// Created by gregorian-rayne on 2/11/26.
//

#ifndef KDA_ENHANCED_ANALYZER_HPP
#define KDA_ENHANCED_ANALYZER_HPP

/**
 * @file enhanced_analyzer.hpp
 * @brief Visualization-oriented dependency analysis.
 *
 * Extends the structural analysis with data a presentation layer needs:
 * - Edge strength and normalized visual weight
 * - Betweenness centrality per component
 * - Clusters of strongly linked components
 * - Highlight and visibility flags that callers toggle afterwards
 *
 * Screen layout is not computed here.
 */

#include "kda/graph/graph_algorithms.hpp"
#include "kda/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kda::analyzers {

    struct EnhancedOptions {
        /// Strength that maps to a visual weight of 1.0
        double max_strength = 10.0;

        /// Edges below this visual weight start out hidden
        double min_strength_for_visibility = 0.5;

        bool cluster_detection = true;
        bool cycle_detection = true;
        bool deduplicate_cycles = true;

        /// Fraction of max_strength an edge needs to count as strong
        double strong_dependency_ratio = 0.7;
    };

    /**
     * An edge with presentation state.
     *
     * strength and visual_weight are computed once per analysis;
     * is_visible and is_highlighted are changed by the filter and
     * highlight functions below.
     */
    struct EnhancedModuleDependency {
        ModuleDependency original;
        double strength = 1.0;
        double visual_weight = 0.0;
        bool is_highlighted = false;
        bool is_visible = true;
    };

    /**
     * Components grouped by strong mutual dependency.
     */
    struct DependencyCluster {
        std::string id;
        std::vector<std::string> components;

        /// Approximate display size, proportional to the member count
        double size = 0.0;
    };

    struct EnhancedDependencyAnalysis {
        std::vector<EnhancedModuleDependency> dependencies;
        std::vector<graph::Cycle> cycles;
        graph::StrengthMap dependency_strength;
        std::unordered_map<std::string, double> component_centrality;
        std::vector<DependencyCluster> clusters;

        /// Component names in input order
        std::vector<std::string> components;
    };

    /**
     * Produces EnhancedDependencyAnalysis snapshots.
     */
    class EnhancedDependencyAnalyzer {
    public:
        EnhancedDependencyAnalyzer() = default;
        explicit EnhancedDependencyAnalyzer(EnhancedOptions options) : options_(options) {}

        void set_max_strength(double max_strength) { options_.max_strength = max_strength; }
        void set_min_strength_for_visibility(double min_strength) { options_.min_strength_for_visibility = min_strength; }
        void set_cluster_detection(bool enabled) { options_.cluster_detection = enabled; }
        void set_cycle_detection(bool enabled) { options_.cycle_detection = enabled; }

        [[nodiscard]] const EnhancedOptions& options() const noexcept {
            return options_;
        }

        /**
         * Analyzes components plus an explicit edge list.
         *
         * @param structure Components and edges; edges may repeat.
         * @return A fresh analysis with all edges unhighlighted.
         */
        [[nodiscard]] EnhancedDependencyAnalysis analyze(const KernelStructure& structure) const;

        /**
         * Analyzes components using their declared dependency lists as edges.
         */
        [[nodiscard]] EnhancedDependencyAnalysis analyze(const std::vector<Component>& components) const;

    private:
        EnhancedOptions options_;
    };

    /**
     * Highlights the edges leaving component_name, and with
     * include_dependents also the edges entering it. Clears every other
     * highlight first.
     */
    void highlight_component_dependencies(
        EnhancedDependencyAnalysis& analysis,
        const std::string& component_name,
        bool include_dependents
    );

    /**
     * Clears all highlights, then highlights one edge for every
     * consecutive pair of every cycle, including the closing pair.
     */
    void highlight_cycles(EnhancedDependencyAnalysis& analysis);

    /**
     * Marks edges visible when visual_weight >= min_visual_weight and
     * hidden otherwise. Weights are not recomputed.
     */
    void filter_dependencies_by_strength(EnhancedDependencyAnalysis& analysis, double min_visual_weight);

    /**
     * Clears every highlight flag.
     */
    void clear_highlights(EnhancedDependencyAnalysis& analysis);

    /**
     * Summary figures over an enhanced analysis.
     */
    struct DependencyStatistics {
        std::size_t total_dependencies = 0;
        std::size_t unique_dependencies = 0;
        std::size_t cycle_count = 0;
        double average_strength = 0.0;
        double max_strength = 0.0;
        std::size_t cluster_count = 0;
        std::optional<std::string> most_central_component;
        std::unordered_map<std::string, std::size_t> dependencies_by_type;

        /**
         * Computes statistics; strengths are averaged over visual weights.
         * Ties for the most central component go to the first in input order.
         */
        [[nodiscard]] static DependencyStatistics generate(const EnhancedDependencyAnalysis& analysis);
    };

}  // namespace kda::analyzers

#endif //KDA_ENHANCED_ANALYZER_HPP

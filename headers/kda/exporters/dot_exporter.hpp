//
// Created by gregorian-rayne on 2/14/26.
//

#ifndef KDA_DOT_EXPORTER_HPP
#define KDA_DOT_EXPORTER_HPP

/**
 * @file dot_exporter.hpp
 * @brief Graphviz DOT output.
 *
 * The plain graph form has one node statement per component and one edge
 * statement per adjacency entry, so a dependency declared twice is drawn
 * twice. Names are quoted and escaped.
 */

#include "kda/analyzers/enhanced_analyzer.hpp"
#include "kda/graph/dependency_graph.hpp"
#include "kda/result.hpp"

#include <filesystem>
#include <string>

namespace kda::exporters {

    struct DotOptions {
        /// LR, RL, TB or BT
        std::string rankdir = "LR";

        std::string node_fill_color = "lightblue";
        std::string highlight_color = "red";

        /// Pen width of an edge with visual weight 1.0; weight 0 draws at 1.0
        double max_pen_width = 5.0;
    };

    /**
     * Renders the dependency graph.
     */
    [[nodiscard]] std::string render_dot(const graph::DependencyGraph& graph, const DotOptions& options = {});

    /**
     * Renders an enhanced analysis.
     *
     * Hidden edges are omitted, highlighted edges use
     * DotOptions::highlight_color, and each cluster becomes a
     * "subgraph cluster_N" block.
     */
    [[nodiscard]] std::string render_dot(
        const analyzers::EnhancedDependencyAnalysis& analysis,
        const DotOptions& options = {}
    );

    /**
     * Writes render_dot(graph) to path atomically.
     *
     * @return IoError on failure; the destination is not modified then.
     */
    [[nodiscard]] Result<void> visualize_graph(
        const graph::DependencyGraph& graph,
        const std::filesystem::path& path,
        const DotOptions& options = {}
    );

    /**
     * Writes render_dot(analysis) to path atomically.
     */
    [[nodiscard]] Result<void> write_dot(
        const analyzers::EnhancedDependencyAnalysis& analysis,
        const std::filesystem::path& path,
        const DotOptions& options = {}
    );

}  // namespace kda::exporters

#endif //KDA_DOT_EXPORTER_HPP

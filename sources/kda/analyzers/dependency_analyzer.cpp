//
// Created by gregorian-rayne on 2/10/26.
//

#include "kda/analyzers/dependency_analyzer.hpp"
#include "kda/graph/graph_builder.hpp"

#include <algorithm>
#include <utility>

namespace kda::analyzers
{
    DependencyAnalysisResult DependencyAnalyzer::analyze(const std::vector<Component>& components) const {
        return analyze_graph(graph::build_dependency_graph(components));
    }

    Result<DependencyAnalysisResult> DependencyAnalyzer::analyze_checked(
        const std::vector<Component>& components) const {

        graph::GraphBuilder builder;
        builder.set_reject_duplicate_names(options_.reject_duplicate_names);

        auto built = builder.build(components);
        if (built.is_err()) {
            return Result<DependencyAnalysisResult>::failure(built.error());
        }
        return Result<DependencyAnalysisResult>::success(analyze_graph(std::move(built).value()));
    }

    DependencyAnalysisResult DependencyAnalyzer::analyze_graph(graph::DependencyGraph graph) const {
        DependencyAnalysisResult result;

        if (options_.enable_missing_dependency_check) {
            result.missing_dependencies = graph::find_missing_dependencies(graph);
        }

        if (options_.enable_cycle_detection) {
            result.cycles = graph::detect_cycles(graph);
            if (options_.deduplicate_cycles) {
                result.cycles = graph::deduplicate_cycles(result.cycles);
            }
        }

        result.components_with_no_dependencies = graph::find_components_with_no_dependencies(graph);
        result.dependency_counts = graph::calculate_dependency_counts(graph);

        if (options_.enable_topological_sorting && result.cycles.empty()) {
            auto order = graph::topological_sort(graph);
            // With cycle detection off a cyclic graph only yields a partial order
            if (order.size() == graph.component_count()) {
                result.topological_order = std::move(order);
                result.build_order.assign(result.topological_order.rbegin(), result.topological_order.rend());
            }
        }

        result.graph = std::move(graph);
        return result;
    }

}  // namespace kda::analyzers

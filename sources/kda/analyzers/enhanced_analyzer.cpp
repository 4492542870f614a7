//
// Created by gregorian-rayne on 2/11/26.
//

#include "kda/analyzers/enhanced_analyzer.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

namespace kda::analyzers
{
    namespace {

        /**
         * Component names first, then edge endpoints that are not components.
         */
        std::vector<std::string> collect_nodes(const KernelStructure& structure) {
            std::vector<std::string> nodes;
            std::unordered_set<std::string> seen;

            auto add = [&](const std::string& name) {
                if (seen.insert(name).second) {
                    nodes.push_back(name);
                }
            };

            for (const auto& component : structure.components) {
                add(component.name);
            }
            for (const auto& edge : structure.dependencies) {
                add(edge.from);
                add(edge.to);
            }
            return nodes;
        }

        graph::AdjacencyMap edge_adjacency(const std::vector<ModuleDependency>& edges) {
            graph::AdjacencyMap adjacency;
            for (const auto& edge : edges) {
                adjacency[edge.from].push_back(edge.to);
            }
            return adjacency;
        }

    }  // namespace

    EnhancedDependencyAnalysis EnhancedDependencyAnalyzer::analyze(const KernelStructure& structure) const {
        EnhancedDependencyAnalysis analysis;

        for (const auto& component : structure.components) {
            if (std::ranges::find(analysis.components, component.name) == analysis.components.end()) {
                analysis.components.push_back(component.name);
            }
        }

        analysis.dependency_strength = graph::compute_dependency_strength(structure.dependencies);

        analysis.dependencies.reserve(structure.dependencies.size());
        for (const auto& edge : structure.dependencies) {
            EnhancedModuleDependency enhanced;
            enhanced.original = edge;
            enhanced.strength = analysis.dependency_strength[edge.from][edge.to];
            enhanced.visual_weight = options_.max_strength > 0.0
                ? enhanced.strength / options_.max_strength
                : 0.0;
            enhanced.is_visible = enhanced.visual_weight >= options_.min_strength_for_visibility;
            analysis.dependencies.push_back(std::move(enhanced));
        }

        const auto adjacency = edge_adjacency(structure.dependencies);

        if (options_.cycle_detection) {
            analysis.cycles = graph::detect_cycles(collect_nodes(structure), adjacency);
            if (options_.deduplicate_cycles) {
                analysis.cycles = graph::deduplicate_cycles(analysis.cycles);
            }
        }

        analysis.component_centrality = graph::betweenness_centrality(analysis.components, adjacency);

        if (options_.cluster_detection) {
            const auto groups = graph::group_by_strength(
                analysis.components,
                structure.dependencies,
                analysis.dependency_strength,
                options_.max_strength * options_.strong_dependency_ratio
            );

            for (const auto& group : groups) {
                DependencyCluster cluster;
                cluster.id = "cluster_" + std::to_string(analysis.clusters.size());
                cluster.components = group;
                cluster.size = static_cast<double>(group.size()) * 100.0;
                analysis.clusters.push_back(std::move(cluster));
            }
        }

        return analysis;
    }

    EnhancedDependencyAnalysis EnhancedDependencyAnalyzer::analyze(const std::vector<Component>& components) const {
        return analyze(make_kernel_structure(components));
    }

    // ============================================================================
    // Presentation state
    // ============================================================================

    void clear_highlights(EnhancedDependencyAnalysis& analysis) {
        for (auto& dep : analysis.dependencies) {
            dep.is_highlighted = false;
        }
    }

    void highlight_component_dependencies(
        EnhancedDependencyAnalysis& analysis,
        const std::string& component_name,
        const bool include_dependents) {

        clear_highlights(analysis);

        for (auto& dep : analysis.dependencies) {
            if (dep.original.from == component_name) {
                dep.is_highlighted = true;
            }
            if (include_dependents && dep.original.to == component_name) {
                dep.is_highlighted = true;
            }
        }
    }

    void highlight_cycles(EnhancedDependencyAnalysis& analysis) {
        clear_highlights(analysis);

        for (const auto& cycle : analysis.cycles) {
            for (std::size_t i = 0; i < cycle.size(); ++i) {
                const auto& from = cycle[i];
                const auto& to = cycle[(i + 1) % cycle.size()];

                const auto edge = std::ranges::find_if(analysis.dependencies, [&](const auto& dep) {
                    return dep.original.from == from && dep.original.to == to;
                });
                if (edge != analysis.dependencies.end()) {
                    edge->is_highlighted = true;
                }
            }
        }
    }

    void filter_dependencies_by_strength(EnhancedDependencyAnalysis& analysis, const double min_visual_weight) {
        for (auto& dep : analysis.dependencies) {
            dep.is_visible = dep.visual_weight >= min_visual_weight;
        }
    }

    // ============================================================================
    // Statistics
    // ============================================================================

    DependencyStatistics DependencyStatistics::generate(const EnhancedDependencyAnalysis& analysis) {
        DependencyStatistics stats;
        stats.total_dependencies = analysis.dependencies.size();
        stats.cycle_count = analysis.cycles.size();
        stats.cluster_count = analysis.clusters.size();

        std::set<std::pair<std::string, std::string>> unique_pairs;
        double total_weight = 0.0;

        for (const auto& dep : analysis.dependencies) {
            unique_pairs.emplace(dep.original.from, dep.original.to);
            total_weight += dep.visual_weight;
            stats.max_strength = std::max(stats.max_strength, dep.visual_weight);
            ++stats.dependencies_by_type[dep.original.dependency_type];
        }

        stats.unique_dependencies = unique_pairs.size();
        if (stats.total_dependencies > 0) {
            stats.average_strength = total_weight / static_cast<double>(stats.total_dependencies);
        }

        double best = 0.0;
        for (const auto& name : analysis.components) {
            const auto it = analysis.component_centrality.find(name);
            if (it == analysis.component_centrality.end()) {
                continue;
            }
            if (!stats.most_central_component || it->second > best) {
                stats.most_central_component = name;
                best = it->second;
            }
        }

        return stats;
    }

}  // namespace kda::analyzers

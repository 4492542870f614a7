//
// Created by gregorian-rayne on 2/15/26.
//

#include "kda/exporters/json_exporter.hpp"
#include "kda/utils/json_utils.hpp"
#include "kda/version.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kda::exporters
{
    using json = nlohmann::json;

    namespace {

        /**
         * Current time in ISO 8601, UTC.
         */
        std::string current_timestamp() {
            const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm time_info{};
#ifdef _WIN32
            gmtime_s(&time_info, &now);
#else
            gmtime_r(&now, &time_info);
#endif
            std::ostringstream ss;
            ss << std::put_time(&time_info, "%Y-%m-%dT%H:%M:%SZ");
            return ss.str();
        }

        void add_metadata(json& output, const JsonExportOptions& options) {
            if (!options.include_metadata) {
                return;
            }
            output["schema_version"] = JSON_SCHEMA_VERSION;
            output["kda_version"] = VERSION_STRING;
            output["generated_at"] = current_timestamp();
        }

        json cycles_to_json(const std::vector<graph::Cycle>& cycles) {
            json out = json::array();
            for (const auto& cycle : cycles) {
                out.push_back(cycle);
            }
            return out;
        }

    }  // namespace

    json to_json(const analyzers::DependencyAnalysisResult& result, const JsonExportOptions& options) {
        const auto& graph = result.graph;
        json output;
        add_metadata(output, options);

        json summary;
        summary["total_components"] = graph.component_count();
        summary["total_dependencies"] = graph.edge_count();
        summary["cycle_count"] = result.cycles.size();
        summary["missing_dependency_count"] = result.missing_dependencies.size();
        summary["has_cycles"] = result.has_cycles();
        output["summary"] = summary;

        json components = json::array();
        for (const auto& name : graph.component_names()) {
            json entry;
            entry["name"] = name;
            entry["dependencies"] = graph.dependencies(name);

            const auto it = result.dependency_counts.find(name);
            entry["dependents"] = it != result.dependency_counts.end() ? it->second : 0;

            if (const auto* component = graph.find_component(name)) {
                entry["type"] = to_string(component->type);
                if (component->description) {
                    entry["description"] = *component->description;
                }
            }
            components.push_back(entry);
        }
        output["components"] = components;

        output["components_with_no_dependencies"] = result.components_with_no_dependencies;
        output["missing_dependencies"] = result.missing_dependencies;
        output["cycles"] = cycles_to_json(result.cycles);
        output["topological_order"] = result.topological_order;
        output["build_order"] = result.build_order;

        return output;
    }

    json to_json(const analyzers::DependencyStatistics& statistics) {
        json output;
        output["total_dependencies"] = statistics.total_dependencies;
        output["unique_dependencies"] = statistics.unique_dependencies;
        output["cycle_count"] = statistics.cycle_count;
        output["average_strength"] = statistics.average_strength;
        output["max_strength"] = statistics.max_strength;
        output["cluster_count"] = statistics.cluster_count;
        output["most_central_component"] = statistics.most_central_component
            ? json(*statistics.most_central_component)
            : json(nullptr);

        json by_type = json::object();
        for (const auto& [type, count] : statistics.dependencies_by_type) {
            by_type[type] = count;
        }
        output["dependencies_by_type"] = by_type;
        return output;
    }

    json to_json(const analyzers::EnhancedDependencyAnalysis& analysis, const JsonExportOptions& options) {
        json output;
        add_metadata(output, options);

        output["components"] = analysis.components;

        json dependencies = json::array();
        for (const auto& dep : analysis.dependencies) {
            json entry;
            entry["from"] = dep.original.from;
            entry["to"] = dep.original.to;
            entry["type"] = dep.original.dependency_type;
            entry["count"] = dep.original.count;
            entry["strength"] = dep.strength;
            entry["visual_weight"] = dep.visual_weight;
            entry["is_highlighted"] = dep.is_highlighted;
            entry["is_visible"] = dep.is_visible;
            dependencies.push_back(entry);
        }
        output["dependencies"] = dependencies;

        output["cycles"] = cycles_to_json(analysis.cycles);

        json centrality = json::object();
        for (const auto& name : analysis.components) {
            if (const auto it = analysis.component_centrality.find(name); it != analysis.component_centrality.end()) {
                centrality[name] = it->second;
            }
        }
        output["centrality"] = centrality;

        json clusters = json::array();
        for (const auto& cluster : analysis.clusters) {
            json entry;
            entry["id"] = cluster.id;
            entry["components"] = cluster.components;
            entry["size"] = cluster.size;
            clusters.push_back(entry);
        }
        output["clusters"] = clusters;

        output["statistics"] = to_json(analyzers::DependencyStatistics::generate(analysis));

        return output;
    }

    Result<void> write_json(const analyzers::DependencyAnalysisResult& result,
                            const std::filesystem::path& path,
                            const JsonExportOptions& options) {
        return json_utils::write_file(path, to_json(result, options), options.indent);
    }

    Result<void> write_json(const analyzers::EnhancedDependencyAnalysis& analysis,
                            const std::filesystem::path& path,
                            const JsonExportOptions& options) {
        return json_utils::write_file(path, to_json(analysis, options), options.indent);
    }

}  // namespace kda::exporters

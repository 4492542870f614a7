//
// Created by gregorian-rayne on 2/14/26.
//

#include "kda/exporters/dot_exporter.hpp"
#include "kda/utils/file_utils.hpp"
#include "kda/utils/string_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace kda::exporters
{
    namespace {

        std::string quoted(const std::string& name) {
            return "\"" + string_utils::escape_dot(name) + "\"";
        }

        void write_header(std::ostringstream& out, const DotOptions& options) {
            out << "digraph DependencyGraph {\n";
            out << "    rankdir=" << options.rankdir << ";\n";
            out << "    node [shape=box, style=filled, fillcolor=" << options.node_fill_color << "];\n";
        }

        void write_node(std::ostringstream& out, const std::string& name) {
            out << "    " << quoted(name) << " [label=" << quoted(name) << "];\n";
        }

        double pen_width(const double visual_weight, const DotOptions& options) {
            const double clamped = std::clamp(visual_weight, 0.0, 1.0);
            return 1.0 + clamped * std::max(options.max_pen_width - 1.0, 0.0);
        }

    }  // namespace

    std::string render_dot(const graph::DependencyGraph& graph, const DotOptions& options) {
        std::ostringstream out;
        write_header(out, options);

        for (const auto& name : graph.component_names()) {
            write_node(out, name);
        }

        for (const auto& name : graph.component_names()) {
            for (const auto& dep : graph.dependencies(name)) {
                out << "    " << quoted(name) << " -> " << quoted(dep) << ";\n";
            }
        }

        out << "}\n";
        return out.str();
    }

    std::string render_dot(const analyzers::EnhancedDependencyAnalysis& analysis, const DotOptions& options) {
        std::ostringstream out;
        write_header(out, options);

        for (const auto& cluster : analysis.clusters) {
            out << "    subgraph " << cluster.id << " {\n";
            out << "        label=" << quoted(cluster.id) << ";\n";
            out << "        style=dashed;\n";
            for (const auto& member : cluster.components) {
                out << "        " << quoted(member) << ";\n";
            }
            out << "    }\n";
        }

        std::unordered_set<std::string> written;
        for (const auto& name : analysis.components) {
            if (written.insert(name).second) {
                write_node(out, name);
            }
        }

        out << std::fixed << std::setprecision(2);
        for (const auto& dep : analysis.dependencies) {
            if (!dep.is_visible) {
                continue;
            }
            out << "    " << quoted(dep.original.from) << " -> " << quoted(dep.original.to)
                << " [penwidth=" << pen_width(dep.visual_weight, options);
            if (dep.is_highlighted) {
                out << ", color=" << options.highlight_color;
            }
            out << "];\n";
        }

        out << "}\n";
        return out.str();
    }

    Result<void> visualize_graph(const graph::DependencyGraph& graph,
                                 const std::filesystem::path& path,
                                 const DotOptions& options) {
        return file_utils::write_file_atomic(path, render_dot(graph, options));
    }

    Result<void> write_dot(const analyzers::EnhancedDependencyAnalysis& analysis,
                           const std::filesystem::path& path,
                           const DotOptions& options) {
        return file_utils::write_file_atomic(path, render_dot(analysis, options));
    }

}  // namespace kda::exporters

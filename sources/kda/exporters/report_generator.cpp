//
// Created by gregorian-rayne on 2/14/26.
//

#include "kda/exporters/report_generator.hpp"
#include "kda/utils/file_utils.hpp"
#include "kda/utils/string_utils.hpp"

#include <sstream>

namespace kda::exporters
{
    namespace {

        void write_name_list(std::ostringstream& out, const std::vector<std::string>& names) {
            if (names.empty()) {
                out << "  None\n";
                return;
            }
            for (const auto& name : names) {
                out << "  - " << name << "\n";
            }
        }

    }  // namespace

    std::string generate_report(const analyzers::DependencyAnalysisResult& result, const ReportOrder order) {
        const auto& graph = result.graph;
        std::ostringstream out;

        out << "Dependency Analysis Report\n";
        out << "================================\n\n";

        out << "Total Components: " << graph.component_count() << "\n\n";

        out << "Components with no dependencies:\n";
        write_name_list(out, result.components_with_no_dependencies);
        out << "\n";

        out << "Missing dependencies:\n";
        write_name_list(out, result.missing_dependencies);
        out << "\n";

        out << "Dependency counts:\n";
        for (const auto& name : graph.component_names()) {
            const auto it = result.dependency_counts.find(name);
            const std::size_t count = it != result.dependency_counts.end() ? it->second : 0;
            out << "  " << name << ": " << count << " dependents\n";
        }
        out << "\n";

        const bool build = order == ReportOrder::Build;
        const auto& names = build ? result.build_order : result.topological_order;

        out << (build ? "Build order:\n" : "Topological order:\n");
        if (result.has_cycles()) {
            out << "  Not available (cycles detected)\n";
        } else if (names.empty()) {
            out << "  None\n";
        } else {
            for (std::size_t i = 0; i < names.size(); ++i) {
                out << "  " << (i + 1) << ". " << names[i] << "\n";
            }
        }
        out << "\n";

        out << "Cycles detected:\n";
        if (result.cycles.empty()) {
            out << "  None\n";
        } else {
            for (std::size_t i = 0; i < result.cycles.size(); ++i) {
                out << "  Cycle " << (i + 1) << ": " << string_utils::join(result.cycles[i], " -> ") << "\n";
            }
        }

        return out.str();
    }

    Result<void> write_report(const analyzers::DependencyAnalysisResult& result,
                              const std::filesystem::path& path,
                              const ReportOrder order) {
        return file_utils::write_file_atomic(path, generate_report(result, order));
    }

}  // namespace kda::exporters

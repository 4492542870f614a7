//
// Created by gregorian-rayne on 2/17/26.
//

#include "kda/cli/commands/command.hpp"

#include "kda/kda.hpp"
#include "kda/exporters/dot_exporter.hpp"
#include "kda/exporters/json_exporter.hpp"
#include "kda/io/component_loader.hpp"
#include "kda/utils/json_utils.hpp"
#include "kda/utils/string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <filesystem>
#include <sstream>

namespace kda::cli
{
    namespace fs = std::filesystem;

    /**
     * Inspect command - centrality, clusters and edge highlighting for presentation.
     */
    class InspectCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "inspect";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show centrality, clusters and dependency strength for kernel components";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: kda inspect [OPTIONS] <components.json>\n"
                   "\n"
                   "Examples:\n"
                   "  kda inspect components.json\n"
                   "  kda inspect --highlight sched --dependents --dot sched.dot components.json\n"
                   "  kda inspect --highlight-cycles --min-strength 0.3 --json structure.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"highlight", 'H', "Highlight the dependencies of COMPONENT", false, true, "", "COMPONENT"},
                {"dependents", 'd', "With --highlight, also highlight its dependents", false, false, "", ""},
                {"highlight-cycles", 0, "Highlight every edge that is part of a cycle", false, false, "", ""},
                {"min-strength", 'm', "Hide edges with a lower visual weight", false, true, "", "WEIGHT"},
                {"top", 't', "Number of central components to list (0=all)", false, true, "10", "N"},
                {"dot", 0, "Also write the graph with highlights to FILE", false, true, "", "FILE"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one component file. Use 'kda inspect <components.json>'";
            }
            if (args.get_flag("dependents") && !args.has("highlight")) {
                return "--dependents requires --highlight";
            }
            if (args.has("highlight") && args.get_flag("highlight-cycles")) {
                return "--highlight and --highlight-cycles cannot be combined";
            }
            if (args.has("min-strength")) {
                const auto weight = args.get_double("min-strength");
                if (!weight || std::isnan(*weight) || *weight < 0.0) {
                    return "--min-strength expects a non-negative number";
                }
            }
            if (const auto top = args.get_int("top"); !top || *top < 0) {
                return "--top expects a non-negative integer";
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            apply_common_options(args);

            auto config = load_config(args);
            if (config.is_err()) {
                print_error(config.error().to_string());
                return 1;
            }

            const fs::path input(args.positional().front());
            auto structure = io::load_kernel_structure(input);
            if (structure.is_err()) {
                print_error(structure.error().to_string());
                return 1;
            }
            print_verbose("Loaded " + std::to_string(structure.value().components.size()) + " components and " +
                          std::to_string(structure.value().dependencies.size()) + " dependency edges");

            const analyzers::EnhancedDependencyAnalyzer analyzer(config.value().visualization);
            auto analysis = analyzer.analyze(structure.value());

            if (const auto weight = args.get_double("min-strength")) {
                print_debug("Filtering edges below visual weight " + std::to_string(*weight));
                analyzers::filter_dependencies_by_strength(analysis, *weight);
            }

            if (const auto component = args.get("highlight")) {
                const auto& names = analysis.components;
                if (std::ranges::find(names, *component) == names.end()) {
                    print_warning("Component not found: " + *component);
                }
                analyzers::highlight_component_dependencies(analysis, *component, args.get_flag("dependents"));
            } else if (args.get_flag("highlight-cycles")) {
                analyzers::highlight_cycles(analysis);
            }

            if (const auto dot_path = args.get("dot")) {
                exporters::DotOptions dot_options;
                dot_options.rankdir = config.value().output.rankdir;
                if (auto written = exporters::write_dot(analysis, *dot_path, dot_options); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print_verbose("DOT graph written to " + *dot_path);
            }

            if (is_json()) {
                exporters::JsonExportOptions json_options;
                json_options.indent = config.value().output.json_indent;
                auto text = json_utils::dump(exporters::to_json(analysis, json_options), json_options.indent);
                if (text.is_err()) {
                    print_error(text.error().to_string());
                    return 1;
                }
                std::cout << text.value() << "\n";
                return 0;
            }

            const auto top = static_cast<std::size_t>(args.get_int("top").value_or(10));
            std::cout << render_text(analysis, top);
            return 0;
        }

    private:
        [[nodiscard]] static std::string render_text(const analyzers::EnhancedDependencyAnalysis& analysis,
                                                     const std::size_t top) {
            const auto stats = analyzers::DependencyStatistics::generate(analysis);
            std::ostringstream out;
            out << std::fixed << std::setprecision(3);

            out << "Components:   " << analysis.components.size() << "\n";
            out << "Dependencies: " << stats.total_dependencies << " (" << stats.unique_dependencies << " unique)\n";
            out << "Cycles:       " << stats.cycle_count << "\n";
            out << "Clusters:     " << stats.cluster_count << "\n";
            out << "Avg weight:   " << stats.average_strength << " (max " << stats.max_strength << ")\n";
            if (stats.most_central_component) {
                out << "Most central: " << *stats.most_central_component << "\n";
            }

            std::vector<std::pair<std::string, double>> ranked;
            for (const auto& name : analysis.components) {
                if (const auto it = analysis.component_centrality.find(name); it != analysis.component_centrality.end()) {
                    ranked.emplace_back(name, it->second);
                }
            }
            std::ranges::stable_sort(ranked, [](const auto& a, const auto& b) { return a.second > b.second; });
            if (top > 0 && ranked.size() > top) {
                ranked.resize(top);
            }

            out << "\nBetweenness centrality:\n";
            for (const auto& [name, score] : ranked) {
                out << "  " << std::left << std::setw(32) << name << score << "\n";
            }

            out << "\nClusters:\n";
            if (analysis.clusters.empty()) {
                out << "  None\n";
            }
            for (const auto& cluster : analysis.clusters) {
                out << "  " << cluster.id << ": " << string_utils::join(cluster.components, ", ") << "\n";
            }

            out << "\nCycles:\n";
            if (analysis.cycles.empty()) {
                out << "  None\n";
            }
            for (std::size_t i = 0; i < analysis.cycles.size(); ++i) {
                out << "  Cycle " << (i + 1) << ": " << string_utils::join(analysis.cycles[i], " -> ") << "\n";
            }

            std::size_t hidden = 0;
            std::vector<const analyzers::EnhancedModuleDependency*> highlighted;
            for (const auto& dep : analysis.dependencies) {
                if (!dep.is_visible) {
                    ++hidden;
                }
                if (dep.is_highlighted) {
                    highlighted.push_back(&dep);
                }
            }

            if (!highlighted.empty()) {
                out << "\nHighlighted dependencies:\n";
                for (const auto* dep : highlighted) {
                    out << "  " << dep->original.from << " -> " << dep->original.to
                        << " (" << dep->original.dependency_type << ", weight " << dep->visual_weight << ")\n";
                }
            }

            out << "\nHidden dependencies: " << hidden << " of " << analysis.dependencies.size() << "\n";

            if (!stats.dependencies_by_type.empty()) {
                std::vector<std::pair<std::string, std::size_t>> by_type(
                    stats.dependencies_by_type.begin(), stats.dependencies_by_type.end());
                std::ranges::sort(by_type);

                out << "\nDependencies by type:\n";
                for (const auto& [type, count] : by_type) {
                    out << "  " << std::left << std::setw(32) << type << count << "\n";
                }
            }

            return out.str();
        }
    };

    namespace {
        struct InspectCommandRegistrar {
            InspectCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<InspectCommand>()
                );
            }
        } inspect_registrar;
    }
}  // namespace kda::cli

//
// Created by gregorian-rayne on 2/16/26.
//

#include "kda/cli/commands/command.hpp"

#include "kda/kda.hpp"
#include "kda/exporters/exporter.hpp"
#include "kda/io/component_loader.hpp"

#include <iostream>
#include <filesystem>

namespace kda::cli
{
    namespace fs = std::filesystem;

    /**
     * Analyze command - structural dependency analysis with a text or JSON report.
     */
    class AnalyzeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "analyze";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Check kernel components for missing dependencies and cycles, and compute a build order";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: kda analyze [OPTIONS] <components.json>\n"
                   "\n"
                   "Examples:\n"
                   "  kda analyze components.json\n"
                   "  kda analyze --output report.txt components.json\n"
                   "  kda analyze --json --output analysis.json components.json\n"
                   "  kda analyze --strict --fail-on-cycles components.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Write the report to FILE instead of stdout", false, true, "", "FILE"},
                {"format", 'f', "Report format (text, json, dot)", false, true, "", "FORMAT"},
                {"strict", 0, "Reject component names declared more than once", false, false, "", ""},
                {"fail-on-cycles", 0, "Exit with status 2 when cycles or missing dependencies are found", false, false, "", ""},
                {"build-order", 0, "List the build order instead of the topological order in text reports", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().empty()) {
                return "No component file specified. Use 'kda analyze <components.json>'";
            }
            if (args.positional().size() > 1) {
                return "Only one component file can be analyzed at a time";
            }
            if (const auto format = args.get("format"); format && !exporters::string_to_format(*format)) {
                return "Unknown format: " + *format;
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

            auto options = config.value().analysis;
            if (args.get_flag("strict")) {
                options.reject_duplicate_names = true;
            }

            const fs::path input(args.positional().front());
            print_verbose("Loading components from " + input.string());

            auto structure = io::load_kernel_structure(input);
            if (structure.is_err()) {
                print_error(structure.error().to_string());
                return 1;
            }
            const auto& components = structure.value().components;
            print_verbose("Loaded " + std::to_string(components.size()) + " components");
            if (const auto undeclared = io::count_undeclared_edges(structure.value()); undeclared > 0) {
                print_warning(std::to_string(undeclared) +
                              " explicit dependency edges are not in any component's dependency list and are ignored;"
                              " use 'kda inspect' to analyze them");
            }

            const analyzers::DependencyAnalyzer analyzer(options);
            auto analysis = analyzer.analyze_checked(components);
            if (analysis.is_err()) {
                print_error(analysis.error().to_string());
                return 1;
            }

            const auto& result = analysis.value();
            print_debug("Graph has " + std::to_string(result.graph.edge_count()) + " dependency edges");

            const auto format = select_format(args);
            exporters::ExportOptions export_options;
            export_options.rankdir = config.value().output.rankdir;
            export_options.json_indent = config.value().output.json_indent;
            if (args.get_flag("build-order")) {
                export_options.report_order = exporters::ReportOrder::Build;
            }

            const auto exporter = exporters::ExporterFactory::create(format);

            if (const auto output = args.get("output")) {
                if (auto written = exporter->export_to_file(*output, result, export_options); written.is_err()) {
                    print_error(written.error().to_string());
                    return 1;
                }
                print(std::string(exporter->format_name()) + " report written to " + *output);
            } else {
                auto rendered = exporter->export_to_string(result, export_options);
                if (rendered.is_err()) {
                    print_error(rendered.error().to_string());
                    return 1;
                }
                std::cout << rendered.value();
                if (format == exporters::ExportFormat::Json) {
                    std::cout << "\n";
                }
            }

            if (result.has_missing_dependencies()) {
                print_warning(std::to_string(result.missing_dependencies.size()) + " missing dependencies");
            }
            if (result.has_cycles()) {
                print_warning(std::to_string(result.cycles.size()) + " dependency cycles detected");
            }

            if (args.get_flag("fail-on-cycles") && (result.has_cycles() || result.has_missing_dependencies())) {
                return 2;
            }
            return 0;
        }

    private:
        [[nodiscard]] exporters::ExportFormat select_format(const ParsedArgs& args) const {
            if (const auto format = args.get("format")) {
                return exporters::string_to_format(*format).value_or(exporters::ExportFormat::Text);
            }
            if (is_json()) {
                return exporters::ExportFormat::Json;
            }
            if (const auto output = args.get("output")) {
                if (auto by_extension = exporters::ExporterFactory::create_for_file(*output); by_extension.is_ok()) {
                    return by_extension.value()->format();
                }
            }
            return exporters::ExportFormat::Text;
        }
    };

    namespace {
        struct AnalyzeCommandRegistrar {
            AnalyzeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<AnalyzeCommand>()
                );
            }
        } analyze_registrar;
    }
}  // namespace kda::cli

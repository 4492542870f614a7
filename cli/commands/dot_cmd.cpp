//
// Created by gregorian-rayne on 2/17/26.
//

#include "kda/cli/commands/command.hpp"

#include "kda/kda.hpp"
#include "kda/exporters/dot_exporter.hpp"
#include "kda/io/component_loader.hpp"

#include <iostream>
#include <filesystem>

namespace kda::cli
{
    namespace fs = std::filesystem;

    /**
     * Dot command - writes the dependency graph in Graphviz format.
     */
    class DotCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "dot";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Export the component dependency graph as Graphviz DOT";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: kda dot [OPTIONS] <components.json>\n"
                   "\n"
                   "Examples:\n"
                   "  kda dot components.json | dot -Tsvg > deps.svg\n"
                   "  kda dot --output deps.dot --rankdir TB components.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"output", 'o', "Write the graph to FILE instead of stdout", false, true, "", "FILE"},
                {"rankdir", 'r', "Layout direction (LR, RL, TB, BT)", false, true, "", "DIR"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (args.positional().size() != 1) {
                return "Expected exactly one component file. Use 'kda dot <components.json>'";
            }
            if (const auto rankdir = args.get("rankdir");
                rankdir && *rankdir != "LR" && *rankdir != "RL" && *rankdir != "TB" && *rankdir != "BT") {
                return "Invalid --rankdir: " + *rankdir;
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
            if (const auto undeclared = io::count_undeclared_edges(structure.value()); undeclared > 0) {
                print_warning(std::to_string(undeclared) +
                              " explicit dependency edges are not in any component's dependency list and are ignored;"
                              " use 'kda inspect' to analyze them");
            }

            const auto graph = graph::build_dependency_graph(structure.value().components);
            print_verbose("Graph: " + std::to_string(graph.component_count()) + " components, " +
                          std::to_string(graph.edge_count()) + " edges");

            exporters::DotOptions options;
            options.rankdir = args.get_or("rankdir", config.value().output.rankdir);

            const auto output = args.get("output");
            if (!output) {
                std::cout << exporters::render_dot(graph, options);
                return 0;
            }

            if (auto written = exporters::visualize_graph(graph, *output, options); written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }

            print("DOT graph written to " + *output);
            return 0;
        }
    };

    namespace {
        struct DotCommandRegistrar {
            DotCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<DotCommand>()
                );
            }
        } dot_registrar;
    }
}  // namespace kda::cli

//
// Created by gregorian-rayne on 2/17/26.
//

#include "kda/cli/commands/command.hpp"
#include "kda/version.hpp"

#include <iostream>
#include <exception>
#include <iomanip>
#include <string>
#include <vector>

namespace {

    void print_help() {
        std::cout << kda::PROJECT_NAME << " " << kda::VERSION_STRING << "\n\n";
        std::cout << "Usage: " << kda::PROJECT_SHORT_NAME << " <command> [OPTIONS] <components.json>\n\n";
        std::cout << "Commands:\n";
        for (const auto* cmd : kda::cli::CommandRegistry::instance().list()) {
            std::cout << "  " << std::left << std::setw(12) << cmd->name() << cmd->description() << "\n";
        }
        std::cout << "\nRun '" << kda::PROJECT_SHORT_NAME << " <command> --help' for command options.\n";
    }

    void print_version() {
        std::cout << kda::PROJECT_SHORT_NAME << " " << kda::VERSION_STRING
                  << " (JSON schema " << kda::JSON_SCHEMA_VERSION << ")\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        const std::string command_name = argv[1];

        if (command_name == "-h" || command_name == "--help" || command_name == "help") {
            if (argc > 2) {
                if (const auto* cmd = kda::cli::CommandRegistry::instance().find(argv[2])) {
                    cmd->print_help();
                    return 0;
                }
            }
            print_help();
            return 0;
        }

        if (command_name == "--version" || command_name == "version") {
            print_version();
            return 0;
        }

        auto* cmd = kda::cli::CommandRegistry::instance().find(command_name);
        if (!cmd) {
            std::cerr << "error: Unknown command: " << command_name << "\n\n";
            print_help();
            return 1;
        }

        const std::vector<std::string> args(argv + 2, argv + argc);
        const auto parsed = kda::cli::parse_arguments(args, cmd->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            std::cerr << cmd->usage() << "\n";
            return 1;
        }

        if (!parsed.args.get_flag("help")) {
            if (const auto problem = cmd->validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n";
                return 1;
            }
        }

        return cmd->execute(parsed.args);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred\n";
        return 1;
    }
}

//
// Created by gregorian-rayne on 2/16/26.
//

#ifndef KDA_COMMAND_HPP
#define KDA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommands of the kda tool.
 *
 * Every subcommand reads one component file given as the sole positional
 * argument. Subcommands register themselves with CommandRegistry from a
 * static registrar in their translation unit.
 *
 * Options shared by every subcommand (--help, --verbose, --debug, --quiet,
 * --json, --config) are recognised by parse_arguments() without being
 * declared.
 */

#include "kda/core/config.hpp"
#include "kda/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kda::cli
{
    /**
     * Declared option of a subcommand.
     *
     * An option without takes_value is a flag. A non-empty default_value is
     * stored before parsing, so get() never misses it.
     */
    struct ArgDef {
        std::string name;
        char short_name = 0;
        std::string description;
        bool required = false;
        bool takes_value = true;
        std::string default_value;
        std::string value_name = "VALUE";
    };

    /**
     * Option values, flags and positional arguments after parsing.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;

        /// std::nullopt when absent or not entirely a number
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;
        [[nodiscard]] std::optional<double> get_double(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> values_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // errors only
        Normal,
        Verbose,    // progress of loading and analysis
        Debug
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    class Command {
    public:
        virtual ~Command() = default;

        /// Subcommand name as typed on the command line
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /// One line for the command listing
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Runs the subcommand.
         *
         * @return Process exit status: 0 on success, 1 on an error, 2 when
         *         a requested check found problems.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * Checks arguments before execute() is called.
         *
         * @return A message for the user, or an empty string when valid.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        void set_verbosity(Verbosity v) { verbosity_ = v; }
        void set_output_format(OutputFormat f) { output_format_ = f; }

        /**
         * Sets verbosity and output format from --debug, --verbose,
         * --quiet and --json. Called at the start of every execute().
         */
        void apply_common_options(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        /// Progress and debug messages go to stderr, keeping stdout for results
        void print_verbose(std::string_view msg) const;
        void print_debug(std::string_view msg) const;

        /**
         * Reads the file named by --config, or returns the defaults.
         */
        [[nodiscard]] Result<core::Config> load_config(const ParsedArgs& args) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] OutputFormat output_format() const { return output_format_; }
        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    /**
     * Process-wide list of subcommands, in registration order.
     */
    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        /// nullptr when no subcommand has that name
        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments following the subcommand name.
     *
     * Accepts "--name value", "--name=value", "-n value", "-nvalue" and
     * bundled short flags ("-vq"). Declared defaults are filled in first.
     * "--" ends option parsing.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

}  // namespace kda::cli

#endif //KDA_COMMAND_HPP

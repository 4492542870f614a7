//
// Created by gregorian-rayne on 2/16/26.
//

#include "kda/cli/commands/command.hpp"
#include "kda/version.hpp"

#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace kda::cli
{
    namespace {

        template <typename T>
        std::optional<T> parse_number(const std::optional<std::string>& text) {
            if (!text) {
                return std::nullopt;
            }

            T parsed{};
            const char* end = text->data() + text->size();
            if (const auto [ptr, ec] = std::from_chars(text->data(), end, parsed); ec != std::errc{} || ptr != end) {
                return std::nullopt;
            }
            return parsed;
        }

        struct CommonOption {
            const char* flag;
            const char* text;
        };

        constexpr CommonOption COMMON_OPTIONS[] = {
            {"-c, --config FILE", "Read analyzer settings from a TOML file"},
            {"-h, --help", "Show this help message"},
            {"-v, --verbose", "Report loading and analysis progress"},
            {"    --debug", "Report internal details"},
            {"-q, --quiet", "Only show errors"},
            {"    --json", "Print results as JSON"},
        };

        std::string option_label(const ArgDef& def) {
            std::string label = def.short_name ? std::string("-") + def.short_name + ", " : std::string(4, ' ');
            label += "--" + def.name;
            if (def.takes_value) {
                label += " " + def.value_name;
            }
            return label;
        }

    }  // namespace

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        values_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        flags_[name] = true;
    }

    void ParsedArgs::add_positional(const std::string& value) {
        positional_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || flags_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ParsedArgs::get_or(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        return parse_number<int>(get(name));
    }

    std::optional<double> ParsedArgs::get_double(const std::string& name) const {
        return parse_number<double>(get(name));
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        const auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    // ----------------------------------------------------------------------------
    // Command
    // ----------------------------------------------------------------------------

    std::string Command::usage() const {
        std::ostringstream ss;
        ss << "Usage: " << PROJECT_SHORT_NAME << " " << name();
        for (const auto& def : arguments()) {
            if (def.required) {
                ss << " --" << def.name << " <" << def.value_name << ">";
            }
        }
        ss << " [OPTIONS] <components.json>";
        return ss.str();
    }

    std::string Command::validate(const ParsedArgs& args) const {
        for (const auto& def : arguments()) {
            if (def.required && !args.has(def.name)) {
                return "Missing required argument: --" + def.name;
            }
        }
        return "";
    }

    void Command::print_help() const {
        constexpr int label_width = 28;

        std::cout << description() << "\n\n" << usage() << "\n\n";

        if (const auto defs = arguments(); !defs.empty()) {
            std::cout << "Options:\n";
            for (const auto& def : defs) {
                std::cout << "  " << std::left << std::setw(label_width) << option_label(def) << def.description;
                if (!def.default_value.empty()) {
                    std::cout << " (default: " << def.default_value << ")";
                }
                if (def.required) {
                    std::cout << " [required]";
                }
                std::cout << "\n";
            }
            std::cout << "\n";
        }

        std::cout << "Common options:\n";
        for (const auto& [flag, text] : COMMON_OPTIONS) {
            std::cout << "  " << std::left << std::setw(label_width) << flag << text << "\n";
        }
    }

    void Command::apply_common_options(const ParsedArgs& args) {
        if (args.get_flag("debug")) {
            set_verbosity(Verbosity::Debug);
        } else if (args.get_flag("verbose")) {
            set_verbosity(Verbosity::Verbose);
        } else if (args.get_flag("quiet")) {
            set_verbosity(Verbosity::Quiet);
        } else {
            set_verbosity(Verbosity::Normal);
        }

        set_output_format(args.get_flag("json") ? OutputFormat::JSON : OutputFormat::Text);
    }

    void Command::print(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (verbosity_ >= Verbosity::Verbose) {
            std::cerr << msg << "\n";
        }
    }

    void Command::print_debug(const std::string_view msg) const {
        if (verbosity_ == Verbosity::Debug) {
            std::cerr << "[DEBUG] " << msg << "\n";
        }
    }

    Result<core::Config> Command::load_config(const ParsedArgs& args) const {
        const auto path = args.get("config");
        if (!path) {
            print_debug("No --config given, using default settings");
            return Result<core::Config>::success(core::Config::default_config());
        }

        print_verbose("Loading configuration from " + *path);
        return core::Config::load_from_file(*path);
    }

    // ----------------------------------------------------------------------------
    // CommandRegistry
    // ----------------------------------------------------------------------------

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        for (const auto& cmd : commands_) {
            if (cmd->name() == name) {
                return cmd.get();
            }
        }
        return nullptr;
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> result;
        result.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            result.push_back(cmd.get());
        }
        return result;
    }

    // ----------------------------------------------------------------------------
    // Argument parsing
    // ----------------------------------------------------------------------------

    namespace {

        const ArgDef CONFIG_OPTION{"config", 'c', "Configuration file", false, true, "", "FILE"};

        bool is_common_flag(const std::string_view name) {
            return name == "help" || name == "verbose" || name == "debug" || name == "quiet" || name == "json";
        }

        std::optional<std::string> common_short_flag(const char c) {
            switch (c) {
            case 'h': return "help";
            case 'v': return "verbose";
            case 'q': return "quiet";
            default: return std::nullopt;
            }
        }

        /**
         * Walks the argument list on behalf of parse_arguments().
         */
        class ArgumentParser {
        public:
            ArgumentParser(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args) {
                by_name_[CONFIG_OPTION.name] = &CONFIG_OPTION;
                by_letter_[CONFIG_OPTION.short_name] = &CONFIG_OPTION;

                for (const auto& def : defs) {
                    by_name_[def.name] = &def;
                    if (def.short_name) {
                        by_letter_[def.short_name] = &def;
                    }
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
            }

            ParseResult run() {
                bool options_ended = false;

                for (index_ = 0; index_ < args_.size() && result_.success; ++index_) {
                    const std::string& arg = args_[index_];

                    if (arg.empty()) {
                        continue;
                    }
                    if (options_ended || arg[0] != '-' || arg.size() == 1) {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        options_ended = true;
                    } else if (arg[1] == '-') {
                        parse_long(arg.substr(2));
                    } else {
                        parse_short(arg);
                    }
                }

                return std::move(result_);
            }

        private:
            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            /// Consumes the following argument as a value, or "" at the end
            std::string next_value() {
                return index_ + 1 < args_.size() ? args_[++index_] : std::string();
            }

            void parse_long(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = by_name_.find(name);
                if (it == by_name_.end()) {
                    if (is_common_flag(name)) {
                        result_.args.set_flag(name);
                    } else {
                        fail("Unknown option: --" + name);
                    }
                    return;
                }

                if (!it->second->takes_value) {
                    result_.args.set_flag(name);
                    return;
                }

                const std::string value = inline_value ? *inline_value : next_value();
                if (value.empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                result_.args.set(name, value);
            }

            /// "-vq" sets two flags; "-t5" and "-t 5" both set a value
            void parse_short(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char letter = arg[j];

                    const auto it = by_letter_.find(letter);
                    if (it == by_letter_.end()) {
                        if (const auto flag = common_short_flag(letter)) {
                            result_.args.set_flag(*flag);
                            continue;
                        }
                        fail(std::string("Unknown option: -") + letter);
                        return;
                    }

                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }

                    const std::string value = j + 1 < arg.size() ? arg.substr(j + 1) : next_value();
                    if (value.empty()) {
                        fail(std::string("Option -") + letter + " requires a value");
                        return;
                    }
                    result_.args.set(def.name, value);
                    return;
                }
            }

            const std::vector<std::string>& args_;
            std::unordered_map<std::string, const ArgDef*> by_name_;
            std::unordered_map<char, const ArgDef*> by_letter_;
            std::size_t index_ = 0;
            ParseResult result_;
        };

    }  // namespace

    ParseResult parse_arguments(const std::vector<std::string>& args, const std::vector<ArgDef>& defs) {
        return ArgumentParser(args, defs).run();
    }

}  // namespace kda::cli

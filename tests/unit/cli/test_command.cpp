//
// Created by gregorian-rayne on 2/21/26.
//

#include "kda/cli/commands/command.hpp"
#include "kda/utils/file_utils.hpp"
#include "kda/utils/json_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace kda::cli
{
    namespace fs = std::filesystem;

    namespace {

        std::vector<ArgDef> sample_defs() {
            return {
                {"output", 'o', "Output file", false, true, "", "FILE"},
                {"top", 't', "Entries to list", false, true, "10", "N"},
                {"strict", 0, "Strict mode", false, false, "", ""},
            };
        }

    }  // namespace

    TEST(ParseArgumentsTest, DefaultsAreFilled) {
        const auto result = parse_arguments({"input.json"}, sample_defs());

        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.args.get("top"), "10");
        EXPECT_FALSE(result.args.get("output").has_value());
        EXPECT_EQ(result.args.positional(), std::vector<std::string>{"input.json"});
    }

    TEST(ParseArgumentsTest, LongOptionsWithSeparateAndInlineValues) {
        const auto result = parse_arguments({"--output", "a.txt", "--top=3", "--strict", "in.json"}, sample_defs());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get("output"), "a.txt");
        EXPECT_EQ(result.args.get_int("top"), 3);
        EXPECT_TRUE(result.args.get_flag("strict"));
        EXPECT_EQ(result.args.positional().size(), 1u);
    }

    TEST(ParseArgumentsTest, ShortOptions) {
        const auto result = parse_arguments({"-o", "x.dot", "-t5", "-vq"}, sample_defs());

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_EQ(result.args.get("output"), "x.dot");
        EXPECT_EQ(result.args.get("top"), "5");
        EXPECT_TRUE(result.args.get_flag("verbose"));
        EXPECT_TRUE(result.args.get_flag("quiet"));
    }

    TEST(ParseArgumentsTest, CommonOptionsNeedNoDeclaration) {
        const auto result = parse_arguments({"--json", "--debug", "-c", "kda.toml", "-h"}, {});

        ASSERT_TRUE(result.success) << result.error;
        EXPECT_TRUE(result.args.get_flag("json"));
        EXPECT_TRUE(result.args.get_flag("debug"));
        EXPECT_TRUE(result.args.get_flag("help"));
        EXPECT_EQ(result.args.get("config"), "kda.toml");
    }

    TEST(ParseArgumentsTest, UnknownOption) {
        const auto result = parse_arguments({"--bogus"}, sample_defs());

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, "Unknown option: --bogus");

        EXPECT_FALSE(parse_arguments({"-z"}, sample_defs()).success);
    }

    TEST(ParseArgumentsTest, MissingValue) {
        const auto result = parse_arguments({"--output"}, sample_defs());

        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, "Option --output requires a value");
        EXPECT_FALSE(parse_arguments({"--output="}, sample_defs()).success);
        EXPECT_FALSE(parse_arguments({"-o"}, sample_defs()).success);
    }

    TEST(ParseArgumentsTest, DoubleDashEndsOptions) {
        const auto result = parse_arguments({"--strict", "--", "--output", "-"}, sample_defs());

        ASSERT_TRUE(result.success);
        EXPECT_FALSE(result.args.has("output"));
        EXPECT_EQ(result.args.positional(), (std::vector<std::string>{"--output", "-"}));
    }

    TEST(ParsedArgsTest, NumericAccessors) {
        ParsedArgs args;
        args.set("count", "42");
        args.set("weight", "0.25");
        args.set("bad", "12abc");

        EXPECT_EQ(args.get_int("count"), 42);
        EXPECT_DOUBLE_EQ(args.get_double("weight").value(), 0.25);
        EXPECT_FALSE(args.get_int("bad").has_value());
        EXPECT_FALSE(args.get_double("bad").has_value());
        EXPECT_FALSE(args.get_int("missing").has_value());
        EXPECT_EQ(args.get_or("missing", "fallback"), "fallback");
    }

    TEST(CommandRegistryTest, CommandsAreRegistered) {
        auto& registry = CommandRegistry::instance();

        for (const auto* name : {"analyze", "dot", "inspect"}) {
            const auto* cmd = registry.find(name);
            ASSERT_NE(cmd, nullptr) << name;
            EXPECT_EQ(cmd->name(), name);
            EXPECT_FALSE(cmd->description().empty());
        }
        EXPECT_EQ(registry.find("record"), nullptr);
    }

    class CommandExecutionTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "kda_command_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        [[nodiscard]] fs::path create_test_file(const std::string& filename, const std::string& content) const {
            const fs::path file_path = temp_dir_ / filename;
            std::ofstream file(file_path);
            file << content;
            return file_path;
        }

        static int run(const std::string& command, const std::vector<std::string>& argv) {
            auto* cmd = CommandRegistry::instance().find(command);
            if (!cmd) {
                return -1;
            }
            const auto parsed = parse_arguments(argv, cmd->arguments());
            if (!parsed.success || !cmd->validate(parsed.args).empty()) {
                return -2;
            }
            return cmd->execute(parsed.args);
        }

        fs::path temp_dir_;
    };

    TEST_F(CommandExecutionTest, AnalyzeValidatesInput) {
        auto* cmd = CommandRegistry::instance().find("analyze");
        ASSERT_NE(cmd, nullptr);

        EXPECT_FALSE(cmd->validate(parse_arguments({}, cmd->arguments()).args).empty());
        EXPECT_FALSE(cmd->validate(parse_arguments({"a.json", "b.json"}, cmd->arguments()).args).empty());
        EXPECT_FALSE(cmd->validate(parse_arguments({"--format", "png", "a.json"}, cmd->arguments()).args).empty());
        EXPECT_TRUE(cmd->validate(parse_arguments({"a.json"}, cmd->arguments()).args).empty());
    }

    TEST_F(CommandExecutionTest, AnalyzeWritesReport) {
        const auto input = create_test_file("components.json",
            R"([{"name": "sched", "dependencies": ["mm"]}, {"name": "mm"}])");
        const auto output = temp_dir_ / "report.txt";

        EXPECT_EQ(run("analyze", {"-q", "-o", output.string(), input.string()}), 0);

        const auto content = file_utils::read_file(output);
        ASSERT_TRUE(content.is_ok());
        EXPECT_NE(content.value().find("Total Components: 2"), std::string::npos);
        EXPECT_NE(content.value().find("  1. sched\n  2. mm\n"), std::string::npos);
    }

    TEST_F(CommandExecutionTest, AnalyzeBuildOrderReport) {
        const auto input = create_test_file("components.json",
            R"([{"name": "sched", "dependencies": ["mm"]}, {"name": "mm"}])");
        const auto output = temp_dir_ / "report.txt";

        EXPECT_EQ(run("analyze", {"-q", "--build-order", "-o", output.string(), input.string()}), 0);

        const auto content = file_utils::read_file(output);
        ASSERT_TRUE(content.is_ok());
        EXPECT_NE(content.value().find("Build order:\n  1. mm\n  2. sched\n"), std::string::npos);
        EXPECT_EQ(content.value().find("Topological order:"), std::string::npos);
    }

    TEST_F(CommandExecutionTest, VerboseJsonOnStdoutStaysParseable) {
        const auto input = create_test_file("components.json",
            R"([{"name": "sched", "dependencies": ["mm", "irq"]}, {"name": "mm"}])");

        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        const int status = run("analyze", {"--json", "-v", "--debug", input.string()});
        const std::string out = testing::internal::GetCapturedStdout();
        const std::string err = testing::internal::GetCapturedStderr();

        EXPECT_EQ(status, 0);
        const auto parsed = nlohmann::json::parse(out, nullptr, false);
        ASSERT_FALSE(parsed.is_discarded()) << out;
        EXPECT_EQ(parsed["missing_dependencies"], nlohmann::json{"irq"});
        EXPECT_NE(err.find("Loading components from"), std::string::npos);
        EXPECT_NE(err.find("[DEBUG]"), std::string::npos);
    }

    TEST_F(CommandExecutionTest, VerboseDotOnStdoutStartsWithDigraph) {
        const auto input = create_test_file("components.json",
            R"([{"name": "net", "dependencies": ["mm"]}, {"name": "mm"}])");

        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        const int status = run("dot", {"-v", input.string()});
        const std::string out = testing::internal::GetCapturedStdout();
        const std::string err = testing::internal::GetCapturedStderr();

        EXPECT_EQ(status, 0);
        EXPECT_EQ(out.rfind("digraph", 0), 0u) << out;
        EXPECT_NE(err.find("Graph: 2 components, 1 edges"), std::string::npos);
    }

    TEST_F(CommandExecutionTest, UndeclaredExplicitEdgesAreReported) {
        const auto input = create_test_file("structure.json", R"({
            "components": [{"name": "sched", "dependencies": ["mm"]}, {"name": "mm"}, {"name": "irq"}],
            "dependencies": [
                {"from": "sched", "to": "mm"},
                {"from": "irq", "to": "sched", "type": "function_call"}
            ]
        })");

        for (const auto* command : {"analyze", "dot"}) {
            testing::internal::CaptureStdout();
            testing::internal::CaptureStderr();
            const int status = run(command, {input.string()});
            static_cast<void>(testing::internal::GetCapturedStdout());
            const std::string err = testing::internal::GetCapturedStderr();

            EXPECT_EQ(status, 0) << command;
            EXPECT_NE(err.find("warning: 1 explicit dependency edges"), std::string::npos) << command << ": " << err;
        }
    }

    TEST_F(CommandExecutionTest, ComponentListsWithoutExtraEdgesDoNotWarn) {
        const auto input = create_test_file("components.json",
            R"([{"name": "sched", "dependencies": ["mm"]}, {"name": "mm"}])");

        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        const int status = run("analyze", {input.string()});
        static_cast<void>(testing::internal::GetCapturedStdout());
        const std::string err = testing::internal::GetCapturedStderr();

        EXPECT_EQ(status, 0);
        EXPECT_EQ(err.find("explicit dependency edges"), std::string::npos) << err;
    }

    TEST_F(CommandExecutionTest, AnalyzeChoosesFormatFromExtension) {
        const auto input = create_test_file("components.json", R"([{"name": "a", "dependencies": ["b"]}])");
        const auto output = temp_dir_ / "analysis.json";

        EXPECT_EQ(run("analyze", {"-q", "-o", output.string(), input.string()}), 0);

        const auto parsed = json_utils::read_file(output);
        ASSERT_TRUE(parsed.is_ok());
        EXPECT_EQ(parsed.value()["missing_dependencies"], nlohmann::json{"b"});
    }

    TEST_F(CommandExecutionTest, AnalyzeFailOnCycles) {
        const auto input = create_test_file("cycle.json",
            R"([{"name": "a", "dependencies": ["b"]}, {"name": "b", "dependencies": ["a"]}])");
        const auto output = temp_dir_ / "report.txt";

        EXPECT_EQ(run("analyze", {"-q", "-o", output.string(), input.string()}), 0);
        EXPECT_EQ(run("analyze", {"-q", "--fail-on-cycles", "-o", output.string(), input.string()}), 2);
    }

    TEST_F(CommandExecutionTest, AnalyzeStrictRejectsDuplicates) {
        const auto input = create_test_file("dup.json", R"([{"name": "a"}, {"name": "a"}])");
        const auto output = temp_dir_ / "report.txt";

        EXPECT_EQ(run("analyze", {"-q", "-o", output.string(), input.string()}), 0);
        EXPECT_EQ(run("analyze", {"-q", "--strict", "-o", output.string(), input.string()}), 1);
    }

    TEST_F(CommandExecutionTest, AnalyzeMissingInputFile) {
        EXPECT_EQ(run("analyze", {"-q", (temp_dir_ / "nope.json").string()}), 1);
    }

    TEST_F(CommandExecutionTest, AnalyzeBadConfigFile) {
        const auto input = create_test_file("components.json", R"([{"name": "a"}])");
        const auto config = create_test_file("kda.toml", "[analysis\n");

        EXPECT_EQ(run("analyze", {"-q", "-c", config.string(), input.string()}), 1);
    }

    TEST_F(CommandExecutionTest, DotWritesGraph) {
        const auto input = create_test_file("components.json",
            R"([{"name": "net", "dependencies": ["mm"]}, {"name": "mm"}])");
        const auto output = temp_dir_ / "graph.dot";

        EXPECT_EQ(run("dot", {"-q", "-r", "TB", "-o", output.string(), input.string()}), 0);

        const auto content = file_utils::read_file(output);
        ASSERT_TRUE(content.is_ok());
        EXPECT_NE(content.value().find("rankdir=TB;"), std::string::npos);
        EXPECT_NE(content.value().find("\"net\" -> \"mm\";"), std::string::npos);
    }

    TEST_F(CommandExecutionTest, DotRejectsBadRankdir) {
        const auto input = create_test_file("components.json", R"([{"name": "a"}])");

        EXPECT_EQ(run("dot", {"--rankdir", "XY", input.string()}), -2);
    }

    TEST_F(CommandExecutionTest, InspectWritesHighlightedDot) {
        const auto input = create_test_file("structure.json", R"({
            "components": [{"name": "sched"}, {"name": "mm"}],
            "dependencies": [
                {"from": "sched", "to": "mm", "type": "function_call"},
                {"from": "sched", "to": "mm", "type": "function_call"},
                {"from": "sched", "to": "mm", "type": "function_call"},
                {"from": "sched", "to": "mm", "type": "function_call"},
                {"from": "sched", "to": "mm", "type": "function_call"}
            ]
        })");
        const auto dot = temp_dir_ / "inspect.dot";

        EXPECT_EQ(run("inspect", {"-q", "--json", "-H", "sched", "--dot", dot.string(), input.string()}), 0);

        const auto content = file_utils::read_file(dot);
        ASSERT_TRUE(content.is_ok());
        EXPECT_NE(content.value().find("\"sched\" -> \"mm\" [penwidth=3.00, color=red];"), std::string::npos);
    }

    TEST_F(CommandExecutionTest, InspectValidatesOptions) {
        auto* cmd = CommandRegistry::instance().find("inspect");
        ASSERT_NE(cmd, nullptr);

        const auto check = [cmd](const std::vector<std::string>& argv) {
            return cmd->validate(parse_arguments(argv, cmd->arguments()).args);
        };

        EXPECT_FALSE(check({"-d", "in.json"}).empty());
        EXPECT_FALSE(check({"-H", "a", "--highlight-cycles", "in.json"}).empty());
        EXPECT_FALSE(check({"-m", "-1", "in.json"}).empty());
        EXPECT_FALSE(check({"-m", "nan", "in.json"}).empty());
        EXPECT_FALSE(check({"-t", "many", "in.json"}).empty());
        EXPECT_TRUE(check({"-H", "a", "-d", "-m", "0.2", "in.json"}).empty());
    }

}  // namespace kda::cli

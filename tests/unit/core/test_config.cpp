//
// Created by gregorian-rayne on 2/18/26.
//

#include "kda/core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>

namespace kda::core
{
    namespace fs = std::filesystem;

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "kda_config_test";
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

        fs::path temp_dir_;
    };

    TEST_F(ConfigTest, DefaultConfig) {
        const auto config = Config::default_config();

        EXPECT_TRUE(config.analysis.enable_cycle_detection);
        EXPECT_TRUE(config.analysis.enable_topological_sorting);
        EXPECT_TRUE(config.analysis.enable_missing_dependency_check);
        EXPECT_TRUE(config.analysis.deduplicate_cycles);
        EXPECT_FALSE(config.analysis.reject_duplicate_names);

        EXPECT_DOUBLE_EQ(config.visualization.max_strength, 10.0);
        EXPECT_DOUBLE_EQ(config.visualization.min_strength_for_visibility, 0.5);
        EXPECT_DOUBLE_EQ(config.visualization.strong_dependency_ratio, 0.7);
        EXPECT_TRUE(config.visualization.cluster_detection);

        EXPECT_EQ(config.output.rankdir, "LR");
        EXPECT_EQ(config.output.json_indent, 2);

        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, LoadFromString) {
        const auto result = Config::load_from_string(R"(
[analysis]
enable_topological_sorting = false
reject_duplicate_names = true

[visualization]
max_strength = 4
min_strength_for_visibility = 0.25

[output]
rankdir = "TB"
json_indent = 4
)");

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        const auto& config = result.value();

        EXPECT_FALSE(config.analysis.enable_topological_sorting);
        EXPECT_TRUE(config.analysis.reject_duplicate_names);
        EXPECT_TRUE(config.analysis.enable_cycle_detection);
        EXPECT_DOUBLE_EQ(config.visualization.max_strength, 4.0);
        EXPECT_DOUBLE_EQ(config.visualization.min_strength_for_visibility, 0.25);
        EXPECT_EQ(config.output.rankdir, "TB");
        EXPECT_EQ(config.output.json_indent, 4);
    }

    TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
        const auto result = Config::load_from_string("");

        ASSERT_TRUE(result.is_ok());
        EXPECT_DOUBLE_EQ(result.value().visualization.max_strength, 10.0);
    }

    TEST_F(ConfigTest, SyntaxErrorIsParseError) {
        const auto result = Config::load_from_string("[analysis\nenable_cycle_detection = true\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_TRUE(result.error().has_context());
    }

    TEST_F(ConfigTest, WrongTypeIsConfigError) {
        const auto result = Config::load_from_string("[analysis]\nenable_cycle_detection = \"yes\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().context().value(), "analysis.enable_cycle_detection");
    }

    TEST_F(ConfigTest, ValidateRejectsNonPositiveMaxStrength) {
        auto config = Config::default_config();
        config.visualization.max_strength = 0.0;

        const auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "visualization.max_strength");
    }

    TEST_F(ConfigTest, ValidateRejectsRatioOutOfRange) {
        auto config = Config::default_config();
        config.visualization.strong_dependency_ratio = 1.5;

        EXPECT_TRUE(config.validate().is_err());
    }

    TEST_F(ConfigTest, ValidateRejectsNotANumber) {
        constexpr double nan = std::numeric_limits<double>::quiet_NaN();

        auto config = Config::default_config();
        config.visualization.strong_dependency_ratio = nan;
        auto result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "visualization.strong_dependency_ratio");

        config = Config::default_config();
        config.visualization.min_strength_for_visibility = nan;
        result = config.validate();
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "visualization.min_strength_for_visibility");

        config = Config::default_config();
        config.visualization.max_strength = std::numeric_limits<double>::infinity();
        EXPECT_TRUE(config.validate().is_err());
    }

    TEST_F(ConfigTest, NanInTomlIsConfigError) {
        const auto result = Config::load_from_string("[visualization]\nmin_strength_for_visibility = nan\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
        EXPECT_EQ(result.error().context().value(), "visualization.min_strength_for_visibility");
    }

    TEST_F(ConfigTest, ValidateRejectsUnknownRankdir) {
        const auto result = Config::load_from_string("[output]\nrankdir = \"XY\"\n");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, LoadFromFile) {
        const auto path = create_test_file("kda.toml", "[visualization]\ncluster_detection = false\n");

        const auto result = Config::load_from_file(path);

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.value().visualization.cluster_detection);
    }

    TEST_F(ConfigTest, LoadFromMissingFile) {
        const auto result = Config::load_from_file(temp_dir_ / "absent.toml");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::IoError);
    }

    TEST_F(ConfigTest, ErrorFromFileNamesThePath) {
        const auto path = create_test_file("bad.toml", "[visualization]\nmax_strength = -1.0\n");

        const auto result = Config::load_from_file(path);

        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().context().value().find("bad.toml"), std::string::npos);
    }

    TEST_F(ConfigTest, ToStringRoundTrips) {
        auto config = Config::default_config();
        config.analysis.deduplicate_cycles = false;
        config.visualization.max_strength = 6.5;
        config.output.rankdir = "BT";

        const auto reloaded = Config::load_from_string(config.to_string());

        ASSERT_TRUE(reloaded.is_ok()) << reloaded.error().to_string();
        EXPECT_FALSE(reloaded.value().analysis.deduplicate_cycles);
        EXPECT_DOUBLE_EQ(reloaded.value().visualization.max_strength, 6.5);
        EXPECT_EQ(reloaded.value().output.rankdir, "BT");
    }

    TEST_F(ConfigTest, SaveToFile) {
        const auto path = temp_dir_ / "nested" / "saved.toml";

        ASSERT_TRUE(Config::default_config().save_to_file(path).is_ok());
        EXPECT_TRUE(fs::exists(path));
        EXPECT_TRUE(Config::load_from_file(path).is_ok());
    }

}  // namespace kda::core

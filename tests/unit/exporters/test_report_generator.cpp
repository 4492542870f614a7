//
// Created by gregorian-rayne on 2/20/26.
//

#include "kda/exporters/report_generator.hpp"
#include "kda/utils/file_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>

namespace kda::exporters
{
    namespace fs = std::filesystem;

    class ReportGeneratorTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "kda_report_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        analyzers::DependencyAnalyzer analyzer_;
        fs::path temp_dir_;
    };

    TEST_F(ReportGeneratorTest, ChainReport) {
        const auto report = generate_report(analyzer_.analyze({{"A", {"B"}}, {"B", {}}}));

        const std::string expected =
            "Dependency Analysis Report\n"
            "================================\n"
            "\n"
            "Total Components: 2\n"
            "\n"
            "Components with no dependencies:\n"
            "  - B\n"
            "\n"
            "Missing dependencies:\n"
            "  None\n"
            "\n"
            "Dependency counts:\n"
            "  A: 0 dependents\n"
            "  B: 1 dependents\n"
            "\n"
            "Topological order:\n"
            "  1. A\n"
            "  2. B\n"
            "\n"
            "Cycles detected:\n"
            "  None\n";

        EXPECT_EQ(report, expected);
    }

    TEST_F(ReportGeneratorTest, BuildOrderHasItsOwnHeading) {
        const auto report = generate_report(analyzer_.analyze({{"A", {"B"}}, {"B", {}}}), ReportOrder::Build);

        EXPECT_NE(report.find("Build order:\n  1. B\n  2. A\n"), std::string::npos);
        EXPECT_EQ(report.find("Topological order:"), std::string::npos);
    }

    TEST_F(ReportGeneratorTest, CycleReport) {
        const auto report = generate_report(analyzer_.analyze({
            {"A", {"B"}},
            {"B", {"C"}},
            {"C", {"A"}},
        }));

        EXPECT_NE(report.find("Components with no dependencies:\n  None\n"), std::string::npos);
        EXPECT_NE(report.find("Topological order:\n  Not available (cycles detected)\n"), std::string::npos);
        EXPECT_NE(report.find("Cycles detected:\n  Cycle 1: A -> B -> C\n"), std::string::npos);
    }

    TEST_F(ReportGeneratorTest, MissingDependenciesListed) {
        const auto report = generate_report(analyzer_.analyze({{"A", {"X", "Y"}}}));

        EXPECT_NE(report.find("Missing dependencies:\n  - X\n  - Y\n"), std::string::npos);
    }

    TEST_F(ReportGeneratorTest, EmptyInput) {
        const auto report = generate_report(analyzer_.analyze({}));

        EXPECT_NE(report.find("Total Components: 0\n"), std::string::npos);
        EXPECT_NE(report.find("Dependency counts:\n\n"), std::string::npos);
        EXPECT_NE(report.find("Topological order:\n  None\n"), std::string::npos);
    }

    TEST_F(ReportGeneratorTest, DuplicateNamesCountedOnce) {
        const auto report = generate_report(analyzer_.analyze({{"A", {}}, {"A", {}}}));

        EXPECT_NE(report.find("Total Components: 1\n"), std::string::npos);
    }

    TEST_F(ReportGeneratorTest, WriteReport) {
        const auto result = analyzer_.analyze({{"A", {}}});
        const auto path = temp_dir_ / "out" / "report.txt";

        ASSERT_TRUE(write_report(result, path).is_ok());

        const auto content = file_utils::read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), generate_report(result));
        EXPECT_FALSE(fs::exists(file_utils::temporary_path_for(path)));
    }

    TEST_F(ReportGeneratorTest, WriteFailureLeavesNoTemporaryFile) {
        // A directory cannot be replaced by a regular file
        const auto path = temp_dir_ / "occupied";
        fs::create_directories(path / "child");

        const auto written = write_report(analyzer_.analyze({{"A", {}}}), path);

        ASSERT_TRUE(written.is_err());
        EXPECT_EQ(written.error().code(), ErrorCode::IoError);
        EXPECT_TRUE(fs::is_directory(path));
        EXPECT_FALSE(fs::exists(file_utils::temporary_path_for(path)));
    }

}  // namespace kda::exporters

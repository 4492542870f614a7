//
// Created by gregorian-rayne on 2/20/26.
//

#include "kda/utils/file_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace kda::file_utils
{
    class FileUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "kda_file_utils_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        fs::path temp_dir_;
    };

    TEST_F(FileUtilsTest, ReadMissingFile) {
        const auto result = read_file(temp_dir_ / "missing.txt");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST_F(FileUtilsTest, WriteThenRead) {
        const auto path = temp_dir_ / "out.txt";

        ASSERT_TRUE(write_file_atomic(path, "line one\nline two\n").is_ok());

        const auto result = read_file(path);
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value(), "line one\nline two\n");
    }

    TEST_F(FileUtilsTest, WriteCreatesParentDirectories) {
        const auto path = temp_dir_ / "a" / "b" / "out.txt";

        ASSERT_TRUE(write_file_atomic(path, "x").is_ok());
        EXPECT_TRUE(fs::exists(path));
    }

    TEST_F(FileUtilsTest, WriteReplacesExistingFile) {
        const auto path = temp_dir_ / "out.txt";
        {
            std::ofstream file(path);
            file << "a much longer previous content";
        }

        ASSERT_TRUE(write_file_atomic(path, "new").is_ok());

        EXPECT_EQ(read_file(path).value(), "new");
        EXPECT_FALSE(fs::exists(temporary_path_for(path)));
    }

    TEST_F(FileUtilsTest, WriteEmptyContent) {
        const auto path = temp_dir_ / "empty.txt";

        ASSERT_TRUE(write_file_atomic(path, "").is_ok());
        EXPECT_EQ(fs::file_size(path), 0u);
    }

    TEST_F(FileUtilsTest, FailedRenameRemovesTemporaryFile) {
        const auto path = temp_dir_ / "taken";
        fs::create_directories(path / "child");

        const auto result = write_file_atomic(path, "content");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::IoError);
        EXPECT_EQ(result.error().context().value_or(""), path.string());
        EXPECT_FALSE(fs::exists(temporary_path_for(path)));
        EXPECT_TRUE(fs::exists(path / "child"));
    }

    TEST_F(FileUtilsTest, TemporaryPathIsSibling) {
        const auto temp = temporary_path_for(temp_dir_ / "graph.dot");

        EXPECT_EQ(temp.parent_path(), temp_dir_);
        EXPECT_EQ(temp.filename(), "graph.dot.tmp");
    }

}  // namespace kda::file_utils

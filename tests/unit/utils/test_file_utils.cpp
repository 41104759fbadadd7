//
// Created by gregorian-rayne on 10/18/26.
//

#include "ppa/utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace ppa::file_utils
{
    class FileUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "ppa_file_utils_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }

        fs::path temp_dir_;
    };

    TEST_F(FileUtilsTest, WriteThenRead) {
        const auto path = temp_dir_ / "nested" / "module.py";

        ASSERT_TRUE(write_file(path, "x = 1\n").is_ok());

        const auto content = read_file(path);
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "x = 1\n");
    }

    TEST_F(FileUtilsTest, MissingFileIsNotFound) {
        const auto content = read_file(temp_dir_ / "absent.py");

        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
    }

    TEST_F(FileUtilsTest, DirectoryIsIoError) {
        const auto content = read_file(temp_dir_);

        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::IoError);
    }
}  // namespace ppa::file_utils

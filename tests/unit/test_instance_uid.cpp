/**
 * @file test_instance_uid.cpp
 * @brief Unit tests for instance uid generation and persistence.
 */

#include "analytics/instance_uid.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace search_analytics;

class InstanceUidTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;
    std::filesystem::path db_path_;
    std::filesystem::path config_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "sa_test_uid";
        std::filesystem::remove_all(temp_dir_);
        db_path_ = temp_dir_ / "data.ms";
        config_dir_ = temp_dir_ / "config";
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(InstanceUidTest, GeneratedUidIsVersion4) {
    auto uid = generate_instance_uid();
    EXPECT_TRUE(is_valid_uuid(uid));
    EXPECT_EQ(uid[14], '4');
    EXPECT_NE(uid, generate_instance_uid());
}

TEST_F(InstanceUidTest, ValidationRejectsMalformed) {
    EXPECT_TRUE(is_valid_uuid("123e4567-e89b-42d3-a456-426614174000"));
    EXPECT_FALSE(is_valid_uuid(""));
    EXPECT_FALSE(is_valid_uuid("123e4567e89b42d3a456426614174000"));
    EXPECT_FALSE(is_valid_uuid("123e4567-e89b-42d3-a456-42661417400g"));
}

TEST_F(InstanceUidTest, FirstRunFindsNothing) {
    EXPECT_FALSE(find_instance_uid(db_path_, config_dir_).has_value());
}

TEST_F(InstanceUidTest, WriteThenFind) {
    auto uid = generate_instance_uid();
    write_instance_uid(db_path_, config_dir_, uid);

    EXPECT_TRUE(std::filesystem::exists(db_path_ / "instance-uid"));
    EXPECT_TRUE(std::filesystem::exists(config_uid_path(db_path_, config_dir_)));
    EXPECT_EQ(find_instance_uid(db_path_, config_dir_), uid);
}

TEST_F(InstanceUidTest, ConfigCopySurvivesDatabaseDeletion) {
    auto uid = generate_instance_uid();
    write_instance_uid(db_path_, config_dir_, uid);
    std::filesystem::remove_all(db_path_);

    EXPECT_EQ(find_instance_uid(db_path_, config_dir_), uid);
}

TEST_F(InstanceUidTest, DistinctDatabasesGetDistinctConfigFiles) {
    EXPECT_NE(config_uid_path(temp_dir_ / "a.ms", config_dir_),
              config_uid_path(temp_dir_ / "b.ms", config_dir_));
}

TEST_F(InstanceUidTest, CorruptFileIsIgnored) {
    std::filesystem::create_directories(db_path_);
    std::ofstream(db_path_ / "instance-uid") << "not-a-uuid";
    EXPECT_FALSE(find_instance_uid(db_path_, {}).has_value());
}

TEST_F(InstanceUidTest, WriteFailureIsIgnored) {
    // db_path is a regular file, so nothing can be created under it.
    std::filesystem::create_directories(temp_dir_);
    std::ofstream(temp_dir_ / "occupied") << "x";

    EXPECT_NO_THROW(write_instance_uid(temp_dir_ / "occupied", {}, generate_instance_uid()));
    EXPECT_FALSE(find_instance_uid(temp_dir_ / "occupied", {}).has_value());
}

/**
 * executable_locator_test.cpp - PHD2 executable lookup
 */

#ifndef _WIN32

#include "process/executable_locator.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace guidelink::process;

class ExecutableLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / ("guidelink_locator_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
        const char *path = std::getenv("PATH");
        saved_path_ = path ? path : "";
    }

    void TearDown() override {
        ::setenv("PATH", saved_path_.c_str(), 1);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string make_file(const std::string &name, bool executable) {
        auto path = dir_ / name;
        std::ofstream(path.string()) << "#!/bin/sh\nexit 0\n";
        auto perms = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
        if (executable) {
            perms |= std::filesystem::perms::owner_exec;
        }
        std::filesystem::permissions(path, perms, std::filesystem::perm_options::replace);
        return path.string();
    }

    std::filesystem::path dir_;
    std::string saved_path_;
};

TEST_F(ExecutableLocatorTest, OverrideThatExistsIsUsed) {
    std::string path = make_file("phd2", true);
    std::string error;

    auto found = locate_executable(path, error);
    ASSERT_TRUE(found.has_value()) << error;
    EXPECT_EQ(*found, path);
}

TEST_F(ExecutableLocatorTest, MissingOverrideDoesNotFallBack) {
    std::string missing = (dir_ / "nope").string();
    ::setenv("PATH", dir_.c_str(), 1);
    make_file("phd2", true);
    std::string error;

    EXPECT_FALSE(locate_executable(missing, error).has_value());
    EXPECT_EQ(error, "PHD2 executable not found: " + missing);
}

TEST_F(ExecutableLocatorTest, NonExecutableOverrideIsRejected) {
    std::string path = make_file("phd2", false);
    std::string error;

    EXPECT_FALSE(locate_executable(path, error).has_value());
}

TEST_F(ExecutableLocatorTest, FindOnPathSkipsEmptyAndMissingDirs) {
    std::string expected = make_file("phd2", true);
    std::string path_value = "::/nonexistent_guidelink_dir:" + dir_.string();
    ::setenv("PATH", path_value.c_str(), 1);

    auto found = find_on_path("phd2");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, expected);
}

TEST_F(ExecutableLocatorTest, FindOnPathIgnoresNonExecutables) {
    make_file("phd2", false);
    ::setenv("PATH", dir_.c_str(), 1);

    EXPECT_FALSE(find_on_path("phd2").has_value());
}

TEST_F(ExecutableLocatorTest, DefaultNameMatchesPlatform) {
    EXPECT_STREQ(default_executable_name(), "phd2");
    EXPECT_FALSE(default_executable_locations().empty());
}

#endif

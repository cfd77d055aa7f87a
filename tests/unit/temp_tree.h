#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

// Fixture owning a scratch directory tree whose file mtimes are pinned
// relative to a fixed base instant, so ordering never depends on the clock
class TempTreeTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = std::filesystem::temp_directory_path() /
                (std::string("monthclose_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
        base_ = std::filesystem::file_time_type::clock::now() - std::chrono::hours(24 * 365);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    // Create (or rewrite) root/rel with mtime base + hour hours
    std::filesystem::path touch(const std::string &rel, int hour)
    {
        auto path = root_ / rel;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << rel << "\n";
        set_time(rel, hour);
        return path;
    }

    void set_time(const std::string &rel, int hour)
    {
        std::filesystem::last_write_time(root_ / rel, at(hour));
    }

    std::filesystem::file_time_type at(int hour) const
    {
        return base_ + std::chrono::hours(hour);
    }

    std::filesystem::file_time_type time_of(const std::string &rel) const
    {
        return std::filesystem::last_write_time(root_ / rel);
    }

    bool exists(const std::string &rel) const
    {
        return std::filesystem::exists(root_ / rel);
    }

    std::filesystem::path root_;
    std::filesystem::file_time_type base_;
};

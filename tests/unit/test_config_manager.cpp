#include <gtest/gtest.h>
#include "core/config_manager.h"
#include <filesystem>
#include <fstream>

using namespace monthclose::core;
namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = fs::temp_directory_path() / (std::string("monthclose_config_") + info->name());
        fs::remove_all(test_dir_);
        manager_ = std::make_unique<ConfigManager>(test_dir_);
    }

    void TearDown() override
    {
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
    std::unique_ptr<ConfigManager> manager_;
};

TEST_F(ConfigManagerTest, Defaults)
{
    EXPECT_FALSE(manager_->exists());
    EXPECT_FALSE(manager_->load());
    EXPECT_EQ(manager_->python(), "python3");
    EXPECT_FALSE(manager_->scripts_dir().has_value());
    EXPECT_FALSE(manager_->pipeline_file().has_value());
    EXPECT_FALSE(manager_->build_log());
    EXPECT_TRUE(manager_->get_storage_roots().empty());
    EXPECT_EQ(manager_->config_file(), test_dir_ / "config.json");
}

TEST_F(ConfigManagerTest, SaveAndLoad)
{
    manager_->add_storage_root("/data/Dropbox");
    manager_->add_storage_root("/mnt/backup");
    manager_->set("python", "/opt/venv/bin/python");
    manager_->set("scripts_dir", "/opt/closing");
    manager_->set("build_log", "true");
    manager_->set("owner", "finance");
    ASSERT_TRUE(manager_->save());

    ConfigManager reloaded(test_dir_);
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.get_storage_roots().size(), 2);
    EXPECT_EQ(reloaded.get_storage_roots()[0], fs::path("/data/Dropbox"));
    EXPECT_EQ(reloaded.python(), "/opt/venv/bin/python");
    EXPECT_EQ(reloaded.scripts_dir().value_or(fs::path()), fs::path("/opt/closing"));
    EXPECT_TRUE(reloaded.build_log());
    EXPECT_EQ(reloaded.get("owner").value_or(""), "finance");
}

TEST_F(ConfigManagerTest, JsonLayout)
{
    manager_->set("build_log", "yes");
    manager_->set("pipeline_file", "/etc/pipeline.json");
    manager_->set("owner", "finance");

    auto j = manager_->to_json();
    EXPECT_EQ(j["build_log"], true);
    EXPECT_EQ(j["pipeline_file"], "/etc/pipeline.json");
    EXPECT_EQ(j["settings"]["owner"], "finance");
    EXPECT_FALSE(j["settings"].contains("pipeline_file"));
    EXPECT_TRUE(j["storage_roots"].is_array());
}

TEST_F(ConfigManagerTest, StorageRootsAreUnique)
{
    manager_->add_storage_root("/a");
    manager_->add_storage_root("/a");
    EXPECT_EQ(manager_->get_storage_roots().size(), 1);
    EXPECT_TRUE(manager_->remove_storage_root("/a"));
    EXPECT_FALSE(manager_->remove_storage_root("/a"));
}

TEST_F(ConfigManagerTest, UnsetAndListKeys)
{
    manager_->set("python", "python3.12");
    manager_->set("owner", "x");
    EXPECT_EQ(manager_->list_keys(), (std::vector<std::string>{"owner", "python"}));
    EXPECT_TRUE(manager_->unset("python"));
    EXPECT_FALSE(manager_->unset("python"));
    EXPECT_EQ(manager_->python(), "python3");
}

TEST_F(ConfigManagerTest, UnreadableFile)
{
    fs::create_directories(test_dir_);
    std::ofstream(test_dir_ / "config.json") << "{ broken";
    EXPECT_TRUE(manager_->exists());
    EXPECT_FALSE(manager_->load());
}

#include <gtest/gtest.h>
#include <fstream>
#include "settings.hpp"
#include "test_support.hpp"

using namespace projsync;
using namespace projsync::test;

namespace {

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        SettingsManager::getInstance().set_change_callback(nullptr);
        SettingsManager::getInstance().set_config_dir(dir_.path());
    }

    void TearDown() override {
        SettingsManager::getInstance().set_change_callback(nullptr);
    }

    void write_settings(const std::string& content) {
        std::ofstream out(dir_.file("settings.json"));
        out << content;
    }

    TempDir dir_;
};

} // namespace

TEST_F(SettingsTest, MissingFileGivesDefaults) {
    auto& settings = SettingsManager::getInstance();
    EXPECT_FALSE(settings.load());

    EXPECT_EQ(settings.get_command_timeout_seconds(), 120);
    EXPECT_EQ(settings.get_ssh_connect_timeout_seconds(), 10);
    EXPECT_EQ(settings.get_rsync_options(), "-avz");
    EXPECT_EQ(settings.get_git_remote(), "origin");
    EXPECT_TRUE(settings.get_show_notifications());
    EXPECT_FALSE(settings.get_debug_logging());
    EXPECT_EQ(settings.get_last_project(), "");
}

TEST_F(SettingsTest, SaveAndLoadRoundTrip) {
    auto& settings = SettingsManager::getInstance();
    settings.load();
    settings.set_command_timeout_seconds(45);
    settings.set_ssh_connect_timeout_seconds(4);
    settings.set_rsync_options("-az --delete-excluded");
    settings.set_git_remote("upstream");
    settings.set_show_notifications(false);
    settings.set_last_project("web \"app\"");
    ASSERT_TRUE(settings.save());

    settings.set_config_dir(dir_.path());
    ASSERT_TRUE(settings.load());
    EXPECT_EQ(settings.get_command_timeout_seconds(), 45);
    EXPECT_EQ(settings.get_ssh_connect_timeout_seconds(), 4);
    EXPECT_EQ(settings.get_rsync_options(), "-az --delete-excluded");
    EXPECT_EQ(settings.get_git_remote(), "upstream");
    EXPECT_FALSE(settings.get_show_notifications());
    EXPECT_EQ(settings.get_last_project(), "web \"app\"");
}

TEST_F(SettingsTest, NumbersAndBooleansAreWrittenUnquoted) {
    auto& settings = SettingsManager::getInstance();
    settings.load();
    settings.set_command_timeout_seconds(30);
    settings.set_debug_logging(true);
    ASSERT_TRUE(settings.save());

    std::string content = dir_.read("settings.json");
    EXPECT_NE(content.find("\"command_timeout_seconds\": 30"), std::string::npos);
    EXPECT_NE(content.find("\"debug_logging\": true"), std::string::npos);
}

TEST_F(SettingsTest, CorruptFileFallsBackToDefaults) {
    write_settings("{\"command_timeout_seconds\": 5,");
    auto& settings = SettingsManager::getInstance();
    EXPECT_FALSE(settings.load());
    EXPECT_EQ(settings.get_command_timeout_seconds(), 120);
}

TEST_F(SettingsTest, PartialFileKeepsOtherDefaults) {
    write_settings("{\"git_remote\": \"backup\"}");
    auto& settings = SettingsManager::getInstance();
    EXPECT_TRUE(settings.load());
    EXPECT_EQ(settings.get_git_remote(), "backup");
    EXPECT_EQ(settings.get_rsync_options(), "-avz");
}

TEST_F(SettingsTest, InvalidTimeoutsFallBackToDefaults) {
    write_settings("{\"command_timeout_seconds\": -3, \"ssh_connect_timeout_seconds\": \"soon\"}");
    auto& settings = SettingsManager::getInstance();
    settings.load();
    EXPECT_EQ(settings.get_command_timeout_seconds(), 120);
    EXPECT_EQ(settings.get_ssh_connect_timeout_seconds(), 10);
}

TEST_F(SettingsTest, ChangeCallbackReceivesKey) {
    auto& settings = SettingsManager::getInstance();
    settings.load();

    std::vector<std::string> changed;
    settings.set_change_callback([&changed](const std::string& key) { changed.push_back(key); });
    settings.set_last_project("api");
    settings.set_bool("show_notifications", false);

    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "last_project");
    EXPECT_EQ(changed[1], "show_notifications");
}

TEST_F(SettingsTest, ConfigPathFollowsConfigDir) {
    EXPECT_EQ(SettingsManager::getInstance().get_config_path(), dir_.path() + "/settings.json");
}

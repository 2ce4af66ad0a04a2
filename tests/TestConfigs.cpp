#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "Fakes.hpp"
#include "core/ConfigManager.hpp"

using namespace kclick;
using namespace kclick::test;

TEST(TestConfigs, TestLoadMissingFile) {
    TempConfigFile file("missing");
    Configs config(file.path);
    EXPECT_FALSE(config.Load());
    EXPECT_EQ(config.Size(), 0u);
    EXPECT_EQ(config.Get<int>("Clicker.Nothing", 7), 7);
}

TEST(TestConfigs, TestLoadSections) {
    TempConfigFile file("sections");
    {
        std::ofstream out(file.path);
        out << "# comment\n";
        out << "[Clicker]\n";
        out << "ClicksPerSecond=25\n";
        out << "Mode=Hold\r\n";
        out << "not a setting\n";
        out << "[Shortcut]\n";
        out << "Binding=keyboard:6:8\n";
    }

    Configs config(file.path);
    ASSERT_TRUE(config.Load());
    EXPECT_EQ(config.Size(), 3u);
    EXPECT_DOUBLE_EQ(config.Get<double>("Clicker.ClicksPerSecond", 0.0), 25.0);
    EXPECT_EQ(config.Get<std::string>("Clicker.Mode", ""), "Hold");
    EXPECT_EQ(config.Get<std::string>("Shortcut.Binding", ""), "keyboard:6:8");
}

TEST(TestConfigs, TestSaveAndReload) {
    TempConfigFile file("save");
    {
        Configs config(file.path);
        config.Set<double>("Clicker.ClicksPerSecond", 12.5);
        config.Set<bool>("Debug.VerboseInputLogging", true);
        config.Set<std::string>("Input.PauseModifier", "Alt");
        ASSERT_TRUE(config.Save());
    }

    Configs reloaded(file.path);
    ASSERT_TRUE(reloaded.Load());
    EXPECT_DOUBLE_EQ(reloaded.Get<double>("Clicker.ClicksPerSecond", 0.0), 12.5);
    EXPECT_TRUE(reloaded.Get<bool>("Debug.VerboseInputLogging", false));
    EXPECT_EQ(reloaded.Get<std::string>("Input.PauseModifier", ""), "Alt");
}

TEST(TestConfigs, TestMalformedValuesUseDefault) {
    TempConfigFile file("malformed");
    Configs config(file.path);
    config.Set<std::string>("Clicker.ClicksPerSecond", "12abc");
    config.Set<std::string>("Debug.VerboseInputLogging", "maybe");
    EXPECT_DOUBLE_EQ(config.Get<double>("Clicker.ClicksPerSecond", 10.0), 10.0);
    EXPECT_FALSE(config.Get<bool>("Debug.VerboseInputLogging", false));
}

TEST(TestConfigs, TestRangedGet) {
    TempConfigFile file("ranged");
    Configs config(file.path);
    config.Set<int>("Clicker.Limit", 500);
    EXPECT_EQ(config.Get<int>("Clicker.Limit", 10, 1, 100), 10);
    EXPECT_EQ(config.Get<int>("Clicker.Limit", 10, 1, 1000), 500);
}

TEST(TestConfigs, TestRemoveAndHas) {
    TempConfigFile file("remove");
    Configs config(file.path);
    config.Set<std::string>("Shortcut.Binding", "mouse:3:0");
    EXPECT_TRUE(config.Has("Shortcut.Binding"));
    config.Remove("Shortcut.Binding");
    EXPECT_FALSE(config.Has("Shortcut.Binding"));
    config.Remove("Shortcut.Binding");
}

TEST(TestConfigs, TestEnsureConfigFileWritesDefaults) {
    TempConfigFile file("ensure");
    Configs config(file.path);
    config.EnsureConfigFile();
    ASSERT_TRUE(std::filesystem::exists(file.path));

    ASSERT_TRUE(config.Load());
    EXPECT_DOUBLE_EQ(config.Get<double>(Configs::CLICKS_PER_SECOND_KEY, 0.0), 10.0);
    EXPECT_EQ(config.Get<std::string>(Configs::CLICK_MODE_KEY, ""), "Toggle");
    EXPECT_EQ(config.Get<std::string>(Configs::PAUSE_MODIFIER_KEY, ""), "Fn");
    EXPECT_FALSE(config.Get<bool>(Configs::VERBOSE_INPUT_KEY, true));
    EXPECT_FALSE(config.Has(Configs::SHORTCUT_KEY));
}

TEST(TestConfigs, TestEnsureConfigFileKeepsExisting) {
    TempConfigFile file("keep");
    {
        std::ofstream out(file.path);
        out << "[Clicker]\nClicksPerSecond=3\n";
    }
    Configs config(file.path);
    config.EnsureConfigFile();
    ASSERT_TRUE(config.Load());
    EXPECT_EQ(config.Get<int>(Configs::CLICKS_PER_SECOND_KEY, 0), 3);
    EXPECT_EQ(config.Size(), 1u);
}

TEST(TestConfigs, TestSaveToUnwritablePathFails) {
    Configs config("/proc/kclick-test/kclick.cfg");
    config.Set<int>("Clicker.ClicksPerSecond", 5);
    EXPECT_FALSE(config.Save());
}

#include "core/settings.h"
#include "persistence/preference_store.h"
#include "persistence/settings_file.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>

using namespace paddleball;

TEST(Settings, DefaultsAreAlreadyValid) {
    Settings s;
    Settings v = s;
    validate_settings(v);
    EXPECT_EQ(v.paddle_width, s.paddle_width);
    EXPECT_EQ(v.win_score, 5);
    EXPECT_EQ(v.ball_direction_y, 0);
}

TEST(Settings, ValidateClampsNumericFields) {
    Settings s;
    s.paddle_height = 0;
    s.ball_speed = -3;
    s.win_score = 0;
    s.difficulty = -1;
    s.ball_direction_y = 7;
    s.ball_color = 0xff123456u;
    validate_settings(s);
    EXPECT_EQ(s.paddle_height, 1);
    EXPECT_EQ(s.ball_speed, 1);
    EXPECT_EQ(s.win_score, 1);
    EXPECT_EQ(s.difficulty, 0);
    EXPECT_EQ(s.ball_direction_y, 1);
    EXPECT_EQ(s.ball_color, 0x123456u);
}

TEST(Settings, PreferencePrefixMatchesKnownHashes) {
    EXPECT_EQ(preference_prefix(""), "0");
    EXPECT_EQ(preference_prefix("abc"), "17862");
    EXPECT_EQ(preference_prefix("PaddleBall"), "7f3fc757");
    EXPECT_EQ(preference_prefix("a much longer game name"), "2304000a");
    EXPECT_NE(preference_prefix("PaddleBall"), preference_prefix("paddleball"));
}

TEST(SettingsManager, ParseOverridesPresentKeys) {
    SettingsManager mgr;
    Settings s = mgr.parse(R"({
        "name": "Court \"One\"",
        "win_score": 3,
        "difficulty": 9,
        "ball_direction_y": 1,
        "left_paddle_color": "#00FF80"
    })");
    EXPECT_EQ(s.name, "Court \"One\"");
    EXPECT_EQ(s.win_score, 3);
    EXPECT_EQ(s.difficulty, 9);
    EXPECT_EQ(s.ball_direction_y, 1);
    EXPECT_EQ(s.left_paddle_color, 0x00ff80u);
    EXPECT_EQ(s.paddle_height, Settings{}.paddle_height);
}

TEST(SettingsManager, MalformedValuesKeepDefaults) {
    SettingsManager mgr;
    Settings s = mgr.parse(R"({"win_score": "many", "ball_color": "#12", "start_text": 4, "paddle_speed": -20})");
    Settings d;
    EXPECT_EQ(s.win_score, d.win_score);
    EXPECT_EQ(s.ball_color, d.ball_color);
    EXPECT_EQ(s.start_text, d.start_text);
    EXPECT_EQ(s.paddle_speed, 1);
}

TEST(SettingsManager, MissingFileGivesDefaults) {
    SettingsManager mgr;
    Settings s = mgr.load(::testing::TempDir() + "paddleball_no_such_file.json");
    EXPECT_EQ(s.name, "PaddleBall");
    EXPECT_EQ(s.ball_size, 10);
}

TEST(SettingsManager, SaveThenLoadKeepsEveryField) {
    const std::string path = ::testing::TempDir() + "paddleball_settings_test.json";
    SettingsManager mgr;
    Settings s;
    s.name = "Tab\tName";
    s.instructions_mobile = "line one\nline two";
    s.background_color = 0x0a0b0c;
    s.ball_size = 14;
    s.ball_direction_y = -1;
    ASSERT_TRUE(mgr.save(path, s));

    Settings r = mgr.load(path);
    EXPECT_EQ(r.name, s.name);
    EXPECT_EQ(r.instructions_mobile, s.instructions_mobile);
    EXPECT_EQ(r.background_color, 0x0a0b0cu);
    EXPECT_EQ(r.ball_size, 14);
    EXPECT_EQ(r.ball_direction_y, -1);
    std::remove(path.c_str());
}

TEST(SettingsManager, HexColors) {
    unsigned int c = 0;
    EXPECT_TRUE(parse_hex_color("#a0B1c2", c));
    EXPECT_EQ(c, 0xa0b1c2u);
    EXPECT_TRUE(parse_hex_color("ffffff", c));
    EXPECT_EQ(c, 0xffffffu);
    EXPECT_FALSE(parse_hex_color("#ggg000", c));
    EXPECT_FALSE(parse_hex_color("#fff", c));
    EXPECT_FALSE(parse_hex_color("", c));
    EXPECT_EQ(format_hex_color(0x00ff80), "#00ff80");
}

TEST(PreferenceStore, MemoryStoreFallsBack) {
    MemoryPreferenceStore prefs;
    EXPECT_TRUE(prefs.get_bool("k", true));
    EXPECT_TRUE(prefs.set_bool("k", false));
    EXPECT_FALSE(prefs.get_bool("k", true));
}

TEST(PreferenceStore, FileStorePersistsAcrossInstances) {
    const std::string path = ::testing::TempDir() + "paddleball_prefs_test.json";
    std::remove(path.c_str());
    {
        FilePreferenceStore prefs(path);
        EXPECT_FALSE(prefs.load());
        EXPECT_TRUE(prefs.set_bool("7f3fc757muted", true));
        EXPECT_TRUE(prefs.set_bool("other", false));
    }
    FilePreferenceStore again(path);
    ASSERT_TRUE(again.load());
    EXPECT_TRUE(again.get_bool("7f3fc757muted", false));
    EXPECT_FALSE(again.get_bool("other", true));
    EXPECT_TRUE(again.get_bool("absent", true));
    std::remove(path.c_str());
}

TEST(PreferenceStore, FileStoreReportsUnwritablePath) {
    FilePreferenceStore prefs(::testing::TempDir() + "no_such_dir/prefs.json");
    EXPECT_FALSE(prefs.set_bool("k", true));
    EXPECT_TRUE(prefs.get_bool("k", false));
}

/**
 * Voidrat - Preferences Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "core/Preferences.hpp"

using namespace voidrat;

class PreferencesTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "voidrat-preferences-test";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
        path = testDir / Preferences::DEFAULT_FILE_NAME;
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
    std::filesystem::path path;
};

TEST_F(PreferencesTest, MissingFileIsCreatedWithDefaults) {
    auto prefs = Preferences::load(path);

    EXPECT_EQ(prefs.updateCooldown, 300);
    EXPECT_EQ(prefs.lastUpdate, 0);
    EXPECT_FALSE(prefs.notifyVoidCapture);
    EXPECT_FALSE(prefs.notifyEpicInvasion);
    EXPECT_TRUE(prefs.notified.empty());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(PreferencesTest, SavesAndLoadsEveryField) {
    Preferences prefs;
    prefs.updateCooldown = 120;
    prefs.lastUpdate = 1700000000;
    prefs.notifyVoidCapture = true;
    prefs.notifyEpicInvasion = false;
    prefs.notified = {1699990000, 1700000100};

    ASSERT_TRUE(prefs.persist(path));
    EXPECT_EQ(Preferences::load(path), prefs);
}

TEST_F(PreferencesTest, LaterWritesReplaceEarlierOnes) {
    Preferences prefs;
    prefs.notified = {1, 2, 3, 4, 5};
    ASSERT_TRUE(prefs.persist(path));

    prefs.notified = {9};
    prefs.notifyEpicInvasion = true;
    ASSERT_TRUE(prefs.persist(path));

    auto loaded = Preferences::load(path);
    EXPECT_EQ(loaded.notified, std::vector<std::int64_t>{9});
    EXPECT_TRUE(loaded.notifyEpicInvasion);
}

TEST_F(PreferencesTest, GarbageFileIsFatal) {
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not a preferences file";
    }
    EXPECT_THROW(Preferences::load(path), PreferencesError);
}

TEST_F(PreferencesTest, TruncatedFileIsFatal) {
    Preferences prefs;
    prefs.notified = {1700000000, 1700000100};
    ASSERT_TRUE(prefs.persist(path));

    auto size = std::filesystem::file_size(path);
    std::filesystem::resize_file(path, size - 4);
    EXPECT_THROW(Preferences::load(path), PreferencesError);
}

TEST_F(PreferencesTest, TrailingBytesAreFatal) {
    Preferences prefs;
    ASSERT_TRUE(prefs.persist(path));
    {
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "x";
    }
    EXPECT_THROW(Preferences::load(path), PreferencesError);
}

TEST(PreferencesLogicTest, CooldownGate) {
    Preferences prefs;
    prefs.updateCooldown = 300;
    prefs.lastUpdate = 1000;

    EXPECT_FALSE(prefs.canUpdate(1300));
    EXPECT_TRUE(prefs.canUpdate(1301));
    EXPECT_EQ(prefs.secondsUntilNextUpdate(1100), 200);
    EXPECT_EQ(prefs.secondsUntilNextUpdate(1400), -100);
}

TEST(PreferencesLogicTest, NotificationHistoryIsDeduplicatedAndCapped) {
    Preferences prefs;
    prefs.recordNotification(10, 3);
    prefs.recordNotification(10, 3);
    EXPECT_EQ(prefs.notified.size(), 1u);

    prefs.recordNotification(20, 3);
    prefs.recordNotification(30, 3);
    prefs.recordNotification(40, 3);

    EXPECT_EQ(prefs.notified, (std::vector<std::int64_t>{20, 30, 40}));
    EXPECT_FALSE(prefs.wasNotified(10));
    EXPECT_TRUE(prefs.wasNotified(40));
}

TEST(PreferencesLogicTest, ZeroCapKeepsEverything) {
    Preferences prefs;
    for (std::int64_t key = 0; key < 500; ++key) {
        prefs.recordNotification(key);
    }
    EXPECT_EQ(prefs.notified.size(), 500u);
}

/**
 * Voidrat - Shared State Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

#include "core/SharedState.hpp"

using namespace voidrat;

namespace {

std::vector<Fissure> fissuresOfSize(size_t count) {
    std::vector<Fissure> fissures(count);
    for (auto& f : fissures) {
        f.expiry = fromEpochSeconds(1700000000);
    }
    return fissures;
}

} // anonymous namespace

TEST(SharedStateTest, StartsEmptyWithGivenPreferences) {
    Preferences prefs;
    prefs.notifyEpicInvasion = true;
    SharedState state(prefs);

    auto snapshot = state.snapshot();
    EXPECT_FALSE(snapshot.initialized);
    EXPECT_TRUE(snapshot.fissures.empty());
    EXPECT_TRUE(snapshot.invasions.empty());
    EXPECT_TRUE(snapshot.preferences.notifyEpicInvasion);
    EXPECT_EQ(snapshot.status.source, DataSource::None);
    EXPECT_FALSE(snapshot.status.lastSuccess.has_value());
}

TEST(SharedStateTest, PartialUpdatesLeaveOtherListsAlone) {
    SharedState state{Preferences()};
    std::vector<Invasion> invasions(2);
    state.replaceWorld(fissuresOfSize(3), CetusCycle(), invasions, DataSource::Cache);

    state.setFissures(fissuresOfSize(1), DataSource::Fallback);

    auto snapshot = state.snapshot();
    EXPECT_EQ(snapshot.fissures.size(), 1u);
    EXPECT_EQ(snapshot.invasions.size(), 2u);
    EXPECT_EQ(snapshot.status.source, DataSource::Fallback);
    EXPECT_EQ(dataSourceName(snapshot.status.source), "fallback");
}

TEST(SharedStateTest, SuccessClearsTheLastError) {
    SharedState state{Preferences()};
    state.recordError("Primary and fallback sources all failed");
    EXPECT_FALSE(state.snapshot().status.lastError.isEmpty());

    auto when = fromEpochSeconds(1700000000);
    state.recordSuccess(when);

    auto status = state.snapshot().status;
    EXPECT_TRUE(status.lastError.isEmpty());
    ASSERT_TRUE(status.lastSuccess.has_value());
    EXPECT_EQ(*status.lastSuccess, when);
}

TEST(SharedStateTest, UpdatePreferencesReturnsTheNewCopy) {
    SharedState state{Preferences()};
    auto prefs = state.updatePreferences([](Preferences& p) {
        p.notifyVoidCapture = true;
        p.recordNotification(42);
    });

    EXPECT_TRUE(prefs.notifyVoidCapture);
    EXPECT_EQ(state.preferences(), prefs);
}

TEST(SharedStateTest, ReadersNeverSeeHalfWrittenWorlds) {
    SharedState state{Preferences()};
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&state, &done]() {
        for (size_t i = 0; i < 2000; ++i) {
            size_t n = i % 7;
            state.replaceWorld(fissuresOfSize(n), CetusCycle(),
                               std::vector<Invasion>(n), DataSource::WorldState);
        }
        done = true;
    });

    while (!done) {
        auto snapshot = state.snapshot();
        if (snapshot.fissures.size() != snapshot.invasions.size()) {
            ++torn;
        }
    }
    writer.join();

    EXPECT_EQ(torn.load(), 0);
}

/**
 * Voidrat - HTTP Fetcher Tests
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include <QtConcurrent>

#include "network/HttpFetcher.hpp"

using namespace voidrat;

TEST(HttpFetcherTest, RefusedConnectionYieldsNothing) {
    QtHttpFetcher fetcher(2000);

    auto future = QtConcurrent::run([&fetcher]() {
        return fetcher.fetch("http://127.0.0.1:1/worldState.php");
    });

    EXPECT_FALSE(future.result().has_value());
}

TEST(HttpFetcherTest, UnsupportedSchemeYieldsNothing) {
    QtHttpFetcher fetcher(2000);

    auto future = QtConcurrent::run([&fetcher]() {
        return fetcher.fetch("gopher://example.invalid/");
    });

    EXPECT_FALSE(future.result().has_value());
    EXPECT_EQ(fetcher.timeout(), 2000);
}

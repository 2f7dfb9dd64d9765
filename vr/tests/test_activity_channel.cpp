/*
 * Part of the Vrushie (VR) project.
 *
 * SPDX-FileCopyrightText: 2025 Vrushie contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Vrushie (VR). See LICENSE for details.
 */

#include "doctest/doctest.h"
#include "vr/internal/activity_channel.hpp"
#include "vr/monitor.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace vr;
using namespace vr::internal;

static ActivityRecord rec(const std::string& msg) {
    ActivityRecord r;
    r.timestamp = std::chrono::system_clock::now();
    r.client = "10.0.0.1";
    r.kind = ActivityKind::Allowed;
    r.message = msg;
    return r;
}

DOCTEST_TEST_CASE("full channel drops the oldest record") {
    ActivityChannel ch(2);
    DOCTEST_CHECK(ch.push(rec("a")));
    DOCTEST_CHECK(ch.push(rec("b")));
    DOCTEST_CHECK_FALSE(ch.push(rec("c")));
    DOCTEST_CHECK_EQ(ch.size(), 2u);
    DOCTEST_CHECK_EQ(ch.dropped(), 1u);

    ActivityRecord out;
    DOCTEST_REQUIRE(ch.pop(out));
    DOCTEST_CHECK_EQ(out.message, "b");
    DOCTEST_REQUIRE(ch.pop(out));
    DOCTEST_CHECK_EQ(out.message, "c");
}

DOCTEST_TEST_CASE("closed channel drains queued records then reports end") {
    ActivityChannel ch(4);
    ch.push(rec("one"));
    ch.close();
    DOCTEST_CHECK_FALSE(ch.push(rec("late")));

    ActivityRecord out;
    DOCTEST_REQUIRE(ch.pop(out));
    DOCTEST_CHECK_EQ(out.message, "one");
    DOCTEST_CHECK_FALSE(ch.pop(out));
}

DOCTEST_TEST_CASE("close wakes a blocked consumer") {
    ActivityChannel ch(4);
    std::atomic<bool> returned{false};
    std::thread consumer([&] {
        ActivityRecord out;
        DOCTEST_CHECK_FALSE(ch.pop(out));
        returned.store(true);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    consumer.join();
    DOCTEST_CHECK(returned.load());
}

DOCTEST_TEST_CASE("producers never block on a channel nobody reads") {
    ActivityChannel ch(8);
    std::vector<std::thread> ts;
    for (int t = 0; t < 4; ++t) {
        ts.emplace_back([&ch, t] {
            for (int i = 0; i < 1000; ++i) ch.push(rec(std::to_string(t) + ":" + std::to_string(i)));
        });
    }
    for (auto& t : ts) t.join();

    DOCTEST_CHECK_EQ(ch.size(), 8u);
    DOCTEST_CHECK_EQ(ch.dropped(), 4000u - 8u);
}

DOCTEST_TEST_CASE("monitor keeps only the most recent history") {
    ActivityChannel ch(64);
    Monitor mon(ch, 10);
    std::atomic<int> seen{0};
    mon.set_listener([&](const ActivityRecord&) { ++seen; });
    mon.start();

    for (int i = 0; i < 25; ++i) ch.push(rec("m" + std::to_string(i)));
    DOCTEST_REQUIRE(mon.wait_for_count(25, std::chrono::seconds(5)));

    auto h = mon.history();
    DOCTEST_REQUIRE_EQ(h.size(), 10u);
    DOCTEST_CHECK_EQ(h.front().message, "m15");
    DOCTEST_CHECK_EQ(h.back().message, "m24");
    DOCTEST_CHECK_EQ(mon.consumed(), 25u);

    mon.stop();
    DOCTEST_CHECK_EQ(seen.load(), 25);
}

DOCTEST_TEST_CASE("monitor stop delivers what was queued") {
    ActivityChannel ch(64);
    Monitor mon(ch, 10);
    ch.push(rec("before-start"));
    mon.start();
    ch.push(rec("second"));
    mon.stop();

    DOCTEST_CHECK_EQ(mon.consumed(), 2u);
    DOCTEST_CHECK_EQ(mon.history().back().message, "second");
}

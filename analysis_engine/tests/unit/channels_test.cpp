// =============================================================================
// SharedParams / SpscQueue / StatusChannel Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <string>
#include <thread>
#include <vector>

#include "SharedParams.hpp"
#include "SpscQueue.hpp"
#include "StatusChannel.hpp"

TEST_CASE("SharedParams snapshots are independent copies", "[params]") {
    SharedParams params;
    ControlSnapshot defaults = params.snapshot();
    REQUIRE(defaults.sampleRate == 2000.0);
    REQUIRE(defaults.chunkLength == 256);
    REQUIRE(defaults.windowSeconds == 4.0);
    REQUIRE(defaults.frameRate == 8.0);
    REQUIRE(defaults.pluginId == "builtin:cwt_morlet");

    params.setSampleRate(4000.0);
    params.setWindowSeconds(2.5);
    REQUIRE(defaults.sampleRate == 2000.0);
    REQUIRE(params.snapshot().sampleRate == 4000.0);
    REQUIRE(params.snapshot().windowSeconds == 2.5);
}

TEST_CASE("SharedParams transform selection", "[params]") {
    SharedParams params;
    params.setTransform("builtin:dwt_wpt", {{"mode", std::string("DWT")}, {"maxlevel", 3}});

    SECTION("setTransform replaces the parameter map") {
        params.setTransform("builtin:cwt_morlet", {{"n_freqs", 64}});
        auto s = params.snapshot();
        REQUIRE(s.pluginId == "builtin:cwt_morlet");
        REQUIRE(s.transformParams.size() == 1);
    }

    SECTION("updateTransformParams merges") {
        params.updateTransformParams({{"maxlevel", 4}, {"show_approx", true}});
        auto s = params.snapshot();
        REQUIRE(s.pluginId == "builtin:dwt_wpt");
        REQUIRE(paramAsString(s.transformParams, "mode", "") == "DWT");
        REQUIRE(paramAsInt(s.transformParams, "maxlevel", 0) == 4);
        REQUIRE(paramAsBool(s.transformParams, "show_approx", false));
    }
}

TEST_CASE("SpscQueue is bounded FIFO", "[queue]") {
    SpscQueue<int> q(3);
    REQUIRE(q.capacity() == 3);
    REQUIRE(q.empty());

    REQUIRE(q.tryPush(1));
    REQUIRE(q.tryPush(2));
    REQUIRE(q.tryPush(3));
    REQUIRE_FALSE(q.tryPush(4));

    int v = 0;
    REQUIRE(q.tryPop(v));
    REQUIRE(v == 1);
    REQUIRE(q.tryPush(5));

    std::vector<int> rest;
    while (q.tryPop(v)) rest.push_back(v);
    REQUIRE(rest == std::vector<int>{2, 3, 5});
    REQUIRE_FALSE(q.tryPop(v));
}

TEST_CASE("SpscQueue hands values across threads in order", "[queue]") {
    SpscQueue<int> q(16);
    const int total = 10000;

    std::thread producer([&]() {
        for (int i = 0; i < total; ++i) {
            while (!q.tryPush(i)) std::this_thread::yield();
        }
    });

    int expected = 0;
    int v = 0;
    while (expected < total) {
        if (q.tryPop(v)) {
            REQUIRE(v == expected);
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    REQUIRE(q.empty());
}

TEST_CASE("StatusChannel drops the oldest message when full", "[status]") {
    StatusChannel status(2);
    status.post("a");
    status.post("b");
    status.post("c");

    auto msgs = status.drain();
    REQUIRE(msgs == std::vector<std::string>{"b", "c"});
    REQUIRE(status.dropped() == 1);
    REQUIRE(status.drain().empty());
}

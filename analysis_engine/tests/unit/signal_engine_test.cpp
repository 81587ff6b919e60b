// =============================================================================
// SignalEngine Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <thread>

#include "LogicalClock.hpp"
#include "SignalEngine.hpp"

TEST_CASE("SignalEngine sums enabled components", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 128);

    ParamMap sine = {{"frequency", 40.0}, {"amplitude", 0.7}, {"smooth_ms", 0}};
    ParamMap rect = {{"amplitude", 0.3}, {"width_sec", 0.02}, {"period_sec", 0.05}};
    REQUIRE(engine.addComponent(ComponentKind::Sine, sine) == 0);
    REQUIRE(engine.addComponent(ComponentKind::RectPulse, rect) == 1);
    REQUIRE(engine.addComponent(ComponentKind::Chirp, {}, false) == 2);

    Chunk chunk = engine.generateChunk();
    REQUIRE(chunk.samples.size() == 128);
    REQUIRE(chunk.startTime == 0.0);
    REQUIRE(chunk.sampleRate == 1000.0);

    SignalComponent a(ComponentKind::Sine, sine, true);
    SignalComponent b(ComponentKind::RectPulse, rect, true);
    auto xa = a.generate(0.0, 128, 1000.0);
    auto xb = b.generate(0.0, 128, 1000.0);
    for (size_t i = 0; i < 128; ++i) {
        REQUIRE(chunk.samples[i] == Approx(xa[i] + xb[i]).margin(1e-6));
    }
}

TEST_CASE("SignalEngine output matches the closed-form sum of its sines", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 256);
    engine.addComponent(ComponentKind::Sine, {{"frequency", 6.0}, {"amplitude", 1.0}, {"smooth_ms", 0}});
    engine.addComponent(ComponentKind::Sine, {{"frequency", 30.0}, {"amplitude", 0.4}, {"smooth_ms", 0}});
    engine.addComponent(ComponentKind::Noise, {{"sigma", 1.0}}, false);

    const double twoPi = 6.283185307179586;
    size_t sampleIndex = 0;
    for (int c = 0; c < 3; ++c) {
        Chunk chunk = engine.generateChunk();
        REQUIRE(chunk.samples.size() == 256);
        for (float v : chunk.samples) {
            const double t = static_cast<double>(sampleIndex++) / 1000.0;
            const double expected = std::sin(twoPi * 6.0 * t) + 0.4 * std::sin(twoPi * 30.0 * t);
            REQUIRE(v == Approx(expected).margin(1e-5));
        }
    }
}

TEST_CASE("SignalEngine advances the clock per chunk", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 2000.0, 256);
    engine.addComponent(ComponentKind::Sine, {{"smooth_ms", 0}});

    Chunk first = engine.generateChunk();
    Chunk second = engine.generateChunk();
    REQUIRE(clock.sampleIndex() == 512);
    REQUIRE(first.startTime == 0.0);
    REQUIRE(second.startTime == Approx(256.0 / 2000.0));

    SECTION("reset rewinds time") {
        engine.reset();
        REQUIRE(clock.sampleIndex() == 0);
        REQUIRE(engine.generateChunk().startTime == 0.0);
    }
}

TEST_CASE("SignalEngine with no components emits silence", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 64);
    Chunk c = engine.generateChunk();
    REQUIRE(c.samples.size() == 64);
    REQUIRE(std::all_of(c.samples.begin(), c.samples.end(), [](float v) { return v == 0.0f; }));
}

TEST_CASE("SignalEngine clips symmetrically", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 500);
    engine.addComponent(ComponentKind::Sine, {{"amplitude", 2.0}, {"frequency", 10.0}, {"smooth_ms", 0}});
    engine.setGlobalParams(std::nullopt, std::nullopt, 0.5);
    REQUIRE(engine.amplitudeClip() == 0.5);

    Chunk c = engine.generateChunk();
    auto [lo, hi] = std::minmax_element(c.samples.begin(), c.samples.end());
    REQUIRE(*hi == Approx(0.5));
    REQUIRE(*lo == Approx(-0.5));
}

TEST_CASE("SignalEngine pause produces empty chunks without advancing time", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 100);
    engine.addComponent(ComponentKind::Sine);

    engine.pause();
    REQUIRE(engine.isPaused());
    Chunk c = engine.generateChunk();
    REQUIRE(c.samples.empty());
    REQUIRE(clock.sampleIndex() == 0);

    engine.play();
    REQUIRE(engine.generateChunk().samples.size() == 100);
    REQUIRE(clock.sampleIndex() == 100);
}

TEST_CASE("SignalEngine global parameter updates", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 100);

    SECTION("chunk length is clamped") {
        engine.setGlobalParams(std::nullopt, 0);
        REQUIRE(engine.getGlobalParams().second == 1);
        engine.setGlobalParams(std::nullopt, kMaxChunkSamples * 2);
        REQUIRE(engine.getGlobalParams().second == kMaxChunkSamples);
    }

    SECTION("non-positive sample rate is ignored") {
        engine.setGlobalParams(-5.0, std::nullopt);
        REQUIRE(engine.getGlobalParams().first == 1000.0);
        engine.setGlobalParams(4000.0, 32);
        REQUIRE(engine.getGlobalParams() == std::make_pair(4000.0, 32));
        REQUIRE(engine.generateChunk().samples.size() == 32);
    }
}

TEST_CASE("SignalEngine component edits", "[engine]") {
    LogicalClock clock;
    SignalEngine engine(clock, 1000.0, 64);
    engine.addComponent(ComponentKind::Noise, {{"seed", 7}});
    engine.addComponent(ComponentKind::Sine, {{"frequency", 12.0}});

    SECTION("unknown kind is rejected") {
        REQUIRE(engine.addComponent("sawtooth") == -1);
        REQUIRE(engine.numComponents() == 2);
    }

    SECTION("out-of-range indices are ignored") {
        engine.removeComponent(5);
        engine.removeComponent(-1);
        engine.setComponentEnabled(9, false);
        engine.updateComponentParams(2, {{"amplitude", 3.0}});
        REQUIRE(engine.numComponents() == 2);
    }

    SECTION("remove shifts later components down") {
        engine.removeComponent(0);
        auto snap = engine.snapshotComponents();
        REQUIRE(snap.size() == 1);
        REQUIRE(snap[0].kind == "sine");
    }

    SECTION("enable flag and params show up in the snapshot") {
        engine.setComponentEnabled(0, false);
        engine.updateComponentParams(1, {{"frequency", 33.0}});
        auto snap = engine.snapshotComponents();
        REQUIRE_FALSE(snap[0].enabled);
        REQUIRE(paramAsDouble(snap[1].params, "frequency", 0.0) == Approx(33.0));
        REQUIRE(paramAsDouble(snap[1].params, "amplitude", 0.0) == Approx(1.0));
    }
}

TEST_CASE("SignalEngine accepts edits while generating", "[engine][threading]") {
    LogicalClock clock;
    SignalEngine engine(clock, 2000.0, 512);
    engine.addComponent(ComponentKind::Sine, {{"frequency", 5.0}, {"smooth_ms", 50}});
    engine.addComponent(ComponentKind::Chirp);

    std::atomic<bool> stop{false};
    std::atomic<int> chunks{0};
    std::thread generator([&] {
        while (!stop.load()) {
            engine.generateChunk();
            chunks.fetch_add(1);
        }
    });

    for (int i = 0; i < 200; ++i) {
        engine.updateComponentParams(0, {{"frequency", 5.0 + i}});
        engine.setComponentEnabled(1, i % 2 == 0);
        int added = engine.addComponent(ComponentKind::GaussPulse);
        engine.snapshotComponents();
        engine.removeComponent(added);
    }
    while (chunks.load() < 5) std::this_thread::yield();
    stop.store(true);
    generator.join();

    auto snap = engine.snapshotComponents();
    REQUIRE(snap.size() == 2);
    REQUIRE(paramAsDouble(snap[0].params, "frequency", 0.0) == Approx(204.0));
    REQUIRE_FALSE(snap[1].enabled);
}

TEST_CASE("SignalEngine snapshot and replace", "[engine]") {
    LogicalClock clock;
    SignalEngine source(clock, 1000.0, 64);
    source.addComponent(ComponentKind::Sine, {{"frequency", 21.0}, {"smooth_ms", 0}});
    source.addComponent(ComponentKind::GaussPulse, {{"center_time_sec", 0.02}}, false);
    auto snap = source.snapshotComponents();

    LogicalClock otherClock;
    SignalEngine copy(otherClock, 1000.0, 64);
    copy.addComponent(ComponentKind::Chirp);

    SECTION("round trip reproduces the signal") {
        REQUIRE(copy.replaceComponents(snap) == 2);
        REQUIRE(copy.numComponents() == 2);
        Chunk a = source.generateChunk();
        Chunk b = copy.generateChunk();
        REQUIRE(a.samples == b.samples);
    }

    SECTION("unknown kinds are skipped") {
        snap.push_back({"triangle", "", true, {}});
        REQUIRE(copy.replaceComponents(snap) == 2);
        auto after = copy.snapshotComponents();
        REQUIRE(after.size() == 2);
        REQUIRE(after[0].kind == "sine");
        REQUIRE(after[1].kind == "gauss_pulse");
        REQUIRE_FALSE(after[1].enabled);
    }
}

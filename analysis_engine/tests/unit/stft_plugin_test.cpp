// =============================================================================
// STFT Spectrogram Module Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <cmath>
#include <string>
#include <vector>

#include "PluginRegistry.hpp"

static constexpr double kPi = 3.14159265358979323846;

TEST_CASE("STFT module places a tone in the right bin", "[plugins][stft]") {
    std::string error;
    auto plugin = PluginRegistry::loadModule(WAVELETSCOPE_STFT_PLUGIN_PATH, error);
    REQUIRE(plugin.has_value());

    const double fs = 1000.0;
    std::vector<float> x(2048);
    for (size_t i = 0; i < x.size(); ++i) {
        x[i] = static_cast<float>(std::sin(2.0 * kPi * 125.0 * i / fs));
    }

    ParamMap params = {{"fft_size", 256}, {"hop", 128}};
    TransformResult r = plugin->capability->transform(x, fs, params);

    REQUIRE(r.rows == 129);
    REQUIRE(r.cols == 1 + (2048 - 256) / 128);
    REQUIRE(r.yLabel == "Hz");
    REQUIRE(r.yAxis.back() == Approx(500.0));
    REQUIRE(r.xAxis.front() == Approx(128.0 / fs));

    // 125 Hz at 1000/256 Hz per bin is exactly bin 32
    const int col = r.cols / 2;
    int best = 0;
    for (int row = 1; row < r.rows; ++row) {
        if (r.at(row, col) > r.at(best, col)) best = row;
    }
    REQUIRE(best == 32);
    REQUIRE(r.yAxis[best] == Approx(125.0));

    SECTION("fft_size larger than the window is clamped") {
        TransformResult small = plugin->capability->transform(
            std::vector<float>(100, 0.0f), fs, {{"fft_size", 4096}});
        REQUIRE(small.cols == 1);
        REQUIRE(small.rows == 51);
    }

    SECTION("short windows give the degenerate result") {
        TransformResult d = plugin->capability->transform(std::vector<float>(4, 0.0f), fs, params);
        REQUIRE(d.rows == 1);
    }
}

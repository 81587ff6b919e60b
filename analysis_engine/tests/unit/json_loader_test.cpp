// =============================================================================
// JSONLoader Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include "JSONLoader.hpp"

TEST_CASE("JSONLoader parses a saved configuration", "[json]") {
    const std::string text = R"({
        "globals": {
            "sample_rate": 4000,
            "chunk_length": 128,
            "window_seconds": 2.5,
            "frame_rate": 10,
            "amplitude_clip": 0.9
        },
        "transform": {
            "plugin_id": "builtin:dwt_wpt",
            "params": { "mode": "WPT", "wpt_level": 3, "show_approx": true }
        },
        "components": [
            { "kind": "sine", "name": "carrier", "params": { "frequency": 50.0 } },
            { "kind": "noise", "enabled": false, "params": { "sigma": 0.1, "seed": 7 } }
        ]
    })";

    const PresetData d = JSONLoader::parsePreset(text);
    REQUIRE(d.globals.sampleRate == 4000.0);
    REQUIRE(d.globals.chunkLength == 128);
    REQUIRE(d.globals.windowSeconds == 2.5);
    REQUIRE(d.globals.frameRate == 10.0);
    REQUIRE(d.globals.amplitudeClip == Approx(0.9));
    REQUIRE(d.pluginId == "builtin:dwt_wpt");
    REQUIRE(paramAsString(d.transformParams, "mode", "") == "WPT");
    REQUIRE(paramAsInt(d.transformParams, "wpt_level", 0) == 3);
    REQUIRE(paramAsBool(d.transformParams, "show_approx", false));

    REQUIRE(d.components.size() == 2);
    REQUIRE(d.components[0].kind == "sine");
    REQUIRE(d.components[0].name == "carrier");
    REQUIRE(d.components[0].enabled);
    REQUIRE(paramAsDouble(d.components[0].params, "frequency", 0.0) == 50.0);
    REQUIRE(d.components[1].kind == "noise");
    REQUIRE_FALSE(d.components[1].enabled);
    REQUIRE(paramAsInt(d.components[1].params, "seed", 0) == 7);
}

TEST_CASE("JSONLoader accepts older key names", "[json]") {
    const std::string text = R"({
        "globals": { "fs": 1000, "chunk_size": 64, "view_window_sec": 3, "scalogram_fps": 5 },
        "wavelet": {
            "plugin_id": "builtin:cwt_morlet",
            "params": { "wavelet": "cmor1.5-1.0", "use_legacy": true, "n_scales": 64,
                        "scales_min": 1, "scales_max": 128 }
        },
        "components": [ { "type": "chirp", "params": {} } ]
    })";

    const PresetData d = JSONLoader::parsePreset(text);
    REQUIRE(d.globals.sampleRate == 1000.0);
    REQUIRE(d.globals.chunkLength == 64);
    REQUIRE(d.globals.windowSeconds == 3.0);
    REQUIRE(d.globals.frameRate == 5.0);

    REQUIRE(d.transformParams.size() == 1);
    REQUIRE(paramAsString(d.transformParams, "wavelet", "") == "cmor1.5-1.0");
    REQUIRE(d.transformParams.count("use_legacy") == 0);
    REQUIRE(d.transformParams.count("n_scales") == 0);

    REQUIRE(d.components.size() == 1);
    REQUIRE(d.components[0].kind == "chirp");
}

TEST_CASE("JSONLoader tolerates partial and malformed sections", "[json]") {
    SECTION("empty object gives defaults") {
        const PresetData d = JSONLoader::parsePreset("{}");
        REQUIRE(d.globals.sampleRate == 2000.0);
        REQUIRE(d.globals.chunkLength == 256);
        REQUIRE(d.pluginId == "builtin:cwt_morlet");
        REQUIRE(d.components.empty());
    }

    SECTION("bad values fall back per field") {
        const PresetData d = JSONLoader::parsePreset(
            R"({ "globals": { "sample_rate": -5, "chunk_length": "big", "amplitude_clip": -1 } })");
        REQUIRE(d.globals.sampleRate == 2000.0);
        REQUIRE(d.globals.chunkLength == 256);
        REQUIRE(d.globals.amplitudeClip == 0.0);
    }

    SECTION("numbers too large for an int fall back") {
        const PresetData d = JSONLoader::parsePreset(R"({
            "globals": { "chunk_length": 1e12 },
            "transform": { "params": { "maxlevel": 3000000000, "wpt_level": -1e15, "n_scales": 64 } }
        })");
        REQUIRE(d.globals.chunkLength == 256);
        REQUIRE(paramAsInt(d.transformParams, "maxlevel", 5) == 5);
        REQUIRE(paramAsInt(d.transformParams, "wpt_level", 3) == 3);
        REQUIRE(paramAsInt(d.transformParams, "n_scales", 0) == 64);
        REQUIRE(paramAsDouble(d.transformParams, "maxlevel", 0.0) == 3e9);
    }

    SECTION("components without a kind are skipped") {
        const PresetData d = JSONLoader::parsePreset(
            R"({ "components": [ 42, { "name": "anon" }, { "kind": "sine" } ] })");
        REQUIRE(d.components.size() == 1);
        REQUIRE(d.components[0].kind == "sine");
    }

    SECTION("non-array components are ignored") {
        const PresetData d = JSONLoader::parsePreset(R"({ "components": { "kind": "sine" } })");
        REQUIRE(d.components.empty());
    }
}

TEST_CASE("JSONLoader rejects unreadable input", "[json]") {
    REQUIRE_THROWS_AS(JSONLoader::parsePreset("{ not json"), std::runtime_error);
    REQUIRE_THROWS_AS(JSONLoader::parsePreset("[1, 2, 3]"), std::runtime_error);
    REQUIRE_THROWS_AS(JSONLoader::loadPreset("/nonexistent/dir/preset.json"), std::runtime_error);
}

TEST_CASE("JSONLoader saves what it loads", "[json]") {
    PresetData d = JSONLoader::defaultPreset();
    d.globals.sampleRate = 8000.0;
    d.pluginId = "plugin:stft";
    d.transformParams = {{"fft_size", 512}, {"normalize", std::string("max")}};
    d.components[1].name = "slow";
    d.components[2].enabled = false;

    const auto path = std::filesystem::temp_directory_path() / "waveletscope_preset_test.json";
    JSONLoader::savePreset(path.string(), d);
    const PresetData back = JSONLoader::loadPreset(path.string());
    std::filesystem::remove(path);

    REQUIRE(back.globals.sampleRate == 8000.0);
    REQUIRE(back.pluginId == "plugin:stft");
    REQUIRE(paramAsInt(back.transformParams, "fft_size", 0) == 512);
    REQUIRE(paramAsString(back.transformParams, "normalize", "") == "max");
    REQUIRE(back.components.size() == 3);
    REQUIRE(back.components[1].name == "slow");
    REQUIRE_FALSE(back.components[2].enabled);
    REQUIRE(paramAsDouble(back.components[2].params, "frequency", 0.0) == 30.0);
}

TEST_CASE("JSONLoader default configuration", "[json]") {
    const PresetData d = JSONLoader::defaultPreset();
    REQUIRE(d.components.size() == 3);
    REQUIRE(d.components[0].kind == "noise");
    REQUIRE(d.components[1].kind == "sine");
    REQUIRE(d.components[2].kind == "sine");
    REQUIRE(d.pluginId == "builtin:cwt_morlet");
}

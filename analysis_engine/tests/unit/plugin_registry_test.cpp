// =============================================================================
// PluginRegistry Tests
// =============================================================================
// External-module cases copy real build outputs into a scratch directory:
//   WAVELETSCOPE_STFT_PLUGIN_PATH    - the STFT spectrogram module
//   WAVELETSCOPE_BROKEN_PLUGIN_PATH  - a module with no entry points
//   WAVELETSCOPE_THROWING_CTOR_PLUGIN_PATH      - plugin constructor throws
//   WAVELETSCOPE_THROWING_TRANSFORM_PLUGIN_PATH - loads, transform throws int
// =============================================================================

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "PluginRegistry.hpp"

namespace fs = std::filesystem;

class PluginDirFixture {
public:
    PluginDirFixture() {
        dir_ = fs::temp_directory_path() / "waveletscope_plugin_test";
        std::error_code ec;
        fs::remove_all(dir_, ec);
        fs::create_directories(dir_);
    }

    ~PluginDirFixture() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir() const { return dir_; }

    void copyModule(const std::string& from, const std::string& name) {
        fs::copy_file(from, dir_ / name, fs::copy_options::overwrite_existing);
    }

    void writeText(const std::string& name, const std::string& text) {
        std::ofstream f(dir_ / name);
        f << text;
    }

private:
    fs::path dir_;
};

TEST_CASE("Built-in transforms are always registered", "[registry]") {
    PluginRegistry registry("/nonexistent/waveletscope/plugins");
    REQUIRE(registry.reloadAll() == 2);

    auto cwt = registry.get("builtin:cwt_morlet");
    REQUIRE(cwt.has_value());
    REQUIRE(cwt->origin == "builtin");
    REQUIRE(cwt->metadata.kind == "CWT");

    auto dwt = registry.get("builtin:dwt_wpt");
    REQUIRE(dwt.has_value());
    REQUIRE_FALSE(dwt->capability->describeParameters().empty());

    REQUIRE_FALSE(registry.get("plugin:stft").has_value());
    REQUIRE(registry.failures().empty());
}

TEST_CASE_METHOD(PluginDirFixture, "External modules load alongside bad candidates", "[registry][plugins]") {
    copyModule(WAVELETSCOPE_STFT_PLUGIN_PATH, "stft_spectrogram.so");
    copyModule(WAVELETSCOPE_STFT_PLUGIN_PATH, "_disabled.so");
    copyModule(WAVELETSCOPE_BROKEN_PLUGIN_PATH, "broken.so");
    writeText("garbage.so", "this is not a shared library");
    writeText("notes.txt", "ignored");

    PluginRegistry registry(dir().string());
    REQUIRE(registry.reloadAll() == 3);

    SECTION("discovery id and declared id both resolve") {
        auto byStem = registry.get("plugin:stft_spectrogram");
        auto byDeclared = registry.get("plugin:stft");
        REQUIRE(byStem.has_value());
        REQUIRE(byDeclared.has_value());
        REQUIRE(byStem->capability == byDeclared->capability);
        REQUIRE(byStem->metadata.kind == "STFT");
    }

    SECTION("list holds each plugin once") {
        auto all = registry.list();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].id == "builtin:cwt_morlet");
        REQUIRE(all[1].id == "builtin:dwt_wpt");
        REQUIRE(all[2].id == "plugin:stft_spectrogram");
    }

    SECTION("catalog describes each plugin with its aliases and schema") {
        const nlohmann::json catalog = registry.catalogJson();
        REQUIRE(catalog.size() == 3);

        const auto& dwt = catalog[1];
        REQUIRE(dwt["id"] == "builtin:dwt_wpt");
        REQUIRE(dwt["origin"] == "builtin");
        REQUIRE(dwt["aliases"].empty());
        bool sawMaxlevel = false;
        for (const auto& p : dwt["params"]) {
            if (p["key"] == "maxlevel") {
                sawMaxlevel = true;
                REQUIRE(p["type"] == "int");
                REQUIRE(p["default"] == 5);
                REQUIRE(p["max"] == 14.0);
                REQUIRE_FALSE(p["description"].get<std::string>().empty());
            }
        }
        REQUIRE(sawMaxlevel);

        const auto& stft = catalog[2];
        REQUIRE(stft["id"] == "plugin:stft_spectrogram");
        REQUIRE(stft["kind"] == "STFT");
        REQUIRE(stft["aliases"] == nlohmann::json::array({"plugin:stft"}));
        REQUIRE_FALSE(stft["params"].empty());
    }

    SECTION("rejected candidates are recorded") {
        auto failures = registry.failures();
        REQUIRE(failures.size() == 2);
        bool sawBroken = false;
        bool sawGarbage = false;
        for (const auto& f : failures) {
            if (f.path.find("broken.so") != std::string::npos) {
                sawBroken = true;
                REQUIRE(f.reason == "missing plugin entry points");
            }
            if (f.path.find("garbage.so") != std::string::npos) sawGarbage = true;
        }
        REQUIRE(sawBroken);
        REQUIRE(sawGarbage);
    }

    SECTION("a plugin handed out survives a reload") {
        auto held = registry.get("plugin:stft");
        REQUIRE(held.has_value());
        fs::remove(dir() / "stft_spectrogram.so");
        REQUIRE(registry.reloadAll() == 2);
        REQUIRE_FALSE(registry.get("plugin:stft").has_value());

        std::vector<float> x(512, 0.5f);
        TransformResult r = held->capability->transform(x, 1000.0, {});
        REQUIRE(r.rows > 1);
    }
}

TEST_CASE_METHOD(PluginDirFixture, "A module that throws while loading costs only itself", "[registry][plugins]") {
    copyModule(WAVELETSCOPE_THROWING_CTOR_PLUGIN_PATH, "a_throwing.so");
    copyModule(WAVELETSCOPE_STFT_PLUGIN_PATH, "b_stft.so");
    copyModule(WAVELETSCOPE_THROWING_TRANSFORM_PLUGIN_PATH, "c_throws_int.so");

    PluginRegistry registry(dir().string());
    size_t loaded = 0;
    REQUIRE_NOTHROW(loaded = registry.reloadAll());
    REQUIRE(loaded == 4);

    REQUIRE(registry.get("plugin:b_stft").has_value());
    REQUIRE(registry.get("plugin:stft").has_value());
    REQUIRE(registry.get("plugin:c_throws_int").has_value());
    REQUIRE_FALSE(registry.get("plugin:a_throwing").has_value());

    auto failures = registry.failures();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].path.find("a_throwing.so") != std::string::npos);
    REQUIRE(failures[0].reason.find("constructor failed") != std::string::npos);
}

TEST_CASE_METHOD(PluginDirFixture, "Later modules take over claimed ids", "[registry][plugins]") {
    SECTION("a declared id already used as an alias moves to the later module") {
        copyModule(WAVELETSCOPE_STFT_PLUGIN_PATH, "stft_one.so");
        copyModule(WAVELETSCOPE_STFT_PLUGIN_PATH, "stft_two.so");

        PluginRegistry registry(dir().string());
        REQUIRE(registry.reloadAll() == 4);

        auto declared = registry.get("plugin:stft");
        REQUIRE(declared.has_value());
        REQUIRE(declared->origin.find("stft_two.so") != std::string::npos);

        auto first = registry.get("plugin:stft_one");
        REQUIRE(first.has_value());
        REQUIRE(first->capability != declared->capability);
    }

    SECTION("a replaced plugin takes its alias with it") {
        // Same stem twice; "spec.dylib" sorts first and is replaced by "spec.so".
        copyModule(WAVELETSCOPE_STFT_PLUGIN_PATH, "spec.dylib");
        copyModule(WAVELETSCOPE_THROWING_TRANSFORM_PLUGIN_PATH, "spec.so");

        PluginRegistry registry(dir().string());
        REQUIRE(registry.reloadAll() == 3);

        auto spec = registry.get("plugin:spec");
        REQUIRE(spec.has_value());
        REQUIRE(spec->metadata.id == "test:throws_int");
        REQUIRE(registry.get("test:throws_int").has_value());
        REQUIRE_FALSE(registry.get("plugin:stft").has_value());
        REQUIRE(registry.ids().size() == 4);
    }
}

TEST_CASE("loadModule reports why a module is rejected", "[registry][plugins]") {
    std::string error;
    REQUIRE_FALSE(PluginRegistry::loadModule(WAVELETSCOPE_BROKEN_PLUGIN_PATH, error).has_value());
    REQUIRE(error == "missing plugin entry points");

    error.clear();
    REQUIRE_FALSE(PluginRegistry::loadModule("/nonexistent/module.so", error).has_value());
    REQUIRE_FALSE(error.empty());

    error.clear();
    REQUIRE_FALSE(PluginRegistry::loadModule(WAVELETSCOPE_THROWING_CTOR_PLUGIN_PATH, error).has_value());
    REQUIRE(error.find("constructor failed") != std::string::npos);

    error.clear();
    auto ok = PluginRegistry::loadModule(WAVELETSCOPE_STFT_PLUGIN_PATH, error);
    REQUIRE(ok.has_value());
    REQUIRE(error.empty());
    REQUIRE(ok->metadata.id == "plugin:stft");
}

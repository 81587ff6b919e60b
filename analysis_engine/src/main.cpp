// waveletScope offline analyser
//
// Same signal model and transforms as the real-time engine, without the
// threads: load a saved configuration, synthesise --duration seconds in
// chunk-sized steps, run the selected transform once on the last analysis
// window and write the image as CSV. Useful for batch runs and for checking
// a preset before taking it live.
//
// the analysed window is exactly what the real-time worker would see at
// that moment: the last window_seconds * sample_rate samples of history,
// clamped to [16, 2^22]

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

#include "JSONLoader.hpp"
#include "PluginRegistry.hpp"
#include "WavUtils.hpp"

#include "LogicalClock.hpp"
#include "RingBuffer.hpp"
#include "SignalEngine.hpp"

static constexpr const char* kDefaultPluginId = "builtin:cwt_morlet";

void printUsage() {
    std::cout << "waveletScope offline analyser\n\n";
    std::cout << "Usage:\n"
              << "  waveletScope_offline \\\n"
              << "    --out-image image.csv \\\n"
              << "    [OPTIONS]\n\n";
    std::cout << "Required:\n"
              << "  --out-image FILE    Transform image CSV (y\\x header, one row per y bin)\n\n";
    std::cout << "Options:\n"
              << "  --preset FILE       Saved configuration JSON (default: built-in components)\n"
              << "  --duration SECONDS  Seconds of signal to synthesise (default: window length)\n"
              << "  --plugin ID         Override the preset's transform plugin\n"
              << "  --plugins-dir DIR   Directory scanned for plugin modules (default: plugins)\n"
              << "  --out-wav FILE      Also write the analysed window as mono float WAV\n"
              << "  --out-csv FILE      Also write the analysed window as t_sec,x CSV\n"
              << "  --list-plugins      Print discovered plugin ids and exit\n"
              << "  --help              Show this help message\n";
}

int main(int argc, char *argv[]) {

    std::string presetPath, outImage, outWav, outCsv, pluginOverride;
    std::string pluginsDir = "plugins";
    double duration = 0.0;
    bool listOnly = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool hasValue = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--list-plugins") {
            listOnly = true;
        } else if (!hasValue) {
            std::cerr << "Error: " << arg << " expects a value\n";
            printUsage();
            return 1;
        } else if (arg == "--preset") {
            presetPath = argv[++i];
        } else if (arg == "--out-image") {
            outImage = argv[++i];
        } else if (arg == "--out-wav") {
            outWav = argv[++i];
        } else if (arg == "--out-csv") {
            outCsv = argv[++i];
        } else if (arg == "--plugin") {
            pluginOverride = argv[++i];
        } else if (arg == "--plugins-dir") {
            pluginsDir = argv[++i];
        } else if (arg == "--duration") {
            try {
                duration = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --duration expects a number\n";
                return 1;
            }
        } else {
            std::cerr << "Warning: ignoring unknown option '" << arg << "'\n";
        }
    }

    PluginRegistry registry(pluginsDir);
    registry.reloadAll();

    if (listOnly) {
        for (const auto& p : registry.list()) {
            std::cout << p.id << "\t" << p.metadata.name << "\t" << p.origin << "\n";
        }
        return 0;
    }

    if (outImage.empty()) {
        std::cerr << "Error: --out-image is required\n";
        printUsage();
        return 1;
    }

    PresetData preset = JSONLoader::defaultPreset();
    if (!presetPath.empty()) {
        try {
            preset = JSONLoader::loadPreset(presetPath);
        } catch (const std::exception& e) {
            std::cerr << "FATAL: " << e.what() << "\n";
            return 1;
        }
    }
    if (!pluginOverride.empty() && pluginOverride != preset.pluginId) {
        preset.pluginId = pluginOverride;
        preset.transformParams.clear();
    }

    auto plugin = registry.get(preset.pluginId);
    if (!plugin) {
        std::cerr << "WARNING: transform plugin '" << preset.pluginId << "' not found, using "
                  << kDefaultPluginId << "\n";
        preset.pluginId = kDefaultPluginId;
        preset.transformParams.clear();
        plugin = registry.get(preset.pluginId);
    }
    if (!plugin) {
        std::cerr << "FATAL: no transform plugins available\n";
        return 1;
    }
    ParamMap params = preset.transformParams;
    backfillDefaults(params, plugin->capability->describeParameters());

    // synthesise
    const PresetGlobals& g = preset.globals;
    LogicalClock clock;
    SignalEngine engine(clock, g.sampleRate, g.chunkLength);
    engine.setGlobalParams(std::nullopt, std::nullopt, g.amplitudeClip);
    int installed = engine.replaceComponents(preset.components);
    const auto [fs, chunk] = engine.getGlobalParams();

    const size_t window = static_cast<size_t>(std::clamp(
        std::floor(g.windowSeconds * fs),
        static_cast<double>(kMinWindowSamples), static_cast<double>(kMaxWindowSamples)));
    if (duration <= 0.0) duration = static_cast<double>(window) / fs;
    const size_t total = static_cast<size_t>(std::ceil(duration * fs));

    std::cout << "Synthesising " << total << " samples at " << fs << " Hz from "
              << installed << " component(s)...\n";

    RingBuffer history(window);
    size_t produced = 0;
    while (produced < total) {
        Chunk c = engine.generateChunk();
        if (c.samples.empty()) break;
        history.append(c.samples);
        produced += c.samples.size();
    }

    const std::vector<float> x = history.getLast(window);

    std::cout << "Running " << plugin->metadata.name << " on " << x.size() << " samples...\n";
    TransformResult result;
    try {
        result = plugin->capability->transform(x, fs, params);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: transform failed: " << e.what() << "\n";
        return 1;
    }

    try {
        WavUtils::writeImageCsv(outImage, result);
        if (!outWav.empty()) WavUtils::writeMonoWav(outWav, x, fs);
        if (!outCsv.empty()) WavUtils::writeSignalCsv(outCsv, x, fs);
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Done. " << result.rows << " x " << result.cols << " image";
    if (chunk > 0) std::cout << " (" << (produced + static_cast<size_t>(chunk) - 1) / static_cast<size_t>(chunk) << " chunks)";
    std::cout << "\n";
    return 0;
}

// main.cpp - Real-Time Signal Analysis Engine entry point
//
// This is the CLI entry point for the real-time engine. It:
//   1. Parses command-line arguments (rates, window, plugin, preset, ...)
//   2. Creates the RealtimeConfig and EngineState
//   3. Builds the RealtimeSession (clock, engine, history, registry, loops)
//   4. Discovers transform plugins (built-ins + plugin directory)
//   5. Applies the saved configuration, or the default components
//   6. Starts the generator and analysis threads, then presses "start"
//   7. Runs a monitoring loop until interrupted (Ctrl+C or --duration)
//      draining the chunk, result and status channels
//   8. Shuts down cleanly (analysis worker -> generator) and writes any
//      requested exports of the last analysis window
//
// Usage:
//   ./waveletScope_realtime_engine \
//       [--preset ../presets/default.json] \
//       [--samplerate 2000] [--chunk 256] \
//       [--window 4] [--fps 8] [--clip 0] \
//       [--plugin builtin:cwt_morlet] [--plugins-dir plugins] \
//       [--duration 10] [--export-wav out.wav] [--export-csv out.csv]

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "RealtimeTypes.hpp"
#include "RealtimeSession.hpp"
#include "JSONLoader.hpp"     // PresetData, JSONLoader::loadPreset()
#include "WavUtils.hpp"       // window export

// ─────────────────────────────────────────────────────────────────────────────
// Signal handling for clean shutdown on Ctrl+C
// ─────────────────────────────────────────────────────────────────────────────

static RealtimeConfig* g_config = nullptr;

void signalHandler(int signum) {
    (void)signum;
    if (g_config) {
        g_config->shouldExit.store(true);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Argument parsing helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Look up a string argument by name. Returns empty string if not found.
static std::string getArgString(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) {
            return std::string(argv[i + 1]);
        }
    }
    return "";
}

/// Look up an integer argument by name. Returns defaultVal if absent or
/// unparsable (with a warning).
static int getArgInt(int argc, char* argv[], const std::string& flag, int defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "[Main] WARNING: " << flag << " expects an integer, got '"
                  << val << "'" << std::endl;
        return defaultVal;
    }
}

/// Look up a floating-point argument by name. Returns defaultVal if absent
/// or unparsable (with a warning).
static double getArgFloat(int argc, char* argv[], const std::string& flag, double defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "[Main] WARNING: " << flag << " expects a number, got '"
                  << val << "'" << std::endl;
        return defaultVal;
    }
}

/// Check if a flag is present (no value).
static bool hasArg(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Usage / help
// ─────────────────────────────────────────────────────────────────────────────

static void printUsage(const char* progName) {
    std::cout << "\nwaveletScope Real-Time Signal Analysis Engine\n"
              << "─────────────────────────────────────────────\n"
              << "Usage: " << progName << " [options]\n\n"
              << "Configuration:\n"
              << "  --preset <path>       Saved configuration JSON (globals, transform,\n"
              << "                        components). Flags below override it.\n\n"
              << "Generation:\n"
              << "  --samplerate <Hz>     Sample rate (default: 2000)\n"
              << "  --chunk <int>         Samples per generated chunk (default: 256)\n"
              << "  --clip <float>        Symmetric amplitude clip, 0 = off (default: 0)\n\n"
              << "Analysis:\n"
              << "  --window <sec>        Analysis window length (default: 4)\n"
              << "  --fps <float>         Transform results per second (default: 8)\n"
              << "  --plugin <id>         Transform plugin id (default: builtin:cwt_morlet)\n"
              << "  --plugins-dir <path>  Directory scanned for plugin modules\n"
              << "                        (default: plugins)\n"
              << "  --list-plugins        Print discovered plugins and exit\n"
              << "  --list-plugins-json   Print plugins and parameter schemas as JSON\n"
              << "                        and exit\n\n"
              << "Run control / export:\n"
              << "  --duration <sec>      Stop after this many seconds (default: until Ctrl+C)\n"
              << "  --export-wav <path>   Write the last analysis window as mono float WAV\n"
              << "  --export-csv <path>   Write the last analysis window as t_sec,x CSV\n"
              << "  --help                Show this message\n"
              << std::endl;
}

static void printPlugins(const PluginRegistry& registry) {
    std::cout << "[Main] Available transform plugins:" << std::endl;
    for (const auto& p : registry.list()) {
        std::cout << "  " << std::left << std::setw(28) << p.id
                  << p.metadata.name << "  [" << p.metadata.kind
                  << ", v" << p.metadata.version << "]" << std::endl;
        std::cout << "      origin: " << p.origin << std::endl;
        for (const auto& spec : p.capability->describeParameters()) {
            std::cout << "      - " << spec.key << " (" << paramTypeName(spec.type)
                      << ", default " << paramValueToString(spec.defaultValue) << ")";
            if (!spec.effectiveDescription().empty()) {
                std::cout << "  " << spec.effectiveDescription();
            }
            std::cout << std::endl;
        }
    }
    for (const auto& f : registry.failures()) {
        std::cout << "  (rejected) " << f.path << ": " << f.reason << std::endl;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {

    // ── Help flag ────────────────────────────────────────────────────────
    if (hasArg(argc, argv, "--help") || hasArg(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    std::cout << "\n╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║  waveletScope Real-Time Signal Analysis Engine           ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝\n" << std::endl;

    // ── Saved configuration (optional) ───────────────────────────────────

    RealtimeConfig config;
    EngineState    state;

    config.presetPath = getArgString(argc, argv, "--preset");
    PresetData preset = JSONLoader::defaultPreset();
    if (!config.presetPath.empty()) {
        try {
            preset = JSONLoader::loadPreset(config.presetPath);
        } catch (const std::exception& e) {
            std::cerr << "[Main] FATAL: Failed to load preset: " << e.what() << std::endl;
            return 1;
        }
    }

    // ── Parse arguments (flags override the preset) ──────────────────────

    config.sampleRate      = getArgFloat(argc, argv, "--samplerate", preset.globals.sampleRate);
    config.chunkLength     = getArgInt(argc, argv, "--chunk", preset.globals.chunkLength);
    config.amplitudeClip   = getArgFloat(argc, argv, "--clip", preset.globals.amplitudeClip);
    config.windowSeconds   = getArgFloat(argc, argv, "--window", preset.globals.windowSeconds);
    config.frameRate       = getArgFloat(argc, argv, "--fps", preset.globals.frameRate);
    config.durationSeconds = getArgFloat(argc, argv, "--duration", 0.0);
    config.exportWavPath   = getArgString(argc, argv, "--export-wav");
    config.exportCsvPath   = getArgString(argc, argv, "--export-csv");

    std::string pluginArg = getArgString(argc, argv, "--plugin");
    config.pluginId = pluginArg.empty() ? preset.pluginId : pluginArg;
    std::string dirArg = getArgString(argc, argv, "--plugins-dir");
    if (!dirArg.empty()) config.pluginsDir = dirArg;

    // ── Validate ─────────────────────────────────────────────────────────

    if (config.sampleRate <= 0.0) {
        std::cerr << "[Main] ERROR: --samplerate must be positive." << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    if (config.chunkLength < 1 || config.chunkLength > kMaxChunkSamples) {
        int clamped = std::clamp(config.chunkLength, 1, kMaxChunkSamples);
        std::cerr << "[Main] WARNING: --chunk " << config.chunkLength << " outside [1, "
                  << kMaxChunkSamples << "], using " << clamped << std::endl;
        config.chunkLength = clamped;
    }
    if (config.windowSeconds <= 0.0 || config.frameRate <= 0.0) {
        std::cerr << "[Main] ERROR: --window and --fps must be positive." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    // ── Build the session and discover plugins ───────────────────────────

    RealtimeSession session(config, state);
    size_t nPlugins = session.loadPlugins();
    if (nPlugins == 0) {
        std::cerr << "[Main] FATAL: No transform plugins available." << std::endl;
        return 1;
    }

    if (hasArg(argc, argv, "--list-plugins")) {
        printPlugins(session.registry());
        return 0;
    }
    if (hasArg(argc, argv, "--list-plugins-json")) {
        std::cout << session.registry().catalogJson().dump(2) << std::endl;
        return 0;
    }

    // Overrides go into the preset so one applyPreset() installs everything.
    preset.globals.sampleRate    = config.sampleRate;
    preset.globals.chunkLength   = config.chunkLength;
    preset.globals.amplitudeClip = config.amplitudeClip;
    preset.globals.windowSeconds = config.windowSeconds;
    preset.globals.frameRate     = config.frameRate;
    if (preset.pluginId != config.pluginId) {
        preset.pluginId = config.pluginId;
        preset.transformParams.clear();
    }

    int nComponents = session.applyPreset(preset);
    const ControlSnapshot active = session.params().snapshot();

    std::cout << "[Main] Configuration:" << std::endl;
    std::cout << "  Preset:       " << (config.presetPath.empty() ? "(built-in default)" : config.presetPath) << std::endl;
    std::cout << "  Sample rate:  " << active.sampleRate << " Hz" << std::endl;
    std::cout << "  Chunk length: " << active.chunkLength << " samples" << std::endl;
    std::cout << "  Clip:         " << (config.amplitudeClip > 0.0 ? std::to_string(config.amplitudeClip) : "off") << std::endl;
    std::cout << "  Window:       " << active.windowSeconds << " s" << std::endl;
    std::cout << "  Frame rate:   " << active.frameRate << " fps" << std::endl;
    std::cout << "  Plugin:       " << active.pluginId << std::endl;
    std::cout << "  Plugins dir:  " << config.pluginsDir << " (" << nPlugins << " plugin(s))" << std::endl;
    std::cout << "  Components:   " << nComponents << std::endl;
    std::cout << "  History:      " << session.history().capacity() << " samples" << std::endl;
    std::cout << std::endl;

    // ── Register signal handler for clean Ctrl+C shutdown ────────────────
    g_config = &config;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // ── Start agents ─────────────────────────────────────────────────────

    if (!session.startThreads()) {
        std::cerr << "[Main] FATAL: Failed to start engine threads." << std::endl;
        return 1;
    }
    session.start();

    // ── Monitoring loop ──────────────────────────────────────────────────
    // Stands in for the UI: drains chunks and results, surfaces status
    // messages, prints counters.

    std::cout << "[Main] Engine running. Press Ctrl+C to stop.\n" << std::endl;

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    auto lastPrint = t0;
    TransformResult lastResult;
    Chunk chunk;
    TransformResult result;

    while (!config.shouldExit.load()) {
        while (session.chunks().tryPop(chunk)) {}
        while (session.results().tryPop(result)) lastResult = std::move(result);

        for (const auto& msg : session.status().drain()) {
            std::cout << "\n[Status] " << msg << std::endl;
        }

        auto now = clock::now();
        double elapsed = std::chrono::duration<double>(now - t0).count();
        if (config.durationSeconds > 0.0 && elapsed >= config.durationSeconds) {
            config.shouldExit.store(true);
        }

        if (now - lastPrint >= std::chrono::seconds(1)) {
            lastPrint = now;
            std::cout << "\r  Time: " << std::fixed << std::setprecision(1)
                      << session.clock().sampleIndex() / active.sampleRate << "s"
                      << "  |  Chunks: " << state.chunksGenerated.load(std::memory_order_relaxed)
                      << "  |  Results: " << state.resultsPublished.load(std::memory_order_relaxed)
                      << "  |  Dropped: " << state.resultsDropped.load(std::memory_order_relaxed)
                      << "  |  Errors: " << state.transformErrors.load(std::memory_order_relaxed)
                      << "  |  Transform: " << std::setprecision(2)
                      << state.lastTransformMs.load(std::memory_order_relaxed) << " ms"
                      << "     " << std::flush;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    std::cout << std::endl;

    // ── Clean shutdown ───────────────────────────────────────────────────

    std::cout << "\n[Main] Shutting down..." << std::endl;
    session.shutdown();

    int exitCode = 0;
    if (!config.exportWavPath.empty() || !config.exportCsvPath.empty()) {
        const std::vector<float> window = session.currentWindow();
        const double fs = session.params().snapshot().sampleRate;
        try {
            if (!config.exportWavPath.empty()) {
                WavUtils::writeMonoWav(config.exportWavPath, window, fs);
            }
            if (!config.exportCsvPath.empty()) {
                WavUtils::writeSignalCsv(config.exportCsvPath, window, fs);
            }
        } catch (const std::exception& e) {
            std::cerr << "[Main] ERROR: Export failed: " << e.what() << std::endl;
            exitCode = 1;
        }
    }

    std::cout << "[Main] Final stats:" << std::endl;
    std::cout << "  Chunks generated:  " << state.chunksGenerated.load() << std::endl;
    std::cout << "  Samples generated: " << state.samplesGenerated.load() << std::endl;
    std::cout << "  Chunks dropped:    " << state.chunksDropped.load() << std::endl;
    std::cout << "  Chunks stale:      " << state.chunksStale.load() << std::endl;
    std::cout << "  Results published: " << state.resultsPublished.load() << std::endl;
    std::cout << "  Results dropped:   " << state.resultsDropped.load() << std::endl;
    std::cout << "  Transform errors:  " << state.transformErrors.load() << std::endl;
    if (!lastResult.empty()) {
        std::cout << "  Last result:       " << lastResult.rows << " x " << lastResult.cols
                  << " (" << lastResult.yLabel << ")" << std::endl;
    }
    std::cout << "[Main] Goodbye." << std::endl;

    return exitCode;
}

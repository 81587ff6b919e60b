// RealtimeSession.hpp - Owns and wires every real-time agent
//
// One object that holds the clock, the SignalEngine, the history
// RingBuffer, SharedParams, the PluginRegistry, the status and data
// channels, and both background loops. main.cpp talks to this instead of
// to the individual agents, and tests can drive a whole engine without
// starting any thread.
//
// LIFECYCLE:
//   construct (paused, default components) -> loadPlugins() ->
//   applyPreset() -> startThreads() -> start()/pause()/resume() ... ->
//   shutdown()
//
// TRANSPORT:
// - start():  reset the logical clock, clear history, then play.
// - pause():  generator idles; the analysis worker keeps transforming the
//             frozen window.
// - resume(): play without touching clock or history.
//
// SAMPLE RATE CHANGES:
// - The ring buffer is resized to history_seconds * fs in place and its
//   contents are discarded. The buffer is tagged with fs, and a chunk the
//   generator produced at the old rate is refused when it arrives late, so
//   samples from two different rates never share one window.

#pragma once

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "RealtimeTypes.hpp"
#include "LogicalClock.hpp"
#include "RingBuffer.hpp"
#include "SignalEngine.hpp"
#include "SharedParams.hpp"
#include "SpscQueue.hpp"
#include "StatusChannel.hpp"
#include "GenerationLoop.hpp"
#include "AnalysisWorker.hpp"
#include "PluginRegistry.hpp"
#include "JSONLoader.hpp"
#include "TransformResult.hpp"

class RealtimeSession {
public:
    static constexpr const char* kDefaultPluginId = "builtin:cwt_morlet";
    static constexpr size_t kChunkQueueCapacity  = 64;
    static constexpr size_t kResultQueueCapacity = 4;

    RealtimeSession(const RealtimeConfig& config, EngineState& state)
        : mHistorySeconds(config.historySeconds > 0.0 ? config.historySeconds : 60.0),
          mEngine(mClock, config.sampleRate, config.chunkLength),
          mRing(historyCapacity(config.sampleRate)),
          mRegistry(config.pluginsDir),
          mChunks(kChunkQueueCapacity),
          mResults(kResultQueueCapacity),
          mGenerator(mEngine, mRing, mChunks, state),
          mWorker(mParams, mRing, mRegistry, mResults, mStatus, state) {
        mEngine.pause();
        mEngine.setGlobalParams(std::nullopt, std::nullopt, config.amplitudeClip);
        const std::pair<double, int> globals = mEngine.getGlobalParams();
        mRing.resize(historyCapacity(globals.first), globals.first);
        mParams.update([&](ControlSnapshot& s) {
            s.sampleRate    = globals.first;
            s.chunkLength   = globals.second;
            s.windowSeconds = config.windowSeconds;
            s.frameRate     = config.frameRate;
            s.pluginId      = config.pluginId;
        });
        mEngine.replaceComponents(JSONLoader::defaultPreset().components);
    }

    ~RealtimeSession() { shutdown(); }

    RealtimeSession(const RealtimeSession&) = delete;
    RealtimeSession& operator=(const RealtimeSession&) = delete;

    // ── Plugins ──────────────────────────────────────────────────────────

    size_t loadPlugins() {
        size_t n = mRegistry.reloadAll();
        for (const auto& f : mRegistry.failures()) {
            mStatus.post("Plugin load failed: " + f.path + " (" + f.reason + ")");
        }
        return n;
    }

    /// Select a transform. Unknown ids fall back to the default plugin with
    /// a status message. Missing params are backfilled from the plugin's
    /// schema. Returns the id actually selected.
    std::string setTransform(const std::string& pluginId, const ParamMap& params = {}) {
        std::string id = pluginId;
        auto plugin = mRegistry.get(id);
        if (!plugin) {
            mStatus.post("Plugin not found: " + id + ", using " + kDefaultPluginId);
            std::cerr << "[Session] WARNING: plugin '" << id << "' not found, using "
                      << kDefaultPluginId << std::endl;
            id = kDefaultPluginId;
            plugin = mRegistry.get(id);
        }

        ParamMap merged = params;
        if (plugin) {
            try {
                backfillDefaults(merged, plugin->capability->describeParameters());
            } catch (const std::exception& e) {
                mStatus.post(std::string("Plugin schema error: ") + e.what());
            }
        }
        mParams.setTransform(id, merged);
        return id;
    }

    // ── Presets ──────────────────────────────────────────────────────────

    void applyGlobals(const PresetGlobals& g) {
        const double oldFs = mEngine.getGlobalParams().first;
        mEngine.setGlobalParams(g.sampleRate, g.chunkLength, g.amplitudeClip);
        const std::pair<double, int> globals = mEngine.getGlobalParams();
        const double fs = globals.first;
        const int n = globals.second;

        if (fs != oldFs) {
            mRing.resize(historyCapacity(fs), fs);
            mStatus.post("Sample rate changed, history cleared");
        }
        mParams.update([&](ControlSnapshot& s) {
            s.sampleRate    = fs;
            s.chunkLength   = n;
            s.windowSeconds = g.windowSeconds > 0.0 ? g.windowSeconds : s.windowSeconds;
            s.frameRate     = g.frameRate > 0.0 ? g.frameRate : s.frameRate;
        });
    }

    /// Replace globals, transform selection and components in one go.
    /// Returns the number of components installed.
    int applyPreset(const PresetData& preset) {
        applyGlobals(preset.globals);
        setTransform(preset.pluginId, preset.transformParams);
        int installed = mEngine.replaceComponents(preset.components);
        if (static_cast<size_t>(installed) != preset.components.size()) {
            mStatus.post("Skipped " + std::to_string(preset.components.size() - installed)
                         + " component(s) of unknown kind");
        }
        return installed;
    }

    PresetData currentPreset() const {
        PresetData d;
        const ControlSnapshot s = mParams.snapshot();
        const auto [fs, n] = mEngine.getGlobalParams();
        d.globals.sampleRate    = fs;
        d.globals.chunkLength   = n;
        d.globals.windowSeconds = s.windowSeconds;
        d.globals.frameRate     = s.frameRate;
        d.globals.amplitudeClip = mEngine.amplitudeClip();
        d.pluginId        = s.pluginId;
        d.transformParams = s.transformParams;
        d.components      = mEngine.snapshotComponents();
        return d;
    }

    // ── Threads and transport ────────────────────────────────────────────

    bool startThreads() {
        if (!mGenerator.start()) return false;
        if (!mWorker.start()) {
            mGenerator.stop();
            return false;
        }
        return true;
    }

    void start() {
        mEngine.reset();
        mRing.clear();
        mEngine.play();
    }

    void pause()  { mEngine.pause(); }
    void resume() { mEngine.play(); }

    void togglePause() {
        if (mEngine.isPaused()) mEngine.play();
        else mEngine.pause();
    }

    /// Stop the worker first (it reads the ring), then the generator.
    void shutdown() {
        mEngine.pause();
        mWorker.stop();
        mGenerator.stop();
    }

    /// Most recent analysis window, the same span the worker transforms.
    std::vector<float> currentWindow() const {
        const ControlSnapshot s = mParams.snapshot();
        const double wanted = std::floor(s.windowSeconds * s.sampleRate);
        const size_t n = static_cast<size_t>(std::clamp(
            wanted, static_cast<double>(kMinWindowSamples), static_cast<double>(kMaxWindowSamples)));
        return mRing.getLast(n);
    }

    // ── Agent access ─────────────────────────────────────────────────────

    SignalEngine&               engine()    { return mEngine; }
    const SignalEngine&         engine() const { return mEngine; }
    RingBuffer&                 history()   { return mRing; }
    SharedParams&               params()    { return mParams; }
    PluginRegistry&             registry()  { return mRegistry; }
    StatusChannel&              status()    { return mStatus; }
    SpscQueue<Chunk>&           chunks()    { return mChunks; }
    SpscQueue<TransformResult>& results()   { return mResults; }
    GenerationLoop&             generator() { return mGenerator; }
    AnalysisWorker&             worker()    { return mWorker; }
    LogicalClock&               clock()     { return mClock; }

private:
    size_t historyCapacity(double fs) const {
        const double rate = fs > 0.0 ? fs : 2000.0;
        return static_cast<size_t>(std::max(1.0, std::ceil(mHistorySeconds * rate)));
    }

    double                     mHistorySeconds;
    LogicalClock               mClock;
    SignalEngine               mEngine;
    RingBuffer                 mRing;
    SharedParams               mParams;
    PluginRegistry             mRegistry;
    StatusChannel              mStatus;
    SpscQueue<Chunk>           mChunks;
    SpscQueue<TransformResult> mResults;
    GenerationLoop             mGenerator;
    AnalysisWorker             mWorker;
};

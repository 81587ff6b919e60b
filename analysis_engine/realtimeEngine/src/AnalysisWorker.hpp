// AnalysisWorker.hpp - Agent 3: Periodic transform of the recent window
//
// Background thread that, once per 1 / frame_rate seconds, takes the most
// recent window of samples from the RingBuffer, runs the selected transform
// plugin on it and publishes the TransformResult. It runs at its own
// cadence, independent of the generator: it may run faster or slower than
// chunks arrive and simply analyses whatever history is there.
//
// STATE MACHINE:
//   Idle --start()--> Running --stop()--> Stopping --(loop exits)--> Stopped
//   stop() never interrupts a transform in progress; the loop notices at
//   its next iteration boundary or wakes early from the inter-frame wait.
//
// PER ITERATION:
// 1. One SharedParams snapshot (all knobs for this frame come from it).
// 2. window = clamp(window_seconds * fs, kMinWindowSamples,
//    kMaxWindowSamples); fps = max(1, frame_rate).
// 3. Plugin lookup. Missing plugin: status message (once per id), skip.
// 4. RingBuffer::getLast(window) -> transform -> result channel.
// 5. Anything the plugin throws is reported on the status channel
//    and counted; the loop continues.
//
// THREADING:
// - mState is atomic. mWakeMutex/mWakeCv only serve the inter-frame wait.
// - runOnce() may be called directly (tests, offline tool) while the
//   thread is not running.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "RealtimeTypes.hpp"
#include "RingBuffer.hpp"
#include "SharedParams.hpp"
#include "SpscQueue.hpp"
#include "StatusChannel.hpp"
#include "PluginRegistry.hpp"
#include "TransformResult.hpp"

enum class WorkerState : int {
    Idle     = 0,
    Running  = 1,
    Stopping = 2,
    Stopped  = 3
};

inline const char* workerStateName(WorkerState s) {
    switch (s) {
        case WorkerState::Idle:     return "idle";
        case WorkerState::Running:  return "running";
        case WorkerState::Stopping: return "stopping";
        case WorkerState::Stopped:  return "stopped";
    }
    return "idle";
}

class AnalysisWorker {
public:
    AnalysisWorker(const SharedParams& params, const RingBuffer& ring,
                   const PluginRegistry& registry,
                   SpscQueue<TransformResult>& results,
                   StatusChannel& status, EngineState& state)
        : mParams(params), mRing(ring), mRegistry(registry),
          mResults(results), mStatus(status), mEngineState(state) {}

    ~AnalysisWorker() { stop(); }

    AnalysisWorker(const AnalysisWorker&) = delete;
    AnalysisWorker& operator=(const AnalysisWorker&) = delete;

    bool start() {
        WorkerState expected = WorkerState::Idle;
        if (!mState.compare_exchange_strong(expected, WorkerState::Running,
                                            std::memory_order_acq_rel)) {
            std::cerr << "[Analysis] WARNING: start() in state "
                      << workerStateName(expected) << ", ignored" << std::endl;
            return false;
        }
        mThread = std::thread([this]() { run(); });
        std::cout << "[Analysis] Worker thread started." << std::endl;
        return true;
    }

    void stop() {
        WorkerState expected = WorkerState::Running;
        if (mState.compare_exchange_strong(expected, WorkerState::Stopping,
                                           std::memory_order_acq_rel)) {
            std::lock_guard<std::mutex> lock(mWakeMutex);
            mWakeCv.notify_all();
        }
        if (mThread.joinable()) {
            mThread.join();
            std::cout << "[Analysis] Worker thread stopped." << std::endl;
        }
    }

    WorkerState state() const { return mState.load(std::memory_order_acquire); }

    /// One analysis iteration using `snap`. Returns true if a result was
    /// published.
    bool runOnce(const ControlSnapshot& snap) {
        const double fs = snap.sampleRate > 0.0 ? snap.sampleRate : 1.0;
        const double wanted = std::floor(snap.windowSeconds * fs);
        const size_t window = static_cast<size_t>(std::clamp(
            wanted, static_cast<double>(kMinWindowSamples), static_cast<double>(kMaxWindowSamples)));

        auto plugin = mRegistry.get(snap.pluginId);
        if (!plugin) {
            if (snap.pluginId != mMissingPluginId) {
                mMissingPluginId = snap.pluginId;
                mStatus.post("Plugin not found: " + snap.pluginId);
            }
            return false;
        }
        mMissingPluginId.clear();

        const std::vector<float> x = mRing.getLast(window);
        try {
            auto t0 = std::chrono::steady_clock::now();
            TransformResult result = plugin->capability->transform(x, fs, snap.transformParams);
            std::chrono::duration<double, std::milli> took = std::chrono::steady_clock::now() - t0;
            mEngineState.lastTransformMs.store(took.count(), std::memory_order_relaxed);

            if (mResults.tryPush(std::move(result))) {
                mEngineState.resultsPublished.fetch_add(1, std::memory_order_relaxed);
            } else {
                mEngineState.resultsDropped.fetch_add(1, std::memory_order_relaxed);
            }
            return true;
        } catch (const std::exception& e) {
            mEngineState.transformErrors.fetch_add(1, std::memory_order_relaxed);
            mStatus.post(std::string("Transform error: ") + e.what());
            return false;
        } catch (...) {
            mEngineState.transformErrors.fetch_add(1, std::memory_order_relaxed);
            mStatus.post("Transform error: unknown exception");
            return false;
        }
    }

private:
    void run() {
        while (mState.load(std::memory_order_acquire) == WorkerState::Running) {
            const ControlSnapshot snap = mParams.snapshot();
            runOnce(snap);

            const double fps = std::max(1.0, snap.frameRate);
            const auto period = std::chrono::duration<double>(1.0 / fps);
            std::unique_lock<std::mutex> lock(mWakeMutex);
            mWakeCv.wait_for(lock, period, [this]() {
                return mState.load(std::memory_order_acquire) != WorkerState::Running;
            });
        }
        mState.store(WorkerState::Stopped, std::memory_order_release);
    }

    const SharedParams&         mParams;
    const RingBuffer&           mRing;
    const PluginRegistry&       mRegistry;
    SpscQueue<TransformResult>& mResults;
    StatusChannel&              mStatus;
    EngineState&                mEngineState;

    std::atomic<WorkerState> mState{WorkerState::Idle};
    std::mutex               mWakeMutex;
    std::condition_variable  mWakeCv;
    std::thread              mThread;

    std::string mMissingPluginId;   // last id reported missing (worker thread only)
};

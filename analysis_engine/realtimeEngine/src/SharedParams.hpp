// SharedParams.hpp - Configuration hand-off from the control side
//
// The control layer (CLI, preset loader, any future UI) writes here; the
// AnalysisWorker reads one snapshot per iteration. Core knobs are typed
// fields of ControlSnapshot. Plugin parameters stay an open ParamMap because
// plugin schemas are only known at runtime.
//
// THREADING:
// - One mutex. Writers replace individual fields; snapshot() copies the
//   whole struct under the lock, so a reader never sees a half-written
//   field. Fields written by separate calls are not transactional.

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>

#include "ParamSchema.hpp"

struct ControlSnapshot {
    double      sampleRate    = 2000.0;
    int         chunkLength   = 256;
    double      windowSeconds = 4.0;
    double      frameRate     = 8.0;
    std::string pluginId      = "builtin:cwt_morlet";
    ParamMap    transformParams;
};

class SharedParams {
public:
    SharedParams() = default;
    explicit SharedParams(ControlSnapshot initial) : mState(std::move(initial)) {}

    ControlSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mState;
    }

    void setSampleRate(double fs) {
        std::lock_guard<std::mutex> lock(mMutex);
        mState.sampleRate = fs;
    }

    void setChunkLength(int n) {
        std::lock_guard<std::mutex> lock(mMutex);
        mState.chunkLength = n;
    }

    void setWindowSeconds(double seconds) {
        std::lock_guard<std::mutex> lock(mMutex);
        mState.windowSeconds = seconds;
    }

    void setFrameRate(double fps) {
        std::lock_guard<std::mutex> lock(mMutex);
        mState.frameRate = fps;
    }

    /// Select a plugin and replace its parameter map in one step.
    void setTransform(const std::string& pluginId, const ParamMap& params) {
        std::lock_guard<std::mutex> lock(mMutex);
        mState.pluginId = pluginId;
        mState.transformParams = params;
    }

    /// Merge into the current plugin's parameters.
    void updateTransformParams(const ParamMap& params) {
        std::lock_guard<std::mutex> lock(mMutex);
        for (const auto& [key, value] : params) {
            mState.transformParams[key] = value;
        }
    }

    /// Arbitrary edit applied under the lock (keep it short).
    void update(const std::function<void(ControlSnapshot&)>& fn) {
        std::lock_guard<std::mutex> lock(mMutex);
        fn(mState);
    }

private:
    mutable std::mutex mMutex;
    ControlSnapshot mState;
};

// LogicalClock.hpp - Sample-indexed time source
//
// "Now" is the number of samples generated since the last reset, not the
// wall clock. Signal phase is therefore reproducible regardless of how the
// generator thread gets scheduled. A steady_clock reference is kept only for
// the uptime figure printed by the monitoring loop.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

class LogicalClock {
public:
    LogicalClock() : mStart(std::chrono::steady_clock::now()) {}

    void reset() {
        std::lock_guard<std::mutex> lock(mMutex);
        mSampleIndex = 0;
        mStart = std::chrono::steady_clock::now();
    }

    void advance(uint64_t n) {
        std::lock_guard<std::mutex> lock(mMutex);
        mSampleIndex += n;
    }

    uint64_t sampleIndex() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mSampleIndex;
    }

    /// Wall-clock seconds since the last reset (diagnostics only).
    double uptime() const {
        std::lock_guard<std::mutex> lock(mMutex);
        std::chrono::duration<double> d = std::chrono::steady_clock::now() - mStart;
        return d.count();
    }

private:
    mutable std::mutex mMutex;
    uint64_t mSampleIndex = 0;
    std::chrono::steady_clock::time_point mStart;
};

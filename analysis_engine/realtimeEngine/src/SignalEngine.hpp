// SignalEngine.hpp - Agent 1: Synthetic signal generation
//
// Composes the active SignalComponents into fixed-length chunks on demand.
// The engine owns the component list and the generation globals; it borrows
// the LogicalClock that defines "now".
//
// RESPONSIBILITIES:
// 1. Hold global generation parameters (sample rate, chunk length, clip).
// 2. Provide the control surface used by the UI/preset layer: play, pause,
//    reset, add/remove/enable/update components, snapshot and replace.
// 3. generateChunk(): sum every enabled component over
//    [t0, t0 + n / fs), clip, advance the clock by n.
//
// THREADING:
// - mMutex guards globals, the paused flag and the component list.
// - Each component lives in a ComponentSlot with its own mutex. The two
//   locks are never held together: every caller copies the slot pointer(s)
//   under the engine lock, RELEASES it, then takes the slot lock. An edit
//   to a component that is rendering waits for that one slot only.
//   add/remove/replace never block on component math, and a slot removed
//   mid-chunk is kept alive by the captured shared_ptr.
// - generateChunk() is owned by ONE thread (the generator, or the offline
//   tool). The accumulator and scratch buffers are not shared.
//
// REAL-TIME NOTES:
// - Scratch buffers are allocated once at kMaxChunkSamples. The returned
//   Chunk copies the accumulator (one allocation per chunk, same as the
//   chunk channel needs anyway).

#pragma once

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "RealtimeTypes.hpp"
#include "LogicalClock.hpp"
#include "SignalComponents.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// ComponentSlot - One component plus the lock that guards it
// ─────────────────────────────────────────────────────────────────────────────

struct ComponentSlot {
    explicit ComponentSlot(SignalComponent c) : component(std::move(c)) {}

    std::mutex      mutex;
    SignalComponent component;
};

// ─────────────────────────────────────────────────────────────────────────────
// SignalEngine
// ─────────────────────────────────────────────────────────────────────────────

class SignalEngine {
public:
    explicit SignalEngine(LogicalClock& clock,
                          double sampleRate = 2000.0,
                          int chunkLength = 256)
        : mClock(clock),
          mSampleRate(sampleRate > 0.0 ? sampleRate : 2000.0),
          mChunkLength(std::clamp(chunkLength, 1, kMaxChunkSamples)),
          mAccum(kMaxChunkSamples, 0.0f),
          mScratch(kMaxChunkSamples, 0.0f) {}

    // ── Global parameters ────────────────────────────────────────────────

    /// Update any subset of the globals. Non-positive sample rates are
    /// ignored; chunk length is clamped to [1, kMaxChunkSamples]; a
    /// negative clip disables clipping.
    void setGlobalParams(std::optional<double> sampleRate,
                         std::optional<int> chunkLength,
                         std::optional<double> amplitudeClip = std::nullopt) {
        std::lock_guard<std::mutex> lock(mMutex);
        if (sampleRate && *sampleRate > 0.0) mSampleRate = *sampleRate;
        if (chunkLength) mChunkLength = std::clamp(*chunkLength, 1, kMaxChunkSamples);
        if (amplitudeClip) mAmplitudeClip = std::max(0.0, *amplitudeClip);
    }

    /// (sample rate, chunk length) read together under one lock.
    std::pair<double, int> getGlobalParams() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return {mSampleRate, mChunkLength};
    }

    double amplitudeClip() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mAmplitudeClip;
    }

    // ── Transport ────────────────────────────────────────────────────────

    void play() {
        std::lock_guard<std::mutex> lock(mMutex);
        mPaused = false;
    }

    void pause() {
        std::lock_guard<std::mutex> lock(mMutex);
        mPaused = true;
    }

    bool isPaused() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mPaused;
    }

    /// Rewind logical time. Components and history are untouched; clearing
    /// the ring buffer is the caller's job.
    void reset() { mClock.reset(); }

    // ── Component control ────────────────────────────────────────────────

    /// Returns the new component's index.
    int addComponent(ComponentKind kind, const ParamMap& params = {}, bool enabled = true) {
        auto slot = std::make_shared<ComponentSlot>(SignalComponent(kind, params, enabled));
        std::lock_guard<std::mutex> lock(mMutex);
        mSlots.push_back(std::move(slot));
        return static_cast<int>(mSlots.size()) - 1;
    }

    /// Returns -1 for an unknown kind name.
    int addComponent(const std::string& kindName, const ParamMap& params = {}, bool enabled = true) {
        auto kind = componentKindFromName(kindName);
        if (!kind) {
            std::cerr << "[SignalEngine] WARNING: unknown component kind '"
                      << kindName << "'" << std::endl;
            return -1;
        }
        return addComponent(*kind, params, enabled);
    }

    void removeComponent(int index) {
        std::lock_guard<std::mutex> lock(mMutex);
        if (!validIndex(index)) return;
        mSlots.erase(mSlots.begin() + index);
    }

    void setComponentEnabled(int index, bool enabled) {
        auto slot = slotAt(index);
        if (!slot) return;
        std::lock_guard<std::mutex> slotLock(slot->mutex);
        slot->component.setEnabled(enabled);
    }

    void updateComponentParams(int index, const ParamMap& params) {
        auto slot = slotAt(index);
        if (!slot) return;
        std::lock_guard<std::mutex> slotLock(slot->mutex);
        slot->component.updateParams(params);
    }

    size_t numComponents() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mSlots.size();
    }

    /// Deep copy of every component, in order.
    std::vector<ComponentSnapshot> snapshotComponents() const {
        std::vector<std::shared_ptr<ComponentSlot>> slots;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            slots = mSlots;
        }
        std::vector<ComponentSnapshot> out;
        out.reserve(slots.size());
        for (const auto& slot : slots) {
            std::lock_guard<std::mutex> slotLock(slot->mutex);
            out.push_back(slot->component.snapshot());
        }
        return out;
    }

    /// Clear and rebuild the component list in one step. Unknown kinds are
    /// skipped; missing parameter keys come from the kind's schema.
    /// Returns the number of components installed.
    int replaceComponents(const std::vector<ComponentSnapshot>& snapshot) {
        std::vector<std::shared_ptr<ComponentSlot>> slots;
        slots.reserve(snapshot.size());
        for (const auto& entry : snapshot) {
            auto component = SignalComponent::create(entry.kind, entry.params, entry.enabled);
            if (!component) {
                std::cerr << "[SignalEngine] WARNING: skipping unknown component kind '"
                          << entry.kind << "'" << std::endl;
                continue;
            }
            slots.push_back(std::make_shared<ComponentSlot>(std::move(*component)));
        }

        std::lock_guard<std::mutex> lock(mMutex);
        mSlots = std::move(slots);
        return static_cast<int>(mSlots.size());
    }

    // ── Generation ───────────────────────────────────────────────────────

    /// Produce the next chunk. While paused the returned chunk is empty and
    /// the clock does not move.
    Chunk generateChunk() {
        std::vector<std::shared_ptr<ComponentSlot>> slots;
        double fs;
        int n;
        double clip;
        bool paused;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            slots  = mSlots;
            fs     = mSampleRate;
            n      = std::min(mChunkLength, kMaxChunkSamples);
            clip   = mAmplitudeClip;
            paused = mPaused;
        }

        Chunk chunk;
        chunk.sampleRate = fs;
        chunk.startTime  = static_cast<double>(mClock.sampleIndex()) / fs;
        if (paused) return chunk;

        std::fill(mAccum.begin(), mAccum.begin() + n, 0.0f);
        for (const auto& slot : slots) {
            std::lock_guard<std::mutex> slotLock(slot->mutex);
            if (!slot->component.enabled()) continue;
            slot->component.render(chunk.startTime, n, fs, mScratch.data());
            for (int i = 0; i < n; ++i) mAccum[i] += mScratch[i];
        }

        if (clip > 0.0) {
            const float c = static_cast<float>(clip);
            for (int i = 0; i < n; ++i) mAccum[i] = std::clamp(mAccum[i], -c, c);
        }

        mClock.advance(static_cast<uint64_t>(n));
        chunk.samples.assign(mAccum.begin(), mAccum.begin() + n);
        return chunk;
    }

    LogicalClock& clock() { return mClock; }

private:
    bool validIndex(int index) const {
        return index >= 0 && index < static_cast<int>(mSlots.size());
    }

    /// Null for an out-of-range index.
    std::shared_ptr<ComponentSlot> slotAt(int index) const {
        std::lock_guard<std::mutex> lock(mMutex);
        if (!validIndex(index)) return nullptr;
        return mSlots[index];
    }

    LogicalClock& mClock;

    mutable std::mutex mMutex;
    double mSampleRate;
    int    mChunkLength;
    double mAmplitudeClip = 0.0;
    bool   mPaused = false;
    std::vector<std::shared_ptr<ComponentSlot>> mSlots;

    // Generator-thread scratch (see THREADING)
    std::vector<float> mAccum;
    std::vector<float> mScratch;
};

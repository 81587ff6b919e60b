// GenerationLoop.hpp - Agent 2: Real-time chunk production
//
// Background thread that drives SignalEngine at real-time pace: one chunk
// every chunk_length / sample_rate seconds. Each non-empty chunk is
// appended to the RingBuffer (history for the analysis worker) and pushed
// to the chunk channel (time-domain view).
//
// RESPONSIBILITIES:
// 1. Read (sample rate, chunk length) as one pair each tick.
// 2. While paused, idle in short sleeps and produce nothing.
// 3. Pace against an absolute deadline so drift does not accumulate. If
//    the loop falls behind by more than one tick it resynchronises instead
//    of bursting to catch up.
//
// THREADING:
// - mRunning: release on write (stop), acquire on read (loop).
// - The loop never logs per chunk. Queue overflow bumps
//   EngineState::chunksDropped. A chunk whose rate no longer matches the
//   history buffer goes nowhere and bumps EngineState::chunksStale.
//
// PROVENANCE:
// - Thread start/stop pattern adapted from Streaming::startLoader() /
//   shutdown() in the engine's streaming agent.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

#include "RealtimeTypes.hpp"
#include "RingBuffer.hpp"
#include "SignalEngine.hpp"
#include "SpscQueue.hpp"

class GenerationLoop {
public:
    // Sleep while paused; also the floor for one tick.
    static constexpr auto kPausedPoll = std::chrono::milliseconds(50);
    static constexpr double kMinTickSeconds = 0.001;

    GenerationLoop(SignalEngine& engine, RingBuffer& ring,
                   SpscQueue<Chunk>& chunks, EngineState& state)
        : mEngine(engine), mRing(ring), mChunks(chunks), mState(state) {}

    ~GenerationLoop() { stop(); }

    GenerationLoop(const GenerationLoop&) = delete;
    GenerationLoop& operator=(const GenerationLoop&) = delete;

    bool start() {
        if (mRunning.load(std::memory_order_acquire)) return false;
        mRunning.store(true, std::memory_order_release);
        mThread = std::thread([this]() { run(); });
        std::cout << "[Generator] Generation thread started." << std::endl;
        return true;
    }

    void stop() {
        mRunning.store(false, std::memory_order_release);
        if (mThread.joinable()) {
            mThread.join();
            std::cout << "[Generator] Generation thread stopped." << std::endl;
        }
    }

    bool isRunning() const { return mRunning.load(std::memory_order_acquire); }

    /// One generation step (also used directly by tests and the offline
    /// tool). Returns the number of samples produced.
    size_t tick() {
        Chunk chunk = mEngine.generateChunk();
        if (chunk.samples.empty()) return 0;

        const size_t n = chunk.samples.size();
        if (!mRing.append(chunk.samples, chunk.sampleRate)) {
            // Generated just before a sample rate change; history was reset.
            mState.chunksStale.fetch_add(1, std::memory_order_relaxed);
            return 0;
        }
        mState.chunksGenerated.fetch_add(1, std::memory_order_relaxed);
        mState.samplesGenerated.fetch_add(n, std::memory_order_relaxed);
        if (!mChunks.tryPush(std::move(chunk))) {
            mState.chunksDropped.fetch_add(1, std::memory_order_relaxed);
        }
        return n;
    }

private:
    void run() {
        using clock = std::chrono::steady_clock;
        auto deadline = clock::now();

        while (mRunning.load(std::memory_order_acquire)) {
            if (mEngine.isPaused()) {
                std::this_thread::sleep_for(kPausedPoll);
                deadline = clock::now();
                continue;
            }

            auto [fs, n] = mEngine.getGlobalParams();
            const double dt = std::max(kMinTickSeconds, static_cast<double>(n) / fs);

            tick();

            deadline += std::chrono::duration_cast<clock::duration>(
                std::chrono::duration<double>(dt));
            auto now = clock::now();
            if (deadline < now - std::chrono::duration_cast<clock::duration>(
                                     std::chrono::duration<double>(dt))) {
                deadline = now;   // too far behind: resync
            }
            std::this_thread::sleep_until(deadline);
        }
    }

    SignalEngine&     mEngine;
    RingBuffer&       mRing;
    SpscQueue<Chunk>& mChunks;
    EngineState&      mState;

    std::thread       mThread;
    std::atomic<bool> mRunning{false};
};

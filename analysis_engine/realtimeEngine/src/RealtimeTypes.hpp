// RealtimeTypes.hpp - Shared data types for the real-time analysis engine
//
// These structs are passed between the agents (SignalEngine, RingBuffer,
// GenerationLoop, AnalysisWorker) and the monitoring loop in main.cpp.
//
// ─────────────────────────────────────────────────────────────────────────────
// THREADING MODEL
// ─────────────────────────────────────────────────────────────────────────────
//
// The engine uses THREE threads:
//
//  ┌──────────────────┬────────────────────────────────────────────────────┐
//  │ Thread           │ Role                                               │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ MAIN thread      │ Setup, preset load, monitoring loop, shutdown.     │
//  │                  │ Owns every agent's lifetime. Drains the chunk,     │
//  │                  │ result and status channels (stands in for the UI). │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ GENERATOR thread │ GenerationLoop: SignalEngine::generateChunk() at   │
//  │                  │ chunk_length / sample_rate cadence, then           │
//  │                  │ RingBuffer::append() and Chunk publication.        │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ ANALYSIS thread  │ AnalysisWorker: SharedParams snapshot, window pull │
//  │                  │ from RingBuffer, plugin transform, TransformResult │
//  │                  │ publication at 1 / frame_rate cadence.             │
//  └──────────────────┴────────────────────────────────────────────────────┘
//
// LOCKS (never held across a blocking call, never nested):
//
//  ┌─────────────────────────────┬────────────────────────────────────────┐
//  │ Lock                        │ Protects                               │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ SignalEngine::mMutex        │ globals, paused flag, component list   │
//  │ ComponentSlot::mutex        │ one component's params + smoothing     │
//  │                             │ state. Always taken AFTER the engine   │
//  │                             │ mutex has been released; the two are   │
//  │                             │ never held together.                   │
//  │ RingBuffer::mMutex          │ storage, cursor, filled                │
//  │ SharedParams::mMutex        │ ControlSnapshot                        │
//  │ LogicalClock::mMutex        │ sample count, uptime reference         │
//  │ StatusChannel::mMutex       │ pending status messages                │
//  └─────────────────────────────┴────────────────────────────────────────┘
//
// MEMORY ORDERING RULES:
//  - RealtimeConfig::shouldExit, EngineState counters: relaxed. Polled for
//    display and exit; no dependent data.
//  - GenerationLoop/AnalysisWorker running flags: release on write,
//    acquire on read.
//  - SpscQueue head/tail: release on publish, acquire on consume.
//
// ─────────────────────────────────────────────────────────────────────────────

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// Hard limits
// ─────────────────────────────────────────────────────────────────────────────

// Largest chunk SignalEngine will produce. Scratch buffers are sized to this
// once so the generator never reallocates per chunk.
static constexpr int kMaxChunkSamples = 131072;

// Largest analysis window. Longer requests are clamped to this.
static constexpr int kMaxWindowSamples = 1 << 22;

// ─────────────────────────────────────────────────────────────────────────────
// RealtimeConfig - Startup configuration for the real-time engine
// ─────────────────────────────────────────────────────────────────────────────
// Filled from CLI flags (and optionally a preset) before any thread starts.
// Live tuning goes through SharedParams, not through this struct.

struct RealtimeConfig {
    // ── Generation ───────────────────────────────────────────────────────
    double sampleRate     = 2000.0;  // Hz
    int    chunkLength    = 256;     // samples per generated chunk
    double amplitudeClip  = 0.0;     // 0 = no clipping

    // ── Analysis ─────────────────────────────────────────────────────────
    double windowSeconds  = 4.0;     // analysis window length
    double frameRate      = 8.0;     // transform results per second
    std::string pluginId  = "builtin:cwt_morlet";

    // ── History ──────────────────────────────────────────────────────────
    double historySeconds = 60.0;    // ring buffer capacity in seconds

    // ── Paths ────────────────────────────────────────────────────────────
    std::string presetPath;          // optional saved configuration
    std::string pluginsDir = "plugins";
    std::string exportWavPath;       // written on shutdown if set
    std::string exportCsvPath;       // written on shutdown if set

    // ── Run control ──────────────────────────────────────────────────────
    double durationSeconds = 0.0;    // 0 = run until SIGINT
    std::atomic<bool> shouldExit{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// EngineState - Diagnostic counters (read by the monitoring loop)
// ─────────────────────────────────────────────────────────────────────────────

struct EngineState {
    // ── Generator ────────────────────────────────────────────────────────
    std::atomic<uint64_t> chunksGenerated{0};
    std::atomic<uint64_t> samplesGenerated{0};
    std::atomic<uint64_t> chunksDropped{0};     // chunk queue full
    std::atomic<uint64_t> chunksStale{0};       // generated at a replaced sample rate

    // ── Analysis ─────────────────────────────────────────────────────────
    std::atomic<uint64_t> resultsPublished{0};
    std::atomic<uint64_t> resultsDropped{0};    // result queue full
    std::atomic<uint64_t> transformErrors{0};
    std::atomic<double>   lastTransformMs{0.0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Chunk - One generation tick
// ─────────────────────────────────────────────────────────────────────────────
// Empty `samples` means "no new data this tick" and is never appended to
// history.

struct Chunk {
    std::vector<float> samples;
    double startTime  = 0.0;   // seconds, from the logical clock
    double sampleRate = 0.0;   // Hz
};

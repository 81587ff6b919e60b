#pragma once

#include <string>
#include <vector>

#include "ParamSchema.hpp"
#include "SignalComponents.hpp"

// Global knobs stored in a saved configuration.
struct PresetGlobals {
    double sampleRate    = 2000.0;
    int    chunkLength   = 256;
    double windowSeconds = 4.0;
    double frameRate     = 8.0;
    double amplitudeClip = 0.0;   // 0 = off
};

struct PresetData {
    PresetGlobals globals;
    std::string   pluginId = "builtin:cwt_morlet";
    ParamMap      transformParams;
    std::vector<ComponentSnapshot> components;
};

class JSONLoader {
public:
    /// Load a saved configuration:
    ///   { "globals":    { sample_rate, chunk_length, window_seconds,
    ///                     frame_rate, amplitude_clip },
    ///     "transform":  { plugin_id, params },
    ///     "components": [ { kind, enabled, params }, ... ] }
    /// Older spellings are accepted (globals.fs / chunk_size /
    /// view_window_sec / scalogram_fps, "wavelet" instead of "transform",
    /// components[].type). Malformed entries are skipped with a warning;
    /// unknown component kinds are kept here and dropped by the engine.
    /// Throws std::runtime_error if the file cannot be read or parsed.
    static PresetData loadPreset(const std::string& path);

    /// Same as loadPreset() on an in-memory document.
    static PresetData parsePreset(const std::string& text);

    /// Write `data` in the current spelling. Throws std::runtime_error on
    /// I/O failure.
    static void savePreset(const std::string& path, const PresetData& data);

    static std::string presetToString(const PresetData& data);

    /// Start-up configuration: Gaussian noise (sigma 0.15), a 6 Hz tone at
    /// amplitude 1 and a 30 Hz tone at amplitude 0.4.
    static PresetData defaultPreset();
};

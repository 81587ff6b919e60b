// SignalComponents.hpp - Independently parameterized signal generators
//
// A SignalComponent is one additive term of the synthetic test signal. The
// set of kinds is closed (noise, tone, rectangular pulse train, Gaussian
// pulse train, linear chirp), so components are modelled as a tagged union:
// each kind owns a typed parameter struct and SignalComponent dispatches
// with std::visit. No string lookups happen at generation time; the
// ParamMap form exists only at the edges (schema defaults, live edits,
// snapshots, saved configurations).
//
// GENERATION CONTRACT:
//   render(startTime, length, sampleRate, out) writes exactly `length`
//   samples covering [startTime, startTime + length / sampleRate).
//   A disabled component writes zeros.
//   Apart from the noise RNG and the tone's smoothing state, output is a
//   pure function of (startTime, length, sampleRate) and the parameters.
//
// THREADING:
//   SignalComponent itself is not synchronized. SignalEngine wraps each one
//   in a ComponentSlot with its own mutex (see SignalEngine.hpp).

#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

#include "ParamSchema.hpp"

enum class ComponentKind {
    Noise,
    Sine,
    RectPulse,
    GaussPulse,
    Chirp
};

/// Saved-configuration spelling ("noise", "sine", "rect_pulse", ...).
const char* componentKindName(ComponentKind kind);
std::optional<ComponentKind> componentKindFromName(const std::string& name);
std::vector<ComponentKind> allComponentKinds();

/// Schema for a kind (static, same for every instance).
Schema componentSchema(ComponentKind kind);

// ─────────────────────────────────────────────────────────────────────────────
// Component kinds
// ─────────────────────────────────────────────────────────────────────────────

class NoiseComponent {
public:
    struct Params {
        double mean  = 0.0;
        double sigma = 0.2;
        int    seed  = 0;     // 0 = nondeterministic
    };

    static constexpr ComponentKind kKind = ComponentKind::Noise;
    static const char* displayName() { return "Noise (Gaussian)"; }
    static Schema schema();

    explicit NoiseComponent(const ParamMap& params);

    void updateParams(const ParamMap& params);
    ParamMap params() const;
    void render(double startTime, int length, double sampleRate, float* out);

private:
    Params mParams;
    std::mt19937 mRng;
    std::optional<int> mLastSeed;
};

/// Tone with exponential parameter smoothing. Live edits set the TARGET
/// values; each render() moves CURRENT toward TARGET by
/// alpha = min(1, chunkDuration / smoothTime), or jumps when smooth_ms <= 0.
class SineComponent {
public:
    struct Params {
        double amplitude = 1.0;
        double frequency = 5.0;
        double phase     = 0.0;
        double dc        = 0.0;
        int    smoothMs  = 150;
    };

    static constexpr ComponentKind kKind = ComponentKind::Sine;
    static const char* displayName() { return "Sine"; }
    static Schema schema();

    explicit SineComponent(const ParamMap& params);

    void updateParams(const ParamMap& params);
    ParamMap params() const;
    void render(double startTime, int length, double sampleRate, float* out);

    /// Values actually used by the last render (after smoothing).
    const Params& current() const { return mCurrent; }

private:
    Params mTarget;
    Params mCurrent;
};

class RectPulseComponent {
public:
    struct Params {
        double amplitude    = 1.0;
        double widthSec     = 0.02;
        double periodSec    = 0.3;
        double startTimeSec = 0.0;
    };

    static constexpr ComponentKind kKind = ComponentKind::RectPulse;
    static const char* displayName() { return "Rectangular pulses"; }
    static Schema schema();

    explicit RectPulseComponent(const ParamMap& params);

    void updateParams(const ParamMap& params);
    ParamMap params() const;
    void render(double startTime, int length, double sampleRate, float* out);

private:
    Params mParams;
};

class GaussPulseComponent {
public:
    struct Params {
        double amplitude           = 1.0;
        double sigmaSec            = 0.01;
        double centerTimeSec       = 1.0;
        double repetitionPeriodSec = 0.0;   // 0 = single pulse
    };

    static constexpr ComponentKind kKind = ComponentKind::GaussPulse;
    static const char* displayName() { return "Gaussian pulses"; }
    static Schema schema();

    /// Pulses are evaluated out to this many sigmas from their centre.
    static constexpr double kSupportSigmas = 8.0;

    explicit GaussPulseComponent(const ParamMap& params);

    void updateParams(const ParamMap& params);
    ParamMap params() const;
    void render(double startTime, int length, double sampleRate, float* out);

private:
    Params mParams;
};

class ChirpComponent {
public:
    struct Params {
        double amplitude    = 0.8;
        double f0           = 10.0;
        double f1           = 200.0;
        double durationSec  = 2.0;
        double startTimeSec = 0.0;
    };

    static constexpr ComponentKind kKind = ComponentKind::Chirp;
    static const char* displayName() { return "Chirp (linear sweep)"; }
    static Schema schema();

    explicit ChirpComponent(const ParamMap& params);

    void updateParams(const ParamMap& params);
    ParamMap params() const;
    void render(double startTime, int length, double sampleRate, float* out);

private:
    Params mParams;
};

// ─────────────────────────────────────────────────────────────────────────────
// ComponentSnapshot - deep copy of one component for cross-thread hand-off
// ─────────────────────────────────────────────────────────────────────────────

struct ComponentSnapshot {
    std::string kind;
    std::string name;
    bool        enabled = true;
    ParamMap    params;
};

// ─────────────────────────────────────────────────────────────────────────────
// SignalComponent - tagged union over the component kinds
// ─────────────────────────────────────────────────────────────────────────────

class SignalComponent {
public:
    using Variant = std::variant<NoiseComponent,
                                 SineComponent,
                                 RectPulseComponent,
                                 GaussPulseComponent,
                                 ChirpComponent>;

    /// Build a component of `kind`. Keys missing from `params` are filled
    /// from the kind's schema defaults.
    SignalComponent(ComponentKind kind, const ParamMap& params, bool enabled);

    /// Returns nullopt for an unknown kind name.
    static std::optional<SignalComponent> create(const std::string& kindName,
                                                 const ParamMap& params,
                                                 bool enabled);

    ComponentKind kind() const;
    const char* kindName() const { return componentKindName(kind()); }
    const char* displayName() const;
    Schema schema() const { return componentSchema(kind()); }

    bool enabled() const { return mEnabled; }
    void setEnabled(bool enabled) { mEnabled = enabled; }

    /// Merge a partial map into the current parameters.
    void updateParams(const ParamMap& params);
    ParamMap params() const;

    ComponentSnapshot snapshot() const;

    void render(double startTime, int length, double sampleRate, float* out);
    std::vector<float> generate(double startTime, int length, double sampleRate);

    Variant& impl() { return mImpl; }
    const Variant& impl() const { return mImpl; }

private:
    static Variant makeVariant(ComponentKind kind, const ParamMap& params);

    Variant mImpl;
    bool    mEnabled = true;
};

#include "SignalComponents.hpp"

#include <algorithm>
#include <cmath>

static constexpr double kTwoPi = 6.283185307179586;

// Time of sample i in a chunk starting at t0.
static inline double sampleTime(double t0, int i, double fs) {
    return t0 + static_cast<double>(i) / fs;
}

// ============================================================================
// Kind registry
// ============================================================================

const char* componentKindName(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Noise:      return "noise";
        case ComponentKind::Sine:       return "sine";
        case ComponentKind::RectPulse:  return "rect_pulse";
        case ComponentKind::GaussPulse: return "gauss_pulse";
        case ComponentKind::Chirp:      return "chirp";
    }
    return "noise";
}

std::optional<ComponentKind> componentKindFromName(const std::string& name) {
    for (ComponentKind k : allComponentKinds()) {
        if (name == componentKindName(k)) return k;
    }
    return std::nullopt;
}

std::vector<ComponentKind> allComponentKinds() {
    return {ComponentKind::Noise, ComponentKind::Sine, ComponentKind::RectPulse,
            ComponentKind::GaussPulse, ComponentKind::Chirp};
}

Schema componentSchema(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::Noise:      return NoiseComponent::schema();
        case ComponentKind::Sine:       return SineComponent::schema();
        case ComponentKind::RectPulse:  return RectPulseComponent::schema();
        case ComponentKind::GaussPulse: return GaussPulseComponent::schema();
        case ComponentKind::Chirp:      return ChirpComponent::schema();
    }
    return {};
}

// ============================================================================
// Noise
// ============================================================================

Schema NoiseComponent::schema() {
    return {
        ParamSpec::makeFloat("mean", "Mean (mu)", 0.0, -5.0, 5.0, 0.01,
            "Expected value of the white Gaussian noise.",
            {"0 - noise around zero", "0.2 - adds a constant offset"}),
        ParamSpec::makeFloat("sigma", "Std. deviation (sigma)", 0.2, 0.0, 5.0, 0.01,
            "Standard deviation; sets the noise strength.",
            {"0.05 - weak noise", "0.5 - strong noise"}),
        ParamSpec::makeInt("seed", "Seed (0 = random)", 0, 0, 10000, 1,
            "RNG seed. A non-zero seed makes the noise reproducible.",
            {"0 - different realisation every run", "123 - identical noise for identical settings"}),
    };
}

NoiseComponent::NoiseComponent(const ParamMap& params) {
    updateParams(params);
}

void NoiseComponent::updateParams(const ParamMap& params) {
    mParams.mean  = paramAsDouble(params, "mean", mParams.mean);
    mParams.sigma = paramAsDouble(params, "sigma", mParams.sigma);
    mParams.seed  = paramAsInt(params, "seed", mParams.seed);
}

ParamMap NoiseComponent::params() const {
    return {{"mean", mParams.mean}, {"sigma", mParams.sigma}, {"seed", mParams.seed}};
}

void NoiseComponent::render(double, int length, double, float* out) {
    if (!mLastSeed || *mLastSeed != mParams.seed) {
        mLastSeed = mParams.seed;
        if (mParams.seed != 0) {
            mRng.seed(static_cast<std::mt19937::result_type>(mParams.seed));
        } else {
            mRng.seed(std::random_device{}());
        }
    }

    if (mParams.sigma <= 0.0) {
        std::fill(out, out + length, static_cast<float>(mParams.mean));
        return;
    }

    std::normal_distribution<double> dist(mParams.mean, mParams.sigma);
    for (int i = 0; i < length; ++i) {
        out[i] = static_cast<float>(dist(mRng));
    }
}

// ============================================================================
// Sine (with parameter smoothing)
// ============================================================================

Schema SineComponent::schema() {
    return {
        ParamSpec::makeFloat("amplitude", "Amplitude", 1.0, 0.0, 10.0, 0.01,
            "Amplitude A of the term A*sin(2*pi*f*t + phi).",
            {"A=1.0 - base level", "A=0.2 - weak component"}),
        ParamSpec::makeFloat("frequency", "Frequency (Hz)", 5.0, 0.0, 10000000.0, 0.1,
            "Tone frequency. Shows up as a horizontal band on the scalogram.",
            {"f=6 Hz - low", "f=30 Hz - mid", "up to fs/2 - high"}),
        ParamSpec::makeFloat("phase", "Phase (rad)", 0.0, -10.0, 10.0, 0.01,
            "Initial phase phi in radians.",
            {"0 - no shift", "pi/2 ~ 1.57 - quarter-period shift"}),
        ParamSpec::makeFloat("dc", "Offset (DC)", 0.0, -5.0, 5.0, 0.01,
            "Constant offset added to the tone.",
            {"dc=0 - no offset", "dc=0.5 - signal above zero"}),
        ParamSpec::makeInt("smooth_ms", "Change smoothing (ms)", 150, 0, 500, 10,
            "Time constant for gliding amplitude/frequency/phase/offset to new values.",
            {"0 - changes apply instantly", "150-300 - smooth transition"}),
    };
}

SineComponent::SineComponent(const ParamMap& params) {
    updateParams(params);
    mCurrent = mTarget;
}

void SineComponent::updateParams(const ParamMap& params) {
    mTarget.amplitude = paramAsDouble(params, "amplitude", mTarget.amplitude);
    mTarget.frequency = paramAsDouble(params, "frequency", mTarget.frequency);
    mTarget.phase     = paramAsDouble(params, "phase", mTarget.phase);
    mTarget.dc        = paramAsDouble(params, "dc", mTarget.dc);
    mTarget.smoothMs  = paramAsInt(params, "smooth_ms", mTarget.smoothMs);
}

ParamMap SineComponent::params() const {
    return {{"amplitude", mTarget.amplitude},
            {"frequency", mTarget.frequency},
            {"phase", mTarget.phase},
            {"dc", mTarget.dc},
            {"smooth_ms", mTarget.smoothMs}};
}

void SineComponent::render(double startTime, int length, double sampleRate, float* out) {
    double alpha = 1.0;
    if (mTarget.smoothMs > 0) {
        double chunkSec = static_cast<double>(length) / sampleRate;
        alpha = std::min(1.0, chunkSec / (mTarget.smoothMs / 1000.0));
    }

    mCurrent.amplitude += alpha * (mTarget.amplitude - mCurrent.amplitude);
    mCurrent.frequency += alpha * (mTarget.frequency - mCurrent.frequency);
    mCurrent.phase     += alpha * (mTarget.phase - mCurrent.phase);
    mCurrent.dc        += alpha * (mTarget.dc - mCurrent.dc);
    mCurrent.smoothMs   = mTarget.smoothMs;

    const double a  = mCurrent.amplitude;
    const double w  = kTwoPi * mCurrent.frequency;
    const double ph = mCurrent.phase;
    const double dc = mCurrent.dc;
    for (int i = 0; i < length; ++i) {
        double t = sampleTime(startTime, i, sampleRate);
        out[i] = static_cast<float>(dc + a * std::sin(w * t + ph));
    }
}

// ============================================================================
// Rectangular pulse train
// ============================================================================

Schema RectPulseComponent::schema() {
    return {
        ParamSpec::makeFloat("amplitude", "Amplitude", 1.0, 0.0, 10.0, 0.01,
            "Height of the rectangular pulses.",
            {"A=1.0 - base level", "A=3.0 - pronounced pulses"}),
        ParamSpec::makeFloat("width_sec", "Pulse width (s)", 0.02, 0.0005, 2.0, 0.0005,
            "Duration of one pulse.",
            {"0.02 s - short pulse", "0.2 s - wide pulse"}),
        ParamSpec::makeFloat("period_sec", "Repetition period (s)", 0.3, 0.001, 10.0, 0.001,
            "Interval between pulse starts. Repetition rate = 1/period.",
            {"0.3 s -> ~3.33 Hz", "1.0 s -> 1 Hz"}),
        ParamSpec::makeFloat("start_time_sec", "Start (s)", 0.0, 0.0, 60.0, 0.01,
            "Time offset at which the pulse train begins.",
            {"0 - immediately", "1.0 - pulses begin after one second"}),
    };
}

RectPulseComponent::RectPulseComponent(const ParamMap& params) {
    updateParams(params);
}

void RectPulseComponent::updateParams(const ParamMap& params) {
    mParams.amplitude    = paramAsDouble(params, "amplitude", mParams.amplitude);
    mParams.widthSec     = paramAsDouble(params, "width_sec", mParams.widthSec);
    mParams.periodSec    = paramAsDouble(params, "period_sec", mParams.periodSec);
    mParams.startTimeSec = paramAsDouble(params, "start_time_sec", mParams.startTimeSec);
}

ParamMap RectPulseComponent::params() const {
    return {{"amplitude", mParams.amplitude},
            {"width_sec", mParams.widthSec},
            {"period_sec", mParams.periodSec},
            {"start_time_sec", mParams.startTimeSec}};
}

void RectPulseComponent::render(double startTime, int length, double sampleRate, float* out) {
    std::fill(out, out + length, 0.0f);

    const double p = mParams.periodSec;
    const double w = mParams.widthSec;
    const double s = mParams.startTimeSec;
    if (p <= 0.0 || w <= 0.0 || length <= 0) return;

    const double endTime = startTime + static_cast<double>(length) / sampleRate;
    const float  amp = static_cast<float>(mParams.amplitude);

    // Only repetitions whose [start, start + width) can touch this chunk.
    long long kFirst = static_cast<long long>(std::floor((startTime - s - w) / p));
    long long kLast  = static_cast<long long>(std::floor((endTime - s) / p));
    kFirst = std::max(kFirst, 0LL);

    for (long long k = kFirst; k <= kLast; ++k) {
        const double pulseStart = s + static_cast<double>(k) * p;
        const double pulseEnd   = pulseStart + w;

        int iFrom = static_cast<int>(std::floor((pulseStart - startTime) * sampleRate)) - 1;
        int iTo   = static_cast<int>(std::ceil((pulseEnd - startTime) * sampleRate)) + 1;
        iFrom = std::max(iFrom, 0);
        iTo   = std::min(iTo, length);

        for (int i = iFrom; i < iTo; ++i) {
            double t = sampleTime(startTime, i, sampleRate);
            if (t >= pulseStart && t < pulseEnd) out[i] = amp;
        }
    }
}

// ============================================================================
// Gaussian pulse train
// ============================================================================

Schema GaussPulseComponent::schema() {
    return {
        ParamSpec::makeFloat("amplitude", "Amplitude", 1.0, 0.0, 10.0, 0.01,
            "Peak value of each Gaussian pulse.",
            {"A=1.0 - base level", "A=3.0 - pronounced pulse"}),
        ParamSpec::makeFloat("sigma_sec", "Width sigma (s)", 0.01, 0.0002, 2.0, 0.0002,
            "Sigma sets the duration of each Gaussian pulse.",
            {"0.01 s - short pulse", "0.1 s - wider pulse"}),
        ParamSpec::makeFloat("center_time_sec", "Centre (s)", 1.0, 0.0, 60.0, 0.01,
            "Time of the first pulse maximum.",
            {"1.0 s - pulse near one second", "0.2 s - early pulse"}),
        ParamSpec::makeFloat("repetition_period_sec", "Repetition period (s, 0 = off)",
            0.0, 0.0, 10.0, 0.01,
            "Pulse repetition period. 0 produces a single pulse.",
            {"0 - single pulse", "0.5 - a pulse every 0.5 s"}),
    };
}

GaussPulseComponent::GaussPulseComponent(const ParamMap& params) {
    updateParams(params);
}

void GaussPulseComponent::updateParams(const ParamMap& params) {
    mParams.amplitude           = paramAsDouble(params, "amplitude", mParams.amplitude);
    mParams.sigmaSec            = paramAsDouble(params, "sigma_sec", mParams.sigmaSec);
    mParams.centerTimeSec       = paramAsDouble(params, "center_time_sec", mParams.centerTimeSec);
    mParams.repetitionPeriodSec = paramAsDouble(params, "repetition_period_sec",
                                                mParams.repetitionPeriodSec);
}

ParamMap GaussPulseComponent::params() const {
    return {{"amplitude", mParams.amplitude},
            {"sigma_sec", mParams.sigmaSec},
            {"center_time_sec", mParams.centerTimeSec},
            {"repetition_period_sec", mParams.repetitionPeriodSec}};
}

void GaussPulseComponent::render(double startTime, int length, double sampleRate, float* out) {
    std::fill(out, out + length, 0.0f);

    const double sigma = mParams.sigmaSec;
    if (sigma <= 0.0 || length <= 0) return;

    const double c0      = mParams.centerTimeSec;
    const double rp      = mParams.repetitionPeriodSec;
    const double support = kSupportSigmas * sigma;
    const double endTime = startTime + static_cast<double>(length) / sampleRate;

    std::vector<double> centers;
    if (rp > 0.0) {
        long long kMin = static_cast<long long>(std::ceil((startTime - support - c0) / rp));
        long long kMax = static_cast<long long>(std::floor((endTime + support - c0) / rp));
        // Centres before t=0 are never emitted
        kMin = std::max(kMin, static_cast<long long>(std::ceil(-c0 / rp)));
        for (long long k = kMin; k <= kMax; ++k) {
            centers.push_back(c0 + static_cast<double>(k) * rp);
        }
    } else {
        centers.push_back(c0);
    }

    const double amp = mParams.amplitude;
    for (double c : centers) {
        int iFrom = static_cast<int>(std::floor((c - support - startTime) * sampleRate));
        int iTo   = static_cast<int>(std::ceil((c + support - startTime) * sampleRate)) + 1;
        iFrom = std::max(iFrom, 0);
        iTo   = std::min(iTo, length);
        for (int i = iFrom; i < iTo; ++i) {
            double z = (sampleTime(startTime, i, sampleRate) - c) / sigma;
            out[i] += static_cast<float>(amp * std::exp(-0.5 * z * z));
        }
    }
}

// ============================================================================
// Linear chirp
// ============================================================================

Schema ChirpComponent::schema() {
    return {
        ParamSpec::makeFloat("amplitude", "Amplitude", 0.8, 0.0, 10.0, 0.01,
            "Amplitude of the linear frequency sweep.",
            {"A=0.8 - base level", "A=2.0 - pronounced sweep"}),
        ParamSpec::makeFloat("f0", "Start frequency f0 (Hz)", 10.0, 0.0, 10000000.0, 0.1,
            "Frequency at the start of the sweep.",
            {"f0=10 Hz - low start", "f0=100 Hz - mid"}),
        ParamSpec::makeFloat("f1", "End frequency f1 (Hz)", 200.0, 0.0, 10000000.0, 0.1,
            "Frequency at the end of the sweep (t = duration).",
            {"f1=200 Hz - moderate range", "f1=50 kHz - high-frequency chirp"}),
        ParamSpec::makeFloat("duration_sec", "Duration (s)", 2.0, 0.01, 60.0, 0.01,
            "Length of the sweep. Outside the sweep interval the output is zero.",
            {"2.0 s - typical test", "0.5 s - short sweep"}),
        ParamSpec::makeFloat("start_time_sec", "Start (s)", 0.0, 0.0, 60.0, 0.01,
            "Time at which the sweep begins.",
            {"0 - start immediately", "1.0 - start after one second"}),
    };
}

ChirpComponent::ChirpComponent(const ParamMap& params) {
    updateParams(params);
}

void ChirpComponent::updateParams(const ParamMap& params) {
    mParams.amplitude    = paramAsDouble(params, "amplitude", mParams.amplitude);
    mParams.f0           = paramAsDouble(params, "f0", mParams.f0);
    mParams.f1           = paramAsDouble(params, "f1", mParams.f1);
    mParams.durationSec  = paramAsDouble(params, "duration_sec", mParams.durationSec);
    mParams.startTimeSec = paramAsDouble(params, "start_time_sec", mParams.startTimeSec);
}

ParamMap ChirpComponent::params() const {
    return {{"amplitude", mParams.amplitude},
            {"f0", mParams.f0},
            {"f1", mParams.f1},
            {"duration_sec", mParams.durationSec},
            {"start_time_sec", mParams.startTimeSec}};
}

void ChirpComponent::render(double startTime, int length, double sampleRate, float* out) {
    std::fill(out, out + length, 0.0f);

    const double dur = mParams.durationSec;
    if (dur <= 0.0) return;

    const double st    = mParams.startTimeSec;
    const double f0    = mParams.f0;
    const double sweep = (mParams.f1 - f0) / dur;   // Hz per second
    const double amp   = mParams.amplitude;

    for (int i = 0; i < length; ++i) {
        double t = sampleTime(startTime, i, sampleRate);
        if (t < st || t > st + dur) continue;
        double tt = t - st;
        double phase = kTwoPi * (f0 * tt + 0.5 * sweep * tt * tt);
        out[i] = static_cast<float>(amp * std::cos(phase));
    }
}

// ============================================================================
// SignalComponent
// ============================================================================

SignalComponent::Variant SignalComponent::makeVariant(ComponentKind kind, const ParamMap& params) {
    ParamMap full = params;
    backfillDefaults(full, componentSchema(kind));

    switch (kind) {
        case ComponentKind::Noise:      return NoiseComponent(full);
        case ComponentKind::Sine:       return SineComponent(full);
        case ComponentKind::RectPulse:  return RectPulseComponent(full);
        case ComponentKind::GaussPulse: return GaussPulseComponent(full);
        case ComponentKind::Chirp:      return ChirpComponent(full);
    }
    return NoiseComponent(full);
}

SignalComponent::SignalComponent(ComponentKind kind, const ParamMap& params, bool enabled)
    : mImpl(makeVariant(kind, params)), mEnabled(enabled) {}

std::optional<SignalComponent> SignalComponent::create(const std::string& kindName,
                                                       const ParamMap& params,
                                                       bool enabled) {
    auto kind = componentKindFromName(kindName);
    if (!kind) return std::nullopt;
    return SignalComponent(*kind, params, enabled);
}

ComponentKind SignalComponent::kind() const {
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::kKind; }, mImpl);
}

const char* SignalComponent::displayName() const {
    return std::visit([](const auto& c) { return std::decay_t<decltype(c)>::displayName(); }, mImpl);
}

void SignalComponent::updateParams(const ParamMap& params) {
    std::visit([&params](auto& c) { c.updateParams(params); }, mImpl);
}

ParamMap SignalComponent::params() const {
    return std::visit([](const auto& c) { return c.params(); }, mImpl);
}

ComponentSnapshot SignalComponent::snapshot() const {
    ComponentSnapshot s;
    s.kind    = kindName();
    s.name    = displayName();
    s.enabled = mEnabled;
    s.params  = params();
    return s;
}

void SignalComponent::render(double startTime, int length, double sampleRate, float* out) {
    if (length <= 0) return;
    if (!mEnabled || sampleRate <= 0.0) {
        std::fill(out, out + length, 0.0f);
        return;
    }
    std::visit([&](auto& c) { c.render(startTime, length, sampleRate, out); }, mImpl);
}

std::vector<float> SignalComponent::generate(double startTime, int length, double sampleRate) {
    std::vector<float> out(static_cast<size_t>(std::max(length, 0)), 0.0f);
    render(startTime, length, sampleRate, out.data());
    return out;
}

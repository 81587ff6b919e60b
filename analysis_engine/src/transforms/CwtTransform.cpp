#include "CwtTransform.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <fftw3.h>

#include "TransformUtils.hpp"

using cdouble = std::complex<double>;

static constexpr double kPi = 3.14159265358979323846;

// Samples used to tabulate the mother wavelet (2^10).
static constexpr int kWaveletPoints = 1024;

// Longest per-scale filter accepted. Beyond this the frequency is too low
// for the sample rate to be worth convolving.
static constexpr size_t kMaxFilterLength = size_t(1) << 22;

// FFTW's planner is not re-entrant; execution is.
static std::mutex sPlannerMutex;

// ─────────────────────────────────────────────────────────────────────────────
// Mother wavelets
// ─────────────────────────────────────────────────────────────────────────────

struct WaveletDef {
    const char* name;
    double lower;
    double upper;
    double centerFrequency;
    bool   isComplex;
    cdouble (*psi)(double);
};

static cdouble psiMorlet(double x) {
    return {std::exp(-0.5 * x * x) * std::cos(5.0 * x), 0.0};
}

static cdouble psiMexicanHat(double x) {
    const double norm = 2.0 / (std::sqrt(3.0) * std::pow(kPi, 0.25));
    return {norm * (1.0 - x * x) * std::exp(-0.5 * x * x), 0.0};
}

static cdouble psiGaus1(double x) {
    return {-2.0 * x * std::exp(-x * x) / std::sqrt(std::sqrt(kPi / 2.0)), 0.0};
}

static cdouble psiGaus2(double x) {
    return {-2.0 * (2.0 * x * x - 1.0) * std::exp(-x * x) / std::sqrt(3.0 * std::sqrt(kPi / 2.0)),
            0.0};
}

static cdouble psiCgau1(double x) {
    const double norm = std::exp(-x * x) / std::sqrt(2.0 * std::sqrt(kPi / 2.0));
    return {(-2.0 * x * std::cos(x) - std::sin(x)) * norm,
            (2.0 * x * std::sin(x) - std::cos(x)) * norm};
}

// Shannon, bandwidth 1, centre 1.5
static cdouble psiShannon(double x) {
    const double b = 1.0;
    const double c = 1.5;
    const double arg = kPi * b * x;
    const double sinc = (arg == 0.0) ? 1.0 : std::sin(arg) / arg;
    return std::sqrt(b) * sinc * std::polar(1.0, 2.0 * kPi * c * x);
}

static const WaveletDef kWavelets[] = {
    {"morl",      -8.0,  8.0,  0.8125, false, psiMorlet},
    {"mexh",      -8.0,  8.0,  0.25,   false, psiMexicanHat},
    {"gaus1",     -5.0,  5.0,  0.2,    false, psiGaus1},
    {"gaus2",     -5.0,  5.0,  0.3,    false, psiGaus2},
    {"cgau1",     -5.0,  5.0,  0.2,    true,  psiCgau1},
    {"shan1-1.5", -20.0, 20.0, 1.5,    true,  psiShannon},
};

static const WaveletDef& findWavelet(const std::string& name) {
    for (const auto& w : kWavelets) {
        if (name == w.name) return w;
    }
    throw std::invalid_argument("Unknown wavelet '" + name + "'");
}

// ─────────────────────────────────────────────────────────────────────────────
// FFTW helpers
// ─────────────────────────────────────────────────────────────────────────────

struct FftwFree {
    void operator()(fftw_complex* p) const { fftw_free(p); }
};
using FftwBuffer = std::unique_ptr<fftw_complex[], FftwFree>;

static FftwBuffer allocComplex(size_t n) {
    auto* p = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * n));
    if (!p) throw std::bad_alloc();
    return FftwBuffer(p);
}

struct PlanDeleter {
    void operator()(fftw_plan_s* p) const { fftw_destroy_plan(p); }
};
using FftwPlan = std::unique_ptr<fftw_plan_s, PlanDeleter>;

static inline cdouble* asComplex(fftw_complex* p) {
    return reinterpret_cast<cdouble*>(p);
}

// ============================================================================
// CwtTransform
// ============================================================================

PluginMetadata CwtTransform::metadata() const {
    return {"builtin:cwt_morlet",
            "CWT: Morlet / |coef| (frequency axis)",
            "CWT",
            "1.3",
            "Continuous wavelet transform. The Y axis is in Hz."};
}

Schema CwtTransform::describeParameters() const {
    return {
        ParamSpec::makeEnum("wavelet", "Wavelet", "morl", supportedWavelets(),
            "Continuous wavelet used by the CWT.",
            {"morl - general purpose", "mexh - good for pulses"}),
        ParamSpec::makeEnum("magnitude", "Coefficient magnitude", "abs", {"abs", "power"},
            "Displayed quantity: |CWT| or |CWT|^2.",
            {"abs - amplitude", "power - energy (squared magnitude)"}),
        ParamSpec::makeEnum("normalize", "Normalisation", "none", {"none", "max", "zscore"},
            "Normalisation of the coefficient map before display.",
            {"none - raw values", "max - divide by the maximum"}),
        ParamSpec::makeFloat("f_min", "Min frequency (Hz)", 5.0, 0.01, 10000000.0, 0.1,
            "Lower edge of the frequency grid.",
            {"5-10 Hz - slow processes", "20 Hz - when the low end is not of interest"}),
        ParamSpec::makeFloat("f_max", "Max frequency (Hz)", 300.0, 0.01, 10000000.0, 0.1,
            "Upper edge of the frequency grid (limited to Nyquist).",
            {"300 Hz - fast details", "fs/2 - highest possible"}),
        ParamSpec::makeInt("n_freqs", "Frequency bins", 128, 8, 4096, 8,
            "Number of scalogram rows. More rows give more detail at more CPU cost.",
            {"64 - faster", "256-512 - high detail", "1024+ - powerful machines"}),
        ParamSpec::makeEnum("freq_spacing", "Frequency scale", "linear", {"linear", "log"},
            "Frequency distribution: linear or logarithmic.",
            {"linear - uniform scale", "log - more detail at the low end"}),
    };
}

std::vector<std::string> CwtTransform::supportedWavelets() {
    std::vector<std::string> out;
    for (const auto& w : kWavelets) out.emplace_back(w.name);
    return out;
}

double CwtTransform::centralFrequency(const std::string& wavelet) {
    return findWavelet(wavelet).centerFrequency;
}

std::vector<double> CwtTransform::frequencyGrid(double fMin, double fMax, int n,
                                                const std::string& spacing) {
    fMin = std::max(fMin, 1e-6);
    fMax = std::max(fMax, fMin * 1.001);
    n = std::max(2, n);
    if (spacing == "log") return TransformUtils::geomspace(fMin, fMax, n);
    return TransformUtils::linspace(fMin, fMax, n);
}

std::vector<std::vector<cdouble>>
CwtTransform::coefficients(const std::vector<float>& samples,
                           const std::vector<double>& scales,
                           const std::string& wavelet) {
    const WaveletDef& def = findWavelet(wavelet);
    const size_t n = samples.size();
    std::vector<std::vector<cdouble>> out(scales.size());
    if (n == 0 || scales.empty()) return out;

    // ── Integrated mother wavelet ────────────────────────────────────────
    const double step = (def.upper - def.lower) / (kWaveletPoints - 1);
    std::vector<cdouble> intPsi(kWaveletPoints);
    cdouble running = 0.0;
    for (int i = 0; i < kWaveletPoints; ++i) {
        running += def.psi(def.lower + i * step);
        intPsi[i] = running * step;
    }
    if (def.isComplex) {
        for (auto& v : intPsi) v = std::conj(v);
    }

    // ── Per-scale filters ────────────────────────────────────────────────
    const double width = def.upper - def.lower;
    std::vector<std::vector<cdouble>> filters(scales.size());
    size_t maxLen = 0;
    for (size_t s = 0; s < scales.size(); ++s) {
        const double scale = scales[s];
        const double count = std::ceil(scale * width + 1.0);
        if (!(scale > 0.0) || count > static_cast<double>(kMaxFilterLength)) {
            throw std::invalid_argument("Scale " + std::to_string(scale) + " out of range");
        }
        std::vector<cdouble>& f = filters[s];
        for (size_t k = 0; k < static_cast<size_t>(count); ++k) {
            size_t j = static_cast<size_t>(static_cast<double>(k) / (scale * step));
            if (j >= intPsi.size()) break;
            f.push_back(intPsi[j]);
        }
        std::reverse(f.begin(), f.end());
        if (f.size() < 2) {
            throw std::invalid_argument("Selected scale " + std::to_string(scale) + " too small");
        }
        maxLen = std::max(maxLen, f.size());
    }

    // ── FFT convolution at one common size ───────────────────────────────
    const size_t L = n + maxLen - 1;
    FftwBuffer signalSpec = allocComplex(L);
    FftwBuffer work = allocComplex(L);

    FftwPlan forward, backward;
    {
        std::lock_guard<std::mutex> lock(sPlannerMutex);
        forward.reset(fftw_plan_dft_1d(static_cast<int>(L), work.get(), work.get(),
                                       FFTW_FORWARD, FFTW_ESTIMATE));
        backward.reset(fftw_plan_dft_1d(static_cast<int>(L), work.get(), work.get(),
                                        FFTW_BACKWARD, FFTW_ESTIMATE));
    }
    if (!forward || !backward) throw std::runtime_error("FFTW plan creation failed");

    cdouble* sig = asComplex(signalSpec.get());
    cdouble* w = asComplex(work.get());

    std::fill(sig, sig + L, cdouble(0.0));
    for (size_t i = 0; i < n; ++i) sig[i] = samples[i];
    fftw_execute_dft(forward.get(), signalSpec.get(), signalSpec.get());

    for (size_t s = 0; s < scales.size(); ++s) {
        const std::vector<cdouble>& f = filters[s];
        const size_t m = f.size();

        std::fill(w, w + L, cdouble(0.0));
        std::copy(f.begin(), f.end(), w);
        fftw_execute(forward.get());
        for (size_t k = 0; k < L; ++k) w[k] *= sig[k];
        fftw_execute(backward.get());

        // Full linear convolution occupies w[0 .. n + m - 2]. Differentiate
        // and keep the centred n samples.
        const double invL = 1.0 / static_cast<double>(L);
        const double gain = -std::sqrt(scales[s]);
        const size_t offset = (m - 2) / 2;
        std::vector<cdouble>& row = out[s];
        row.resize(n);
        for (size_t i = 0; i < n; ++i) {
            size_t k = offset + i;
            row[i] = gain * (w[k + 1] - w[k]) * invL;
        }
        if (!def.isComplex) {
            for (auto& v : row) v = cdouble(v.real(), 0.0);
        }
    }

    return out;
}

TransformResult CwtTransform::transform(const std::vector<float>& samples,
                                        double sampleRate,
                                        const ParamMap& params) const {
    const std::string wname     = paramAsString(params, "wavelet", "morl");
    const std::string magnitude = paramAsString(params, "magnitude", "abs");
    const std::string normalize = paramAsString(params, "normalize", "none");
    const std::string spacing   = paramAsString(params, "freq_spacing", "linear");
    const double cf = centralFrequency(wname);

    if (samples.size() < static_cast<size_t>(kMinWindowSamples) || sampleRate <= 0.0) {
        return TransformUtils::degenerateResult(samples.size(), sampleRate, "Hz");
    }

    const double fs = sampleRate;
    const double fMin = paramAsDouble(params, "f_min", 5.0);
    double fMax = paramAsDouble(params, "f_max", std::min(fs / 2.0, 300.0));
    fMax = std::min(fMax, fs / 2.0 - 1e-6);
    const int nFreqs = paramAsInt(params, "n_freqs", 128);

    const std::vector<double> freqs = frequencyGrid(fMin, fMax, nFreqs, spacing);
    const int rows = static_cast<int>(freqs.size());
    const int cols = static_cast<int>(samples.size());

    // Ascending frequency gives descending scale; evaluate ascending scale.
    std::vector<double> scalesAsc(rows);
    for (int r = 0; r < rows; ++r) {
        double f = std::max(freqs[rows - 1 - r], 1e-6);
        scalesAsc[r] = std::max(cf * fs / f, 1e-6);
    }

    const auto coefs = coefficients(samples, scalesAsc, wname);

    TransformResult result;
    result.resize(rows, cols);
    for (int r = 0; r < rows; ++r) {
        const auto& src = coefs[rows - 1 - r];
        for (int c = 0; c < cols; ++c) {
            result.at(r, c) = static_cast<float>(std::abs(src[c]));
        }
    }
    TransformUtils::applyMagnitude(result.image, magnitude);
    TransformUtils::normalizeImage(result.image, normalize);

    result.yAxis = freqs;
    result.xAxis = TransformUtils::timeAxis(cols, fs);
    result.yLabel = "Hz";
    result.meta = {{"mode", std::string("CWT")},
                   {"wavelet", wname},
                   {"magnitude", magnitude},
                   {"normalize", normalize},
                   {"freq_spacing", spacing}};
    return result;
}

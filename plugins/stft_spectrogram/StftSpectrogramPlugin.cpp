// StftSpectrogramPlugin.cpp - Short-time Fourier spectrogram, external module
//
// Built as a loadable module (stft_spectrogram.so) and discovered from the
// plugin directory as "plugin:stft_spectrogram". Its metadata declares
// "plugin:stft", so the registry answers to both ids.
//
// Each column is one Hann-windowed frame of fft_size samples, frames hop
// samples apart; each row is one FFT bin from 0 Hz to Nyquist. The x axis
// holds frame centre times.

#include <algorithm>
#include <cmath>
#include <complex>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <fftw3.h>

#include "TransformPlugin.hpp"
#include "TransformUtils.hpp"

namespace {

constexpr double kPi = 3.14159265358979323846;

// FFTW's planner is not re-entrant; execution is.
std::mutex sPlannerMutex;

struct FftwFree {
    void operator()(void* p) const { fftw_free(p); }
};

struct PlanDeleter {
    void operator()(fftw_plan_s* p) const { fftw_destroy_plan(p); }
};

class StftSpectrogramPlugin : public ITransformPlugin {
public:
    PluginMetadata metadata() const override {
        return {"plugin:stft",
                "STFT spectrogram (Hann)",
                "STFT",
                "1.0",
                "Short-time Fourier magnitude spectrogram. The Y axis is in Hz."};
    }

    Schema describeParameters() const override {
        return {
            ParamSpec::makeInt("fft_size", "FFT size", 256, 16, 65536, 16,
                "Samples per frame. Longer frames resolve frequency better and time worse.",
                {"128 - sharp in time", "1024 - sharp in frequency"}),
            ParamSpec::makeInt("hop", "Hop", 64, 1, 65536, 1,
                "Samples between frame starts."),
            ParamSpec::makeEnum("magnitude", "Coefficient magnitude", "abs", {"abs", "power"},
                "Displayed quantity: |X| or |X|^2."),
            ParamSpec::makeEnum("normalize", "Normalisation", "none", {"none", "max", "zscore"},
                "Normalisation of the spectrogram before display."),
        };
    }

    TransformResult transform(const std::vector<float>& samples,
                              double sampleRate,
                              const ParamMap& params) const override {
        const std::string magnitude = paramAsString(params, "magnitude", "abs");
        const std::string normalize = paramAsString(params, "normalize", "none");
        const size_t n = samples.size();

        if (n < static_cast<size_t>(kMinWindowSamples) || sampleRate <= 0.0) {
            return TransformUtils::degenerateResult(n, sampleRate, "Hz");
        }

        int fftSize = paramAsInt(params, "fft_size", 256);
        if (fftSize < kMinWindowSamples) {
            throw std::invalid_argument("fft_size must be at least " +
                                        std::to_string(kMinWindowSamples));
        }
        fftSize = std::min(fftSize, static_cast<int>(n));
        const int hop = std::max(1, paramAsInt(params, "hop", 64));

        const int bins = fftSize / 2 + 1;
        const int frames = 1 + static_cast<int>((n - static_cast<size_t>(fftSize)) / static_cast<size_t>(hop));

        std::unique_ptr<double, FftwFree> in(
            static_cast<double*>(fftw_malloc(sizeof(double) * fftSize)));
        std::unique_ptr<fftw_complex, FftwFree> out(
            static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins)));
        if (!in || !out) throw std::bad_alloc();

        std::unique_ptr<fftw_plan_s, PlanDeleter> plan;
        {
            std::lock_guard<std::mutex> lock(sPlannerMutex);
            plan.reset(fftw_plan_dft_r2c_1d(fftSize, in.get(), out.get(), FFTW_ESTIMATE));
        }
        if (!plan) throw std::runtime_error("FFTW plan creation failed");

        // Periodic Hann window.
        std::vector<double> window(fftSize);
        for (int i = 0; i < fftSize; ++i) {
            window[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * i / fftSize);
        }

        TransformResult result;
        result.resize(bins, frames);
        result.xAxis.resize(frames);

        for (int f = 0; f < frames; ++f) {
            const size_t start = static_cast<size_t>(f) * static_cast<size_t>(hop);
            for (int i = 0; i < fftSize; ++i) {
                in.get()[i] = window[i] * samples[start + i];
            }
            fftw_execute(plan.get());
            for (int k = 0; k < bins; ++k) {
                const fftw_complex& c = out.get()[k];
                result.at(k, f) = static_cast<float>(std::hypot(c[0], c[1]));
            }
            result.xAxis[f] = (static_cast<double>(start) + 0.5 * fftSize) / sampleRate;
        }

        TransformUtils::applyMagnitude(result.image, magnitude);
        TransformUtils::normalizeImage(result.image, normalize);

        result.yAxis.resize(bins);
        for (int k = 0; k < bins; ++k) {
            result.yAxis[k] = k * sampleRate / fftSize;
        }
        result.yLabel = "Hz";
        result.meta = {{"mode", std::string("STFT")},
                       {"fft_size", fftSize},
                       {"hop", hop},
                       {"magnitude", magnitude},
                       {"normalize", normalize}};
        return result;
    }
};

} // namespace

WAVELETSCOPE_EXPORT_TRANSFORM_PLUGIN(StftSpectrogramPlugin)

// CwtTransform.hpp - Continuous wavelet transform on a frequency grid
//
// Builds an ascending frequency grid from {f_min, f_max, n_freqs,
// freq_spacing}, maps each frequency to a scale through the wavelet's
// centre frequency (scale = cf * fs / f), evaluates the CWT at ascending
// scale order and returns rows in ascending-frequency order with yLabel "Hz".
//
// ALGORITHM:
// - The mother wavelet is sampled on 1024 points over its support and
//   integrated (cumulative sum * step).
// - For each scale the integrated wavelet is resampled at
//   j = floor(k / (scale * step)), k = 0 .. scale * width, and reversed.
// - The signal is convolved with it (FFTW, one padded size for all scales),
//   differentiated, multiplied by -sqrt(scale) and trimmed back to the
//   input length around the centre.
//
// Supported wavelets: morl, mexh, gaus1, gaus2, cgau1, shan1-1.5.

#pragma once

#include <complex>
#include <string>
#include <vector>

#include "TransformPlugin.hpp"

class CwtTransform : public ITransformPlugin {
public:
    PluginMetadata metadata() const override;
    Schema describeParameters() const override;
    TransformResult transform(const std::vector<float>& samples,
                              double sampleRate,
                              const ParamMap& params) const override;

    static std::vector<std::string> supportedWavelets();

    /// Centre frequency (cycles per unit of the wavelet's argument).
    /// Throws std::invalid_argument for an unknown name.
    static double centralFrequency(const std::string& wavelet);

    /// Ascending frequency grid; f_min >= 1e-6, f_max >= 1.001 * f_min,
    /// at least two points. spacing is "linear" or "log".
    static std::vector<double> frequencyGrid(double fMin, double fMax, int n,
                                             const std::string& spacing);

    /// Raw coefficients, one row per scale in the order given.
    /// Throws std::invalid_argument for an unknown wavelet or a scale too
    /// small to resolve.
    static std::vector<std::vector<std::complex<double>>>
    coefficients(const std::vector<float>& samples,
                 const std::vector<double>& scales,
                 const std::string& wavelet);
};

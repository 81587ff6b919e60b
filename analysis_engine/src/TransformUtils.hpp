#pragma once

#include <string>
#include <vector>

#include "TransformResult.hpp"

// Post-processing helpers shared by the built-in transforms and external
// plugins.
class TransformUtils {
public:
    /// "abs" -> |x| (no-op on magnitudes), "power" -> x^2.
    /// Unknown modes are treated as "abs".
    static void applyMagnitude(std::vector<float>& image, const std::string& mode);

    /// "none", "max" (divide by the global max when > 0) or "zscore"
    /// (skipped when the std-dev is below 1e-9).
    static void normalizeImage(std::vector<float>& image, const std::string& mode);

    /// Linear resampling of `values` onto `length` points spanning the same
    /// range. Inputs of fewer than two values give zeros.
    static std::vector<float> stretchToLength(const std::vector<float>& values, int length);

    /// Column times: i / sampleRate for i in [0, n).
    static std::vector<double> timeAxis(int n, double sampleRate);

    /// Evenly spaced points on [start, stop], endpoint included.
    static std::vector<double> linspace(double start, double stop, int n);

    /// Geometrically spaced points on [start, stop], endpoint included.
    /// Both ends must be positive.
    static std::vector<double> geomspace(double start, double stop, int n);

    /// The 1-row all-zero result returned for windows that are too short.
    static TransformResult degenerateResult(size_t numSamples, double sampleRate,
                                            const std::string& yLabel);
};

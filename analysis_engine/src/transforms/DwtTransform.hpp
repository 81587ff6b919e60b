// DwtTransform.hpp - Discrete (DWT) and packet (WPT) wavelet decompositions
//
// DWT mode: one row per detail level D<L> .. D1, optionally preceded by the
// approximation A<L>. WPT mode: one row per leaf node at the requested
// depth, listed in frequency (Gray-code) order, optionally restricted to an
// explicit node list and/or the top-K nodes by energy. Every row is
// stretched back to the input length so columns line up with time. The
// y axis is the row ordinal (yLabel "level/node"); meta "labels" names the
// rows.
//
// Boundary handling is half-sample symmetric extension.
//
// Both maxlevel and wpt_level are clamped to [1, min(14, L)] where L is the
// deepest level at which the filter still fits the signal,
// floor(log2(N / (F - 1))). WPT work grows as 2^level.

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "TransformPlugin.hpp"

struct WaveletFilterBank {
    std::vector<double> decLo;
    std::vector<double> decHi;
};

class DwtTransform : public ITransformPlugin {
public:
    static constexpr int kMaxDecompositionLevel = 14;

    PluginMetadata metadata() const override;
    Schema describeParameters() const override;
    TransformResult transform(const std::vector<float>& samples,
                              double sampleRate,
                              const ParamMap& params) const override;

    static std::vector<std::string> supportedWavelets();

    /// Decomposition filters. Throws std::invalid_argument for an unknown
    /// name.
    static WaveletFilterBank filterBank(const std::string& wavelet);

    /// One analysis step: (approximation, detail), each of length
    /// floor((N + F - 1) / 2).
    static std::pair<std::vector<double>, std::vector<double>>
    decompose(const std::vector<double>& x, const WaveletFilterBank& bank);

    /// floor(log2(n / (filterLength - 1))), or 0 when the filter is longer
    /// than the signal.
    static int maxUsefulLevel(size_t n, size_t filterLength);

    /// Node paths at `level` in frequency order ("a", "d" at level 1;
    /// "aa", "ad", "dd", "da" at level 2; ...).
    static std::vector<std::string> frequencyOrderedPaths(int level);
};

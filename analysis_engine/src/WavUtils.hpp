#pragma once

#include <string>
#include <vector>

#include "TransformResult.hpp"

struct MonoWavData {
    int sampleRate = 0;
    std::vector<float> samples;
};

class WavUtils {
public:
    /// Write mono 32-bit float WAV. The header rate is sampleRate rounded to
    /// the nearest integer. Throws std::runtime_error on failure.
    static void writeMonoWav(const std::string& path, const std::vector<float>& samples,
                             double sampleRate);

    /// Read a mono WAV (any format libsndfile understands) as float.
    /// Throws std::runtime_error if the file is missing or not mono.
    static MonoWavData loadMonoWav(const std::string& path);

    /// Two-column CSV with header "t_sec,x"; t = i / sampleRate.
    static void writeSignalCsv(const std::string& path, const std::vector<float>& samples,
                               double sampleRate);

    /// Transform image as CSV. Header row: "y\\x" then the x axis; each
    /// following row: its y value then the row's coefficients.
    static void writeImageCsv(const std::string& path, const TransformResult& result);
};

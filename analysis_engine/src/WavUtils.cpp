#include "WavUtils.hpp"
#include <sndfile.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

void WavUtils::writeMonoWav(const std::string& path, const std::vector<float>& samples,
                            double sampleRate) {
    if (!std::isfinite(sampleRate) || sampleRate < 0.5 ||
        sampleRate >= static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Invalid sample rate for WAV: " + path);
    }
    const int rate = static_cast<int>(std::lround(sampleRate));

    SF_INFO info = {};
    info.channels = 1;
    info.samplerate = rate;
    info.format = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    SNDFILE* snd = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!snd) {
        std::cerr << "[WavUtils] ERROR: opening " << path << " for write: "
                  << sf_strerror(nullptr) << "\n";
        throw std::runtime_error("Cannot create WAV file: " + path);
    }

    sf_count_t written = sf_write_float(snd, samples.data(), static_cast<sf_count_t>(samples.size()));
    if (written != static_cast<sf_count_t>(samples.size())) {
        std::string err = sf_strerror(snd);
        sf_close(snd);
        throw std::runtime_error("Short write to " + path + ": " + err);
    }
    sf_close(snd);

    std::cout << "[WavUtils] Wrote " << samples.size() << " samples at "
              << rate << " Hz to " << path << "\n";
}

MonoWavData WavUtils::loadMonoWav(const std::string& path) {
    SF_INFO info = {};
    SNDFILE* snd = sf_open(path.c_str(), SFM_READ, &info);
    if (!snd) throw std::runtime_error("Failed to open WAV: " + path);

    if (info.channels != 1) {
        sf_close(snd);
        throw std::runtime_error("WAV is not mono: " + path);
    }

    MonoWavData d;
    d.sampleRate = info.samplerate;
    d.samples.resize(static_cast<size_t>(info.frames));
    sf_count_t got = sf_read_float(snd, d.samples.data(), info.frames);
    sf_close(snd);
    d.samples.resize(static_cast<size_t>(std::max<sf_count_t>(got, 0)));
    return d;
}

void WavUtils::writeSignalCsv(const std::string& path, const std::vector<float>& samples,
                              double sampleRate) {
    if (sampleRate <= 0.0) throw std::runtime_error("Invalid sample rate for CSV: " + path);

    std::ofstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot create CSV file: " + path);

    f << std::setprecision(std::numeric_limits<float>::max_digits10);
    f << "t_sec,x\n";
    for (size_t i = 0; i < samples.size(); ++i) {
        f << static_cast<double>(i) / sampleRate << "," << samples[i] << "\n";
    }
    if (!f.good()) throw std::runtime_error("Failed writing CSV: " + path);

    std::cout << "[WavUtils] Wrote " << samples.size() << " rows to " << path << "\n";
}

void WavUtils::writeImageCsv(const std::string& path, const TransformResult& result) {
    std::ofstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot create CSV file: " + path);

    f << std::setprecision(std::numeric_limits<float>::max_digits10);
    f << "y\\x";
    for (double x : result.xAxis) f << "," << x;
    f << "\n";

    for (int r = 0; r < result.rows; ++r) {
        f << (static_cast<size_t>(r) < result.yAxis.size() ? result.yAxis[r] : static_cast<double>(r));
        for (int c = 0; c < result.cols; ++c) f << "," << result.at(r, c);
        f << "\n";
    }
    if (!f.good()) throw std::runtime_error("Failed writing CSV: " + path);

    std::cout << "[WavUtils] Wrote " << result.rows << "x" << result.cols
              << " image (" << result.yLabel << ") to " << path << "\n";
}

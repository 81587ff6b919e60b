#include "TransformUtils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

void TransformUtils::applyMagnitude(std::vector<float>& image, const std::string& mode) {
    if (mode == "power") {
        for (float& v : image) v = v * v;
    } else {
        for (float& v : image) v = std::fabs(v);
    }
}

void TransformUtils::normalizeImage(std::vector<float>& image, const std::string& mode) {
    if (image.empty()) return;

    if (mode == "max") {
        float m = *std::max_element(image.begin(), image.end());
        if (m > 0.0f) {
            for (float& v : image) v /= m;
        }
    } else if (mode == "zscore") {
        double sum = std::accumulate(image.begin(), image.end(), 0.0);
        double mean = sum / static_cast<double>(image.size());
        double var = 0.0;
        for (float v : image) {
            double d = v - mean;
            var += d * d;
        }
        double sd = std::sqrt(var / static_cast<double>(image.size()));
        if (sd > 1e-9) {
            for (float& v : image) v = static_cast<float>((v - mean) / sd);
        }
    }
    // "none" and anything unrecognised: leave as is
}

std::vector<float> TransformUtils::stretchToLength(const std::vector<float>& values, int length) {
    if (length <= 0) return {};
    if (values.size() == static_cast<size_t>(length)) return values;
    std::vector<float> out(static_cast<size_t>(length), 0.0f);
    if (values.size() <= 1) return out;
    if (length == 1) {
        out[0] = values[0];
        return out;
    }

    const double span = static_cast<double>(values.size() - 1);
    for (int i = 0; i < length; ++i) {
        double pos = span * i / (length - 1);
        size_t lo = static_cast<size_t>(std::floor(pos));
        if (lo >= values.size() - 1) {
            out[i] = values.back();
            continue;
        }
        double frac = pos - static_cast<double>(lo);
        out[i] = static_cast<float>(values[lo] * (1.0 - frac) + values[lo + 1] * frac);
    }
    return out;
}

std::vector<double> TransformUtils::timeAxis(int n, double sampleRate) {
    std::vector<double> t(static_cast<size_t>(std::max(n, 0)));
    for (int i = 0; i < n; ++i) t[i] = static_cast<double>(i) / sampleRate;
    return t;
}

std::vector<double> TransformUtils::linspace(double start, double stop, int n) {
    std::vector<double> out(static_cast<size_t>(std::max(n, 0)));
    if (n == 1) {
        out[0] = start;
    } else {
        for (int i = 0; i < n; ++i) {
            out[i] = start + (stop - start) * static_cast<double>(i) / (n - 1);
        }
    }
    return out;
}

std::vector<double> TransformUtils::geomspace(double start, double stop, int n) {
    std::vector<double> out = linspace(std::log(start), std::log(stop), n);
    for (double& v : out) v = std::exp(v);
    if (n > 0) out.front() = start;
    if (n > 1) out.back() = stop;
    return out;
}

TransformResult TransformUtils::degenerateResult(size_t numSamples, double sampleRate,
                                                 const std::string& yLabel) {
    const int cols = std::max(static_cast<int>(numSamples), 1);
    TransformResult r;
    r.resize(1, cols);
    r.yAxis = {0.0};
    r.xAxis = linspace(0.0, sampleRate > 0.0 ? numSamples / sampleRate : 0.0, cols);
    r.yLabel = yLabel;
    return r;
}

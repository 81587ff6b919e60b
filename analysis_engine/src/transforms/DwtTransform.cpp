#include "DwtTransform.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

#include "TransformUtils.hpp"

// Decomposition low-pass filters. High-pass is the quadrature mirror:
// hi[k] = (-1)^(k+1) * lo[F-1-k].
struct NamedFilter {
    const char* name;
    std::vector<double> decLo;
};

static const std::vector<NamedFilter>& namedFilters() {
    static const std::vector<NamedFilter> filters = {
        {"haar", {0.7071067811865476, 0.7071067811865476}},
        {"db2",  {-0.12940952255126037, 0.2241438680420134,
                  0.8365163037378079, 0.48296291314453416}},
        {"db4",  {-0.010597401785069032, 0.0328830116668852,
                  0.030841381835560764, -0.18703481171909309,
                  -0.027983769416859854, 0.6308807679298589,
                  0.7148465705529157, 0.2303778133088965}},
        {"sym4", {-0.07576571478927333, -0.02963552764599851,
                  0.49761866763201545, 0.8037387518059161,
                  0.29785779560527736, -0.09921954357684722,
                  -0.012603967262037833, 0.0322231006040427}},
        {"coif1", {-0.015655728135791993, -0.07273261951252645,
                   0.3848648468648578, 0.8525720202116004,
                   0.3378976624574818, -0.07273261951252645}},
    };
    return filters;
}

// Half-sample symmetric extension: ... x1 x0 | x0 x1 ... xN-1 | xN-1 xN-2 ...
static inline size_t symmetricIndex(long long idx, size_t n) {
    const long long period = 2 * static_cast<long long>(n);
    long long m = idx % period;
    if (m < 0) m += period;
    if (m >= static_cast<long long>(n)) m = period - 1 - m;
    return static_cast<size_t>(m);
}

// ============================================================================
// Static helpers
// ============================================================================

std::vector<std::string> DwtTransform::supportedWavelets() {
    std::vector<std::string> out;
    for (const auto& f : namedFilters()) out.emplace_back(f.name);
    return out;
}

WaveletFilterBank DwtTransform::filterBank(const std::string& wavelet) {
    for (const auto& f : namedFilters()) {
        if (wavelet != f.name) continue;
        WaveletFilterBank bank;
        bank.decLo = f.decLo;
        const size_t F = f.decLo.size();
        bank.decHi.resize(F);
        for (size_t k = 0; k < F; ++k) {
            double sign = (k % 2 == 0) ? -1.0 : 1.0;
            bank.decHi[k] = sign * f.decLo[F - 1 - k];
        }
        return bank;
    }
    throw std::invalid_argument("Unknown wavelet '" + wavelet + "'");
}

std::pair<std::vector<double>, std::vector<double>>
DwtTransform::decompose(const std::vector<double>& x, const WaveletFilterBank& bank) {
    const size_t n = x.size();
    const size_t F = bank.decLo.size();
    if (n == 0) return {};

    const size_t outLen = (n + F - 1) / 2;
    std::vector<double> approx(outLen, 0.0);
    std::vector<double> detail(outLen, 0.0);

    for (size_t k = 0; k < outLen; ++k) {
        const long long base = 2 * static_cast<long long>(k) + 1;
        double a = 0.0;
        double d = 0.0;
        for (size_t j = 0; j < F; ++j) {
            double v = x[symmetricIndex(base - static_cast<long long>(j), n)];
            a += bank.decLo[j] * v;
            d += bank.decHi[j] * v;
        }
        approx[k] = a;
        detail[k] = d;
    }
    return {std::move(approx), std::move(detail)};
}

std::vector<std::string> DwtTransform::frequencyOrderedPaths(int level) {
    std::vector<std::string> order = {"a", "d"};
    for (int i = 1; i < level; ++i) {
        std::vector<std::string> next;
        next.reserve(order.size() * 2);
        for (const auto& p : order) next.push_back("a" + p);
        for (auto it = order.rbegin(); it != order.rend(); ++it) next.push_back("d" + *it);
        order = std::move(next);
    }
    return order;
}

// ============================================================================
// ITransformPlugin
// ============================================================================

PluginMetadata DwtTransform::metadata() const {
    return {"builtin:dwt_wpt",
            "DWT/WPT: levels and packet nodes",
            "DWT/WPT",
            "1.1",
            "Discrete (DWT) and packet (WPT) decomposition shown as a coefficient "
            "matrix by level / node."};
}

Schema DwtTransform::describeParameters() const {
    return {
        ParamSpec::makeEnum("mode", "Mode", "WPT", {"DWT", "WPT"},
            "Decomposition type: DWT (detail levels) or WPT (packet nodes).",
            {"DWT - compact, one row per level", "WPT - finer band split"}),
        ParamSpec::makeEnum("wavelet", "Wavelet family", "db4", supportedWavelets(),
            "Discrete wavelet used for DWT/WPT.",
            {"haar - simple and fast", "db4 - general purpose"}),
        ParamSpec::makeInt("maxlevel", "Max level", 5, 1, kMaxDecompositionLevel, 1,
            "Upper bound on the decomposition level. WPT depth is set separately.",
            {"5 - typical for a 2-6 s window", "8-12 - long windows"}),
        ParamSpec::makeBool("show_approx", "DWT: include approximation (A)", false,
            "Add the approximation row A(L) above the detail rows.",
            {"Useful to see the low-frequency content"}),
        ParamSpec::makeInt("wpt_level", "WPT: level", 4, 1, kMaxDecompositionLevel, 1,
            "Packet decomposition depth. Limited to maxlevel.",
            {"4 - baseline", "6-10 - more bands, more CPU"}),
        ParamSpec::makeString("wpt_nodes", "WPT: nodes (comma separated, empty = all)", "",
            "Node paths to display. Empty shows every node at the level.",
            {"aa, ad, da, dd", "empty - all nodes"}),
        ParamSpec::makeEnum("wpt_select", "WPT: node selection", "all", {"all", "top_energy"},
            "Show every node, or only the most energetic ones.",
            {"all - full level", "top_energy - strongest bands"}),
        ParamSpec::makeInt("top_k", "WPT: node count (top-energy)", 8, 1, 256, 1,
            "How many nodes to keep when wpt_select = top_energy.",
            {"8 - typical", "32-64 - detailed"}),
        ParamSpec::makeEnum("magnitude", "Coefficient magnitude", "abs", {"abs", "power"},
            "Mapping from coefficients to the displayed map.",
            {"abs - |coef|", "power - |coef|^2 (energy)"}),
        ParamSpec::makeEnum("normalize", "Normalisation", "none", {"none", "max", "zscore"},
            "Normalisation of the coefficient matrix before display.",
            {"none - unchanged", "max - divide by the maximum", "zscore - (x-mu)/sigma"}),
    };
}

static std::vector<float> toFloat(const std::vector<double>& v) {
    return std::vector<float>(v.begin(), v.end());
}

int DwtTransform::maxUsefulLevel(size_t n, size_t filterLength) {
    if (filterLength < 2 || n < filterLength - 1) return 0;
    return static_cast<int>(std::floor(std::log2(static_cast<double>(n) /
                                                 static_cast<double>(filterLength - 1))));
}

TransformResult DwtTransform::transform(const std::vector<float>& samples,
                                        double sampleRate,
                                        const ParamMap& params) const {
    const size_t n = samples.size();
    if (n < static_cast<size_t>(kMinWindowSamples) || sampleRate <= 0.0) {
        return TransformUtils::degenerateResult(n, sampleRate, "level/node");
    }

    const std::string wname     = paramAsString(params, "wavelet", "db4");
    const std::string mode      = paramAsString(params, "mode", "WPT");
    const std::string magnitude = paramAsString(params, "magnitude", "abs");
    const std::string normalize = paramAsString(params, "normalize", "none");
    const WaveletFilterBank bank = filterBank(wname);
    const int levelCap = std::max(1, std::min(kMaxDecompositionLevel,
                                              maxUsefulLevel(n, bank.decLo.size())));
    const int maxlevel = std::clamp(paramAsInt(params, "maxlevel", 5), 1, levelCap);
    const int cols = static_cast<int>(n);

    const std::vector<double> x(samples.begin(), samples.end());
    std::vector<std::vector<float>> rows;
    std::vector<std::string> labels;
    ParamMap meta;

    if (mode == "DWT") {
        // Details come out finest first; display coarsest first.
        std::vector<std::vector<double>> details;
        std::vector<double> approx = x;
        for (int level = 1; level <= maxlevel; ++level) {
            auto [a, d] = decompose(approx, bank);
            details.push_back(std::move(d));
            approx = std::move(a);
        }

        if (paramAsBool(params, "show_approx", false)) {
            rows.push_back(TransformUtils::stretchToLength(toFloat(approx), cols));
            labels.push_back("A" + std::to_string(maxlevel));
        }
        for (int level = maxlevel; level >= 1; --level) {
            rows.push_back(TransformUtils::stretchToLength(toFloat(details[level - 1]), cols));
            labels.push_back("D" + std::to_string(level));
        }
        meta["mode"] = std::string("DWT");
        meta["level"] = maxlevel;
    } else {
        const int level = std::max(1, std::min(paramAsInt(params, "wpt_level", 4), maxlevel));

        // Full packet tree down to `level`, keyed by node path
        std::map<std::string, std::vector<double>> nodes;
        std::vector<std::string> frontier = {""};
        nodes[""] = x;
        for (int l = 0; l < level; ++l) {
            std::vector<std::string> next;
            for (const auto& path : frontier) {
                auto [a, d] = decompose(nodes[path], bank);
                nodes[path + "a"] = std::move(a);
                nodes[path + "d"] = std::move(d);
                next.push_back(path + "a");
                next.push_back(path + "d");
            }
            frontier = std::move(next);
        }

        std::vector<std::string> selected = frequencyOrderedPaths(level);
        const std::vector<std::string> wanted = paramAsStringList(params, "wpt_nodes");
        if (!wanted.empty()) {
            std::vector<std::string> filtered;
            for (const auto& p : selected) {
                if (std::find(wanted.begin(), wanted.end(), p) != wanted.end()) {
                    filtered.push_back(p);
                }
            }
            selected = std::move(filtered);
        }

        if (paramAsString(params, "wpt_select", "all") == "top_energy") {
            std::vector<std::pair<std::string, double>> energies;
            for (const auto& p : selected) {
                double e = 0.0;
                for (double v : nodes[p]) e += v * v;
                energies.emplace_back(p, e);
            }
            std::stable_sort(energies.begin(), energies.end(),
                             [](const auto& l, const auto& r) { return l.second > r.second; });
            const size_t k = static_cast<size_t>(std::max(0, paramAsInt(params, "top_k", 8)));
            selected.clear();
            for (size_t i = 0; i < energies.size() && i < k; ++i) {
                selected.push_back(energies[i].first);
            }
        }

        for (const auto& p : selected) {
            rows.push_back(TransformUtils::stretchToLength(toFloat(nodes[p]), cols));
            labels.push_back(p);
        }
        if (rows.empty()) {
            rows.emplace_back(n, 0.0f);
            labels.push_back("(none)");
        }
        meta["mode"] = std::string("WPT");
        meta["level"] = level;
    }

    TransformResult result;
    result.resize(static_cast<int>(rows.size()), cols);
    for (size_t r = 0; r < rows.size(); ++r) {
        std::copy(rows[r].begin(), rows[r].end(), result.image.begin() + r * n);
    }
    TransformUtils::applyMagnitude(result.image, magnitude);
    TransformUtils::normalizeImage(result.image, normalize);

    result.yAxis.resize(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) result.yAxis[r] = static_cast<double>(r);
    result.xAxis = TransformUtils::timeAxis(cols, sampleRate);
    result.yLabel = "level/node";

    meta["wavelet"] = wname;
    meta["labels"] = labels;
    result.meta = std::move(meta);
    return result;
}

// =============================================================================
// DwtTransform Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

#include "transforms/DwtTransform.hpp"

static constexpr double kPi = 3.14159265358979323846;

static std::vector<std::string> labelsOf(const TransformResult& r) {
    return paramAsStringList(r.meta, "labels");
}

static std::vector<float> slowTone(size_t n) {
    std::vector<float> x(n);
    for (size_t i = 0; i < n; ++i) x[i] = static_cast<float>(std::sin(2.0 * kPi * 10.0 * i / 1000.0));
    return x;
}

TEST_CASE("Haar filter bank", "[transform][dwt]") {
    auto bank = DwtTransform::filterBank("haar");
    const double h = 1.0 / std::sqrt(2.0);
    REQUIRE(bank.decLo.size() == 2);
    REQUIRE(bank.decLo[0] == Approx(h));
    REQUIRE(bank.decLo[1] == Approx(h));
    REQUIRE(bank.decHi[0] == Approx(-h));
    REQUIRE(bank.decHi[1] == Approx(h));
    REQUIRE_THROWS_AS(DwtTransform::filterBank("morl"), std::invalid_argument);
}

TEST_CASE("Single decomposition step", "[transform][dwt]") {
    auto bank = DwtTransform::filterBank("haar");
    std::vector<double> x = {1, 1, 2, 2, 3, 3, 4, 4};
    auto [a, d] = DwtTransform::decompose(x, bank);
    REQUIRE(a.size() == 4);
    REQUIRE(d.size() == 4);
    const double s2 = std::sqrt(2.0);
    REQUIRE(a[0] == Approx(2.0 / s2));
    REQUIRE(a[3] == Approx(8.0 / s2));
    for (double v : d) REQUIRE(v == Approx(0.0).margin(1e-12));

    SECTION("longer filters use (N + F - 1) / 2 outputs") {
        auto db4 = DwtTransform::filterBank("db4");
        auto [a4, d4] = DwtTransform::decompose(x, db4);
        REQUIRE(a4.size() == (x.size() + db4.decLo.size() - 1) / 2);
    }
}

TEST_CASE("Packet nodes are listed in frequency order", "[transform][dwt]") {
    REQUIRE(DwtTransform::frequencyOrderedPaths(1) == std::vector<std::string>{"a", "d"});
    REQUIRE(DwtTransform::frequencyOrderedPaths(2) ==
            std::vector<std::string>{"aa", "ad", "dd", "da"});
    REQUIRE(DwtTransform::frequencyOrderedPaths(3).size() == 8);
}

TEST_CASE("DWT mode rows", "[transform][dwt]") {
    DwtTransform dwt;
    const auto x = slowTone(512);

    TransformResult r = dwt.transform(x, 1000.0, {{"mode", std::string("DWT")},
                                                  {"wavelet", std::string("db2")},
                                                  {"maxlevel", 3},
                                                  {"show_approx", true}});
    REQUIRE(r.rows == 4);
    REQUIRE(r.cols == 512);
    REQUIRE(r.yLabel == "level/node");
    REQUIRE(labelsOf(r) == std::vector<std::string>{"A3", "D3", "D2", "D1"});
    REQUIRE(r.yAxis == std::vector<double>{0.0, 1.0, 2.0, 3.0});
    REQUIRE(paramAsString(r.meta, "mode", "") == "DWT");
    REQUIRE(paramAsInt(r.meta, "level", 0) == 3);

    SECTION("without approximation") {
        TransformResult d = dwt.transform(x, 1000.0, {{"mode", std::string("DWT")}, {"maxlevel", 2}});
        REQUIRE(labelsOf(d) == std::vector<std::string>{"D2", "D1"});
    }
}

TEST_CASE("WPT mode node selection", "[transform][dwt]") {
    DwtTransform dwt;
    const auto x = slowTone(512);
    ParamMap base = {{"mode", std::string("WPT")}, {"wavelet", std::string("haar")},
                     {"maxlevel", 2}, {"wpt_level", 2}};

    SECTION("all nodes at the level") {
        TransformResult r = dwt.transform(x, 1000.0, base);
        REQUIRE(r.rows == 4);
        REQUIRE(labelsOf(r) == std::vector<std::string>{"aa", "ad", "dd", "da"});
    }

    SECTION("level is limited to maxlevel") {
        ParamMap p = base;
        p["wpt_level"] = 6;
        TransformResult r = dwt.transform(x, 1000.0, p);
        REQUIRE(paramAsInt(r.meta, "level", 0) == 2);
        REQUIRE(r.rows == 4);
    }

    SECTION("explicit node list") {
        ParamMap p = base;
        p["wpt_nodes"] = std::string("dd, aa");
        TransformResult r = dwt.transform(x, 1000.0, p);
        REQUIRE(labelsOf(r) == std::vector<std::string>{"aa", "dd"});
    }

    SECTION("top energy picks the low band for a slow tone") {
        ParamMap p = base;
        p["wpt_select"] = std::string("top_energy");
        p["top_k"] = 1;
        TransformResult r = dwt.transform(x, 1000.0, p);
        REQUIRE(labelsOf(r) == std::vector<std::string>{"aa"});
    }

    SECTION("empty selection yields one placeholder row") {
        ParamMap p = base;
        p["wpt_nodes"] = std::vector<std::string>{"zz"};
        TransformResult r = dwt.transform(x, 1000.0, p);
        REQUIRE(r.rows == 1);
        REQUIRE(labelsOf(r) == std::vector<std::string>{"(none)"});
    }
}

TEST_CASE("Decomposition depth is clamped to what the window supports", "[transform][dwt]") {
    DwtTransform dwt;
    const auto x = slowTone(256);

    // db4 has 8 taps: floor(log2(256 / 7)) = 5
    REQUIRE(DwtTransform::maxUsefulLevel(256, 8) == 5);
    REQUIRE(DwtTransform::maxUsefulLevel(512, 2) == 9);
    REQUIRE(DwtTransform::maxUsefulLevel(4, 8) == 0);

    SECTION("WPT") {
        TransformResult r = dwt.transform(x, 1000.0, {{"mode", std::string("WPT")},
                                                      {"wavelet", std::string("db4")},
                                                      {"maxlevel", 1000000},
                                                      {"wpt_level", 24}});
        REQUIRE(paramAsInt(r.meta, "level", 0) == 5);
        REQUIRE(r.rows == 32);
    }

    SECTION("DWT") {
        TransformResult r = dwt.transform(x, 1000.0, {{"mode", std::string("DWT")},
                                                      {"wavelet", std::string("db4")},
                                                      {"maxlevel", 100}});
        REQUIRE(paramAsInt(r.meta, "level", 0) == 5);
        REQUIRE(r.rows == 5);
    }

    SECTION("long windows still stop at the schema maximum") {
        TransformResult r = dwt.transform(std::vector<float>(1 << 16, 0.0f), 1000.0,
                                          {{"mode", std::string("DWT")},
                                           {"wavelet", std::string("haar")},
                                           {"maxlevel", 40}});
        REQUIRE(paramAsInt(r.meta, "level", 0) == DwtTransform::kMaxDecompositionLevel);
    }

    SECTION("non-positive levels become 1") {
        TransformResult r = dwt.transform(x, 1000.0, {{"mode", std::string("WPT")},
                                                      {"maxlevel", -3},
                                                      {"wpt_level", 0}});
        REQUIRE(paramAsInt(r.meta, "level", 0) == 1);
        REQUIRE(r.rows == 2);
    }
}

TEST_CASE("DWT short windows and bad wavelets", "[transform][dwt]") {
    DwtTransform dwt;
    TransformResult r = dwt.transform(std::vector<float>(8, 1.0f), 1000.0, {});
    REQUIRE(r.rows == 1);
    REQUIRE(r.yLabel == "level/node");

    REQUIRE_THROWS_AS(dwt.transform(slowTone(64), 1000.0, {{"wavelet", std::string("bior9")}}),
                      std::invalid_argument);
}

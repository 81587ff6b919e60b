// =============================================================================
// TransformUtils Tests
// =============================================================================

#include <catch2/catch.hpp>

#include <algorithm>
#include <vector>

#include "TransformUtils.hpp"

TEST_CASE("Magnitude modes", "[transform][utils]") {
    std::vector<float> v = {-2.0f, 0.5f, 3.0f};

    SECTION("abs") {
        TransformUtils::applyMagnitude(v, "abs");
        REQUIRE(v == std::vector<float>{2.0f, 0.5f, 3.0f});
    }
    SECTION("power") {
        TransformUtils::applyMagnitude(v, "power");
        REQUIRE(v == std::vector<float>{4.0f, 0.25f, 9.0f});
    }
}

TEST_CASE("Normalisation modes", "[transform][utils]") {
    SECTION("max") {
        std::vector<float> v = {1.0f, 2.0f, 4.0f};
        TransformUtils::normalizeImage(v, "max");
        REQUIRE(v[2] == Approx(1.0f));
        REQUIRE(v[0] == Approx(0.25f));
    }
    SECTION("max of an all-zero image is left alone") {
        std::vector<float> v(4, 0.0f);
        TransformUtils::normalizeImage(v, "max");
        REQUIRE(v == std::vector<float>(4, 0.0f));
    }
    SECTION("zscore") {
        std::vector<float> v = {1.0f, 2.0f, 3.0f, 4.0f};
        TransformUtils::normalizeImage(v, "zscore");
        double mean = (v[0] + v[1] + v[2] + v[3]) / 4.0;
        REQUIRE(mean == Approx(0.0).margin(1e-6));
        REQUIRE(v[3] == Approx(1.3416408).epsilon(1e-5));
    }
    SECTION("zscore of a constant image is left alone") {
        std::vector<float> v(5, 3.0f);
        TransformUtils::normalizeImage(v, "zscore");
        REQUIRE(v == std::vector<float>(5, 3.0f));
    }
}

TEST_CASE("stretchToLength interpolates linearly", "[transform][utils]") {
    REQUIRE(TransformUtils::stretchToLength({0.0f, 2.0f}, 5) ==
            std::vector<float>{0.0f, 0.5f, 1.0f, 1.5f, 2.0f});
    REQUIRE(TransformUtils::stretchToLength({1.0f, 2.0f, 3.0f}, 3) ==
            std::vector<float>{1.0f, 2.0f, 3.0f});
    REQUIRE(TransformUtils::stretchToLength({7.0f}, 4) == std::vector<float>(4, 0.0f));
    REQUIRE(TransformUtils::stretchToLength({}, 3) == std::vector<float>(3, 0.0f));
}

TEST_CASE("Grids keep their endpoints", "[transform][utils]") {
    auto lin = TransformUtils::linspace(10.0, 20.0, 3);
    REQUIRE(lin == std::vector<double>{10.0, 15.0, 20.0});

    auto geo = TransformUtils::geomspace(1.0, 100.0, 3);
    REQUIRE(geo.front() == 1.0);
    REQUIRE(geo[1] == Approx(10.0));
    REQUIRE(geo.back() == 100.0);

    REQUIRE(TransformUtils::geomspace(5.0, 50.0, 1) == std::vector<double>{5.0});
}

TEST_CASE("Degenerate result is one zero row", "[transform][utils]") {
    auto r = TransformUtils::degenerateResult(8, 1000.0, "Hz");
    REQUIRE(r.rows == 1);
    REQUIRE(r.cols == 8);
    REQUIRE(r.yAxis == std::vector<double>{0.0});
    REQUIRE(r.xAxis.size() == 8);
    REQUIRE(r.xAxis.back() == Approx(0.008));
    REQUIRE(std::all_of(r.image.begin(), r.image.end(), [](float v) { return v == 0.0f; }));

    auto empty = TransformUtils::degenerateResult(0, 1000.0, "Hz");
    REQUIRE(empty.cols == 1);
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "score_normalizer.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>

using Catch::Approx;

TEST_CASE("normalize divides every raw value by the total", "[ScoreNormalizer]") {
    SECTION("Scores sum to one") {
        ScoreMap raw{{"a.py", 3.0}, {"b.py", 1.0}, {"src/c.cpp", 4.0}};
        auto scores = normalize(raw);

        REQUIRE(scores.size() == 3);
        REQUIRE(scores["a.py"] == Approx(0.375));
        REQUIRE(scores["b.py"] == Approx(0.125));
        REQUIRE(scores["src/c.cpp"] == Approx(0.5));
        REQUIRE(std::fabs(scoreTotal(scores) - 1.0) <= NORMALIZATION_TOLERANCE);
        REQUIRE(isNormalized(scores));
    }

    SECTION("Many small values still sum to one") {
        ScoreMap raw;
        for (int i = 0; i < 1000; ++i) {
            raw["file" + std::to_string(i)] = 1.0 + (i % 7) * 0.1;
        }
        auto scores = normalize(raw);
        REQUIRE(scores.size() == 1000);
        REQUIRE(isNormalized(scores));
    }

    SECTION("Zero entries keep their key") {
        auto scores = normalize({{"a.py", 2.0}, {"b.py", 0.0}});
        REQUIRE(scores.size() == 2);
        REQUIRE(scores["a.py"] == Approx(1.0));
        REQUIRE(scores["b.py"] == 0.0);
    }

    SECTION("Normalizing twice changes nothing") {
        auto once = normalize({{"x", 5.0}, {"y", 15.0}});
        auto twice = normalize(once);
        REQUIRE(twice.size() == once.size());
        for (const auto& [path, score] : once) {
            REQUIRE(twice[path] == Approx(score));
        }
    }
}

TEST_CASE("normalize treats a zero total as no signal", "[ScoreNormalizer]") {
    SECTION("Empty input") {
        REQUIRE(normalize(ScoreMap()).empty());
    }

    SECTION("All zeros") {
        REQUIRE(normalize({{"a.py", 0.0}, {"b.py", 0.0}}).empty());
    }

    SECTION("An empty map counts as normalized") {
        REQUIRE(isNormalized(ScoreMap()));
    }
}

TEST_CASE("normalize rejects invalid raw values", "[ScoreNormalizer]") {
    REQUIRE_THROWS_AS(normalize({{"a.py", -1.0}}), std::invalid_argument);
    REQUIRE_THROWS_AS(normalize({{"a.py", std::numeric_limits<double>::quiet_NaN()}}), std::invalid_argument);
    REQUIRE_THROWS_AS(normalize({{"a.py", std::numeric_limits<double>::infinity()}}), std::invalid_argument);
}

TEST_CASE("blend forms a weighted average of two score maps", "[ScoreNormalizer]") {
    ScoreMap a{{"x", 0.8}, {"y", 0.2}};
    ScoreMap b{{"x", 0.2}, {"y", 0.8}};

    SECTION("Equal weight") {
        auto blended = blend(a, b, 0.5);
        REQUIRE(blended.size() == 2);
        REQUIRE(blended["x"] == Approx(0.5));
        REQUIRE(blended["y"] == Approx(0.5));
    }

    SECTION("Weight 1 keeps the first map") {
        auto blended = blend(a, b, 1.0);
        REQUIRE(blended["x"] == Approx(0.8));
        REQUIRE(blended["y"] == Approx(0.2));
    }

    SECTION("Weight 0 keeps the second map") {
        auto blended = blend(a, b, 0.0);
        REQUIRE(blended["x"] == Approx(0.2));
        REQUIRE(blended["y"] == Approx(0.8));
    }

    SECTION("Keys missing from one side count as zero") {
        auto blended = blend({{"x", 1.0}}, {{"y", 1.0}}, 0.25);
        REQUIRE(blended.size() == 2);
        REQUIRE(blended["x"] == Approx(0.25));
        REQUIRE(blended["y"] == Approx(0.75));
        REQUIRE(isNormalized(blended));
    }

    SECTION("Weights outside [0, 1] are rejected") {
        REQUIRE_THROWS_AS(blend(a, b, -0.1), std::invalid_argument);
        REQUIRE_THROWS_AS(blend(a, b, 1.5), std::invalid_argument);
        REQUIRE_THROWS_AS(blend(a, b, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    }
}

TEST_CASE("blendAll folds any number of sources", "[ScoreNormalizer]") {
    ScoreMap history{{"a", 0.5}, {"b", 0.5}};
    ScoreMap tools{{"a", 1.0}};
    ScoreMap model{{"b", 0.25}, {"c", 0.75}};

    SECTION("Matches the weighted average") {
        auto blended = blendAll({{history, 2.0}, {tools, 1.0}, {model, 1.0}});
        REQUIRE(blended["a"] == Approx((2.0 * 0.5 + 1.0) / 4.0));
        REQUIRE(blended["b"] == Approx((2.0 * 0.5 + 0.25) / 4.0));
        REQUIRE(blended["c"] == Approx(0.75 / 4.0));
        REQUIRE(isNormalized(blended));
    }

    SECTION("Two sources agree with blend") {
        auto viaAll = blendAll({{history, 3.0}, {tools, 1.0}});
        auto viaBlend = blend(history, tools, 0.75);
        REQUIRE(viaAll.size() == viaBlend.size());
        for (const auto& [path, score] : viaBlend) {
            REQUIRE(viaAll[path] == Approx(score));
        }
    }

    SECTION("Zero weight and empty sources are skipped") {
        auto blended = blendAll({{history, 1.0}, {tools, 0.0}, {ScoreMap(), 5.0}});
        REQUIRE(blended.size() == 2);
        REQUIRE(blended["a"] == Approx(0.5));
        REQUIRE(blended["b"] == Approx(0.5));
    }

    SECTION("Nothing but empty sources gives no signal") {
        REQUIRE(blendAll({{ScoreMap(), 1.0}}).empty());
    }

    SECTION("Invalid weights are rejected") {
        REQUIRE_THROWS_AS(blendAll({{history, -1.0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(blendAll({{history, 0.0}, {tools, 0.0}}), std::invalid_argument);
        REQUIRE_THROWS_AS(blendAll({}), std::invalid_argument);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "rank_reporter.hpp"
#include <stdexcept>

TEST_CASE("topN orders files by descending score", "[RankReporter]") {
    ScoreMap scores{{"low.py", 0.1}, {"high.py", 0.6}, {"mid.py", 0.3}};

    SECTION("Highest scores come first with 1-based ranks") {
        auto entries = topN(scores, 2);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].path == "high.py");
        REQUIRE(entries[0].rank == 1);
        REQUIRE(entries[0].score == 0.6);
        REQUIRE(entries[1].path == "mid.py");
        REQUIRE(entries[1].rank == 2);
    }

    SECTION("Asking for more than exists returns every file") {
        auto entries = topN(scores, 10);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[2].path == "low.py");
        REQUIRE(entries[2].rank == 3);
    }

    SECTION("An empty map gives an empty report") {
        REQUIRE(topN(ScoreMap(), 5).empty());
    }

    SECTION("n of zero is rejected") {
        REQUIRE_THROWS_AS(topN(scores, 0), std::invalid_argument);
    }
}

TEST_CASE("topN breaks ties by ascending path", "[RankReporter]") {
    ScoreMap scores{{"z.py", 0.25}, {"a.py", 0.25}, {"m.py", 0.25}, {"b.py", 0.25}};

    auto entries = topN(scores, 3);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].path == "a.py");
    REQUIRE(entries[1].path == "b.py");
    REQUIRE(entries[2].path == "m.py");

    SECTION("Repeated calls give identical reports") {
        auto again = topN(scores, 3);
        REQUIRE(again.size() == entries.size());
        for (size_t i = 0; i < again.size(); ++i) {
            REQUIRE(again[i].path == entries[i].path);
            REQUIRE(again[i].rank == entries[i].rank);
        }
    }
}

TEST_CASE("Reports are formatted for display", "[RankReporter]") {
    SECTION("One entry per line with four decimals") {
        REQUIRE(formatEntry({"src/main.cpp", 0.5, 1}) == "1. src/main.cpp (Score: 0.5000)");
        REQUIRE(formatEntry({"b.py", 0.123456, 12}) == "12. b.py (Score: 0.1235)");
    }

    SECTION("Report has a heading") {
        auto text = formatReport(topN({{"a.py", 0.5}, {"b.py", 0.5}}, 2), 2);
        REQUIRE(text == "Top 2 files most likely to contain defects:\n"
                        "1. a.py (Score: 0.5000)\n"
                        "2. b.py (Score: 0.5000)\n");
    }

    SECTION("Empty report says there is no signal") {
        auto text = formatReport({}, 10);
        REQUIRE(text.find("No defect signal") != std::string::npos);
    }

    SECTION("JSON entries carry rank, path and score") {
        auto json = entriesToJson(topN({{"a.py", 0.75}, {"b.py", 0.25}}, 2));
        REQUIRE(json.is_array());
        REQUIRE(json.size() == 2);
        REQUIRE(json[0]["rank"] == 1);
        REQUIRE(json[0]["path"] == "a.py");
        REQUIRE(json[0]["score"] == 0.75);
        REQUIRE(json[1]["path"] == "b.py");
    }
}

#include <catch2/catch_test_macros.hpp>
#include "external_signal.hpp"
#include "git_repository.hpp"
#include "score_source.hpp"
#include "test_support.hpp"
#include <memory>

TEST_CASE("PlaceholderModelSource scores source files reproducibly", "[ScoreSource]") {
    TempDir root("placeholder");
    createTestFile(root.path() / "app.py", "x\n");
    createTestFile(root.path() / "lib" / "core.cpp", "x\n");
    createTestFile(root.path() / "lib" / "core.h", "x\n");
    createTestFile(root.path() / "web" / "main.go", "x\n");
    createTestFile(root.path() / "README.md", "x\n");
    createTestFile(root.path() / "lib" / "core.hpp", "x\n");

    PatternMatcher matcher;
    PlaceholderModelSource model(root.path(), matcher, 42);
    REQUIRE(model.name() == "placeholder-model");

    auto scores = model.rawScores();

    SECTION("Only listed extensions are scored") {
        REQUIRE(scores.size() == 4);
        REQUIRE(scores.count("app.py") == 1);
        REQUIRE(scores.count("lib/core.cpp") == 1);
        REQUIRE(scores.count("lib/core.h") == 1);
        REQUIRE(scores.count("web/main.go") == 1);
        REQUIRE(scores.count("README.md") == 0);
        REQUIRE(scores.count("lib/core.hpp") == 0);
    }

    SECTION("Scores lie in [0, 1)") {
        for (const auto& [path, score] : scores) {
            REQUIRE(score >= 0.0);
            REQUIRE(score < 1.0);
        }
    }

    SECTION("The same seed gives the same scores") {
        PlaceholderModelSource again(root.path(), matcher, 42);
        REQUIRE(again.rawScores() == scores);
        REQUIRE(model.rawScores() == scores);
    }

    SECTION("Another seed gives other scores") {
        PlaceholderModelSource other(root.path(), matcher, 7);
        REQUIRE(other.rawScores() != scores);
    }

    SECTION("No warnings") {
        REQUIRE(model.warnings().empty());
        REQUIRE_FALSE(model.isPartial());
    }
}

TEST_CASE("ChangeHistorySource exposes aggregated counts", "[ScoreSource]") {
    TempGitRepo repo("history_source");
    repo.write("a.py", "1\n");
    repo.commit("c1", 1700000000);
    repo.write("a.py", "2\n");
    repo.write("b.py", "1\n");
    repo.commit("c2", 1700000100);

    GitRepository handle(repo.path());

    SECTION("Complete history") {
        ChangeHistorySource source(handle, HistorySelector::all(), AggregationOptions());
        REQUIRE(source.name() == "change-history");

        auto raw = source.rawScores();
        REQUIRE(raw.at("a.py") == 2.0);
        REQUIRE(raw.at("b.py") == 1.0);
        REQUIRE(source.lastResult().commitsVisited == 2);
        REQUIRE_FALSE(source.isPartial());
    }

    SECTION("Unknown refs are reported") {
        ChangeHistorySource source(handle, HistorySelector::refs({"main", "nope"}), AggregationOptions());
        source.rawScores();
        REQUIRE(source.isPartial());
        REQUIRE(source.warnings().size() == 1);
    }
}

TEST_CASE("StaticAnalysisSource wraps the external signal", "[ScoreSource]") {
    TempDir root("static_source");
    createTestFile(root.path() / "a.c", "int main(void) { return 0; }\n");

    ToolRegistry registry;
    registry.registerAdapter({"*.c"}, std::make_shared<CppcheckAdapter>("defectscope-no-such-cppcheck"));
    ExternalSignalAdapter adapter(registry);

    StaticAnalysisSource source(adapter, root.path(), {"a.c"});
    REQUIRE(source.name() == "static-analysis");

    auto raw = source.rawScores();
    REQUIRE(raw.size() == 1);
    REQUIRE(raw.at("a.c") == 0.0);
    REQUIRE(source.isPartial());
    REQUIRE(source.warnings().size() == 1);
    REQUIRE(source.lastSignal().failures == 1);
}

#include <catch2/catch_test_macros.hpp>
#include "commit_walker.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <memory>

namespace {

std::unique_ptr<LineSource> lines(const std::string& text) {
    return std::make_unique<StringLineSource>(text);
}

std::vector<Commit> walkAll(const std::string& text) {
    CommitWalker walker(lines(text));
    std::vector<Commit> commits;
    Commit commit;
    while (walker.next(commit)) {
        commits.push_back(commit);
    }
    return commits;
}

// Reports a failed producer once all of its lines have been read
class FailingLineSource : public StringLineSource {
public:
    using StringLineSource::StringLineSource;

    void finish() override {
        throw HistoryTraversalError("fatal: bad object");
    }
};

}  // namespace

TEST_CASE("CommitWalker parses log records", "[CommitWalker]") {
    const std::string c1 = commitId('1');
    const std::string c2 = commitId('2');
    const std::string c3 = commitId('3');

    std::string log = logRecord(c3, {c2}, 1700000300, {"M\tb.py"}) +
                      logRecord(c2, {c1}, 1700000200, {"M\ta.py", "A\tb.py"}) +
                      logRecord(c1, {}, 1700000100, {"A\ta.py"});

    auto commits = walkAll(log);
    REQUIRE(commits.size() == 3);

    SECTION("Children come before parents") {
        REQUIRE(commits[0].id == c3);
        REQUIRE(commits[1].id == c2);
        REQUIRE(commits[2].id == c1);
    }

    SECTION("Header fields are read") {
        REQUIRE(commits[1].parents == std::vector<std::string>{c1});
        REQUIRE(commits[1].authorTime == 1700000200);
        REQUIRE(commits[2].parents.empty());
        REQUIRE_FALSE(commits[0].isMerge());
    }

    SECTION("Status lines become changes") {
        REQUIRE(commits[1].changes.size() == 2);
        REQUIRE(commits[1].changes[0].kind == ChangeKind::Modified);
        REQUIRE(commits[1].changes[0].path == "a.py");
        REQUIRE(commits[1].changes[1].kind == ChangeKind::Added);
        REQUIRE(commits[1].changes[1].path == "b.py");
    }
}

TEST_CASE("CommitWalker handles special records", "[CommitWalker]") {
    const std::string c1 = commitId('1');
    const std::string c2 = commitId('2');
    const std::string m = commitId('a');

    SECTION("Commit without changes") {
        auto commits = walkAll(logRecord(c1, {}, 100, {}));
        REQUIRE(commits.size() == 1);
        REQUIRE(commits[0].changes.empty());
        REQUIRE(commits[0].touchedPaths().empty());
    }

    SECTION("Renames keep both paths") {
        auto commits = walkAll(logRecord(c1, {}, 100, {"R087\told/name.py\tnew/name.py"}));
        REQUIRE(commits[0].changes.size() == 1);
        const auto& change = commits[0].changes[0];
        REQUIRE(change.kind == ChangeKind::Renamed);
        REQUIRE(change.previousPath == "old/name.py");
        REQUIRE(change.path == "new/name.py");
        REQUIRE(commits[0].touchedPaths() == std::vector<std::string>{"old/name.py", "new/name.py"});
    }

    SECTION("Merges list every parent") {
        auto commits = walkAll(logRecord(m, {c2, c1}, 300, {"M\tx.c"}) +
                               logRecord(c2, {c1}, 200, {}) +
                               logRecord(c1, {}, 100, {}));
        REQUIRE(commits.size() == 3);
        REQUIRE(commits[0].isMerge());
        REQUIRE(commits[0].parents.size() == 2);
    }

    SECTION("SHA-256 ids are accepted") {
        const std::string longId(64, 'e');
        auto commits = walkAll(logRecord(longId, {}, 100, {"A\tfile"}));
        REQUIRE(commits[0].id == longId);
    }

    SECTION("Quoted paths are unquoted") {
        auto commits = walkAll(logRecord(c1, {}, 100, {"A\t\"tab\\there.txt\""}));
        REQUIRE(commits[0].changes[0].path == "tab\there.txt");
    }

    SECTION("Windows line endings are tolerated") {
        std::string log = logRecord(c1, {}, 100, {"M\ta.py"});
        std::string crlf;
        for (char c : log) {
            if (c == '\n') {
                crlf += '\r';
            }
            crlf += c;
        }
        auto commits = walkAll(crlf);
        REQUIRE(commits[0].changes[0].path == "a.py");
        REQUIRE(commits[0].authorTime == 100);
    }
}

TEST_CASE("CommitWalker yields each commit once", "[CommitWalker]") {
    const std::string c1 = commitId('1');
    const std::string c2 = commitId('2');

    CommitWalker walker(lines(logRecord(c2, {c1}, 200, {"M\ta"}) +
                              logRecord(c2, {c1}, 200, {"M\ta"}) +
                              logRecord(c1, {}, 100, {"A\ta"})));
    std::vector<std::string> ids;
    Commit commit;
    while (walker.next(commit)) {
        ids.push_back(commit.id);
    }

    REQUIRE(ids == std::vector<std::string>{c2, c1});
    REQUIRE(walker.visited() == 2);
    REQUIRE(walker.duplicatesSkipped() == 1);
}

TEST_CASE("CommitWalker rejects inconsistent history", "[CommitWalker]") {
    const std::string c1 = commitId('1');
    const std::string c2 = commitId('2');

    SECTION("Self parent") {
        REQUIRE_THROWS_AS(walkAll(logRecord(c1, {c1}, 100, {})), HistoryTraversalError);
    }

    SECTION("Parent before child") {
        REQUIRE_THROWS_AS(walkAll(logRecord(c1, {}, 100, {}) + logRecord(c2, {c1}, 200, {})),
                          HistoryTraversalError);
    }

    SECTION("Malformed header") {
        std::string header = std::string(1, COMMIT_RECORD_MARK) + c1 + "\n";
        REQUIRE_THROWS_AS(walkAll(header), HistoryTraversalError);
    }

    SECTION("Invalid commit id") {
        REQUIRE_THROWS_AS(walkAll(logRecord("not-a-commit", {}, 100, {})), HistoryTraversalError);
        REQUIRE_THROWS_AS(walkAll(logRecord(std::string(40, 'G'), {}, 100, {})), HistoryTraversalError);
    }

    SECTION("Invalid parent id") {
        REQUIRE_THROWS_AS(walkAll(logRecord(c2, {"abc"}, 100, {})), HistoryTraversalError);
    }

    SECTION("Invalid author time") {
        std::string record = logRecord(c1, {}, 100, {});
        record.replace(record.find("100"), 3, "1x0");
        REQUIRE_THROWS_AS(walkAll(record), HistoryTraversalError);
    }

    SECTION("Text before the first record") {
        REQUIRE_THROWS_AS(walkAll("warning: something odd\n" + logRecord(c1, {}, 100, {})),
                          HistoryTraversalError);
    }

    SECTION("Change line without a path") {
        REQUIRE_THROWS_AS(walkAll(logRecord(c1, {}, 100, {"M"})), HistoryTraversalError);
    }

    SECTION("Rename without a target") {
        REQUIRE_THROWS_AS(walkAll(logRecord(c1, {}, 100, {"R100\tonly-one"})), HistoryTraversalError);
    }

    SECTION("Producer failure surfaces at the end of the walk") {
        CommitWalker walker(std::make_unique<FailingLineSource>(logRecord(c1, {}, 100, {"A\ta"})));
        Commit commit;
        REQUIRE(walker.next(commit));
        REQUIRE_THROWS_AS(walker.next(commit), HistoryTraversalError);
    }
}

TEST_CASE("CommitWalker stops on request", "[CommitWalker]") {
    CommitWalker walker(lines(logRecord(commitId('2'), {commitId('1')}, 200, {}) +
                              logRecord(commitId('1'), {}, 100, {})));
    Commit commit;
    REQUIRE(walker.next(commit));
    walker.stop();
    REQUIRE_FALSE(walker.next(commit));
}

TEST_CASE("Object ids and quoted paths", "[CommitWalker]") {
    SECTION("isObjectId") {
        REQUIRE(isObjectId(std::string(40, 'a')));
        REQUIRE(isObjectId(std::string(64, '0')));
        REQUIRE_FALSE(isObjectId(std::string(39, 'a')));
        REQUIRE_FALSE(isObjectId(std::string(40, 'A')));
        REQUIRE_FALSE(isObjectId(""));
    }

    SECTION("unquoteGitPath") {
        REQUIRE(unquoteGitPath("plain.txt") == "plain.txt");
        REQUIRE(unquoteGitPath("\"with \\\"quotes\\\"\"") == "with \"quotes\"");
        REQUIRE(unquoteGitPath("\"back\\\\slash\"") == "back\\slash");
        REQUIRE(unquoteGitPath("\"caf\\303\\251.txt\"") == "caf\xc3\xa9.txt");
        REQUIRE(unquoteGitPath("\"line\\nbreak\"") == "line\nbreak");
    }
}

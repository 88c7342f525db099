#include <catch2/catch_test_macros.hpp>
#include "process.hpp"
#include <chrono>

TEST_CASE("runProcess captures output and exit status", "[Process]") {
    const fs::path cwd = fs::temp_directory_path();

    SECTION("Both streams are captured") {
        auto result = runProcess({"/bin/sh", "-c", "echo out; echo err >&2"}, cwd, std::chrono::seconds(10));
        REQUIRE(result.succeeded());
        REQUIRE(result.exitCode == 0);
        REQUIRE(result.stdoutText == "out\n");
        REQUIRE(result.stderrText == "err\n");
    }

    SECTION("Arguments are passed without a shell") {
        auto result = runProcess({"/bin/echo", "a b", "$HOME"}, cwd, std::chrono::seconds(10));
        REQUIRE(result.stdoutText == "a b $HOME\n");
    }

    SECTION("Non-zero exit status") {
        auto result = runProcess({"/bin/sh", "-c", "exit 3"}, cwd, std::chrono::seconds(10));
        REQUIRE_FALSE(result.succeeded());
        REQUIRE(result.exitCode == 3);
        REQUIRE_FALSE(result.timedOut);
    }

    SECTION("Large output does not block the child") {
        auto result = runProcess({"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line $i; echo noise >&2; i=$((i+1)); done"},
                                 cwd, std::chrono::seconds(30));
        REQUIRE(result.succeeded());
        REQUIRE(result.stdoutText.size() > 100000);
    }
}

TEST_CASE("runProcess reports launch failures and timeouts", "[Process]") {
    const fs::path cwd = fs::temp_directory_path();

    SECTION("Missing binary") {
        auto result = runProcess({"defectscope-no-such-binary"}, cwd, std::chrono::seconds(5));
        REQUIRE(result.launchFailed);
        REQUIRE_FALSE(result.launchError.empty());
        REQUIRE_FALSE(result.succeeded());
    }

    SECTION("Timeout kills the child") {
        auto start = std::chrono::steady_clock::now();
        auto result = runProcess({"/bin/sleep", "10"}, cwd, std::chrono::milliseconds(200));
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result.timedOut);
        REQUIRE_FALSE(result.succeeded());
        REQUIRE(elapsed < std::chrono::seconds(5));
    }

    SECTION("Missing working directory") {
        auto result = runProcess({"/bin/true"}, cwd / "defectscope-no-such-dir", std::chrono::seconds(5));
        REQUIRE(result.launchFailed);
    }
}

TEST_CASE("Subprocess streams stdout line by line", "[Process]") {
    Subprocess process({"/bin/sh", "-c", "printf 'one\\ntwo\\nthree'"}, fs::temp_directory_path());
    REQUIRE_FALSE(process.launchFailed());

    std::vector<std::string> lines;
    std::string line;
    while (process.readLine(line)) {
        lines.push_back(line);
    }
    REQUIRE(lines == std::vector<std::string>{"one", "two", "three"});
    REQUIRE(process.wait() == 0);
}

TEST_CASE("Destroying a running Subprocess stops the child", "[Process]") {
    auto start = std::chrono::steady_clock::now();
    {
        Subprocess process({"/bin/sh", "-c", "echo first; sleep 30"}, fs::temp_directory_path());
        std::string line;
        REQUIRE(process.readLine(line));
        REQUIRE(line == "first");
    }
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

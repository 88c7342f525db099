#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>
#include "commit_walker.hpp"
#include "process.hpp"

namespace fs = std::filesystem;

// A syntactically valid commit id made of one repeated hex digit
inline std::string commitId(char digit) {
    return std::string(40, digit);
}

// One record in the format CommitWalker reads, ending with a newline
inline std::string logRecord(const std::string& id,
                             const std::vector<std::string>& parents,
                             int64_t authorTime,
                             const std::vector<std::string>& statusLines) {
    std::string record;
    record += COMMIT_RECORD_MARK;
    record += id;
    record += COMMIT_FIELD_SEPARATOR;
    for (size_t i = 0; i < parents.size(); ++i) {
        if (i > 0) {
            record += ' ';
        }
        record += parents[i];
    }
    record += COMMIT_FIELD_SEPARATOR;
    record += std::to_string(authorTime);
    record += "\n\n";
    for (const auto& line : statusLines) {
        record += line + "\n";
    }
    return record;
}

inline void createTestFile(const fs::path& filePath, const std::string& content) {
    fs::create_directories(filePath.parent_path());
    std::ofstream file(filePath);
    file << content;
}

// Fresh directory under the system temp directory, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("defectscope_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Throw-away repository built with the git command line
class TempGitRepo : public TempDir {
public:
    explicit TempGitRepo(const std::string& name) : TempDir(name) {
        git({"init", "-q"});
        git({"symbolic-ref", "HEAD", "refs/heads/main"});
    }

    ProcessResult git(const std::vector<std::string>& args) const {
        std::vector<std::string> argv = {
            "git", "-C", path().string(),
            "-c", "user.name=Test Author",
            "-c", "user.email=test@example.com",
            "-c", "commit.gpgsign=false",
            "-c", "tag.gpgsign=false",
            "-c", "init.defaultBranch=main"
        };
        argv.insert(argv.end(), args.begin(), args.end());
        auto result = runProcess(argv, path(), std::chrono::seconds(30));
        if (!result.succeeded()) {
            throw std::runtime_error("git command failed: " + result.stderrText + result.launchError);
        }
        return result;
    }

    void write(const std::string& file, const std::string& content) const {
        createTestFile(path() / file, content);
    }

    // Stage everything and commit with a fixed author time; returns the new id
    std::string commit(const std::string& message, int64_t authorTime) const {
        git({"add", "-A"});
        git({"commit", "-q", "--allow-empty", "-m", message,
             "--date=" + std::to_string(authorTime) + " +0000"});
        return revParse("HEAD");
    }

    std::string revParse(const std::string& rev) const {
        std::string id = git({"rev-parse", rev}).stdoutText;
        while (!id.empty() && (id.back() == '\n' || id.back() == '\r')) {
            id.pop_back();
        }
        return id;
    }
};

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "history_selector.hpp"
#include "line_source.hpp"
#include "process.hpp"

namespace fs = std::filesystem;

// A ref peeled to the commit it names
// Longest stretch a log read waits before checking for cancellation
constexpr std::chrono::milliseconds LOG_POLL_INTERVAL{100};

struct RefHead {
    std::string name;
    std::string commitId;
};

/**
 * @brief Read-only handle on a local, already cloned git repository.
 *
 * All access goes through the git executable. Construction validates the
 * path and throws RepositoryAccessError when it is not a readable repository.
 */
class GitRepository {
public:
    explicit GitRepository(const fs::path& path, std::string gitExecutable = "git");

    const fs::path& path() const { return path_; }

    // Top of the work tree; empty for bare repositories
    const fs::path& workTree() const { return workTree_; }
    bool isBare() const { return workTree_.empty(); }

    // HEAD first, then refs/heads, refs/remotes and refs/tags in refname order,
    // peeled to commits. Refs sharing a commit collapse into the first one.
    std::vector<RefHead> listRefHeads() const;

    // Resolve user supplied ref names; unresolvable names become warnings
    std::vector<RefHead> resolveRefs(const std::vector<std::string>& names, WarningList& warnings) const;

    // True when `id` names an existing commit object
    bool verifyCommit(const std::string& id) const;

    // Start a streaming `git log` over one partition. A cancelled token stops
    // the read within LOG_POLL_INTERVAL, even while git prints nothing.
    std::unique_ptr<LineSource> openLog(const HistoryPartition& partition, const WalkOptions& options,
                                        const CancellationToken* cancel = nullptr) const;

    // Full argument vector openLog() runs
    std::vector<std::string> logCommand(const HistoryPartition& partition, const WalkOptions& options) const;

    // Run a git subcommand in this repository
    ProcessResult git(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout = std::chrono::seconds(60)) const;

private:
    fs::path path_;
    fs::path workTree_;
    std::string gitExecutable_;

    std::vector<std::string> baseCommand() const;
};

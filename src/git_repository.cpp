#include "git_repository.hpp"
#include "commit_walker.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace {

// Time budget for short metadata queries (rev-parse, for-each-ref)
constexpr auto METADATA_TIMEOUT = std::chrono::seconds(30);

std::string trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return start < end ? std::string(start, end) : std::string();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string part;
    while (std::getline(ss, part, delim)) {
        parts.push_back(part);
    }
    // getline drops a trailing empty field
    if (!str.empty() && str.back() == delim) {
        parts.emplace_back();
    }
    return parts;
}

// Streams `git log` output and turns a failed exit into HistoryTraversalError
class GitLogSource : public LineSource {
public:
    GitLogSource(const std::vector<std::string>& argv, const fs::path& workingDir, std::string label,
                 const CancellationToken* cancel)
        : process_(argv, workingDir), label_(std::move(label)), cancel_(cancel) {
        if (process_.launchFailed()) {
            throw RepositoryAccessError("Failed to launch git: " + process_.launchError());
        }
    }

    bool readLine(std::string& line) override {
        if (!cancel_) {
            return process_.readLine(line);
        }
        while (true) {
            bool timedOut = false;
            if (process_.readLine(line, std::chrono::steady_clock::now() + LOG_POLL_INTERVAL, timedOut)) {
                return true;
            }
            if (!timedOut) {
                return false;
            }
            if (cancel_->isCancelled()) {
                process_.terminate();
                throw HistoryTraversalError("History walk of " + label_ + " cancelled");
            }
        }
    }

    void finish() override {
        int exitCode = process_.wait();
        if (exitCode != 0) {
            std::string reason = trim(process_.stderrText());
            if (reason.empty()) {
                reason = "git log exited with status " + std::to_string(exitCode);
            }
            throw HistoryTraversalError("History walk of " + label_ + " failed: " + reason);
        }
    }

    void close() override {
        process_.terminate();
    }

private:
    Subprocess process_;
    std::string label_;
    const CancellationToken* cancel_;
};

}  // namespace

GitRepository::GitRepository(const fs::path& path, std::string gitExecutable)
    : gitExecutable_(std::move(gitExecutable)) {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_directory(path, ec)) {
        throw RepositoryAccessError("Repository path does not exist or is not a directory: " + path.string());
    }
    path_ = fs::absolute(path, ec);
    if (ec) {
        path_ = path;
    }

    auto gitDir = git({"rev-parse", "--git-dir"}, METADATA_TIMEOUT);
    if (gitDir.launchFailed) {
        throw RepositoryAccessError("Failed to launch git: " + gitDir.launchError);
    }
    if (!gitDir.succeeded()) {
        throw RepositoryAccessError("Not a readable git repository: " + path_.string() +
                                    ": " + trim(gitDir.stderrText));
    }

    auto bare = git({"rev-parse", "--is-bare-repository"}, METADATA_TIMEOUT);
    if (bare.succeeded() && trim(bare.stdoutText) == "false") {
        auto topLevel = git({"rev-parse", "--show-toplevel"}, METADATA_TIMEOUT);
        if (topLevel.succeeded()) {
            workTree_ = trim(topLevel.stdoutText);
        }
    }
}

std::vector<std::string> GitRepository::baseCommand() const {
    // quotePath=false keeps non-ASCII paths readable; signatures would
    // interleave gpg output with the log records
    return {gitExecutable_, "-C", path_.string(),
            "-c", "core.quotePath=false",
            "-c", "log.showSignature=false"};
}

ProcessResult GitRepository::git(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const {
    auto argv = baseCommand();
    argv.insert(argv.end(), args.begin(), args.end());
    return runProcess(argv, path_, timeout);
}

std::vector<RefHead> GitRepository::listRefHeads() const {
    std::vector<RefHead> heads;
    std::unordered_set<std::string> seenCommits;

    auto addHead = [&](const std::string& name, const std::string& commitId) {
        if (seenCommits.insert(commitId).second) {
            heads.push_back({name, commitId});
        }
    };

    // A repository without commits has no HEAD to resolve; that is not an error
    auto head = git({"rev-parse", "--verify", "-q", "HEAD^{commit}"}, METADATA_TIMEOUT);
    if (head.succeeded()) {
        addHead("HEAD", trim(head.stdoutText));
    }

    auto refs = git({"for-each-ref",
                     "--format=%(objectname)%09%(objecttype)%09%(*objectname)%09%(*objecttype)%09%(refname)",
                     "refs/heads", "refs/remotes", "refs/tags"},
                    METADATA_TIMEOUT);
    if (!refs.succeeded()) {
        throw RepositoryAccessError("Failed to list refs in " + path_.string() + ": " +
                                    (refs.launchFailed ? refs.launchError : trim(refs.stderrText)));
    }

    std::stringstream ss(refs.stdoutText);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.empty()) {
            continue;
        }
        auto fields = split(line, '\t');
        if (fields.size() < 5) {
            continue;
        }
        const auto& objectName = fields[0];
        const auto& objectType = fields[1];
        const auto& peeledName = fields[2];
        const auto& peeledType = fields[3];
        const auto& refName = fields[4];

        if (objectType == "commit") {
            addHead(refName, objectName);
        } else if (objectType == "tag" && peeledType == "commit") {
            addHead(refName, peeledName);
        }
        // Tags of trees and blobs carry no history
    }

    return heads;
}

std::vector<RefHead> GitRepository::resolveRefs(const std::vector<std::string>& names, WarningList& warnings) const {
    std::vector<RefHead> heads;
    std::unordered_set<std::string> seenCommits;

    for (const auto& name : names) {
        if (name.empty() || name.front() == '-') {
            warnings.push_back({"history", name, "is not a ref name"});
            continue;
        }
        auto resolved = git({"rev-parse", "--verify", "-q", name + "^{commit}"}, METADATA_TIMEOUT);
        if (!resolved.succeeded()) {
            warnings.push_back({"history", name, "does not resolve to a commit"});
            continue;
        }
        std::string commitId = trim(resolved.stdoutText);
        if (seenCommits.insert(commitId).second) {
            heads.push_back({name, commitId});
        }
    }
    return heads;
}

bool GitRepository::verifyCommit(const std::string& id) const {
    return git({"cat-file", "-e", id + "^{commit}"}, METADATA_TIMEOUT).succeeded();
}

std::vector<std::string> GitRepository::logCommand(const HistoryPartition& partition, const WalkOptions& options) const {
    auto argv = baseCommand();
    argv.insert(argv.end(), {
        "log",
        "--topo-order",
        "--root",
        "--no-color",
        std::string("--format=") + COMMIT_LOG_FORMAT,
        "--name-status",
    });

    if (options.renamePolicy == RenamePolicy::FollowRenames) {
        argv.push_back("-M");
    } else {
        argv.push_back("--no-renames");
    }

    if (options.mergePolicy == MergePolicy::FirstParent) {
        argv.push_back("--diff-merges=first-parent");
    } else {
        argv.push_back("--diff-merges=off");
    }

    for (const auto& rev : partition.include) {
        argv.push_back(rev);
    }
    for (const auto& rev : partition.exclude) {
        argv.push_back("^" + rev);
    }
    argv.push_back("--");
    return argv;
}

std::unique_ptr<LineSource> GitRepository::openLog(const HistoryPartition& partition, const WalkOptions& options,
                                                   const CancellationToken* cancel) const {
    return std::make_unique<GitLogSource>(logCommand(partition, options), path_, partition.label, cancel);
}

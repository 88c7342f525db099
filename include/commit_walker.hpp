#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include "commit.hpp"
#include "line_source.hpp"

// Framing of the `git log --format` records the walker parses:
// <RS>id<US>parent parent...<US>author-time, then --name-status lines
constexpr char COMMIT_RECORD_MARK = '\x1e';
constexpr char COMMIT_FIELD_SEPARATOR = '\x1f';
constexpr const char* COMMIT_LOG_FORMAT = "%x1e%H%x1f%P%x1f%at";

/**
 * @brief Lazy iterator over the commits of one history partition.
 *
 * Commits come out children-before-parents, the order `git log --topo-order`
 * produces. Each commit id is yielded at most once; a repeated id is
 * skipped. Any of the following raises HistoryTraversalError:
 *  - a header that does not parse, or an id that is not 40/64 hex digits
 *  - a commit that lists itself as a parent
 *  - a commit whose parent was already yielded (parent before child)
 *  - the underlying source reporting failure when it is exhausted
 */
class CommitWalker {
public:
    explicit CommitWalker(std::unique_ptr<LineSource> source);
    ~CommitWalker();

    CommitWalker(const CommitWalker&) = delete;
    CommitWalker& operator=(const CommitWalker&) = delete;

    // Fill `commit` with the next record; false once history is exhausted
    bool next(Commit& commit);

    // Abandon the walk and release the source
    void stop();

    size_t visited() const { return seen_.size(); }
    size_t duplicatesSkipped() const { return duplicatesSkipped_; }

private:
    std::unique_ptr<LineSource> source_;
    std::string pendingHeader_;
    bool hasPendingHeader_ = false;
    bool exhausted_ = false;
    size_t duplicatesSkipped_ = 0;
    std::unordered_set<std::string> seen_;

    // Read one raw record (header + status lines); false at end of input
    bool readRecord(Commit& commit);
    void parseHeader(const std::string& header, Commit& commit) const;
    void parseStatusLine(const std::string& line, Commit& commit) const;
};

// True for a full SHA-1 or SHA-256 object id
bool isObjectId(const std::string& id);

// Undo git's C-style quoting of unusual paths ("a\tb" -> a<TAB>b)
std::string unquoteGitPath(const std::string& path);

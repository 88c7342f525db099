#pragma once

#include <string>
#include <vector>
#include "errors.hpp"

class GitRepository;

// How renames map onto file identities
enum class RenamePolicy {
    SeparatePaths,   // Every distinct path is its own identity; a rename touches both paths
    FollowRenames    // A rename touches the new path and folds the old path's history into it
};

// Which files a merge commit touches
enum class MergePolicy {
    FirstParent,     // Diff against the first parent
    None             // Merges touch nothing
};

struct WalkOptions {
    RenamePolicy renamePolicy = RenamePolicy::SeparatePaths;
    MergePolicy mergePolicy = MergePolicy::FirstParent;
};

// One independently walkable slice of history: commits reachable from
// `include` and not from `exclude`
struct HistoryPartition {
    std::string label;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
};

class HistorySelector {
public:
    enum class Kind {
        AllRefs,
        NamedRefs,
        Range
    };

    // Every branch, remote branch, tag and HEAD
    static HistorySelector all();

    // The listed refs (branch names, tags, commit ids)
    static HistorySelector refs(const std::vector<std::string>& names);

    // A single git revision range such as "v1.0..main". Throws
    // std::invalid_argument for an empty range or one starting with a dash.
    static HistorySelector range(const std::string& revisions);

    Kind kind() const { return kind_; }
    const std::vector<std::string>& refNames() const { return refNames_; }
    const std::string& rangeRevisions() const { return rangeRevisions_; }

    std::string describe() const;

    // Split the selection into pairwise disjoint partitions, one per distinct
    // head. Head i excludes heads 0..i-1, so no commit lands in two partitions.
    // Heads that do not resolve to a commit are reported in `warnings` and
    // left out of every partition.
    std::vector<HistoryPartition> plan(const GitRepository& repo, WarningList& warnings) const;

private:
    HistorySelector() = default;

    Kind kind_ = Kind::AllRefs;
    std::vector<std::string> refNames_;
    std::string rangeRevisions_;
};

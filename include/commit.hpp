#pragma once

#include <cstdint>
#include <string>
#include <vector>

// How a commit touched a path (git --name-status letters)
enum class ChangeKind {
    Added,
    Modified,
    Deleted,
    Renamed,
    Copied,
    TypeChanged,
    Other
};

struct FileChange {
    ChangeKind kind = ChangeKind::Modified;
    std::string path;          // Path after the change
    std::string previousPath;  // Source path for renames and copies, empty otherwise
};

// Read-only record of one commit as it appears in history
struct Commit {
    std::string id;                    // Full object id (40 or 64 hex digits)
    std::vector<std::string> parents;  // Two or more for merges, none for roots
    int64_t authorTime = 0;            // Seconds since the epoch
    std::vector<FileChange> changes;

    bool isMerge() const { return parents.size() > 1; }

    // Every path the commit touched; renames list both sides
    std::vector<std::string> touchedPaths() const {
        std::vector<std::string> paths;
        paths.reserve(changes.size());
        for (const auto& change : changes) {
            if (!change.previousPath.empty() && change.kind == ChangeKind::Renamed) {
                paths.push_back(change.previousPath);
            }
            paths.push_back(change.path);
        }
        return paths;
    }
};

// Map a --name-status letter to a ChangeKind
inline ChangeKind changeKindFromStatus(char status) {
    switch (status) {
        case 'A': return ChangeKind::Added;
        case 'M': return ChangeKind::Modified;
        case 'D': return ChangeKind::Deleted;
        case 'R': return ChangeKind::Renamed;
        case 'C': return ChangeKind::Copied;
        case 'T': return ChangeKind::TypeChanged;
        default:  return ChangeKind::Other;
    }
}

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// The repository path is missing, is not a repository, or git cannot read it
class RepositoryAccessError : public std::runtime_error {
public:
    explicit RepositoryAccessError(const std::string& what) : std::runtime_error(what) {}
};

// git reported a broken object store or the commit graph is inconsistent
class HistoryTraversalError : public std::runtime_error {
public:
    explicit HistoryTraversalError(const std::string& what) : std::runtime_error(what) {}
};

// A static analysis tool could not produce a usable result for one file.
// Only thrown inside the tool layer; callers see it as an AnalysisWarning.
class ExternalToolError : public std::runtime_error {
public:
    explicit ExternalToolError(const std::string& what) : std::runtime_error(what) {}
};

// Non-fatal problem attached to a result
struct AnalysisWarning {
    std::string source;   // "history" or a tool name
    std::string subject;  // ref, revision range or file path
    std::string reason;
};

using WarningList = std::vector<AnalysisWarning>;

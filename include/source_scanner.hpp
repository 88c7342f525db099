#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

/**
 * @brief Lists the files of a work tree the way history names them.
 *
 * Paths come back relative to the root, '/'-separated and sorted, so they
 * can be used as keys next to change counts. Ignored directories are pruned
 * rather than walked.
 */
class SourceScanner {
public:
    explicit SourceScanner(const PatternMatcher& patternMatcher);

    // Throws std::runtime_error if root is not a directory
    std::vector<std::string> collectFiles(const fs::path& root) const;

    // Only files whose extension (".cpp", ".py", ...) is listed
    std::vector<std::string> collectFiles(const fs::path& root, const std::vector<std::string>& extensions) const;

private:
    const PatternMatcher& patternMatcher_;
};

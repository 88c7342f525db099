#include "source_scanner.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

SourceScanner::SourceScanner(const PatternMatcher& patternMatcher)
    : patternMatcher_(patternMatcher) {}

std::vector<std::string> SourceScanner::collectFiles(const fs::path& root) const {
    return collectFiles(root, {});
}

std::vector<std::string> SourceScanner::collectFiles(const fs::path& root,
                                                     const std::vector<std::string>& extensions) const {
    if (!fs::exists(root) || !fs::is_directory(root)) {
        throw std::runtime_error("Invalid directory: " + root.string());
    }

    std::vector<std::string> files;
    files.reserve(1000);

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Cannot read directory " + root.string() + ": " + ec.message());
    }

    const fs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            // An unreadable entry stops the walk; keep what was collected
            break;
        }

        const fs::path relative = it->path().lexically_relative(root);
        const std::string relativeStr = relative.generic_string();

        std::error_code statusError;
        if (it->is_directory(statusError)) {
            // Ignoring "dir/" ignores everything below it, so the subtree is skipped
            if (patternMatcher_.isIgnored(relativeStr + "/")) {
                it.disable_recursion_pending();
            }
            continue;
        }

        if (!it->is_regular_file(statusError) || !patternMatcher_.shouldProcess(relativeStr)) {
            continue;
        }

        if (!extensions.empty()) {
            const std::string extension = relative.extension().string();
            if (std::find(extensions.begin(), extensions.end(), extension) == extensions.end()) {
                continue;
            }
        }

        files.push_back(relativeStr);
    }

    std::sort(files.begin(), files.end());
    return files;
}

#include "pattern_matcher.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string trimmed(std::string text) {
    text.erase(text.begin(), std::find_if(text.begin(), text.end(),
        [](unsigned char ch) { return !std::isspace(ch); }));
    text.erase(std::find_if(text.rbegin(), text.rend(),
        [](unsigned char ch) { return !std::isspace(ch); }).base(), text.end());
    return text;
}

// Relative, '/'-separated form of a path for matching
std::string normalizedPath(const fs::path& filePath) {
    std::string pathStr = filePath.generic_string();
    while (pathStr.size() >= 2 && pathStr[0] == '.' && pathStr[1] == '/') {
        pathStr.erase(0, 2);
    }
    return pathStr;
}

}  // namespace

PatternMatcher::PatternMatcher() {
    // Version control metadata and build output never carry defect signal
    addIgnorePattern(".git/");
    addIgnorePattern(".svn/");
    addIgnorePattern(".hg/");
    addIgnorePattern("node_modules/");
    addIgnorePattern("__pycache__/");
    addIgnorePattern("CMakeFiles/");
    addIgnorePattern("*.o");
    addIgnorePattern("*.obj");
    addIgnorePattern("*.exe");
    addIgnorePattern("*.dll");
    addIgnorePattern("*.lib");
    addIgnorePattern("*.a");
    addIgnorePattern("*.so");
    addIgnorePattern("*.dylib");
    addIgnorePattern("*.class");
    addIgnorePattern("*.pyc");
    addIgnorePattern(".DS_Store");
}

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns) 
    : PatternMatcher() {
    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

PatternMatcher PatternMatcher::empty() {
    return PatternMatcher(NoDefaults{});
}

void PatternMatcher::addIgnorePattern(const std::string& pattern) {
    ignorePatterns_.push_back(compile(pattern, true));
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    includePatterns_.push_back(compile(pattern, false));
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    includePatterns_.clear();
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;
    
    while (std::getline(ss, pattern, ',')) {
        pattern = trimmed(pattern);
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }
    
    return patterns;
}

bool PatternMatcher::loadGitignore(const fs::path& gitignorePath) {
    std::ifstream file(gitignorePath);
    if (!file) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trimmed(line);

        // Comments, blanks, and negations (re-inclusion is not supported)
        if (line.empty() || line[0] == '#' || line[0] == '!') {
            continue;
        }
        
        addIgnorePattern(line);
    }
    return true;
}

bool PatternMatcher::shouldProcess(const fs::path& filePath) const {
    if (isIgnored(filePath)) {
        return false;
    }
    return isIncluded(filePath);
}

bool PatternMatcher::isIgnored(const fs::path& filePath) const {
    return matchesAny(ignorePatterns_, normalizedPath(filePath));
}

bool PatternMatcher::isIncluded(const fs::path& filePath) const {
    if (includePatterns_.empty()) {
        return true;
    }
    return matchesAny(includePatterns_, normalizedPath(filePath));
}

bool PatternMatcher::matches(const std::string& pattern, const std::string& path) {
    return matchesAny({compile(pattern, false)}, normalizedPath(path));
}

bool PatternMatcher::matchesAny(const std::vector<CompiledPattern>& patterns, const std::string& path) {
    for (const auto& pattern : patterns) {
        if (std::regex_match(path, pattern.regex)) {
            return true;
        }
    }
    return false;
}

PatternMatcher::CompiledPattern PatternMatcher::compile(const std::string& pattern, bool coversContents) {
    std::string glob = pattern;

    // A leading '/' anchors at the root, which full-path matching already does
    bool anchored = false;
    if (!glob.empty() && glob[0] == '/') {
        glob.erase(0, 1);
        anchored = true;
    }

    // "dir/" names a directory only
    bool directoryOnly = false;
    if (!glob.empty() && glob.back() == '/') {
        glob.pop_back();
        directoryOnly = true;
    }

    // Bare names match at any depth; decided before any suffix is added
    const bool anyDepth = !anchored && glob.find('/') == std::string::npos;

    std::string regexStr;
    if (anyDepth) {
        regexStr += "(?:.*/)?";
    }
    regexStr += globToRegex(glob);
    if (directoryOnly) {
        regexStr += "/.*";
    } else if (coversContents) {
        // An ignored directory takes everything below it along
        regexStr += "(?:/.*)?";
    }

    CompiledPattern compiled;
    compiled.text = pattern;
    compiled.regex = std::regex(regexStr);
    return compiled;
}

std::string PatternMatcher::globToRegex(const std::string& glob) {
    std::string regexStr;
    
    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        
        if (c == '*') {
            if (i + 1 < glob.size() && glob[i + 1] == '*') {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    // **/ matches zero or more directories
                    regexStr += "(?:.*/)?";
                    i += 2;
                } else {
                    // ** matches anything, separators included
                    regexStr += ".*";
                    i++;
                }
            } else {
                // * stops at directory separators
                regexStr += "[^/]*";
            }
        } else if (c == '?') {
            regexStr += "[^/]";
        } else if (std::string("\\.()[]{}+^$|").find(c) != std::string::npos) {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    
    return regexStr;
}

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

// Glob matcher with a subset of .gitignore syntax: '*', '?', '**', a leading
// '/' anchoring at the root, a trailing '/' for a whole directory, and bare
// names (no '/') matching at any depth. An ignore pattern that matches a
// directory also ignores everything below it; a directory path is passed
// with a trailing '/'.
class PatternMatcher {
public:
    // Default constructor with default ignore patterns (VCS metadata, build output)
    PatternMatcher();
    
    // Defaults plus custom ignore patterns
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // A matcher with no patterns at all
    static PatternMatcher empty();
    
    void addIgnorePattern(const std::string& pattern);
    void addIncludePattern(const std::string& pattern);
    
    // Replace include patterns from a comma-separated string (e.g., "*.cpp,*.hpp")
    void setIncludePatterns(const std::string& patternsStr);
    
    // Add exclude patterns from a comma-separated string (e.g., "*.txt,*.md")
    void setExcludePatterns(const std::string& patternsStr);
    
    // Load patterns from a .gitignore file. Returns false if it cannot be read.
    bool loadGitignore(const fs::path& gitignorePath);
    
    // Not ignored, and included when include patterns exist
    bool shouldProcess(const fs::path& filePath) const;
    
    bool isIgnored(const fs::path& filePath) const;
    bool isIncluded(const fs::path& filePath) const;
    
    bool hasIncludePatterns() const { return !includePatterns_.empty(); }

    // Match one glob against one '/'-separated relative path
    static bool matches(const std::string& pattern, const std::string& path);

    // Split a comma-separated list, trimming blanks
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);
    
private:
    struct CompiledPattern {
        std::string text;
        std::regex regex;
    };

    std::vector<CompiledPattern> ignorePatterns_;
    std::vector<CompiledPattern> includePatterns_;

    struct NoDefaults {};
    explicit PatternMatcher(NoDefaults) {}

    static CompiledPattern compile(const std::string& pattern, bool coversContents);
    static std::string globToRegex(const std::string& glob);
    static bool matchesAny(const std::vector<CompiledPattern>& patterns, const std::string& path);
};

#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

// What one tool run on one file produced, as seen at the process boundary
struct ToolInvocation {
    std::string tool;
    std::string file;              // Repository-relative path
    int exitStatus = 0;
    std::string stdoutText;
    std::string stderrText;
    bool launchFailed = false;
    bool timedOut = false;
    std::string launchError;
};

// Finding count for one file, with a warning when the run was unusable
struct ToolOutcome {
    std::string file;
    double findings = 0.0;
    std::optional<AnalysisWarning> warning;
};

/**
 * @brief Translation layer for one static analysis tool.
 *
 * An adapter knows how to invoke its tool on a single file and how to turn
 * the tool's output into a (possibly severity weighted) finding count.
 */
class ToolAdapter {
public:
    virtual ~ToolAdapter() = default;

    virtual std::string name() const = 0;

    // Command line that analyses `file` (an absolute path)
    virtual std::vector<std::string> commandFor(const fs::path& file) const = 0;

    // Weighted findings of a run that exited normally.
    // Throws ExternalToolError when the output cannot be interpreted.
    virtual double countFindings(const ToolInvocation& invocation) const = 0;
};

// cppcheck: one "file:line:column: severity: message [id]" line per finding on stderr
class CppcheckAdapter : public ToolAdapter {
public:
    explicit CppcheckAdapter(std::string executable = "cppcheck");

    std::string name() const override { return "cppcheck"; }
    std::vector<std::string> commandFor(const fs::path& file) const override;
    double countFindings(const ToolInvocation& invocation) const override;

    // Weight of one finding of `severity`; unknown severities weigh 1
    void setSeverityWeight(const std::string& severity, double weight);
    double severityWeight(const std::string& severity) const;

private:
    std::string executable_;
    std::map<std::string, double> severityWeights_;
};

// SpotBugs text UI: one "<priority> <category> <type>: ..." line per bug on stdout
class SpotBugsAdapter : public ToolAdapter {
public:
    explicit SpotBugsAdapter(std::string executable = "spotbugs");

    std::string name() const override { return "spotbugs"; }
    std::vector<std::string> commandFor(const fs::path& file) const override;
    double countFindings(const ToolInvocation& invocation) const override;

    // Weight per priority letter (H, M, L)
    void setPriorityWeight(char priority, double weight);

private:
    std::string executable_;
    std::map<char, double> priorityWeights_;
};

// Launch failure, timeout, non-zero exit or output the adapter cannot read
// give 0 findings and a warning. Otherwise the adapter counts the findings.
ToolOutcome translateInvocation(const ToolAdapter& adapter, const ToolInvocation& invocation);

/**
 * @brief Maps file categories to the adapters that analyse them.
 *
 * A category is a set of glob patterns plus optional exclusions. Adding a
 * language or tool means registering another adapter here.
 */
class ToolRegistry {
public:
    void registerAdapter(const std::vector<std::string>& patterns,
                         std::shared_ptr<const ToolAdapter> adapter,
                         const std::vector<std::string>& excluded = {});

    // Every adapter whose category matches `path`, in registration order
    std::vector<const ToolAdapter*> adaptersFor(const std::string& path) const;

    // Adapter names in registration order, without repeats
    std::vector<std::string> toolNames() const;

    // Copy holding only the named tools
    ToolRegistry restrictedTo(const std::vector<std::string>& names) const;

    bool empty() const { return entries_.empty(); }

    // spotbugs for Java sources (module-info.java excluded), cppcheck for C and C++
    static ToolRegistry defaults();

private:
    struct Entry {
        PatternMatcher category = PatternMatcher::empty();
        std::shared_ptr<const ToolAdapter> adapter;
    };

    std::vector<Entry> entries_;
};

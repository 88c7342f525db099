#include "tool_adapter.hpp"
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <sstream>

namespace {

// First non-empty line of a tool's diagnostic output
std::string firstLine(const std::string& text) {
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty()) {
            return line;
        }
    }
    return "";
}

}  // namespace

CppcheckAdapter::CppcheckAdapter(std::string executable)
    : executable_(std::move(executable)) {
    // "information" lines are about cppcheck itself (missing includes and such)
    severityWeights_["information"] = 0.0;
}

std::vector<std::string> CppcheckAdapter::commandFor(const fs::path& file) const {
    return {
        executable_,
        "--enable=warning,style,performance,portability",
        "--quiet",
        "--template={file}:{line}:{column}: {severity}: {message} [{id}]",
        file.string()
    };
}

void CppcheckAdapter::setSeverityWeight(const std::string& severity, double weight) {
    severityWeights_[severity] = weight;
}

double CppcheckAdapter::severityWeight(const std::string& severity) const {
    auto it = severityWeights_.find(severity);
    return it == severityWeights_.end() ? 1.0 : it->second;
}

double CppcheckAdapter::countFindings(const ToolInvocation& invocation) const {
    // Current template, and the "[file:line]: (severity) message" form of old releases
    static const std::regex findingLine(R"(^.+:\d+:\d+: ([a-z]+): .*$)");
    static const std::regex legacyLine(R"(^\[.+:\d+\]: \(([a-z]+)\) .*$)");

    double findings = 0.0;
    std::stringstream ss(invocation.stderrText);
    std::string line;
    std::smatch match;
    while (std::getline(ss, line)) {
        if (std::regex_match(line, match, findingLine) || std::regex_match(line, match, legacyLine)) {
            findings += severityWeight(match[1].str());
        }
    }
    return findings;
}

SpotBugsAdapter::SpotBugsAdapter(std::string executable)
    : executable_(std::move(executable)) {
    priorityWeights_['H'] = 1.0;
    priorityWeights_['M'] = 1.0;
    priorityWeights_['L'] = 1.0;
}

std::vector<std::string> SpotBugsAdapter::commandFor(const fs::path& file) const {
    return {executable_, "-textui", file.string()};
}

void SpotBugsAdapter::setPriorityWeight(char priority, double weight) {
    priorityWeights_[priority] = weight;
}

double SpotBugsAdapter::countFindings(const ToolInvocation& invocation) const {
    // e.g. "M D UrF: Unread field: Foo.bar  At Foo.java:[line 12]"
    static const std::regex bugLine(R"(^([HML]) [A-Z]+ [A-Za-z0-9_]+: .*$)");

    double findings = 0.0;
    std::stringstream ss(invocation.stdoutText);
    std::string line;
    std::smatch match;
    while (std::getline(ss, line)) {
        if (std::regex_match(line, match, bugLine)) {
            findings += priorityWeights_.at(match[1].str()[0]);
        }
    }

    if (findings == 0.0 && invocation.stdoutText.find("Exception") != std::string::npos) {
        throw ExternalToolError("spotbugs reported an exception: " + firstLine(invocation.stdoutText));
    }
    return findings;
}

ToolOutcome translateInvocation(const ToolAdapter& adapter, const ToolInvocation& invocation) {
    ToolOutcome outcome;
    outcome.file = invocation.file;

    const std::string tool = invocation.tool.empty() ? adapter.name() : invocation.tool;
    auto warn = [&](const std::string& reason) {
        outcome.findings = 0.0;
        outcome.warning = AnalysisWarning{tool, invocation.file, reason};
    };

    if (invocation.launchFailed) {
        warn("could not be started: " + invocation.launchError);
        return outcome;
    }
    if (invocation.timedOut) {
        warn("timed out");
        return outcome;
    }
    if (invocation.exitStatus != 0) {
        std::string reason = "exited with status " + std::to_string(invocation.exitStatus);
        std::string detail = firstLine(invocation.stderrText);
        if (!detail.empty()) {
            reason += ": " + detail;
        }
        warn(reason);
        return outcome;
    }

    try {
        outcome.findings = adapter.countFindings(invocation);
    } catch (const ExternalToolError& e) {
        warn(e.what());
    } catch (const std::exception& e) {
        warn(std::string("output could not be read: ") + e.what());
    }
    return outcome;
}

void ToolRegistry::registerAdapter(const std::vector<std::string>& patterns,
                                   std::shared_ptr<const ToolAdapter> adapter,
                                   const std::vector<std::string>& excluded) {
    Entry entry;
    for (const auto& pattern : patterns) {
        entry.category.addIncludePattern(pattern);
    }
    for (const auto& pattern : excluded) {
        entry.category.addIgnorePattern(pattern);
    }
    entry.adapter = std::move(adapter);
    entries_.push_back(std::move(entry));
}

std::vector<const ToolAdapter*> ToolRegistry::adaptersFor(const std::string& path) const {
    std::vector<const ToolAdapter*> adapters;
    for (const auto& entry : entries_) {
        if (!entry.category.hasIncludePatterns() || !entry.category.shouldProcess(path)) {
            continue;
        }
        // One run per tool even when two of its categories match
        if (std::find(adapters.begin(), adapters.end(), entry.adapter.get()) == adapters.end()) {
            adapters.push_back(entry.adapter.get());
        }
    }
    return adapters;
}

std::vector<std::string> ToolRegistry::toolNames() const {
    std::vector<std::string> names;
    for (const auto& entry : entries_) {
        const std::string name = entry.adapter->name();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(name);
        }
    }
    return names;
}

ToolRegistry ToolRegistry::restrictedTo(const std::vector<std::string>& names) const {
    ToolRegistry restricted;
    for (const auto& entry : entries_) {
        if (std::find(names.begin(), names.end(), entry.adapter->name()) != names.end()) {
            restricted.entries_.push_back(entry);
        }
    }
    return restricted;
}

ToolRegistry ToolRegistry::defaults() {
    ToolRegistry registry;
    registry.registerAdapter({"*.java"}, std::make_shared<SpotBugsAdapter>(), {"module-info.java"});

    auto cppcheck = std::make_shared<CppcheckAdapter>();
    registry.registerAdapter({"*.cpp", "*.cc", "*.cxx", "*.h", "*.hpp"}, cppcheck);
    registry.registerAdapter({"*.c"}, cppcheck);
    return registry;
}

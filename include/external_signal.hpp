#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "errors.hpp"
#include "score_map.hpp"
#include "tool_adapter.hpp"

namespace fs = std::filesystem;

struct ExternalToolOptions {
    unsigned int concurrency = 4;                          // Tool processes running at once
    std::chrono::milliseconds timeout{60000};              // Per invocation
    std::shared_ptr<const CancellationToken> cancel;       // Optional stop signal
};

// Raw per-file findings, ready for normalize()
struct ExternalSignal {
    ScoreMap raw;
    WarningList warnings;
    size_t invocations = 0;
    size_t failures = 0;
};

/**
 * @brief Runs registered static analysis tools and exposes their findings
 * as a raw ScoreMap.
 *
 * Tool failures never abort the pipeline: a failed run contributes a zero
 * entry for its file and an AnalysisWarning.
 */
class ExternalSignalAdapter {
public:
    explicit ExternalSignalAdapter(ToolRegistry registry, ExternalToolOptions options = ExternalToolOptions());

    // Run every matching adapter on every file. `files` are relative to `root`;
    // files no adapter claims are left out of the result.
    ExternalSignal collect(const fs::path& root, const std::vector<std::string>& files) const;

    // Build the signal from runs captured elsewhere (no processes are started)
    ExternalSignal fromInvocations(const std::vector<ToolInvocation>& invocations) const;

    const ToolRegistry& registry() const { return registry_; }

private:
    ToolRegistry registry_;
    ExternalToolOptions options_;

    // Fold outcomes into a signal on the calling thread
    static void accumulate(ExternalSignal& signal, const ToolOutcome& outcome);
};

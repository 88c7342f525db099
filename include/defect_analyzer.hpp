#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "cancellation.hpp"
#include "errors.hpp"
#include "history_selector.hpp"
#include "rank_reporter.hpp"
#include "score_map.hpp"

namespace fs = std::filesystem;

enum class ReportFormat {
    Text,
    Json
};

struct AnalyzerOptions {
    fs::path inputDir;
    fs::path outputFile;                 // Empty: the caller prints the report
    ReportFormat format = ReportFormat::Text;
    bool verbose = false;
    bool showTiming = false;
    size_t topN = 10;

    // History selection
    std::vector<std::string> refs;       // Empty: every ref
    std::string range;                   // Takes precedence over refs
    bool followRenames = false;
    MergePolicy mergePolicy = MergePolicy::FirstParent;
    double halfLifeDays = 0.0;           // 0 counts every commit as 1
    std::optional<int64_t> referenceTime;  // Seconds since the epoch; default is now
    unsigned int threads = std::thread::hardware_concurrency();
    unsigned int timeoutSeconds = 0;     // 0 means no deadline

    std::string includePatterns;         // Comma-separated globs
    std::string excludePatterns;

    // Blend weights, relative to each other
    double historyWeight = 1.0;
    double externalWeight = 0.0;
    double placeholderWeight = 0.0;

    // Static analysis
    std::vector<std::string> tools;      // Empty: every registered tool
    unsigned int toolTimeoutSeconds = 60;
    unsigned int toolConcurrency = 4;

    uint64_t seed = 0;                   // Placeholder model seed
    std::string gitExecutable = "git";
};

/**
 * @brief Runs the whole pipeline: collect raw scores from every enabled
 * source, normalize each, blend them and rank the result.
 */
class DefectAnalyzer {
public:
    explicit DefectAnalyzer(const AnalyzerOptions& options);

    // Run the analysis. Returns false after printing an error when no report
    // could be produced. A partial report still returns true.
    bool run();

    // Report in the configured format
    std::string getOutput() const;

    // Plain text report
    std::string getReport() const;

    nlohmann::json getJsonReport() const;

    std::string getSummary() const;

    std::string getTimingInfo() const;

    bool isPartial() const { return partial_; }
    const WarningList& warnings() const { return warnings_; }
    const ScoreMap& combinedScores() const { return combined_; }
    const std::vector<RankedEntry>& rankedEntries() const { return entries_; }

    // Share a stop signal with the caller (a signal handler, for example)
    void setCancellationToken(std::shared_ptr<CancellationToken> token) { cancel_ = std::move(token); }

private:
    // Per-source slice of the report
    struct SourceReport {
        std::string name;
        std::string title;
        double weight = 0.0;
        size_t rawFiles = 0;
        ScoreMap normalized;
        std::vector<RankedEntry> entries;
        bool partial = false;
        std::chrono::milliseconds duration{0};
    };

    AnalyzerOptions options_;
    std::shared_ptr<CancellationToken> cancel_;

    std::vector<SourceReport> sources_;
    ScoreMap combined_;
    std::vector<RankedEntry> entries_;
    WarningList warnings_;
    bool partial_ = false;

    // Statistics
    size_t commitsVisited_ = 0;
    size_t partitionsWalked_ = 0;
    size_t toolInvocations_ = 0;
    size_t toolFailures_ = 0;
    std::string selection_;

    // Timing info
    std::chrono::steady_clock::time_point startTime_;
    std::chrono::milliseconds duration_{0};
    std::chrono::milliseconds reportDuration_{0};

    void validateOptions() const;
    void writeOutput() const;
};

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "change_aggregator.hpp"
#include "errors.hpp"
#include "external_signal.hpp"
#include "git_repository.hpp"
#include "pattern_matcher.hpp"
#include "score_map.hpp"

namespace fs = std::filesystem;

// Anything that yields raw per-file scores for the normalizer
class ScoreSource {
public:
    virtual ~ScoreSource() = default;

    virtual std::string name() const = 0;

    // Raw, not yet normalized, scores
    virtual ScoreMap rawScores() = 0;

    // Problems met by the last rawScores() call
    const WarningList& warnings() const { return warnings_; }

    // True when the last rawScores() call could only produce part of its signal
    bool isPartial() const { return partial_; }

protected:
    WarningList warnings_;
    bool partial_ = false;
};

// Change frequency mined from version control history
class ChangeHistorySource : public ScoreSource {
public:
    ChangeHistorySource(const GitRepository& repo, HistorySelector selector, AggregationOptions options);

    std::string name() const override { return "change-history"; }
    ScoreMap rawScores() override;

    const AggregationResult& lastResult() const { return lastResult_; }

private:
    const GitRepository& repo_;
    HistorySelector selector_;
    AggregationOptions options_;
    AggregationResult lastResult_;
};

// Findings reported by external static analysis tools
class StaticAnalysisSource : public ScoreSource {
public:
    StaticAnalysisSource(const ExternalSignalAdapter& adapter, fs::path root, std::vector<std::string> files);

    std::string name() const override { return "static-analysis"; }
    ScoreMap rawScores() override;

    const ExternalSignal& lastSignal() const { return lastSignal_; }

private:
    const ExternalSignalAdapter& adapter_;
    fs::path root_;
    std::vector<std::string> files_;
    ExternalSignal lastSignal_;
};

/**
 * @brief Stand-in for a trained defect model.
 *
 * Assigns every source file in the work tree a uniform random raw score in
 * [0, 1). The generator is seeded, so one seed always gives one map.
 */
class PlaceholderModelSource : public ScoreSource {
public:
    PlaceholderModelSource(fs::path root, const PatternMatcher& patternMatcher, uint64_t seed);

    std::string name() const override { return "placeholder-model"; }
    ScoreMap rawScores() override;

    // Extensions the placeholder model scores
    static const std::vector<std::string>& sourceExtensions();

private:
    fs::path root_;
    const PatternMatcher& patternMatcher_;
    uint64_t seed_;
};

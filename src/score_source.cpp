#include "score_source.hpp"
#include "source_scanner.hpp"
#include <random>

ChangeHistorySource::ChangeHistorySource(const GitRepository& repo, HistorySelector selector, AggregationOptions options)
    : repo_(repo),
      selector_(std::move(selector)),
      options_(std::move(options)) {}

ScoreMap ChangeHistorySource::rawScores() {
    lastResult_ = aggregateChangeHistory(repo_, selector_, options_);
    warnings_ = lastResult_.warnings;
    partial_ = lastResult_.isPartial();
    return lastResult_.counts;
}

StaticAnalysisSource::StaticAnalysisSource(const ExternalSignalAdapter& adapter, fs::path root, std::vector<std::string> files)
    : adapter_(adapter),
      root_(std::move(root)),
      files_(std::move(files)) {}

ScoreMap StaticAnalysisSource::rawScores() {
    lastSignal_ = adapter_.collect(root_, files_);
    warnings_ = lastSignal_.warnings;
    partial_ = lastSignal_.failures > 0;
    return lastSignal_.raw;
}

PlaceholderModelSource::PlaceholderModelSource(fs::path root, const PatternMatcher& patternMatcher, uint64_t seed)
    : root_(std::move(root)),
      patternMatcher_(patternMatcher),
      seed_(seed) {}

const std::vector<std::string>& PlaceholderModelSource::sourceExtensions() {
    static const std::vector<std::string> extensions = {
        ".py", ".c", ".cpp", ".h", ".java", ".js", ".go"
    };
    return extensions;
}

ScoreMap PlaceholderModelSource::rawScores() {
    warnings_.clear();
    partial_ = false;

    SourceScanner scanner(patternMatcher_);
    const auto files = scanner.collectFiles(root_, sourceExtensions());

    // Files arrive sorted, so the draw order and therefore the map depend only on the seed
    std::mt19937_64 generator(seed_);
    std::uniform_real_distribution<double> distribution(0.0, 1.0);

    ScoreMap scores;
    for (const auto& file : files) {
        scores[file] = distribution(generator);
    }
    return scores;
}

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "cancellation.hpp"
#include "commit.hpp"
#include "errors.hpp"
#include "history_selector.hpp"
#include "line_source.hpp"
#include "pattern_matcher.hpp"
#include "score_map.hpp"

class GitRepository;

// Amount a commit adds to each file it touches. Must be finite and >= 0.
using WeightFunction = std::function<double(const Commit&)>;

// Every commit counts 1
WeightFunction unitWeight();

// weight = exp(-age / halfLife), with age = referenceTime - authorTime clamped at 0
WeightFunction recencyDecay(std::chrono::seconds halfLife, int64_t referenceTime);

// Rename edges (old path -> new path) seen during a walk, newest first
using RenameLog = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Folds a commit sequence into per-file change counts.
 *
 * Each touched path gains weight(commit). Increments commute, so any
 * permutation of the same commits produces the same record. An aggregator
 * belongs to one worker; partial records are combined with mergeRecords().
 */
class ChangeAggregator {
public:
    explicit ChangeAggregator(WeightFunction weight = unitWeight(),
                              RenamePolicy renamePolicy = RenamePolicy::SeparatePaths,
                              const PatternMatcher* pathFilter = nullptr);

    void add(const Commit& commit);

    size_t commitCount() const { return commitCount_; }
    const RenameLog& renames() const { return renames_; }

    // Hand the finished record to the caller; the aggregator starts over empty
    FileChangeRecord finish();

private:
    WeightFunction weight_;
    RenamePolicy renamePolicy_;
    const PatternMatcher* pathFilter_;
    FileChangeRecord counts_;
    RenameLog renames_;
    size_t commitCount_ = 0;

    void touch(const std::string& path, double amount);
};

// Sum partial records
FileChangeRecord mergeRecords(const std::vector<FileChangeRecord>& partials);

// Move the counts of renamed paths onto their latest name. Chains are
// followed (a -> b -> c folds a into c); a cycle stops at the first repeat.
FileChangeRecord foldRenames(const FileChangeRecord& counts, const RenameLog& renames);

// Aggregate an in-memory commit sequence in one pass
FileChangeRecord aggregateCommits(const std::vector<Commit>& commits,
                                  const WeightFunction& weight = unitWeight(),
                                  RenamePolicy renamePolicy = RenamePolicy::SeparatePaths);

enum class AggregationStatus {
    Complete,
    Partial      // Cancelled, or at least one partition failed
};

struct AggregationOptions {
    WeightFunction weight = unitWeight();
    WalkOptions walk;
    const PatternMatcher* pathFilter = nullptr;
    unsigned int threads = 1;                          // Concurrent partition walks
    std::shared_ptr<const CancellationToken> cancel;   // Optional stop signal
};

struct AggregationResult {
    FileChangeRecord counts;
    AggregationStatus status = AggregationStatus::Complete;
    WarningList warnings;
    size_t commitsVisited = 0;
    size_t partitionsWalked = 0;
    bool cancelled = false;

    bool isPartial() const { return status == AggregationStatus::Partial; }
};

// Opens the line feed of one partition; runs on a worker thread
using PartitionOpener = std::function<std::unique_ptr<LineSource>(const HistoryPartition&)>;

// Walk partitions on a bounded worker pool, one ChangeAggregator per
// partition, then sum the partial records on the calling thread in partition
// order. A partition whose walk raises HistoryTraversalError is dropped and
// reported as a warning; the result is then Partial.
AggregationResult aggregatePartitions(const std::vector<HistoryPartition>& partitions,
                                      const PartitionOpener& open,
                                      const AggregationOptions& options = AggregationOptions());

// Walk the selected history and count changes per file.
// Throws RepositoryAccessError for an unreadable repository and
// HistoryTraversalError when every partition failed.
AggregationResult aggregateChangeHistory(const GitRepository& repo,
                                         const HistorySelector& selector,
                                         const AggregationOptions& options = AggregationOptions());

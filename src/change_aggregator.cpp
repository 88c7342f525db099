#include "change_aggregator.hpp"
#include "commit_walker.hpp"
#include "git_repository.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace {

// What one worker hands back for one partition
struct PartitionOutcome {
    FileChangeRecord counts;
    RenameLog renames;
    size_t commits = 0;
    bool failed = false;
    bool cancelled = false;
    std::string error;
    std::exception_ptr fatal;    // Anything that is not a history problem
};

PartitionOutcome walkPartition(const HistoryPartition& partition,
                               const PartitionOpener& open,
                               const AggregationOptions& options) {
    PartitionOutcome outcome;
    const CancellationToken* cancel = options.cancel.get();

    if (cancel && cancel->isCancelled()) {
        outcome.cancelled = true;
        return outcome;
    }

    ChangeAggregator aggregator(options.weight, options.walk.renamePolicy, options.pathFilter);
    try {
        CommitWalker walker(open(partition));

        Commit commit;
        while (true) {
            if (cancel && cancel->isCancelled()) {
                outcome.cancelled = true;
                walker.stop();
                break;
            }
            if (!walker.next(commit)) {
                break;
            }
            aggregator.add(commit);
        }
    } catch (const HistoryTraversalError& e) {
        // An interrupt also reaches git, which then exits with an error
        if (cancel && cancel->isCancelled()) {
            outcome.cancelled = true;
        } else {
            outcome.failed = true;
            outcome.error = e.what();
            return outcome;
        }
    } catch (const RepositoryAccessError& e) {
        outcome.failed = true;
        outcome.error = e.what();
        return outcome;
    } catch (...) {
        outcome.fatal = std::current_exception();
        return outcome;
    }

    outcome.commits = aggregator.commitCount();
    outcome.renames = aggregator.renames();
    outcome.counts = aggregator.finish();
    return outcome;
}

}  // namespace

WeightFunction unitWeight() {
    return [](const Commit&) { return 1.0; };
}

WeightFunction recencyDecay(std::chrono::seconds halfLife, int64_t referenceTime) {
    if (halfLife.count() <= 0) {
        throw std::invalid_argument("Recency half-life must be positive");
    }
    const double scale = static_cast<double>(halfLife.count());
    return [scale, referenceTime](const Commit& commit) {
        double age = static_cast<double>(referenceTime - commit.authorTime);
        if (age < 0.0) {
            age = 0.0;
        }
        return std::exp(-age / scale);
    };
}

ChangeAggregator::ChangeAggregator(WeightFunction weight, RenamePolicy renamePolicy, const PatternMatcher* pathFilter)
    : weight_(std::move(weight)),
      renamePolicy_(renamePolicy),
      pathFilter_(pathFilter) {
    if (!weight_) {
        weight_ = unitWeight();
    }
}

void ChangeAggregator::touch(const std::string& path, double amount) {
    if (path.empty()) {
        return;
    }
    if (pathFilter_ && !pathFilter_->shouldProcess(path)) {
        return;
    }
    counts_[path] += amount;
}

void ChangeAggregator::add(const Commit& commit) {
    const double amount = weight_(commit);
    if (!std::isfinite(amount) || amount < 0.0) {
        throw std::invalid_argument("Weight for commit " + commit.id + " must be finite and non-negative, got " +
                                    std::to_string(amount));
    }

    ++commitCount_;
    for (const auto& change : commit.changes) {
        if (change.kind == ChangeKind::Renamed) {
            if (renamePolicy_ == RenamePolicy::FollowRenames) {
                renames_.emplace_back(change.previousPath, change.path);
            } else {
                touch(change.previousPath, amount);
            }
        }
        touch(change.path, amount);
    }
}

FileChangeRecord ChangeAggregator::finish() {
    FileChangeRecord finished;
    finished.swap(counts_);
    return finished;
}

FileChangeRecord mergeRecords(const std::vector<FileChangeRecord>& partials) {
    FileChangeRecord merged;
    for (const auto& partial : partials) {
        for (const auto& [path, count] : partial) {
            merged[path] += count;
        }
    }
    return merged;
}

FileChangeRecord foldRenames(const FileChangeRecord& counts, const RenameLog& renames) {
    if (renames.empty()) {
        return counts;
    }

    // The log is newest first, so the first edge for a path is its latest rename
    std::unordered_map<std::string, std::string> renamedTo;
    for (const auto& [from, to] : renames) {
        if (from != to) {
            renamedTo.emplace(from, to);
        }
    }

    auto canonical = [&renamedTo](const std::string& path) {
        std::string current = path;
        std::unordered_set<std::string> visited{current};
        while (true) {
            auto it = renamedTo.find(current);
            if (it == renamedTo.end() || !visited.insert(it->second).second) {
                return current;
            }
            current = it->second;
        }
    };

    FileChangeRecord folded;
    for (const auto& [path, count] : counts) {
        folded[canonical(path)] += count;
    }
    return folded;
}

FileChangeRecord aggregateCommits(const std::vector<Commit>& commits,
                                  const WeightFunction& weight,
                                  RenamePolicy renamePolicy) {
    ChangeAggregator aggregator(weight, renamePolicy);
    for (const auto& commit : commits) {
        aggregator.add(commit);
    }
    RenameLog renames = aggregator.renames();
    FileChangeRecord counts = aggregator.finish();
    if (renamePolicy == RenamePolicy::FollowRenames) {
        counts = foldRenames(counts, renames);
    }
    return counts;
}

AggregationResult aggregatePartitions(const std::vector<HistoryPartition>& partitions,
                                      const PartitionOpener& open,
                                      const AggregationOptions& options) {
    AggregationResult result;
    if (partitions.empty()) {
        return result;
    }

    // Each worker writes only its own slot; the reduction below runs after all joins
    std::vector<PartitionOutcome> outcomes(partitions.size());
    std::queue<size_t> pending;
    for (size_t i = 0; i < partitions.size(); ++i) {
        pending.push(i);
    }
    std::mutex queueMutex;

    auto worker = [&]() {
        while (true) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(queueMutex);
                if (pending.empty()) {
                    return;
                }
                index = pending.front();
                pending.pop();
            }
            outcomes[index] = walkPartition(partitions[index], open, options);
        }
    };

    unsigned int threadCount = std::max(1u, std::min(options.threads, static_cast<unsigned int>(partitions.size())));
    std::vector<std::thread> workers;
    try {
        for (unsigned int i = 0; i < threadCount; ++i) {
            workers.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        // Whatever threads did start keep draining the queue
        result.warnings.push_back({"history", "workers", std::string("could not create worker thread: ") + e.what()});
    }
    if (workers.empty()) {
        worker();
    }
    for (auto& thread : workers) {
        thread.join();
    }

    // Single-threaded reduction in partition order
    std::vector<FileChangeRecord> records;
    RenameLog renames;
    size_t failures = 0;
    std::string firstError;

    for (size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];
        if (outcome.fatal) {
            std::rethrow_exception(outcome.fatal);
        }
        if (outcome.failed) {
            ++failures;
            if (firstError.empty()) {
                firstError = outcome.error;
            }
            result.warnings.push_back({"history", partitions[i].label, outcome.error});
            result.status = AggregationStatus::Partial;
            continue;
        }
        if (outcome.cancelled) {
            result.cancelled = true;
            result.status = AggregationStatus::Partial;
        }
        if (outcome.commits > 0 || !outcome.cancelled) {
            ++result.partitionsWalked;
        }
        result.commitsVisited += outcome.commits;
        records.push_back(std::move(outcome.counts));
        renames.insert(renames.end(), outcome.renames.begin(), outcome.renames.end());
    }

    if (failures == partitions.size()) {
        throw HistoryTraversalError("No usable history: " + firstError);
    }

    if (result.cancelled) {
        result.warnings.push_back({"history", "walk", "cancelled before the history was exhausted"});
    }

    result.counts = mergeRecords(records);
    if (options.walk.renamePolicy == RenamePolicy::FollowRenames) {
        result.counts = foldRenames(result.counts, renames);
    }
    return result;
}

AggregationResult aggregateChangeHistory(const GitRepository& repo,
                                         const HistorySelector& selector,
                                         const AggregationOptions& options) {
    WarningList planWarnings;
    auto partitions = selector.plan(repo, planWarnings);

    if (partitions.empty()) {
        if (!planWarnings.empty()) {
            throw HistoryTraversalError("No usable history for " + selector.describe() + ": " +
                                        planWarnings.front().subject + " " + planWarnings.front().reason);
        }
        // No refs at all: an empty repository has no history, which is not an error
        return AggregationResult();
    }

    const WalkOptions walk = options.walk;
    const CancellationToken* cancel = options.cancel.get();
    auto result = aggregatePartitions(
        partitions,
        [&repo, walk, cancel](const HistoryPartition& partition) { return repo.openLog(partition, walk, cancel); },
        options);

    if (!planWarnings.empty()) {
        result.status = AggregationStatus::Partial;
        result.warnings.insert(result.warnings.begin(), planWarnings.begin(), planWarnings.end());
    }
    return result;
}

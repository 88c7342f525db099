#include "defect_analyzer.hpp"
#include "change_aggregator.hpp"
#include "external_signal.hpp"
#include "git_repository.hpp"
#include "pattern_matcher.hpp"
#include "score_normalizer.hpp"
#include "score_source.hpp"
#include "source_scanner.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::string describeWarning(const AnalysisWarning& warning) {
    return warning.source + ": " + warning.subject + ": " + warning.reason;
}

void checkWeight(const std::string& name, double weight) {
    if (!std::isfinite(weight) || weight < 0.0) {
        throw std::invalid_argument(name + " must be finite and non-negative");
    }
}

}  // namespace

DefectAnalyzer::DefectAnalyzer(const AnalyzerOptions& options)
    : options_(options) {}

void DefectAnalyzer::validateOptions() const {
    if (options_.topN == 0) {
        throw std::invalid_argument("Number of reported files must be at least 1");
    }
    checkWeight("History weight", options_.historyWeight);
    checkWeight("External weight", options_.externalWeight);
    checkWeight("Placeholder weight", options_.placeholderWeight);
    if (options_.historyWeight + options_.externalWeight + options_.placeholderWeight <= 0.0) {
        throw std::invalid_argument("At least one score source needs a positive weight");
    }
    if (!std::isfinite(options_.halfLifeDays) || options_.halfLifeDays < 0.0) {
        throw std::invalid_argument("Half-life must be a non-negative number of days");
    }

    const auto known = ToolRegistry::defaults().toolNames();
    for (const auto& tool : options_.tools) {
        if (std::find(known.begin(), known.end(), tool) == known.end()) {
            throw std::invalid_argument("Unknown static analysis tool: " + tool);
        }
    }
}

bool DefectAnalyzer::run() {
    try {
        startTime_ = std::chrono::steady_clock::now();

        sources_.clear();
        combined_.clear();
        entries_.clear();
        warnings_.clear();
        partial_ = false;
        commitsVisited_ = 0;
        partitionsWalked_ = 0;
        toolInvocations_ = 0;
        toolFailures_ = 0;

        validateOptions();

        if (!cancel_) {
            cancel_ = std::make_shared<CancellationToken>();
        }
        if (options_.timeoutSeconds > 0) {
            cancel_->setDeadline(CancellationToken::Clock::now() + std::chrono::seconds(options_.timeoutSeconds));
        }

        if (options_.verbose) {
            std::cout << "Analyzing repository: " << options_.inputDir << std::endl;
        }

        // Applied to history paths; empty unless the user narrows the analysis
        PatternMatcher pathFilter = PatternMatcher::empty();
        const bool filtering = !options_.includePatterns.empty() || !options_.excludePatterns.empty();
        if (!options_.includePatterns.empty()) {
            pathFilter.setIncludePatterns(options_.includePatterns);
            if (options_.verbose) {
                std::cout << "Using include patterns: " << options_.includePatterns << std::endl;
            }
        }
        if (!options_.excludePatterns.empty()) {
            pathFilter.setExcludePatterns(options_.excludePatterns);
            if (options_.verbose) {
                std::cout << "Using exclude patterns: " << options_.excludePatterns << std::endl;
            }
        }

        std::unique_ptr<GitRepository> repo;
        fs::path root = options_.inputDir;
        if (options_.historyWeight > 0.0) {
            repo = std::make_unique<GitRepository>(options_.inputDir, options_.gitExecutable);
            if (!repo->isBare()) {
                // Work tree keys match the repository-relative paths git reports
                root = repo->workTree();
            }
        }

        const bool scansWorkTree = options_.externalWeight > 0.0 || options_.placeholderWeight > 0.0;
        if (scansWorkTree && repo && repo->isBare()) {
            throw RepositoryAccessError("Repository at " + options_.inputDir.string() +
                                        " is bare; static analysis needs a work tree");
        }

        // Applied to the work tree: default ignores, .gitignore, then the user's patterns
        PatternMatcher scanMatcher;
        if (scansWorkTree) {
            const auto gitignorePath = root / ".gitignore";
            if (fs::exists(gitignorePath) && !scanMatcher.loadGitignore(gitignorePath)) {
                warnings_.push_back({"scanner", gitignorePath.string(), "could not be read"});
            }
            if (!options_.includePatterns.empty()) {
                scanMatcher.setIncludePatterns(options_.includePatterns);
            }
            if (!options_.excludePatterns.empty()) {
                scanMatcher.setExcludePatterns(options_.excludePatterns);
            }
        }

        // Sources hold references to the repository and adapter, which outlive them
        std::unique_ptr<ExternalSignalAdapter> externalAdapter;
        std::vector<std::pair<std::unique_ptr<ScoreSource>, double>> sources;
        std::vector<std::string> titles;
        ChangeHistorySource* historySource = nullptr;
        StaticAnalysisSource* staticSource = nullptr;

        if (repo) {
            HistorySelector selector = !options_.range.empty()
                ? HistorySelector::range(options_.range)
                : options_.refs.empty() ? HistorySelector::all() : HistorySelector::refs(options_.refs);
            selection_ = selector.describe();

            AggregationOptions aggregation;
            aggregation.walk.renamePolicy = options_.followRenames ? RenamePolicy::FollowRenames
                                                                   : RenamePolicy::SeparatePaths;
            aggregation.walk.mergePolicy = options_.mergePolicy;
            aggregation.pathFilter = filtering ? &pathFilter : nullptr;
            aggregation.threads = std::max(1u, options_.threads);
            aggregation.cancel = cancel_;

            if (options_.halfLifeDays > 0.0) {
                const int64_t referenceTime = options_.referenceTime
                    ? *options_.referenceTime
                    : static_cast<int64_t>(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
                const auto halfLife = std::chrono::seconds(
                    std::max<long long>(1, std::llround(options_.halfLifeDays * 86400.0)));
                aggregation.weight = recencyDecay(halfLife, referenceTime);
            }

            auto source = std::make_unique<ChangeHistorySource>(*repo, selector, aggregation);
            historySource = source.get();
            sources.emplace_back(std::move(source), options_.historyWeight);
            titles.push_back("Change history");
        }

        if (options_.externalWeight > 0.0) {
            ToolRegistry registry = ToolRegistry::defaults();
            if (!options_.tools.empty()) {
                registry = registry.restrictedTo(options_.tools);
            }

            ExternalToolOptions toolOptions;
            toolOptions.concurrency = std::max(1u, options_.toolConcurrency);
            toolOptions.timeout = std::chrono::seconds(options_.toolTimeoutSeconds);
            toolOptions.cancel = cancel_;
            externalAdapter = std::make_unique<ExternalSignalAdapter>(std::move(registry), toolOptions);

            SourceScanner scanner(scanMatcher);
            auto files = scanner.collectFiles(root);
            if (options_.verbose) {
                std::cout << "Found " << files.size() << " files for static analysis" << std::endl;
            }

            auto source = std::make_unique<StaticAnalysisSource>(*externalAdapter, root, std::move(files));
            staticSource = source.get();
            sources.emplace_back(std::move(source), options_.externalWeight);
            titles.push_back("Static analysis");
        }

        if (options_.placeholderWeight > 0.0) {
            sources.emplace_back(std::make_unique<PlaceholderModelSource>(root, scanMatcher, options_.seed),
                                 options_.placeholderWeight);
            titles.push_back("Placeholder model");
        }

        // Each source is normalized on its own before blending
        std::vector<std::pair<ScoreMap, double>> weighted;
        for (size_t i = 0; i < sources.size(); ++i) {
            auto& [source, weight] = sources[i];

            auto sourceStart = std::chrono::steady_clock::now();
            ScoreMap raw = source->rawScores();

            SourceReport report;
            report.name = source->name();
            report.title = titles[i];
            report.weight = weight;
            report.rawFiles = raw.size();
            report.normalized = normalize(raw);
            report.entries = topN(report.normalized, options_.topN);
            report.partial = source->isPartial();
            report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - sourceStart);

            warnings_.insert(warnings_.end(), source->warnings().begin(), source->warnings().end());
            partial_ = partial_ || report.partial;

            if (options_.verbose) {
                std::cout << report.title << ": " << report.rawFiles << " files scored in "
                          << report.duration.count() << " ms" << std::endl;
            }

            weighted.emplace_back(report.normalized, weight);
            sources_.push_back(std::move(report));
        }

        if (historySource) {
            commitsVisited_ = historySource->lastResult().commitsVisited;
            partitionsWalked_ = historySource->lastResult().partitionsWalked;
            if (options_.verbose) {
                std::cout << "Walked " << commitsVisited_ << " commits in " << partitionsWalked_
                          << " partitions (" << selection_ << ")" << std::endl;
            }
        }
        if (staticSource) {
            toolInvocations_ = staticSource->lastSignal().invocations;
            toolFailures_ = staticSource->lastSignal().failures;
        }

        auto reportStart = std::chrono::steady_clock::now();

        combined_ = blendAll(weighted);
        entries_ = topN(combined_, options_.topN);

        for (const auto& warning : warnings_) {
            std::cerr << "Warning: " << describeWarning(warning) << std::endl;
        }
        if (partial_) {
            std::cerr << "Warning: Analysis is incomplete; the report is based on partial data" << std::endl;
        }

        if (!options_.outputFile.empty()) {
            writeOutput();
        }

        auto endTime = std::chrono::steady_clock::now();
        reportDuration_ = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - reportStart);
        duration_ = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime_);

        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

void DefectAnalyzer::writeOutput() const {
    std::ofstream outFile(options_.outputFile);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + options_.outputFile.string());
    }
    outFile << getOutput();
    if (!outFile) {
        throw std::runtime_error("Failed to write output file: " + options_.outputFile.string());
    }
    if (options_.verbose) {
        std::cout << "Report written to " << options_.outputFile << std::endl;
    }
}

std::string DefectAnalyzer::getOutput() const {
    if (options_.format == ReportFormat::Json) {
        return getJsonReport().dump(2) + "\n";
    }
    return getReport();
}

std::string DefectAnalyzer::getReport() const {
    std::stringstream ss;

    // One source: its ranking is the combined ranking
    if (sources_.size() > 1) {
        for (const auto& source : sources_) {
            ss << "== " << source.title << " (weight " << std::fixed << std::setprecision(2)
               << source.weight << ") ==" << std::endl;
            ss << formatReport(source.entries, options_.topN) << std::endl;
        }
        ss << "== Combined ==" << std::endl;
    }
    ss << formatReport(entries_, options_.topN);

    if (partial_) {
        ss << "(partial result: " << warnings_.size() << " warning"
           << (warnings_.size() == 1 ? "" : "s") << ")" << std::endl;
    }
    return ss.str();
}

json DefectAnalyzer::getJsonReport() const {
    json report;
    report["repository"] = options_.inputDir.string();
    report["status"] = partial_ ? "partial" : "complete";

    json config;
    config["top"] = options_.topN;
    config["selection"] = selection_;
    config["renames"] = options_.followRenames ? "follow" : "separate";
    config["merges"] = options_.mergePolicy == MergePolicy::FirstParent ? "first-parent" : "none";
    config["halfLifeDays"] = options_.halfLifeDays;
    config["weights"] = {
        {"history", options_.historyWeight},
        {"external", options_.externalWeight},
        {"placeholder", options_.placeholderWeight}
    };
    report["config"] = config;

    json sources = json::array();
    for (const auto& source : sources_) {
        sources.push_back({
            {"name", source.name},
            {"weight", source.weight},
            {"files", source.rawFiles},
            {"partial", source.partial},
            {"entries", entriesToJson(source.entries)}
        });
    }
    report["sources"] = sources;
    report["combined"] = entriesToJson(entries_);

    json warnings = json::array();
    for (const auto& warning : warnings_) {
        warnings.push_back({
            {"source", warning.source},
            {"subject", warning.subject},
            {"reason", warning.reason}
        });
    }
    report["warnings"] = warnings;

    report["summary"] = {
        {"filesScored", combined_.size()},
        {"commitsVisited", commitsVisited_},
        {"partitionsWalked", partitionsWalked_},
        {"toolInvocations", toolInvocations_},
        {"toolFailures", toolFailures_}
    };
    return report;
}

std::string DefectAnalyzer::getSummary() const {
    std::stringstream ss;
    ss << "Analysis summary:" << std::endl;
    ss << "  Files scored: " << combined_.size() << std::endl;
    if (!selection_.empty()) {
        ss << "  History: " << selection_ << ", " << commitsVisited_ << " commits in "
           << partitionsWalked_ << " partitions" << std::endl;
    }
    if (toolInvocations_ > 0) {
        ss << "  Tool runs: " << toolInvocations_ << " (" << toolFailures_ << " failed)" << std::endl;
    }
    ss << "  Warnings: " << warnings_.size() << std::endl;
    ss << "  Status: " << (partial_ ? "partial" : "complete") << std::endl;

    if (options_.showTiming) {
        for (const auto& source : sources_) {
            ss << "  " << source.title << " time: " << source.duration.count() << " ms" << std::endl;
        }
        ss << "  Report time: " << reportDuration_.count() << " ms" << std::endl;
        ss << "  Total time: " << duration_.count() << " ms" << std::endl;
    }
    return ss.str();
}

std::string DefectAnalyzer::getTimingInfo() const {
    const auto total = duration_.count() ? duration_.count() : 1;

    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << duration_.count() << "ms" << std::endl;

    auto accounted = reportDuration_;
    for (const auto& source : sources_) {
        ss << "- " << source.title << " time: " << source.duration.count() << "ms ("
           << (source.duration.count() * 100 / total) << "%)" << std::endl;
        accounted += source.duration;
    }
    ss << "- Blend and report time: " << reportDuration_.count() << "ms ("
       << (reportDuration_.count() * 100 / total) << "%)" << std::endl;

    // Repository checks, scanning and option handling
    auto overheadTime = duration_ - accounted;
    ss << "- Overhead time: " << overheadTime.count() << "ms ("
       << (overheadTime.count() * 100 / total) << "%)" << std::endl;

    if (commitsVisited_ > 0 && !sources_.empty() && sources_.front().duration.count() > 0) {
        double commitsPerSecond = static_cast<double>(commitsVisited_) / (sources_.front().duration.count() / 1000.0);
        ss << "- Performance:" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2) << commitsPerSecond << " commits/second" << std::endl;
    }
    return ss.str();
}

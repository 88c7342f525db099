#include <csignal>
#include <iostream>
#include <memory>
#include <CLI/CLI.hpp>
#include "defect_analyzer.hpp"

namespace {

// Set before the handlers are installed, never reset
CancellationToken* activeToken = nullptr;

void handleStopSignal(int) {
    if (activeToken) {
        activeToken->requestStop();
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        CLI::App app{"defectscope - Rank the files of a git repository by how likely they are to contain defects"};
        app.set_config("--config", "", "Read options from an INI or TOML file");

        AnalyzerOptions options;
        std::string formatStr = "text";
        std::string mergeStr = "first-parent";
        int64_t referenceTime = 0;

        // Required input directory
        app.add_option("-i,--input", options.inputDir, "Repository to analyze (required)")
            ->required()
            ->check(CLI::ExistingDirectory);

        app.add_option("-n,--top", options.topN, "Number of files to report (default: 10)")
            ->check(CLI::PositiveNumber);

        app.add_option("-o,--output", options.outputFile, "Write the report to this file instead of stdout");

        app.add_option("-f,--format", formatStr, "Report format: text, json (default: text)")
            ->check(CLI::IsMember({"text", "json"}));

        app.add_flag("-v,--verbose", options.verbose, "Enable verbose output");
        app.add_flag("-t,--timing", options.showTiming, "Show detailed timing information");

        // History selection
        auto historyGroup = app.add_option_group("History Options");
        auto refsOpt = historyGroup->add_option("--refs", options.refs,
                                                "Refs to walk (default: every branch, tag and HEAD)")
            ->delimiter(',');
        historyGroup->add_option("--range", options.range, "Walk a single revision range such as v1.0..main")
            ->excludes(refsOpt);
        historyGroup->add_flag("--follow-renames", options.followRenames,
                               "Fold the history of renamed files into their new path");
        historyGroup->add_option("--merge-diffs", mergeStr,
                                 "Files a merge touches: first-parent, none (default: first-parent)")
            ->check(CLI::IsMember({"first-parent", "none"}));
        historyGroup->add_option("--half-life-days", options.halfLifeDays,
                                 "Weight commits by recency with this half-life (default: 0, every commit counts 1)")
            ->check(CLI::NonNegativeNumber);
        auto referenceOpt = historyGroup->add_option("--reference-time", referenceTime,
                                                     "Unix time recency is measured from (default: now)");
        historyGroup->add_option("--threads", options.threads,
                                 "Number of partitions walked at once (default: number of CPU cores)")
            ->check(CLI::Range(1u, 64u));
        historyGroup->add_option("--timeout", options.timeoutSeconds,
                                 "Stop after this many seconds and report what was collected (default: none)");

        // Path filters
        app.add_option("--include", options.includePatterns,
                       "Comma-separated list of glob patterns for files to include (e.g. *.cpp,src/**)");
        app.add_option("--exclude", options.excludePatterns,
                       "Comma-separated list of glob patterns for files to exclude (e.g. *.md,docs/**)");

        // Score sources
        auto blendGroup = app.add_option_group("Blend Options");
        blendGroup->add_option("--history-weight", options.historyWeight,
                               "Weight of the change history signal (default: 1)")
            ->check(CLI::NonNegativeNumber);
        blendGroup->add_option("--external-weight", options.externalWeight,
                               "Weight of the static analysis signal (default: 0)")
            ->check(CLI::NonNegativeNumber);
        blendGroup->add_option("--placeholder-weight", options.placeholderWeight,
                               "Weight of the random placeholder model (default: 0)")
            ->check(CLI::NonNegativeNumber);
        blendGroup->add_option("--seed", options.seed, "Seed of the placeholder model (default: 0)");

        auto toolGroup = app.add_option_group("Static Analysis Options");
        toolGroup->add_option("--tools", options.tools, "Tools to run (default: all)")
            ->delimiter(',')
            ->check(CLI::IsMember({"cppcheck", "spotbugs"}));
        toolGroup->add_option("--tool-timeout", options.toolTimeoutSeconds,
                              "Seconds one tool run may take (default: 60)")
            ->check(CLI::Range(1u, 86400u));
        toolGroup->add_option("--tool-concurrency", options.toolConcurrency,
                              "Tool processes running at once (default: 4)")
            ->check(CLI::Range(1u, 64u));

        app.add_option("--git", options.gitExecutable, "git executable (default: git)");

        // Parse command line arguments
        CLI11_PARSE(app, argc, argv);

        options.format = formatStr == "json" ? ReportFormat::Json : ReportFormat::Text;
        options.mergePolicy = mergeStr == "none" ? MergePolicy::None : MergePolicy::FirstParent;
        if (referenceOpt->count() > 0) {
            options.referenceTime = referenceTime;
        }

        auto token = std::make_shared<CancellationToken>();
        activeToken = token.get();
        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        DefectAnalyzer analyzer(options);
        analyzer.setCancellationToken(token);
        if (!analyzer.run()) {
            return 1;
        }

        if (options.outputFile.empty()) {
            std::cout << analyzer.getOutput();
        }

        if (options.verbose) {
            std::cout << analyzer.getSummary() << std::endl;
        }

        if (options.showTiming) {
            std::cout << analyzer.getTimingInfo() << std::endl;
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

#include "rank_reporter.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

std::vector<RankedEntry> topN(const ScoreMap& scores, size_t n) {
    if (n == 0) {
        throw std::invalid_argument("Report size must be positive");
    }

    std::vector<RankedEntry> entries;
    entries.reserve(scores.size());
    for (const auto& [path, score] : scores) {
        entries.push_back({path, score, 0});
    }

    auto byScoreThenPath = [](const RankedEntry& a, const RankedEntry& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.path < b.path;
    };

    const size_t count = std::min(n, entries.size());
    std::partial_sort(entries.begin(), entries.begin() + count, entries.end(), byScoreThenPath);
    entries.resize(count);

    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i].rank = i + 1;
    }
    return entries;
}

std::string formatEntry(const RankedEntry& entry) {
    std::ostringstream ss;
    ss << entry.rank << ". " << entry.path << " (Score: "
       << std::fixed << std::setprecision(4) << entry.score << ")";
    return ss.str();
}

std::string formatReport(const std::vector<RankedEntry>& entries, size_t requested) {
    std::ostringstream ss;
    if (entries.empty()) {
        ss << "No defect signal: there are no files to rank." << std::endl;
        return ss.str();
    }

    ss << "Top " << requested << " files most likely to contain defects:" << std::endl;
    for (const auto& entry : entries) {
        ss << formatEntry(entry) << std::endl;
    }
    return ss.str();
}

json entriesToJson(const std::vector<RankedEntry>& entries) {
    json array = json::array();
    for (const auto& entry : entries) {
        array.push_back({
            {"rank", entry.rank},
            {"path", entry.path},
            {"score", entry.score}
        });
    }
    return array;
}

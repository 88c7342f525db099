#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "score_map.hpp"

// One line of a report. Recomputed for every request, never cached.
struct RankedEntry {
    std::string path;
    double score = 0.0;
    size_t rank = 0;   // 1-based
};

// The n highest scores, descending. Equal scores are ordered by ascending
// path so identical input always yields an identical report. Fewer than n
// entries come back when the map is smaller; an empty map gives an empty
// report. Throws std::invalid_argument when n is 0.
std::vector<RankedEntry> topN(const ScoreMap& scores, size_t n);

// "{rank}. {path} (Score: {score:.4f})"
std::string formatEntry(const RankedEntry& entry);

// Heading plus one formatted line per entry, or a "no signal" line
std::string formatReport(const std::vector<RankedEntry>& entries, size_t requested);

// [{"rank": 1, "path": "...", "score": 0.5}, ...]
nlohmann::json entriesToJson(const std::vector<RankedEntry>& entries);

#include "score_normalizer.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

double scoreTotal(const ScoreMap& scores) {
    // Path order keeps the floating point sum identical across runs
    double total = 0.0;
    for (const auto& [path, value] : scores) {
        total += value;
    }
    return total;
}

ScoreMap normalize(const ScoreMap& raw) {
    for (const auto& [path, value] : raw) {
        if (!std::isfinite(value) || value < 0.0) {
            throw std::invalid_argument("Raw score for " + path + " must be finite and non-negative");
        }
    }

    ScoreMap scores;
    const double total = scoreTotal(raw);
    if (total <= 0.0) {
        return scores;
    }

    for (const auto& [path, value] : raw) {
        scores.emplace_hint(scores.end(), path, value / total);
    }
    return scores;
}

ScoreMap blend(const ScoreMap& a, const ScoreMap& b, double weight) {
    if (!(weight >= 0.0 && weight <= 1.0)) {
        throw std::invalid_argument("Blend weight must be within [0, 1], got " + std::to_string(weight));
    }

    ScoreMap blended;
    for (const auto& [path, score] : a) {
        blended[path] += weight * score;
    }
    for (const auto& [path, score] : b) {
        blended[path] += (1.0 - weight) * score;
    }
    return blended;
}

ScoreMap blendAll(const std::vector<std::pair<ScoreMap, double>>& weightedMaps) {
    double totalWeight = 0.0;
    for (const auto& [scores, weight] : weightedMaps) {
        if (!std::isfinite(weight) || weight < 0.0) {
            throw std::invalid_argument("Source weights must be finite and non-negative");
        }
        totalWeight += weight;
    }
    if (totalWeight <= 0.0) {
        throw std::invalid_argument("At least one source weight must be positive");
    }

    // Fold left: the accumulator carries the combined weight of what it already holds
    ScoreMap accumulated;
    double accumulatedWeight = 0.0;
    for (const auto& [scores, weight] : weightedMaps) {
        if (weight <= 0.0 || scores.empty()) {
            continue;
        }
        if (accumulatedWeight <= 0.0) {
            accumulated = scores;
            accumulatedWeight = weight;
            continue;
        }
        const double combined = accumulatedWeight + weight;
        accumulated = blend(accumulated, scores, accumulatedWeight / combined);
        accumulatedWeight = combined;
    }
    return accumulated;
}

bool isNormalized(const ScoreMap& scores, double tolerance) {
    if (scores.empty()) {
        return true;
    }
    return std::fabs(scoreTotal(scores) - 1.0) <= tolerance;
}

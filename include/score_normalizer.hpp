#pragma once

#include <utility>
#include <vector>
#include "score_map.hpp"

// Tolerance used when checking that normalized scores sum to 1
constexpr double NORMALIZATION_TOLERANCE = 1e-9;

// score[f] = raw[f] / sum(raw). Returns an empty map when the sum is 0
// (empty input or all zeros): that is "no signal", not an error.
// Throws std::invalid_argument for a negative or non-finite raw value.
ScoreMap normalize(const ScoreMap& raw);

// blended[f] = weight * a[f] + (1 - weight) * b[f], a missing key counting
// as 0. Both inputs are expected to be normalized already.
// Throws std::invalid_argument unless 0 <= weight <= 1.
ScoreMap blend(const ScoreMap& a, const ScoreMap& b, double weight);

// Weighted average of any number of normalized maps, built from repeated
// blend() calls. Weights are relative. Maps with weight 0 and empty maps
// (no signal) are skipped so they do not dilute the others.
// Throws std::invalid_argument for a negative weight or a zero total weight.
ScoreMap blendAll(const std::vector<std::pair<ScoreMap, double>>& weightedMaps);

// Sum of all values
double scoreTotal(const ScoreMap& scores);

// True for an empty map or one whose values sum to 1 within the tolerance
bool isNormalized(const ScoreMap& scores, double tolerance = NORMALIZATION_TOLERANCE);

#pragma once

#include <map>
#include <string>

// Per-file values keyed by repository-relative path ('/' separated).
// std::map keeps iteration in path order so sums and reports are reproducible.
using ScoreMap = std::map<std::string, double>;

// Raw change counts share the ScoreMap shape so they feed the normalizer directly
using FileChangeRecord = ScoreMap;

#pragma once
#include "devpulse/leetcode/models.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace devpulse::leetcode {

// Count for the tier named exactly Difficulty, or 0 when absent.
int64_t tierCount(
    const std::vector<models::TierCount> &Tiers, std::string_view Difficulty
);
int64_t tierSubmissions(
    const std::vector<models::TierCount> &Tiers, std::string_view Difficulty
);

// Solved / Submissions as a percentage rounded to two decimals, clamped to
// [0, 100]. Zero submissions give 0.
double acceptanceRate(int64_t Solved, int64_t Submissions);

models::LeetCodeProfile normalize(const models::RawSubmissionStats &Stats);

} // namespace devpulse::leetcode

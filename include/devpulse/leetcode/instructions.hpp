#pragma once
#include "devpulse/leetcode/models.hpp"

#include <string>

namespace devpulse::leetcode {

inline constexpr const char *GrindPlanTitle = "Grind Plan";

std::string buildInstructions(const models::LeetCodeProfile &Profile);

} // namespace devpulse::leetcode

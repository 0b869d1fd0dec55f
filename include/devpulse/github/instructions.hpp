#pragma once
#include "devpulse/github/models.hpp"

#include <string>

namespace devpulse::github {

inline constexpr const char *CareerAdviceTitle = "Career Advice";

// Deterministic prompt for the downstream writer. Every numeric fact in the
// text is taken verbatim from Profile.
std::string buildInstructions(const models::GitHubProfile &Profile);

} // namespace devpulse::github

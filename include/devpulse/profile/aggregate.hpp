#pragma once
#include "devpulse/core/result.hpp"
#include "devpulse/core/timestamp.hpp"
#include "devpulse/github/client.hpp"
#include "devpulse/github/models.hpp"
#include "devpulse/leetcode/client.hpp"
#include "devpulse/leetcode/models.hpp"

#include <chrono>
#include <expected>
#include <string_view>

namespace devpulse::profile {

// resolve handle -> fetch profile + repositories -> normalize -> instructions.
// Now is taken per call so day counts are never cached.
std::expected<github::models::GitHubProfile, core::Error> getGitHubProfileData(
    const github::Client &Client,
    std::string_view IdentifierOrUrl,
    core::Timestamp Now = std::chrono::system_clock::now()
);

std::expected<leetcode::models::LeetCodeProfile, core::Error>
getLeetCodeProfileData(const leetcode::Client &Client, std::string_view Handle);

} // namespace devpulse::profile

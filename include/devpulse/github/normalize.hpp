#pragma once
#include "devpulse/core/timestamp.hpp"
#include "devpulse/github/models.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace devpulse::github {

// The Limit most frequent languages, most frequent first. Ties keep the
// order in which languages were first seen. Absent languages and the
// literal "null" are ignored.
std::vector<std::string> topLanguages(
    const std::vector<models::RawRepository> &Repositories,
    std::size_t Limit = 3
);

// Builds the output record from a fetched profile. Instructions are left
// empty; see buildInstructions.
models::GitHubProfile
normalize(const models::FetchedProfile &Fetched, core::Timestamp Now);

} // namespace devpulse::github

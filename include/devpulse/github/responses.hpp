#pragma once
#include "devpulse/core/result.hpp"
#include "devpulse/github/models.hpp"

#include <expected>
#include <glaze/json/generic.hpp>
#include <vector>

namespace devpulse::github::responses {

// GET /users/{handle}. `login` is required; everything else defaults.
std::expected<models::RawProfile, core::Error>
decodeProfile(const glz::generic &Document);

// GET /users/{handle}/repos. The document must be an array; malformed
// entries inside it are skipped.
std::expected<std::vector<models::RawRepository>, core::Error>
decodeRepositories(const glz::generic &Document);

} // namespace devpulse::github::responses

#pragma once
#include "devpulse/core/result.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace devpulse::profile {

inline const std::vector<std::string> DefaultHostDomains{"github.com"};

// Trims surrounding whitespace from Input.
std::string_view trim(std::string_view Input);

// Reduces a handle or profile URL to a bare handle. Inputs that mention a
// known domain (case-insensitively), or carry a URL scheme, resolve to the
// first non-empty segment of their path; a port is skipped with the rest of
// the authority. Anything else is returned trimmed but otherwise unchanged.
std::expected<std::string, core::Error> resolveHandle(
    std::string_view Input,
    const std::vector<std::string> &KnownDomains = DefaultHostDomains
);

} // namespace devpulse::profile

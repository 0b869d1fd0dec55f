#pragma once
#include "devpulse/core/result.hpp"

#include <cstdint>
#include <expected>
#include <glaze/json/generic.hpp>
#include <optional>
#include <string>
#include <string_view>

// Typed field access over loosely-typed upstream JSON.
//
// Required fields fail closed with UpstreamFailure. Optional fields that are
// missing, null, or of an unexpected type fall back to their default.
namespace devpulse::core::json {

std::expected<glz::generic, Error>
parse(std::string_view Body, std::string_view What);

// nullptr when Object is not an object or has no such key.
const glz::generic *field(const glz::generic &Object, std::string_view Key);

const glz::generic::object_t *
objectField(const glz::generic &Object, std::string_view Key);
const glz::generic::array_t *
arrayField(const glz::generic &Object, std::string_view Key);

std::expected<std::string, Error> requiredString(
    const glz::generic &Object, std::string_view Key, std::string_view What
);

// Empty strings are treated as absent.
std::optional<std::string>
optionalString(const glz::generic &Object, std::string_view Key);

// Non-negative count; negatives clamp to zero, fractions truncate.
int64_t countOr(
    const glz::generic &Object, std::string_view Key, int64_t Default = 0
);

bool boolOr(
    const glz::generic &Object, std::string_view Key, bool Default = false
);

} // namespace devpulse::core::json

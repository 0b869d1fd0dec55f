#pragma once
#include "devpulse/core/result.hpp"
#include "devpulse/leetcode/models.hpp"

#include <expected>
#include <glaze/json/generic.hpp>
#include <string>
#include <string_view>

namespace devpulse::leetcode::responses {

inline constexpr std::string_view ProfileQuery =
    R"(query getUserProfile($username: String!) {
  matchedUser(username: $username) {
    username
    profile {
      ranking
      reputation
    }
    submitStats {
      acSubmissionNum {
        difficulty
        count
        submissions
      }
      totalSubmissionNum {
        difficulty
        count
        submissions
      }
    }
  }
})";

struct ProfileVariables {
  std::string username;
};

struct ProfileRequest {
  std::string query;
  ProfileVariables variables;
};

// Decodes a GraphQL response document. A null or absent data.matchedUser is
// reported as NotFound for Handle.
std::expected<models::RawSubmissionStats, core::Error>
decodeProfile(const glz::generic &Document, std::string_view Handle);

} // namespace devpulse::leetcode::responses

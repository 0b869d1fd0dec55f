#pragma once
#include "devpulse/core/http.hpp"

#include "glaze/net/http.hpp"
#include "glaze/net/http_server.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devpulse::server::middleware {

struct AccessToken {
  std::string Token;
  std::string ClientId;
  std::vector<std::string> Scopes;
};

inline constexpr std::string_view ClientId = "devpulse-client";

// Accepts "Bearer <Secret>" (scheme is case-insensitive) and grants the
// unrestricted scope. Anything else is rejected.
inline std::optional<AccessToken>
verifyBearer(std::string_view AuthorizationHeader, std::string_view Secret) {
  constexpr std::string_view Scheme = "bearer ";
  if (Secret.empty() || AuthorizationHeader.size() <= Scheme.size()) {
    return std::nullopt;
  }

  auto Prefix = AuthorizationHeader.substr(0, Scheme.size());
  bool SchemeMatches =
      std::ranges::equal(Prefix, Scheme, [](char Lhs, char Rhs) {
        return std::tolower(static_cast<unsigned char>(Lhs)) == Rhs;
      });
  if (!SchemeMatches) {
    return std::nullopt;
  }

  auto Token = AuthorizationHeader.substr(Scheme.size());
  if (Token != Secret) {
    return std::nullopt;
  }
  return AccessToken{
      .Token = std::string(Token),
      .ClientId = std::string(ClientId),
      .Scopes = {"*"},
  };
}

// Header names are matched case-insensitively.
template <typename HeaderMap>
std::optional<std::string_view>
findHeader(const HeaderMap &Headers, std::string_view Name) {
  for (const auto &[Key, Value] : Headers) {
    if (std::ranges::equal(Key, Name, [](char Lhs, char Rhs) {
          return std::tolower(static_cast<unsigned char>(Lhs)) ==
                 std::tolower(static_cast<unsigned char>(Rhs));
        })) {
      return Value;
    }
  }
  return std::nullopt;
}

// Requires a valid bearer token on every path under ProtectedPrefix.
inline auto
createAuthMiddleware(std::string Secret, std::string ProtectedPrefix) {
  return [Secret = std::move(Secret),
          ProtectedPrefix = std::move(ProtectedPrefix)](
             const glz::request &Request,
             glz::response &Response,
             const auto &Next
         ) {
    if (!Request.path.starts_with(ProtectedPrefix)) {
      Next();
      return;
    }

    auto Header = findHeader(Request.headers, "Authorization");
    if (!Header || !verifyBearer(*Header, Secret)) {
      spdlog::warn("Rejected unauthenticated request to {}", Request.path);
      Response.status(static_cast<int>(core::HttpStatus::Unauthorized))
          .header("WWW-Authenticate", "Bearer")
          .json({{"error", "invalid_token"}});
      return;
    }
    Next();
  };
}

} // namespace devpulse::server::middleware

#pragma once
#include "devpulse/core/result.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace devpulse::core {

struct Config {
  std::string AuthToken;
  std::string Identity;
  std::string Host{"0.0.0.0"};
  int Port = 8086;
  std::string LogLevel{"info"};
  std::optional<std::string> LogDir;
  std::string GitHubApiUrl{"https://api.github.com"};
  std::optional<std::string> GitHubToken;
  std::string LeetCodeApiUrl{"https://leetcode.com/graphql"};
  std::chrono::seconds RequestTimeout{10};

  static std::expected<Config, Error> load() {
    auto *AuthTokenEnv = std::getenv("AUTH_TOKEN");
    auto *IdentityEnv = std::getenv("MY_NUMBER");

    if (AuthTokenEnv == nullptr || *AuthTokenEnv == '\0') {
      return std::unexpected(
          Error{ErrorKind::Internal, "AUTH_TOKEN is required"}
      );
    }

    if (IdentityEnv == nullptr || *IdentityEnv == '\0') {
      return std::unexpected(
          Error{ErrorKind::Internal, "MY_NUMBER is required"}
      );
    }

    Config Cfg;
    Cfg.AuthToken = AuthTokenEnv;
    Cfg.Identity = IdentityEnv;

    if (auto *HostEnv = std::getenv("HOST")) {
      Cfg.Host = HostEnv;
    }

    if (auto *PortEnv = std::getenv("PORT")) {
      auto Port = parseInt(PortEnv);
      if (!Port || *Port <= 0 || *Port > 65535) {
        return std::unexpected(Error{
            ErrorKind::Internal,
            std::format("PORT is not a valid port: {}", PortEnv)
        });
      }
      Cfg.Port = *Port;
    }

    if (auto *LogLevelEnv = std::getenv("LOG_LEVEL")) {
      Cfg.LogLevel = LogLevelEnv;
    }

    if (auto *LogDirEnv = std::getenv("LOG_DIR")) {
      Cfg.LogDir = LogDirEnv;
    }

    if (auto *GitHubUrlEnv = std::getenv("GITHUB_API_URL")) {
      Cfg.GitHubApiUrl = GitHubUrlEnv;
    }

    if (auto *GitHubTokenEnv = std::getenv("GITHUB_TOKEN");
        GitHubTokenEnv != nullptr && *GitHubTokenEnv != '\0') {
      Cfg.GitHubToken = GitHubTokenEnv;
    }

    if (auto *LeetCodeUrlEnv = std::getenv("LEETCODE_API_URL")) {
      Cfg.LeetCodeApiUrl = LeetCodeUrlEnv;
    }

    if (auto *TimeoutEnv = std::getenv("REQUEST_TIMEOUT_SECONDS")) {
      auto Seconds = parseInt(TimeoutEnv);
      if (!Seconds || *Seconds <= 0) {
        return std::unexpected(Error{
            ErrorKind::Internal,
            std::format(
                "REQUEST_TIMEOUT_SECONDS is not a positive integer: {}",
                TimeoutEnv
            )
        });
      }
      Cfg.RequestTimeout = std::chrono::seconds(*Seconds);
    }

    return Cfg;
  }

private:
  static std::optional<int> parseInt(std::string_view Text) {
    int Value = 0;
    const auto *End = Text.data() + Text.size();
    auto [Ptr, Ec] = std::from_chars(Text.data(), End, Value);
    if (Ec != std::errc{} || Ptr != End) {
      return std::nullopt;
    }
    return Value;
  }
};

} // namespace devpulse::core

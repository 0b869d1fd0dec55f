#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devpulse::github::models {

// Raw shapes decoded from the GitHub REST API. Timestamps are kept as the
// upstream strings; parsing happens during normalization.
struct RawRepository {
  int64_t Stars{0};
  bool Fork{false};
  std::optional<std::string> Language;
};

struct RawProfile {
  std::string Login;
  std::optional<std::string> Name;
  std::optional<std::string> Bio;
  int64_t Followers{0};
  int64_t Following{0};
  int64_t PublicRepos{0};
  std::optional<std::string> CreatedAt;
  std::optional<std::string> UpdatedAt;
  std::optional<std::string> TwitterUsername;
};

struct FetchedProfile {
  RawProfile Profile;
  std::vector<RawRepository> Repositories;
  bool RepositoriesAvailable{false};
};

// Normalized output returned to tool callers.
struct GitHubProfile {
  std::string Username;
  std::optional<std::string> Name;
  std::optional<std::string> Bio;
  int64_t Followers{0};
  int64_t Following{0};
  int64_t PublicRepos{0};
  int64_t TotalStars{0};
  int64_t ForkedRepos{0};
  long long AccountAgeDays{0};
  long long DaysSinceLastActivity{0};
  std::vector<std::string> TopLanguages;
  std::optional<std::string> TwitterUsername;
  std::string Instructions;
};

} // namespace devpulse::github::models

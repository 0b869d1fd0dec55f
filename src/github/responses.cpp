#include "devpulse/github/responses.hpp"

#include "devpulse/core/json.hpp"

#include <variant>

namespace devpulse::github::responses {

std::expected<models::RawProfile, core::Error>
decodeProfile(const glz::generic &Document) {
  auto Login = core::json::requiredString(Document, "login", "GitHub profile");
  if (!Login) {
    return std::unexpected(Login.error());
  }

  return models::RawProfile{
      .Login = *Login,
      .Name = core::json::optionalString(Document, "name"),
      .Bio = core::json::optionalString(Document, "bio"),
      .Followers = core::json::countOr(Document, "followers"),
      .Following = core::json::countOr(Document, "following"),
      .PublicRepos = core::json::countOr(Document, "public_repos"),
      .CreatedAt = core::json::optionalString(Document, "created_at"),
      .UpdatedAt = core::json::optionalString(Document, "updated_at"),
      .TwitterUsername =
          core::json::optionalString(Document, "twitter_username"),
  };
}

std::expected<std::vector<models::RawRepository>, core::Error>
decodeRepositories(const glz::generic &Document) {
  const auto *Items = std::get_if<glz::generic::array_t>(&Document.data);
  if (Items == nullptr) {
    return std::unexpected(
        core::upstreamFailure("GitHub repositories response is not an array")
    );
  }

  std::vector<models::RawRepository> Repositories;
  Repositories.reserve(Items->size());
  for (const auto &Item : *Items) {
    if (!std::holds_alternative<glz::generic::object_t>(Item.data)) {
      continue;
    }
    Repositories.push_back(models::RawRepository{
        .Stars = core::json::countOr(Item, "stargazers_count"),
        .Fork = core::json::boolOr(Item, "fork"),
        .Language = core::json::optionalString(Item, "language"),
    });
  }
  return Repositories;
}

} // namespace devpulse::github::responses

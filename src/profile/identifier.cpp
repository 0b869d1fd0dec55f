#include "devpulse/profile/identifier.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <optional>

namespace devpulse::profile {

static bool isSpace(char Ch) {
  return std::isspace(static_cast<unsigned char>(Ch)) != 0;
}

static bool equalsIgnoreCase(char Lhs, char Rhs) {
  return std::tolower(static_cast<unsigned char>(Lhs)) ==
         std::tolower(static_cast<unsigned char>(Rhs));
}

std::string_view trim(std::string_view Input) {
  while (!Input.empty() && isSpace(Input.front())) {
    Input.remove_prefix(1);
  }
  while (!Input.empty() && isSpace(Input.back())) {
    Input.remove_suffix(1);
  }
  return Input;
}

// Everything from the first '/' on; the authority (":port", userinfo) before
// it is not part of the path.
static std::string_view afterAuthority(std::string_view Rest) {
  auto Slash = Rest.find('/');
  return Slash == std::string_view::npos ? std::string_view{}
                                         : Rest.substr(Slash);
}

// Path portion of a URL-ish string, or nullopt when it does not look like one.
static std::optional<std::string_view>
urlPath(std::string_view Input, const std::vector<std::string> &KnownDomains) {
  for (const auto &Domain : KnownDomains) {
    auto Match = std::ranges::search(Input, Domain, equalsIgnoreCase);
    if (!Match.empty()) {
      auto End = static_cast<std::size_t>(Match.end() - Input.begin());
      return afterAuthority(Input.substr(End));
    }
  }

  if (auto Scheme = Input.find("://"); Scheme != std::string_view::npos) {
    return afterAuthority(Input.substr(Scheme + 3));
  }
  return std::nullopt;
}

static std::string_view firstSegment(std::string_view Path) {
  if (auto Cut = Path.find_first_of("?#"); Cut != std::string_view::npos) {
    Path = Path.substr(0, Cut);
  }
  while (!Path.empty()) {
    auto Slash = Path.find('/');
    auto Segment = Path.substr(0, Slash);
    if (!Segment.empty()) {
      return Segment;
    }
    if (Slash == std::string_view::npos) {
      break;
    }
    Path.remove_prefix(Slash + 1);
  }
  return {};
}

std::expected<std::string, core::Error> resolveHandle(
    std::string_view Input, const std::vector<std::string> &KnownDomains
) {
  auto Trimmed = trim(Input);
  if (Trimmed.empty()) {
    return std::unexpected(
        core::invalidInput("A username or profile URL is required")
    );
  }

  auto Handle = Trimmed;
  if (auto Path = urlPath(Trimmed, KnownDomains)) {
    Handle = firstSegment(*Path);
    if (Handle.empty()) {
      return std::unexpected(core::invalidInput(std::format(
          "Could not find a username in profile URL '{}'", Trimmed
      )));
    }
  }

  if (std::ranges::any_of(Handle, isSpace) ||
      Handle.find_first_of("/?#:") != std::string_view::npos) {
    return std::unexpected(
        core::invalidInput(std::format("'{}' is not a valid username", Handle))
    );
  }
  return std::string(Handle);
}

} // namespace devpulse::profile

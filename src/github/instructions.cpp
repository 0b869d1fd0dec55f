#include "devpulse/github/instructions.hpp"

#include <format>
#include <iterator>

namespace devpulse::github {

static std::string joinLanguages(const std::vector<std::string> &Languages) {
  if (Languages.empty()) {
    return "no dominant language";
  }
  std::string Joined;
  for (std::size_t I = 0; I < Languages.size(); ++I) {
    if (I > 0) {
      Joined += ", ";
    }
    Joined += Languages[I];
  }
  return Joined;
}

std::string buildInstructions(const models::GitHubProfile &Profile) {
  std::string Text;
  auto Out = std::back_inserter(Text);

  std::format_to(
      Out,
      "GitHub user @{} ({}) has {} public repositories with {} total stars, "
      "{} followers and follows {} accounts. "
      "{} of their repositories are forks. "
      "The account is {} days old and was last active {} days ago. "
      "Top languages: {}.\n",
      Profile.Username,
      Profile.Name.value_or(Profile.Username),
      Profile.PublicRepos,
      Profile.TotalStars,
      Profile.Followers,
      Profile.Following,
      Profile.ForkedRepos,
      Profile.AccountAgeDays,
      Profile.DaysSinceLastActivity,
      joinLanguages(Profile.TopLanguages)
  );

  if (Profile.Bio) {
    std::format_to(Out, "Their bio reads: \"{}\".\n", *Profile.Bio);
  }

  if (Profile.TwitterUsername) {
    std::format_to(
        Out,
        "They are also @{} on Twitter/X. Use that handle in your praise or "
        "critique, and compare their posting habits with their commit "
        "habits.\n",
        *Profile.TwitterUsername
    );
  } else {
    Text += "They have no Twitter/X account linked, so nobody hears about "
            "their code unless they read the commit log.\n";
  }

  std::format_to(
      Out,
      "Task: 1) Write a short, witty and creative roast of this developer "
      "based only on the facts above. 2) Then add a section titled \"{}\" "
      "with three concrete suggestions to grow their profile.",
      CareerAdviceTitle
  );
  return Text;
}

} // namespace devpulse::github

#include "devpulse/server/tools.hpp"

#include "devpulse/core/json.hpp"
#include "devpulse/core/logging.hpp"
#include "devpulse/profile/aggregate.hpp"
#include "devpulse/profile/identifier.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <glaze/json/write.hpp>
#include <utility>
#include <variant>

namespace devpulse::server {

namespace {

constexpr std::string_view NoArgumentsSchema =
    R"({"type":"object","properties":{},"additionalProperties":false})";

constexpr std::string_view UsernameSchema = R"({
  "type": "object",
  "properties": {
    "username": {"type": "string", "description": "Username or profile URL"}
  },
  "required": ["username"]
})";

constexpr std::string_view LetterSchema = R"({
  "type": "object",
  "properties": {
    "letter": {
      "type": "string",
      "description": "The letter to guess (single character)"
    }
  },
  "required": ["letter"]
})";

using ToolResult = std::expected<ToolOutput, core::Error>;

std::string describe(const ToolDescription &Description) {
  std::string Out;
  if (glz::write_json(Description, Out)) {
    return Description.description;
  }
  return Out;
}

template <typename T> ToolResult structuredOutput(const T &Record) {
  std::string Json;
  if (glz::write_json(Record, Json)) {
    return std::unexpected(core::Error{
        core::ErrorKind::Internal, "Failed to serialize tool result"
    });
  }
  return ToolOutput{.Text = Json, .Structured = Json};
}

ToolOutput textOutput(std::string Text) {
  return ToolOutput{.Text = std::move(Text)};
}

constexpr std::string_view GameBanner = "🎮 **HANGMAN GAME** 🎮\n\n";

} // namespace

void ToolRegistry::add(Tool Entry) {
  auto Existing = std::ranges::find(Tools, Entry.Name, &Tool::Name);
  if (Existing != Tools.end()) {
    *Existing = std::move(Entry);
    return;
  }
  Tools.push_back(std::move(Entry));
}

const Tool *ToolRegistry::find(std::string_view Name) const {
  auto It = std::ranges::find(Tools, Name, &Tool::Name);
  return It == Tools.end() ? nullptr : &*It;
}

std::expected<std::string, core::Error>
stringArgument(const glz::generic &Arguments, std::string_view Name) {
  const auto *Value = core::json::field(Arguments, Name);
  if (Value == nullptr) {
    return std::unexpected(
        core::invalidInput(std::format("Missing argument '{}'", Name))
    );
  }
  const auto *Text = std::get_if<std::string>(&Value->data);
  if (Text == nullptr) {
    return std::unexpected(
        core::invalidInput(std::format("Argument '{}' must be a string", Name))
    );
  }
  return *Text;
}

void registerValidateTool(ToolRegistry &Registry, std::string Identity) {
  Registry.add(Tool{
      .Name = "validate",
      .Description = describe({
          .description = "Return the identity this server was configured with",
          .use_when = "Called by the host to verify the server is reachable",
          .side_effects = std::nullopt,
      }),
      .InputSchema = std::string(NoArgumentsSchema),
      .Handler = [Identity = std::move(Identity)](const glz::generic &)
          -> ToolResult { return textOutput(Identity); },
  });
}

void registerProfileTools(
    ToolRegistry &Registry,
    std::shared_ptr<const github::Client> GitHub,
    std::shared_ptr<const leetcode::Client> LeetCode
) {
  Registry.add(Tool{
      .Name = "get_github_profile_data",
      .Description = describe({
          .description = "Fetch and summarize a public GitHub profile: "
                         "stars, forks, followers, account age, activity "
                         "and top languages",
          .use_when = "Use this when the user shares a GitHub username or "
                      "profile URL and wants it roasted, reviewed or "
                      "summarized",
          .side_effects = std::nullopt,
      }),
      .InputSchema = std::string(UsernameSchema),
      .Handler = [GitHub = std::move(GitHub)](const glz::generic &Arguments)
          -> ToolResult {
        auto Username = stringArgument(Arguments, "username");
        if (!Username) {
          return std::unexpected(Username.error());
        }
        auto Profile = profile::getGitHubProfileData(*GitHub, *Username);
        if (!Profile) {
          return std::unexpected(Profile.error());
        }
        return structuredOutput(*Profile);
      },
  });

  Registry.add(Tool{
      .Name = "get_leetcode_profile_data",
      .Description = describe({
          .description = "Fetch and summarize a public LeetCode profile: "
                         "ranking, solved problems per difficulty and "
                         "acceptance rate",
          .use_when = "Use this when the user shares a LeetCode username "
                      "and wants their problem-solving record critiqued",
          .side_effects = std::nullopt,
      }),
      .InputSchema = std::string(UsernameSchema),
      .Handler = [LeetCode = std::move(LeetCode)](const glz::generic &Arguments)
          -> ToolResult {
        auto Username = stringArgument(Arguments, "username");
        if (!Username) {
          return std::unexpected(Username.error());
        }
        auto Profile = profile::getLeetCodeProfileData(*LeetCode, *Username);
        if (!Profile) {
          return std::unexpected(Profile.error());
        }
        return structuredOutput(*Profile);
      },
  });
}

void registerGameTools(
    ToolRegistry &Registry, std::shared_ptr<GameTable> Table
) {
  Registry.add(Tool{
      .Name = "start_new_game",
      .Description = describe({
          .description = "Start a new hangman game with a random word",
          .use_when = "Use this when the user wants to start a new hangman "
                      "game or restart the current one",
          .side_effects = "Resets the current game state and selects a new "
                          "random word",
      }),
      .InputSchema = std::string(NoArgumentsSchema),
      .Handler = [Table](const glz::generic &) -> ToolResult {
        std::scoped_lock Lock(Table->Mutex);
        Table->Session.startRandom(Table->Rng);
        core::logger("game")->info("New hangman game started");
        return textOutput(std::format(
            "🎮 **NEW HANGMAN GAME STARTED!** 🎮\n\n{}\n\n"
            "Hint: The word has {} letters and is related to "
            "programming/computers!",
            Table->Session.status(),
            Table->Session.word().size()
        ));
      },
  });

  Registry.add(Tool{
      .Name = "user_tool_make_guess",
      .Description = describe({
          .description = "Make a letter guess in the current hangman game",
          .use_when = "Use this when the user wants to guess a letter in "
                      "the hangman game",
          .side_effects = "Updates the game state, reveals letters if "
                          "correct, or adds to wrong guesses if incorrect",
      }),
      .InputSchema = std::string(LetterSchema),
      .Handler = [Table](const glz::generic &Arguments) -> ToolResult {
        auto Letter = stringArgument(Arguments, "letter");
        if (!Letter) {
          return std::unexpected(Letter.error());
        }

        std::scoped_lock Lock(Table->Mutex);
        auto &Session = Table->Session;
        auto Outcome = Session.guess(*Letter);
        if (!Outcome) {
          return std::unexpected(Outcome.error());
        }

        auto First = static_cast<unsigned char>(profile::trim(*Letter).front());
        char Upper = static_cast<char>(std::toupper(First));
        switch (*Outcome) {
        case game::GuessOutcome::NoGame:
          return textOutput(
              "❌ No game in progress! Please start a new game first."
          );
        case game::GuessOutcome::GameOver:
          return textOutput(std::format(
              "{}Game is over! Start a new game.\n\n{}",
              GameBanner,
              Session.status()
          ));
        case game::GuessOutcome::AlreadyGuessed:
          return textOutput(std::format(
              "{}You already guessed '{}'!\n\n{}",
              GameBanner,
              Upper,
              Session.status()
          ));
        case game::GuessOutcome::Hit:
          return textOutput(std::format(
              "{}✅ Great! '{}' is in the word!\n\n{}",
              GameBanner,
              Upper,
              Session.status()
          ));
        case game::GuessOutcome::Miss:
          return textOutput(std::format(
              "{}❌ Sorry, '{}' is not in the word.\n\n{}",
              GameBanner,
              Upper,
              Session.status()
          ));
        }
        return textOutput(Session.status());
      },
  });

  Registry.add(Tool{
      .Name = "get_game_status",
      .Description = describe({
          .description = "Get the current status of the hangman game",
          .use_when = "Use this when the user wants to see the current "
                      "game state without making a guess",
          .side_effects = "None - just displays current game information",
      }),
      .InputSchema = std::string(NoArgumentsSchema),
      .Handler = [Table](const glz::generic &) -> ToolResult {
        std::scoped_lock Lock(Table->Mutex);
        if (!Table->Session.inProgress()) {
          return textOutput(
              "No game in progress! Please start a new game first."
          );
        }
        return textOutput(std::format(
            "🎮 **HANGMAN GAME STATUS** 🎮\n\n{}", Table->Session.status()
        ));
      },
  });

  Registry.add(Tool{
      .Name = "game_rules",
      .Description = describe({
          .description = "Explain the rules of hangman game",
          .use_when = "Use this when the user wants to understand how to "
                      "play hangman",
          .side_effects = "None - just provides information",
      }),
      .InputSchema = std::string(NoArgumentsSchema),
      .Handler = [](const glz::generic &) -> ToolResult {
        return textOutput(std::string(game::rules()));
      },
  });
}

} // namespace devpulse::server

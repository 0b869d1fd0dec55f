#include "devpulse/game/hangman.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>

namespace devpulse::game {

namespace {

constexpr std::array<std::string_view, MaxWrongGuesses + 1> Stages{
    R"(
   +---+
   |   |
       |
       |
       |
       |
=========
)",
    R"(
   +---+
   |   |
   O   |
       |
       |
       |
=========
)",
    R"(
   +---+
   |   |
   O   |
   |   |
       |
       |
=========
)",
    R"(
   +---+
   |   |
   O   |
  /|   |
       |
       |
=========
)",
    R"(
   +---+
   |   |
   O   |
  /|\  |
       |
       |
=========
)",
    R"(
   +---+
   |   |
   O   |
  /|\  |
  /    |
       |
=========
)",
    R"(
   +---+
   |   |
   O   |
  /|\  |
  / \  |
       |
=========
)",
};

std::string_view trimmed(std::string_view Text) {
  auto IsSpace = [](char Ch) {
    return std::isspace(static_cast<unsigned char>(Ch)) != 0;
  };
  while (!Text.empty() && IsSpace(Text.front())) {
    Text.remove_prefix(1);
  }
  while (!Text.empty() && IsSpace(Text.back())) {
    Text.remove_suffix(1);
  }
  return Text;
}

} // namespace

void Session::start(std::string_view NewWord) {
  Word.clear();
  std::ranges::transform(
      NewWord,
      std::back_inserter(Word),
      [](unsigned char Ch) { return static_cast<char>(std::toupper(Ch)); }
  );
  Guessed.clear();
  WrongGuesses = 0;
  GameOver = false;
  Won = false;
}

void Session::startRandom(std::mt19937 &Rng) {
  std::uniform_int_distribution<std::size_t> Pick(0, Words.size() - 1);
  start(Words[Pick(Rng)]);
}

bool Session::solved() const {
  return std::ranges::all_of(Word, [this](char Ch) {
    return Guessed.contains(Ch);
  });
}

std::expected<GuessOutcome, core::Error>
Session::guess(std::string_view Letter) {
  auto Input = trimmed(Letter);
  auto First = static_cast<unsigned char>(Input.empty() ? '\0' : Input.front());
  if (Input.size() != 1 || !std::isalpha(First)) {
    return std::unexpected(
        core::invalidInput("Please guess a single letter only!")
    );
  }
  auto Upper = static_cast<char>(std::toupper(First));

  if (!inProgress()) {
    return GuessOutcome::NoGame;
  }
  if (GameOver) {
    return GuessOutcome::GameOver;
  }
  if (Guessed.contains(Upper)) {
    return GuessOutcome::AlreadyGuessed;
  }

  Guessed.insert(Upper);
  if (Word.find(Upper) != std::string::npos) {
    if (solved()) {
      GameOver = true;
      Won = true;
    }
    return GuessOutcome::Hit;
  }

  ++WrongGuesses;
  if (WrongGuesses >= MaxWrongGuesses) {
    GameOver = true;
    Won = false;
  }
  return GuessOutcome::Miss;
}

std::string Session::displayWord() const {
  std::string Display;
  for (std::size_t I = 0; I < Word.size(); ++I) {
    if (I > 0) {
      Display += ' ';
    }
    Display += Guessed.contains(Word[I]) ? Word[I] : '_';
  }
  return Display;
}

std::string Session::status() const {
  std::string Letters;
  for (char Ch : Guessed) {
    if (!Letters.empty()) {
      Letters += ", ";
    }
    Letters += Ch;
  }

  std::string Text;
  auto Out = std::back_inserter(Text);
  std::format_to(
      Out,
      "```{}```\nWord: {}\nLetters guessed: {}\nWrong guesses: {}/{}\n"
      "Remaining guesses: {}\n\n",
      Stages[static_cast<std::size_t>(std::min(WrongGuesses, MaxWrongGuesses))],
      displayWord(),
      Letters.empty() ? "None" : Letters,
      WrongGuesses,
      MaxWrongGuesses,
      MaxWrongGuesses - WrongGuesses
  );

  if (GameOver) {
    Text += Won ? "🎉 **CONGRATULATIONS! YOU WON!** 🎉\n"
                : "💀 **GAME OVER! YOU LOST!** 💀\n";
    std::format_to(Out, "The word was: **{}**", Word);
  } else {
    Text += "Keep guessing! Enter a letter... 🎯";
  }
  return Text;
}

std::string_view rules() {
  return R"(🎮 **HANGMAN GAME RULES** 🎮

📝 **How to Play:**
1. I'll pick a random word related to programming/computers
2. You see blank spaces representing each letter: _ _ _ _ _
3. Guess letters one at a time
4. If your letter is in the word, it gets revealed in all positions
5. If your letter is NOT in the word, part of the hangman gets drawn
6. You have 6 wrong guesses before the hangman is complete

🎯 **How to Win:**
- Guess all letters in the word before making 6 wrong guesses

💀 **How to Lose:**
- Make 6 wrong guesses and the hangman drawing is completed

🎲 **Commands:**
- Use `start_new_game` to begin a new game
- Use `user_tool_make_guess` with a letter to guess
- Use `get_game_status` to see current progress

Good luck! 🍀)";
}

} // namespace devpulse::game

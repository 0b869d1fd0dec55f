#pragma once
#include "devpulse/core/result.hpp"

#include <array>
#include <expected>
#include <random>
#include <set>
#include <string>
#include <string_view>

namespace devpulse::game {

inline constexpr int MaxWrongGuesses = 6;

inline constexpr std::array<std::string_view, 20> Words{
    "PYTHON",    "JAVASCRIPT", "COMPUTER",  "PROGRAMMING", "ALGORITHM",
    "DATABASE",  "NETWORK",    "SOFTWARE",  "HARDWARE",    "INTERNET",
    "FUNCTION",  "VARIABLE",   "BOOLEAN",   "INTEGER",     "STRING",
    "FRAMEWORK", "LIBRARY",    "DEBUGGING", "COMPILER",    "SYNTAX",
};

enum class GuessOutcome {
  NoGame,
  GameOver,
  AlreadyGuessed,
  Hit,
  Miss,
};

// State of a single hangman game. Sessions are owned by the caller; nothing
// here is shared between instances.
class Session {
public:
  void start(std::string_view Word);
  void startRandom(std::mt19937 &Rng);

  // Letter is trimmed and upper-cased; anything but one alphabetic
  // character is rejected with InvalidInput.
  std::expected<GuessOutcome, core::Error> guess(std::string_view Letter);

  bool inProgress() const { return !Word.empty(); }
  bool isOver() const { return GameOver; }
  bool isWon() const { return Won; }
  int wrongGuesses() const { return WrongGuesses; }
  const std::string &word() const { return Word; }
  const std::set<char> &guessedLetters() const { return Guessed; }

  // Word with unguessed letters masked, e.g. "P _ T H _ N".
  std::string displayWord() const;

  // Gallows, masked word, guessed letters and counters.
  std::string status() const;

private:
  bool solved() const;

  std::string Word;
  std::set<char> Guessed;
  int WrongGuesses{0};
  bool GameOver{false};
  bool Won{false};
};

std::string_view rules();

} // namespace devpulse::game

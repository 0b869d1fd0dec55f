#include <gtest/gtest.h>

#include "devpulse/game/hangman.hpp"

#include <algorithm>
#include <random>
#include <string>

using devpulse::core::ErrorKind;
using devpulse::game::GuessOutcome;
using devpulse::game::Session;

TEST(HangmanTest, GuessWithoutGameReportsNoGame) {
  Session Game;
  EXPECT_FALSE(Game.inProgress());
  EXPECT_EQ(Game.guess("a").value(), GuessOutcome::NoGame);
}

TEST(HangmanTest, RejectsAnythingButOneLetter) {
  Session Game;
  Game.start("SYNTAX");
  for (const char *Input : {"", "ab", "1", "?", "  "}) {
    auto Outcome = Game.guess(Input);
    ASSERT_FALSE(Outcome) << Input;
    EXPECT_EQ(Outcome.error().Kind, ErrorKind::InvalidInput);
  }
  EXPECT_EQ(Game.wrongGuesses(), 0);
  EXPECT_TRUE(Game.guessedLetters().empty());
}

TEST(HangmanTest, RevealsHitsCaseInsensitively) {
  Session Game;
  Game.start("string");
  EXPECT_EQ(Game.word(), "STRING");

  EXPECT_EQ(Game.guess(" s ").value(), GuessOutcome::Hit);
  EXPECT_EQ(Game.displayWord(), "S _ _ _ _ _");
  EXPECT_EQ(Game.guess("S").value(), GuessOutcome::AlreadyGuessed);
}

TEST(HangmanTest, WinsWhenEveryLetterIsGuessed) {
  Session Game;
  Game.start("BOOLEAN");
  for (const char *Letter : {"b", "o", "l", "e", "a"}) {
    EXPECT_EQ(Game.guess(Letter).value(), GuessOutcome::Hit);
    EXPECT_FALSE(Game.isOver());
  }
  EXPECT_EQ(Game.guess("n").value(), GuessOutcome::Hit);
  EXPECT_TRUE(Game.isOver());
  EXPECT_TRUE(Game.isWon());
  EXPECT_NE(Game.status().find("YOU WON"), std::string::npos);
  EXPECT_EQ(Game.guess("z").value(), GuessOutcome::GameOver);
}

TEST(HangmanTest, LosesAfterSixMisses) {
  Session Game;
  Game.start("GO");
  for (const char *Letter : {"a", "b", "c", "d", "e"}) {
    EXPECT_EQ(Game.guess(Letter).value(), GuessOutcome::Miss);
  }
  EXPECT_FALSE(Game.isOver());
  EXPECT_EQ(Game.guess("f").value(), GuessOutcome::Miss);
  EXPECT_TRUE(Game.isOver());
  EXPECT_FALSE(Game.isWon());
  EXPECT_EQ(Game.wrongGuesses(), devpulse::game::MaxWrongGuesses);

  auto Status = Game.status();
  EXPECT_NE(Status.find("GAME OVER"), std::string::npos);
  EXPECT_NE(Status.find("**GO**"), std::string::npos);
  EXPECT_NE(Status.find("/|\\"), std::string::npos);
}

TEST(HangmanTest, StatusListsSortedGuessesAndCounters) {
  Session Game;
  Game.start("COMPILER");
  ASSERT_TRUE(Game.guess("z"));
  ASSERT_TRUE(Game.guess("c"));
  ASSERT_TRUE(Game.guess("a"));

  auto Status = Game.status();
  EXPECT_NE(Status.find("Letters guessed: A, C, Z"), std::string::npos);
  EXPECT_NE(Status.find("Wrong guesses: 2/6"), std::string::npos);
  EXPECT_NE(Status.find("Remaining guesses: 4"), std::string::npos);
  EXPECT_NE(Status.find("Word: C _ _ _ _ _ _ _"), std::string::npos);
}

TEST(HangmanTest, StartResetsPreviousGame) {
  Session Game;
  Game.start("GO");
  ASSERT_TRUE(Game.guess("x"));
  Game.start("SYNTAX");
  EXPECT_EQ(Game.wrongGuesses(), 0);
  EXPECT_TRUE(Game.guessedLetters().empty());
  EXPECT_FALSE(Game.isOver());
}

TEST(HangmanTest, RandomWordComesFromTheWordList) {
  std::mt19937 Rng{7};
  Session Game;
  Game.startRandom(Rng);
  ASSERT_TRUE(Game.inProgress());
  const auto &Words = devpulse::game::Words;
  EXPECT_NE(std::ranges::find(Words, Game.word()), Words.end());
}

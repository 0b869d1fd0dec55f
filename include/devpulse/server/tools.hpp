#pragma once
#include "devpulse/core/result.hpp"
#include "devpulse/game/hangman.hpp"
#include "devpulse/github/client.hpp"
#include "devpulse/leetcode/client.hpp"

#include <expected>
#include <functional>
#include <glaze/json/generic.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace devpulse::server {

// Serialized into each tool's description so agents know when to call it.
struct ToolDescription {
  std::string description;
  std::string use_when;
  std::optional<std::string> side_effects;
};

struct ToolOutput {
  std::string Text;
  // JSON document exposed as structuredContent.
  std::optional<std::string> Structured;
};

using ToolHandler = std::function<
    std::expected<ToolOutput, core::Error>(const glz::generic &Arguments)>;

struct Tool {
  std::string Name;
  std::string Description;
  std::string InputSchema;
  ToolHandler Handler;
};

class ToolRegistry {
public:
  void add(Tool Entry);
  const Tool *find(std::string_view Name) const;
  const std::vector<Tool> &tools() const { return Tools; }

private:
  std::vector<Tool> Tools;
};

// The one hangman game served by this process. Owned by the boundary and
// handed to each game tool by reference. A game is dealt on construction,
// so guesses are played even before start_new_game is called.
struct GameTable {
  GameTable() : GameTable(std::random_device{}()) {}
  explicit GameTable(std::mt19937::result_type Seed) : Rng(Seed) {
    Session.startRandom(Rng);
  }

  std::mutex Mutex;
  game::Session Session;
  std::mt19937 Rng;
};

// Required string argument; InvalidInput when absent or not a string.
std::expected<std::string, core::Error>
stringArgument(const glz::generic &Arguments, std::string_view Name);

void registerValidateTool(ToolRegistry &Registry, std::string Identity);
void registerProfileTools(
    ToolRegistry &Registry,
    std::shared_ptr<const github::Client> GitHub,
    std::shared_ptr<const leetcode::Client> LeetCode
);
void registerGameTools(
    ToolRegistry &Registry, std::shared_ptr<GameTable> Table
);

} // namespace devpulse::server

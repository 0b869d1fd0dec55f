#include "devpulse/core/json.hpp"

#include <cmath>
#include <format>
#include <glaze/json/read.hpp>
#include <limits>
#include <variant>

namespace devpulse::core::json {

std::expected<glz::generic, Error>
parse(std::string_view Body, std::string_view What) {
  glz::generic Document{};
  auto ParseError = glz::read_json(Document, Body);
  if (ParseError) {
    return std::unexpected(upstreamFailure(std::format(
        "Failed to parse {} response: {}",
        What,
        glz::format_error(ParseError, Body)
    )));
  }
  return Document;
}

const glz::generic *field(const glz::generic &Object, std::string_view Key) {
  const auto *Members = std::get_if<glz::generic::object_t>(&Object.data);
  if (Members == nullptr) {
    return nullptr;
  }
  auto It = Members->find(Key);
  if (It == Members->end()) {
    return nullptr;
  }
  return &It->second;
}

const glz::generic::object_t *
objectField(const glz::generic &Object, std::string_view Key) {
  const auto *Value = field(Object, Key);
  return Value ? std::get_if<glz::generic::object_t>(&Value->data) : nullptr;
}

const glz::generic::array_t *
arrayField(const glz::generic &Object, std::string_view Key) {
  const auto *Value = field(Object, Key);
  return Value ? std::get_if<glz::generic::array_t>(&Value->data) : nullptr;
}

std::expected<std::string, Error> requiredString(
    const glz::generic &Object, std::string_view Key, std::string_view What
) {
  const auto *Value = field(Object, Key);
  if (Value == nullptr) {
    return std::unexpected(upstreamFailure(std::format(
        "{} response is missing required field '{}'", What, Key
    )));
  }
  const auto *Text = std::get_if<std::string>(&Value->data);
  if (Text == nullptr || Text->empty()) {
    return std::unexpected(upstreamFailure(std::format(
        "{} response field '{}' is not a non-empty string", What, Key
    )));
  }
  return *Text;
}

std::optional<std::string>
optionalString(const glz::generic &Object, std::string_view Key) {
  const auto *Value = field(Object, Key);
  if (Value == nullptr) {
    return std::nullopt;
  }
  const auto *Text = std::get_if<std::string>(&Value->data);
  if (Text == nullptr || Text->empty()) {
    return std::nullopt;
  }
  return *Text;
}

int64_t
countOr(const glz::generic &Object, std::string_view Key, int64_t Default) {
  const auto *Value = field(Object, Key);
  if (Value == nullptr) {
    return Default;
  }
  const auto *Number = std::get_if<double>(&Value->data);
  if (Number == nullptr || !std::isfinite(*Number)) {
    return Default;
  }
  if (*Number <= 0.0) {
    return 0;
  }
  if (*Number >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
    return std::numeric_limits<int64_t>::max();
  }
  return static_cast<int64_t>(*Number);
}

bool boolOr(const glz::generic &Object, std::string_view Key, bool Default) {
  const auto *Value = field(Object, Key);
  if (Value == nullptr) {
    return Default;
  }
  const auto *Flag = std::get_if<bool>(&Value->data);
  return Flag ? *Flag : Default;
}

} // namespace devpulse::core::json

#include "devpulse/server/rpc.hpp"

#include "devpulse/core/json.hpp"

#include <format>
#include <glaze/json/read.hpp>
#include <glaze/json/write.hpp>
#include <spdlog/spdlog.h>
#include <utility>
#include <variant>
#include <vector>

namespace devpulse::server {

namespace {

struct RpcErrorBody {
  int code{rpc_error::InternalError};
  std::string message;
};

struct RpcResponse {
  std::string jsonrpc{"2.0"};
  glz::generic id{};
  std::optional<glz::raw_json> result;
  std::optional<RpcErrorBody> error;
};

struct ToolsCapability {
  bool listChanged{false};
};

struct Capabilities {
  ToolsCapability tools;
};

struct InitializeResult {
  std::string protocolVersion;
  Capabilities capabilities;
  ServerInfo serverInfo;
};

struct ToolListing {
  std::string name;
  std::string description;
  glz::raw_json inputSchema;
};

struct ToolsListResult {
  std::vector<ToolListing> tools;
};

struct TextContent {
  std::string type{"text"};
  std::string text;
};

struct ToolCallResult {
  std::vector<TextContent> content;
  std::optional<glz::raw_json> structuredContent;
  bool isError{false};
};

template <typename T> std::string toJson(const T &Value) {
  std::string Out;
  if (glz::write_json(Value, Out)) {
    spdlog::error("Failed to serialize JSON-RPC payload");
    return R"({"jsonrpc":"2.0","id":null,)"
           R"("error":{"code":-32603,"message":"serialization failed"}})";
  }
  return Out;
}

std::string makeResult(const glz::generic &Id, std::string ResultJson) {
  return toJson(RpcResponse{
      .id = Id, .result = glz::raw_json{std::move(ResultJson)}
  });
}

std::string makeError(const glz::generic &Id, int Code, std::string Message) {
  return toJson(RpcResponse{
      .id = Id,
      .error = RpcErrorBody{.code = Code, .message = std::move(Message)},
  });
}

} // namespace

int toRpcCode(core::ErrorKind Kind) {
  switch (Kind) {
  case core::ErrorKind::InvalidInput:
  case core::ErrorKind::NotFound:
    return rpc_error::InvalidParams;
  case core::ErrorKind::UpstreamFailure:
  case core::ErrorKind::Internal:
    return rpc_error::InternalError;
  }
  return rpc_error::InternalError;
}

RpcDispatcher::RpcDispatcher(
    ServerInfo Info, std::shared_ptr<const ToolRegistry> Registry
)
    : Info(std::move(Info)), Registry(std::move(Registry)) {}

std::optional<std::string> RpcDispatcher::handle(std::string_view Body) const {
  glz::generic Request{};
  if (auto ParseError = glz::read_json(Request, Body)) {
    spdlog::warn(
        "Rejecting unparsable JSON-RPC request: {}",
        glz::format_error(ParseError, Body)
    );
    return makeError(glz::generic{}, rpc_error::ParseError, "Parse error");
  }

  const auto *IdField = core::json::field(Request, "id");
  bool IsNotification = IdField == nullptr;
  glz::generic Id = IdField ? *IdField : glz::generic{};

  auto Version = core::json::optionalString(Request, "jsonrpc");
  auto Method = core::json::optionalString(Request, "method");
  if (!Version || *Version != "2.0" || !Method) {
    return makeError(Id, rpc_error::InvalidRequest, "Invalid JSON-RPC request");
  }

  spdlog::debug(
      "JSON-RPC {} ({})",
      *Method,
      IsNotification ? "notification" : "request"
  );

  if (IsNotification) {
    // notifications/initialized and friends carry no reply
    return std::nullopt;
  }

  static const glz::generic NoParams{};
  const auto *Params = core::json::field(Request, "params");
  const auto &ParamsRef = Params ? *Params : NoParams;

  if (*Method == "initialize") {
    return makeResult(
        Id,
        toJson(InitializeResult{
            .protocolVersion = std::string(ProtocolVersion),
            .capabilities = {.tools = {.listChanged = false}},
            .serverInfo = Info,
        })
    );
  }

  if (*Method == "ping") {
    return makeResult(Id, "{}");
  }

  if (*Method == "tools/list") {
    ToolsListResult Listing;
    for (const auto &Entry : Registry->tools()) {
      Listing.tools.push_back(ToolListing{
          .name = Entry.Name,
          .description = Entry.Description,
          .inputSchema = glz::raw_json{Entry.InputSchema},
      });
    }
    return makeResult(Id, toJson(Listing));
  }

  if (*Method == "tools/call") {
    auto Name = core::json::optionalString(ParamsRef, "name");
    if (!Name) {
      return makeError(Id, rpc_error::InvalidParams, "Missing tool name");
    }

    const auto *Entry = Registry->find(*Name);
    if (Entry == nullptr) {
      return makeError(
          Id, rpc_error::InvalidParams, std::format("Unknown tool: {}", *Name)
      );
    }

    const auto *Arguments = core::json::field(ParamsRef, "arguments");
    auto Output = Entry->Handler(Arguments ? *Arguments : NoParams);
    if (!Output) {
      spdlog::warn(
          "Tool {} failed ({}): {}",
          *Name,
          core::toString(Output.error().Kind),
          Output.error().Message
      );
      return makeError(
          Id, toRpcCode(Output.error().Kind), Output.error().Message
      );
    }

    ToolCallResult Result{
        .content = {TextContent{.text = std::move(Output->Text)}}
    };
    if (Output->Structured) {
      Result.structuredContent = glz::raw_json{std::move(*Output->Structured)};
    }
    return makeResult(Id, toJson(Result));
  }

  return makeError(
      Id, rpc_error::MethodNotFound, std::format("Unknown method: {}", *Method)
  );
}

} // namespace devpulse::server

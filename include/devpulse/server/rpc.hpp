#pragma once
#include "devpulse/core/result.hpp"
#include "devpulse/server/tools.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace devpulse::server {

// JSON-RPC 2.0 error codes
namespace rpc_error {
inline constexpr int ParseError = -32700;
inline constexpr int InvalidRequest = -32600;
inline constexpr int MethodNotFound = -32601;
inline constexpr int InvalidParams = -32602;
inline constexpr int InternalError = -32603;
} // namespace rpc_error

inline constexpr std::string_view ProtocolVersion = "2025-03-26";

int toRpcCode(core::ErrorKind Kind);

struct ServerInfo {
  std::string name;
  std::string version;
};

// Model Context Protocol dispatcher: initialize, ping, tools/list and
// tools/call over JSON-RPC 2.0. Tool failures are reported as JSON-RPC
// errors carrying the mapped code and the error message.
class RpcDispatcher {
public:
  RpcDispatcher(ServerInfo Info, std::shared_ptr<const ToolRegistry> Registry);

  // Response body for Body, or nullopt when Body is a notification.
  std::optional<std::string> handle(std::string_view Body) const;

private:
  ServerInfo Info;
  std::shared_ptr<const ToolRegistry> Registry;
};

} // namespace devpulse::server

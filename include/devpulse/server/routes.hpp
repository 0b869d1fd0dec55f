#pragma once
#include "devpulse/server/rpc.hpp"

#include <glaze/net/http_router.hpp>
#include <memory>

namespace devpulse::server {

inline constexpr const char *McpPath = "/mcp";

// JSON-RPC request body in, response body out. Notifications get 202 and no
// body.
void handleMcpPost(
    const RpcDispatcher &Dispatcher,
    const glz::request &Request,
    glz::response &Response
);

// Server-initiated streams are not offered: 405.
void handleMcpGet(const glz::request &Request, glz::response &Response);

void handleHealth(const glz::request &Request, glz::response &Response);

// POST/GET /mcp and GET /health.
void registerRoutes(
    glz::http_router &Router, std::shared_ptr<const RpcDispatcher> Dispatcher
);

} // namespace devpulse::server

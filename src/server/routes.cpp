#include "devpulse/server/routes.hpp"

#include "devpulse/core/http.hpp"

#include <spdlog/spdlog.h>

namespace devpulse::server {

using enum core::HttpStatus;

void handleMcpPost(
    const RpcDispatcher &Dispatcher,
    const glz::request &Request,
    glz::response &Response
) {
  auto Reply = Dispatcher.handle(Request.body);
  if (!Reply) {
    Response.status(static_cast<int>(Accepted));
    return;
  }
  Response.status(static_cast<int>(Ok))
      .header("Content-Type", "application/json")
      .body(*Reply);
}

void handleMcpGet(const glz::request &, glz::response &Response) {
  Response.status(static_cast<int>(MethodNotAllowed))
      .json({{"error", "GET is not supported on this endpoint"}});
}

void handleHealth(const glz::request &, glz::response &Response) {
  spdlog::debug("GET /health - Running healthcheck");
  Response.status(static_cast<int>(Ok)).json({{"status", "healthy"}});
}

void registerRoutes(
    glz::http_router &Router, std::shared_ptr<const RpcDispatcher> Dispatcher
) {
  Router.post(
      McpPath,
      [Dispatcher](const glz::request &Request, glz::response &Response) {
        handleMcpPost(*Dispatcher, Request, Response);
      }
  );
  Router.get(McpPath, handleMcpGet);
  Router.get("/health", handleHealth);
}

} // namespace devpulse::server

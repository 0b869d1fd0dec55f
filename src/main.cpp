#include <algorithm>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <glaze/net/http_router.hpp>
#include <glaze/net/http_server.hpp>
#include <memory>
#include <ranges>
#include <system_error>
#include <thread>
#include <vector>

#include "devpulse/core/config.hpp"
#include "devpulse/core/http.hpp"
#include "devpulse/core/logging.hpp"
#include "devpulse/github/client.hpp"
#include "devpulse/leetcode/client.hpp"
#include "devpulse/server/middleware/auth.hpp"
#include "devpulse/server/middleware/logging.hpp"
#include "devpulse/server/routes.hpp"
#include "devpulse/server/rpc.hpp"
#include "devpulse/server/tools.hpp"
#include "spdlog/spdlog.h"

int main() {
  auto Config = devpulse::core::Config::load();
  if (!Config) {
    spdlog::error(Config.error().Message);
    return 1;
  }

  devpulse::core::setupLogging(*Config);
  spdlog::debug(
      "Loaded config - Host: {}, Port: {}", Config->Host, Config->Port
  );

  auto Transport = devpulse::core::GlazeTransport::create();
  if (!Transport) {
    spdlog::error(Transport.error().Message);
    return 1;
  }

  auto GitHub = std::make_shared<const devpulse::github::Client>(
      *Transport, devpulse::github::ClientOptions::fromConfig(*Config)
  );
  auto LeetCode = std::make_shared<const devpulse::leetcode::Client>(
      *Transport, devpulse::leetcode::ClientOptions::fromConfig(*Config)
  );

  // Register Tools
  auto Registry = std::make_shared<devpulse::server::ToolRegistry>();
  devpulse::server::registerValidateTool(*Registry, Config->Identity);
  devpulse::server::registerProfileTools(*Registry, GitHub, LeetCode);
  devpulse::server::registerGameTools(
      *Registry, std::make_shared<devpulse::server::GameTable>()
  );
  spdlog::info("Registered {} tools.", Registry->tools().size());

  auto Dispatcher = std::make_shared<const devpulse::server::RpcDispatcher>(
      devpulse::server::ServerInfo{.name = "devpulse", .version = "1.0.0"},
      Registry
  );

  auto IOContext = std::make_shared<asio::io_context>();
  auto Server{glz::http_server<false>(IOContext)};

  spdlog::info("⚡devpulse MCP Server⚡");
  Server.bind(Config->Host, Config->Port);
  spdlog::info("Binding to Address: {}, Port: {}.", Config->Host, Config->Port);

  // Register Middleware
  Server.wrap(devpulse::server::middleware::createAccessLogMiddleware());
  Server.wrap(devpulse::server::middleware::createAuthMiddleware(
      Config->AuthToken, devpulse::server::McpPath
  ));

  // Register Routes
  glz::http_router Router;
  devpulse::server::registerRoutes(Router, Dispatcher);
  Server.mount("/", Router);

  // Start The Server (0 Worker Threads so we can run with ASIO shared IO
  // Context)
  Server.start(0);

  asio::signal_set Signals(*IOContext, SIGINT, SIGTERM);
  Signals.async_wait([&](const std::error_code &, int) {
    spdlog::info("Shutdown signal received.");
    Server.stop();
    IOContext->stop();
  });

  // Start the Thread pool.
  std::vector<std::thread> Threads;
  const size_t NumThreads = std::max(2u, std::thread::hardware_concurrency());
  Threads.reserve(NumThreads);

  spdlog::info(
      "Server ready and listening on http://{}:{}{}",
      Config->Host,
      Config->Port,
      devpulse::server::McpPath
  );
  spdlog::info("Sharing {} threads.", NumThreads);

  for (auto _ : std::views::iota(0uz, NumThreads)) {
    Threads.emplace_back([IOContext]() { IOContext->run(); });
  }

  for (auto &Thread : Threads) {
    if (Thread.joinable()) {
      Thread.join();
    }
  }

  return 0;
}

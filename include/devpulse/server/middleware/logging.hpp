#pragma once
#include "glaze/net/http.hpp"
#include "glaze/net/http_server.hpp"

#include "spdlog/spdlog.h"

#include <chrono>

namespace devpulse::server::middleware {

inline spdlog::level::level_enum
accessLevel(const glz::request &Request, int Status) {
  if (Status >= 500) {
    return spdlog::level::err;
  }
  if (Status >= 400) {
    return spdlog::level::warn;
  }
  // health checks arrive every few seconds
  return Request.path == "/health" ? spdlog::level::debug : spdlog::level::info;
}

// One access log line per request: method, path, status, latency and body size.
inline auto createAccessLogMiddleware() {
  return [](const glz::request &Request,
            glz::response &Response,
            const auto &Next) {
    auto Start = std::chrono::steady_clock::now();
    Next();
    auto Elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - Start
    );
    spdlog::log(
        accessLevel(Request, Response.status_code),
        "[{}] {} {} {}ms {}B",
        glz::to_string(Request.method),
        Request.path,
        Response.status_code,
        Elapsed.count(),
        Request.body.size()
    );
  };
}

} // namespace devpulse::server::middleware

#pragma once
#include "devpulse/core/result.hpp"

#include "glaze/net/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace devpulse::core {

enum class HttpStatus : uint16_t {
  // 2xx Success
  Ok = 200,
  Accepted = 202,
  NoContent = 204,

  // 4xx Client Errors
  BadRequest = 400,
  Unauthorized = 401,
  NotFound = 404,
  MethodNotAllowed = 405,

  // 5xx Server Errors
  InternalServerError = 500,
  ServiceUnavailable = 503,
};

using Headers = std::unordered_map<std::string, std::string>;
using HttpOutcome = std::expected<glz::response, std::error_code>;
using PendingResponse = std::future<HttpOutcome>;

inline bool isSuccess(int Status) { return Status >= 200 && Status < 300; }

// Outbound HTTP seam. Source clients issue requests through this so the
// network can be swapped out in tests. Requests are started immediately and
// complete on the transport's own threads.
class Transport {
public:
  virtual ~Transport() = default;

  virtual PendingResponse
  get(std::string_view Url, const Headers &RequestHeaders) = 0;
  virtual PendingResponse post(
      std::string_view Url,
      const std::string &Body,
      const Headers &RequestHeaders
  ) = 0;
};

// Transport backed by glz::http_client with the system CA bundle loaded.
class GlazeTransport final : public Transport {
public:
  static std::expected<std::shared_ptr<GlazeTransport>, Error> create();

  explicit GlazeTransport(std::shared_ptr<glz::http_client> Client);

  PendingResponse
  get(std::string_view Url, const Headers &RequestHeaders) override;
  PendingResponse post(
      std::string_view Url,
      const std::string &Body,
      const Headers &RequestHeaders
  ) override;

private:
  std::shared_ptr<glz::http_client> Client;
};

// Waits for a pending request until Deadline and folds the outcome into a
// typed result. Transport errors and expiry both surface as UpstreamFailure;
// HTTP status interpretation is left to the caller.
std::expected<glz::response, Error> settle(
    PendingResponse &Pending,
    std::chrono::steady_clock::time_point Deadline,
    std::string_view What
);

} // namespace devpulse::core

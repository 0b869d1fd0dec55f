#include "devpulse/core/http.hpp"

#include "devpulse/core/logging.hpp"

#include <asio/ssl.hpp>
#include <exception>
#include <format>
#include <future>
#include <utility>

namespace devpulse::core {

std::expected<std::shared_ptr<GlazeTransport>, Error> GlazeTransport::create() {
  auto Client = std::make_shared<glz::http_client>();

  auto Ok = Client->configure_system_ca_certificates();
  if (!Ok) {
    spdlog::error("Error: Could not find CA certificates.");
    return std::unexpected(
        Error{ErrorKind::Internal, "Error: Could not find CA certificates."}
    );
  }
  return std::make_shared<GlazeTransport>(std::move(Client));
}

GlazeTransport::GlazeTransport(std::shared_ptr<glz::http_client> Client)
    : Client(std::move(Client)) {}

PendingResponse
GlazeTransport::get(std::string_view Url, const Headers &RequestHeaders) {
  spdlog::debug("Making HTTP GET request to: {}", Url);
  return Client->get_async(Url, RequestHeaders);
}

PendingResponse GlazeTransport::post(
    std::string_view Url, const std::string &Body, const Headers &RequestHeaders
) {
  spdlog::debug("Making HTTP POST request to: {}", Url);
  return Client->post_async(Url, Body, RequestHeaders);
}

std::expected<glz::response, Error> settle(
    PendingResponse &Pending,
    std::chrono::steady_clock::time_point Deadline,
    std::string_view What
) {
  if (!Pending.valid()) {
    return std::unexpected(
        upstreamFailure(std::format("{} request was never started", What))
    );
  }

  if (Pending.wait_until(Deadline) == std::future_status::timeout) {
    return std::unexpected(
        upstreamFailure(std::format("{} request timed out", What))
    );
  }

  try {
    auto Outcome = Pending.get();
    if (!Outcome) {
      return std::unexpected(upstreamFailure(
          std::format("{} request failed: {}", What, Outcome.error().message())
      ));
    }
    return std::move(*Outcome);
  } catch (const std::exception &Err) {
    return std::unexpected(
        upstreamFailure(std::format("{} request failed: {}", What, Err.what()))
    );
  }
}

} // namespace devpulse::core

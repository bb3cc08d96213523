#pragma once

#include <api/response.hpp>
#include <concepts/device_validator.hpp>
#include <core/errors.hpp>
#include <gate/gate_options.hpp>
#include <gate/token_extractor.hpp>

#include <boost/asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace devicecheck::gate {

/**
 * @brief Admission check for inbound requests, backed by a blocking validator.
 *
 * A request is admitted when it carries a device token that the upstream
 * service validates as ok. Upstream and transport failures deny admission.
 */
template<concepts::device_validator Validator> class device_gate
{
public:
  explicit device_gate(std::shared_ptr<Validator> validator, gate_options options = {})
    : validator_(std::move(validator)), options_(std::move(options))
  {}

  /**
   * @brief Decides whether a request may reach its handler.
   *
   * @param request Inbound request
   * @param extractor Extractor for the request type
   * @return true if the request carries a valid device token or the gate is skipped
   */
  template<typename Request>
  [[nodiscard]] auto admit(const Request &request, const token_extractor<Request> &extractor) -> bool
  {
    if (options_.skip) {
      spdlog::debug("[gate] Skipping device check");
      return true;
    }

    auto device_token = extractor.extract(request);
    if (not device_token.has_value()) { return false; }

    if (is_valid_device(*device_token)) { return true; }

    spdlog::info("[gate] Caught invalid device token: \"{}\"", *device_token);
    return false;
  }

  [[nodiscard]] auto is_valid_device(const std::string &device_token) -> bool
  {
    if (options_.mock_token.has_value()) { return device_token == *options_.mock_token; }

    try {
      return api::is_ok(validator_->validate_device_token(device_token));
    } catch (const core::upstream_error &e) {
      spdlog::debug("[gate] Device token rejected: {}", e.what());
      return false;
    } catch (const core::error &e) {
      spdlog::error("[gate] DeviceCheck request failed. {}", e.what());
      return false;
    }
  }

private:
  std::shared_ptr<Validator> validator_;
  gate_options options_;
};

/**
 * @brief Admission check for inbound requests, backed by a coroutine validator.
 */
template<concepts::async_device_validator Validator> class async_device_gate
{
public:
  explicit async_device_gate(std::shared_ptr<Validator> validator, gate_options options = {})
    : validator_(std::move(validator)), options_(std::move(options))
  {}

  /**
   * @brief Decides whether a request may reach its handler.
   *
   * The token is extracted before the first suspension, so neither the
   * request nor the extractor needs to outlive the call.
   */
  template<typename Request>
  [[nodiscard]] auto async_admit(const Request &request, const token_extractor<Request> &extractor)
    -> boost::asio::awaitable<bool>
  {
    if (options_.skip) {
      spdlog::debug("[gate] Skipping device check");
      return admit_token(std::nullopt, true);
    }
    return admit_token(extractor.extract(request), false);
  }

  [[nodiscard]] auto async_is_valid_device(std::string device_token) -> boost::asio::awaitable<bool>
  {
    if (options_.mock_token.has_value()) { co_return device_token == *options_.mock_token; }

    try {
      co_return api::is_ok(co_await validator_->validate_device_token(std::move(device_token)));
    } catch (const core::upstream_error &e) {
      spdlog::debug("[gate] Device token rejected: {}", e.what());
    } catch (const core::error &e) {
      spdlog::error("[gate] DeviceCheck request failed. {}", e.what());
    }
    co_return false;
  }

private:
  auto admit_token(std::optional<std::string> device_token, bool skipped) -> boost::asio::awaitable<bool>
  {
    if (skipped) { co_return true; }
    if (not device_token.has_value()) { co_return false; }

    if (co_await async_is_valid_device(*device_token)) { co_return true; }

    spdlog::info("[gate] Caught invalid device token: \"{}\"", *device_token);
    co_return false;
  }

  std::shared_ptr<Validator> validator_;
  gate_options options_;
};

}// namespace devicecheck::gate

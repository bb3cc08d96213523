#pragma once

#include <api/operation_request.hpp>
#include <api/response.hpp>
#include <client/client_core.hpp>
#include <concepts/http_session.hpp>
#include <core/client_config.hpp>
#include <core/environment.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace devicecheck::client {

/**
 * @brief Blocking DeviceCheck client.
 *
 * Each operation occupies the calling thread for one or two sequential round
 * trips. With retry_wrong_environment set, a non-200 first response is
 * followed by exactly one attempt on the other environment carrying the same
 * request body; its response is returned whatever its outcome.
 *
 * @tparam Session Blocking HTTPS session, created once and reused for every call
 */
template<concepts::http_session Session> class client
{
public:
  client(std::shared_ptr<Session> session, core::client_config config)
    : session_(std::move(session)), core_(std::move(config))
  {}

  client(std::shared_ptr<Session> session, core::client_config config, auth::credential_signer::clock_fn clock)
    : session_(std::move(session)), core_(std::move(config), std::move(clock))
  {}

  /**
   * @brief Validates a device token.
   *
   * @param device_token Token generated by DCDevice on the device
   * @param override_env Environment of the first attempt instead of the configured one
   * @return Normalized result, usually a status_result
   */
  auto validate_device_token(const std::string &device_token,
    std::optional<core::environment> override_env = std::nullopt) -> api::result
  {
    return execute(api::paths::validate_device_token, api::make_operation_request(device_token), override_env);
  }

  /**
   * @brief Reads the two bits stored for a device.
   *
   * @return Normalized result, a data_result when the service reports bits
   */
  auto query_two_bits(const std::string &device_token, std::optional<core::environment> override_env = std::nullopt)
    -> api::result
  {
    return execute(api::paths::query_two_bits, api::make_operation_request(device_token), override_env);
  }

  /**
   * @brief Updates one or both bits stored for a device.
   *
   * Unset bits are left out of the request and keep their stored value.
   */
  auto update_two_bits(const std::string &device_token,
    std::optional<bool> bit0,
    std::optional<bool> bit1,
    std::optional<core::environment> override_env = std::nullopt) -> api::result
  {
    return execute(api::paths::update_two_bits, api::make_operation_request(device_token, bit0, bit1), override_env);
  }

  [[nodiscard]] auto policy() -> client_core & { return core_; }

private:
  auto execute(std::string_view path, const api::operation_request &request, std::optional<core::environment> override_env)
    -> api::result
  {
    const auto primary = core_.primary_environment(override_env);
    auto response = session_->post(core_.build_request(path, request, primary));

    if (core_.should_retry(response.status)) {
      const auto secondary = core::other(primary);
      spdlog::info("[client] Got {} from {}, retrying request on {} server",
        response.status,
        core::to_string(primary),
        core::to_string(secondary));
      response = session_->post(core_.build_request(path, request, secondary));
    }

    return core_.parse(response);
  }

  std::shared_ptr<Session> session_;
  client_core core_;
};

}// namespace devicecheck::client

#pragma once

#include <api/operation_request.hpp>
#include <api/response.hpp>
#include <client/client_core.hpp>
#include <concepts/http_session.hpp>
#include <core/client_config.hpp>
#include <core/environment.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace devicecheck::client {

/**
 * @brief Coroutine DeviceCheck client.
 *
 * Same operations, retry policy and normalization as client, but every call
 * suspends at the I/O boundary so many calls can interleave on one
 * io_context. A call cancelled before the wrong-environment retry is issued
 * does not retry and completes with boost::asio::error::operation_aborted.
 *
 * @tparam Session Coroutine HTTPS session, created once and reused for every call
 */
template<concepts::async_http_session Session> class async_client
{
public:
  async_client(std::shared_ptr<Session> session, core::client_config config)
    : session_(std::move(session)), core_(std::move(config))
  {}

  async_client(std::shared_ptr<Session> session, core::client_config config, auth::credential_signer::clock_fn clock)
    : session_(std::move(session)), core_(std::move(config), std::move(clock))
  {}

  auto validate_device_token(std::string device_token, std::optional<core::environment> override_env = std::nullopt)
    -> boost::asio::awaitable<api::result>
  {
    co_return co_await execute(
      api::paths::validate_device_token, api::make_operation_request(std::move(device_token)), override_env);
  }

  auto query_two_bits(std::string device_token, std::optional<core::environment> override_env = std::nullopt)
    -> boost::asio::awaitable<api::result>
  {
    co_return co_await execute(
      api::paths::query_two_bits, api::make_operation_request(std::move(device_token)), override_env);
  }

  auto update_two_bits(std::string device_token,
    std::optional<bool> bit0,
    std::optional<bool> bit1,
    std::optional<core::environment> override_env = std::nullopt) -> boost::asio::awaitable<api::result>
  {
    co_return co_await execute(
      api::paths::update_two_bits, api::make_operation_request(std::move(device_token), bit0, bit1), override_env);
  }

  [[nodiscard]] auto policy() -> client_core & { return core_; }

private:
  auto execute(std::string_view path, api::operation_request request, std::optional<core::environment> override_env)
    -> boost::asio::awaitable<api::result>
  {
    const auto primary = core_.primary_environment(override_env);
    auto response = co_await session_->async_post(core_.build_request(path, request, primary));

    if (core_.should_retry(response.status)) {
      auto cancellation = co_await boost::asio::this_coro::cancellation_state;
      if (cancellation.cancelled() != boost::asio::cancellation_type::none) {
        spdlog::debug("[client] Call cancelled, skipping retry on {} server", core::to_string(core::other(primary)));
        throw boost::system::system_error(boost::asio::error::operation_aborted);
      }

      const auto secondary = core::other(primary);
      spdlog::info("[client] Got {} from {}, retrying request on {} server",
        response.status,
        core::to_string(primary),
        core::to_string(secondary));
      response = co_await session_->async_post(core_.build_request(path, request, secondary));
    }

    co_return core_.parse(response);
  }

  std::shared_ptr<Session> session_;
  client_core core_;
};

}// namespace devicecheck::client

#pragma once

// Public API of the devicecheck library

#include <api/operation_request.hpp>
#include <api/response.hpp>
#include <auth/credential_signer.hpp>
#include <client/async_client.hpp>
#include <client/client.hpp>
#include <core/client_config.hpp>
#include <core/environment.hpp>
#include <core/errors.hpp>
#include <gate/beast_token_extractor.hpp>
#include <gate/device_gate.hpp>
#include <gate/generic_token_extractor.hpp>
#include <transport/async_https_session.hpp>
#include <transport/https_session.hpp>

#include <boost/asio/io_context.hpp>
#include <memory>
#include <utility>

namespace devicecheck {

using blocking_client = client::client<transport::https_session>;
using cooperative_client = client::async_client<transport::async_https_session>;

/**
 * @brief Creates a blocking client with its own HTTPS session.
 *
 * @throws core::configuration_error for malformed configuration
 */
[[nodiscard]] inline auto make_blocking_client(core::client_config config) -> std::shared_ptr<blocking_client>
{
  auto session = std::make_shared<transport::https_session>(config.request_timeout);
  return std::make_shared<blocking_client>(std::move(session), std::move(config));
}

/**
 * @brief Creates a coroutine client whose HTTPS session runs on io_context.
 *
 * @throws core::configuration_error for malformed configuration
 */
[[nodiscard]] inline auto make_cooperative_client(const std::shared_ptr<boost::asio::io_context> &io_context,
  core::client_config config) -> std::shared_ptr<cooperative_client>
{
  auto session = std::make_shared<transport::async_https_session>(io_context, config.request_timeout);
  return std::make_shared<cooperative_client>(std::move(session), std::move(config));
}

}// namespace devicecheck

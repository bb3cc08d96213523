#pragma once

#include <transport/async_https_session.hpp>
#include <transport/http_message.hpp>

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string_view>

namespace devicecheck::transport {

/**
 * @brief Blocking HTTPS client session.
 *
 * Runs an async_https_session on a private io_context, so each post()
 * occupies the calling thread until the response arrives while keeping the
 * same connection reuse and timeout behavior as the coroutine session.
 */
class https_session
{
public:
  explicit https_session(std::chrono::seconds timeout = async_https_session::default_timeout);

  /**
   * @brief Sends a JSON POST and waits for the response.
   *
   * @throws core::transport_error on network failure or timeout
   */
  auto post(const http_request &request) -> http_response;

  /**
   * @brief Trusts an additional certificate authority besides the system store.
   *
   * @throws core::configuration_error if the certificate cannot be loaded
   */
  auto add_certificate_authority(std::string_view pem) -> void { session_.add_certificate_authority(pem); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  async_https_session session_;
};

}// namespace devicecheck::transport

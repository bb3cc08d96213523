#pragma once

#include <transport/http_message.hpp>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devicecheck::transport {

/**
 * @brief HTTPS client session with coroutine based operations.
 *
 * Calls may interleave on the session's io_context. Each in-flight call owns
 * its TLS connection exclusively; idle keep-alive connections are pooled per
 * host:port and handed to the next call. A connection goes back to the pool
 * only after a complete keep-alive response, and is dropped after any I/O
 * error. A pooled connection that turns out to be closed by the server before
 * any response byte arrives is replaced by a fresh one, once.
 *
 * Not thread-safe: drive a session from one thread or strand.
 */
class async_https_session
{
public:
  static constexpr std::chrono::seconds default_timeout{ 30 };

  /**
   * @brief Constructs a session.
   *
   * @param io_context Boost.Asio io_context running the session's I/O
   * @param timeout Limit applied to each connect, handshake, write and read step
   */
  explicit async_https_session(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::chrono::seconds timeout = default_timeout);

  /**
   * @brief Sends a JSON POST and awaits the response.
   *
   * @param request Request to send
   * @return Status code and body of the response
   * @throws core::transport_error on resolve, connect, TLS, write or read failure
   */
  auto async_post(http_request request) -> boost::asio::awaitable<http_response>;

  /**
   * @brief Trusts an additional certificate authority besides the system store.
   *
   * @param pem PEM encoded CA certificate, e.g. of a staging host
   * @throws core::configuration_error if the certificate cannot be loaded
   */
  auto add_certificate_authority(std::string_view pem) -> void;

  async_https_session(const async_https_session &) = delete;
  auto operator=(const async_https_session &) -> async_https_session & = delete;
  async_https_session(async_https_session &&) = delete;
  auto operator=(async_https_session &&) -> async_https_session & = delete;
  ~async_https_session() = default;

private:
  using stream_t = boost::beast::ssl_stream<boost::beast::tcp_stream>;
  using request_t = boost::beast::http::request<boost::beast::http::string_body>;
  using parser_t = boost::beast::http::response_parser<boost::beast::http::string_body>;

  struct connection
  {
    std::shared_ptr<stream_t> stream;
    bool reused{ false };
  };

  auto acquire(const std::string &host, const std::string &port, bool allow_reuse)
    -> boost::asio::awaitable<connection>;

  auto connect(const std::string &host, const std::string &port) -> boost::asio::awaitable<std::shared_ptr<stream_t>>;

  auto exchange(stream_t &stream, const request_t &request, parser_t &parser)
    -> boost::asio::awaitable<boost::system::error_code>;

  auto release(const std::string &key, std::shared_ptr<stream_t> stream) -> void;

  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::ssl::context ssl_context_;
  std::chrono::seconds timeout_;
  std::unordered_map<std::string, std::vector<std::shared_ptr<stream_t>>> idle_connections_;
};

}// namespace devicecheck::transport

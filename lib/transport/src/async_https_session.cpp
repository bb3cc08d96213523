#include <core/errors.hpp>
#include <transport/async_https_session.hpp>

#include <boost/asio/redirect_error.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

namespace devicecheck::transport {

namespace {

  constexpr int http_version = 11;

  auto connection_key(const std::string &host, const std::string &port) -> std::string
  {
    return fmt::format("{}:{}", host, port);
  }

}// namespace

async_https_session::async_https_session(const std::shared_ptr<boost::asio::io_context> &io_context,
  std::chrono::seconds timeout)
  : io_context_(io_context), ssl_context_(boost::asio::ssl::context::tlsv12_client), timeout_(timeout)
{
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

auto async_https_session::add_certificate_authority(std::string_view pem) -> void
{
  boost::system::error_code error;
  ssl_context_.add_certificate_authority(boost::asio::buffer(pem.data(), pem.size()), error);
  if (error) {
    throw core::configuration_error(fmt::format("Unable to load certificate authority: {}", error.message()));
  }
}

auto async_https_session::async_post(http_request request) -> boost::asio::awaitable<http_response>
{
  namespace http = boost::beast::http;

  const auto key = connection_key(request.host, request.port);

  request_t req{ http::verb::post, request.target, http_version };
  req.set(http::field::host, request.host);
  req.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " devicecheck");
  req.set(http::field::content_type, "application/json");
  req.set(http::field::authorization, "Bearer " + request.bearer_token);
  req.keep_alive(true);
  req.body() = std::move(request.body);
  req.prepare_payload();

  try {
    auto conn = co_await acquire(request.host, request.port, true);
    std::optional<parser_t> parser(std::in_place);
    auto error = co_await exchange(*conn.stream, req, *parser);

    if (error and conn.reused and not parser->got_some()) {
      spdlog::debug("[transport] Pooled connection to {} is gone ({}), reconnecting", key, error.message());
      conn = co_await acquire(request.host, request.port, false);
      parser.emplace();
      error = co_await exchange(*conn.stream, req, *parser);
    }
    if (error) { throw boost::system::system_error(error); }

    auto res = parser->release();
    if (res.keep_alive()) {
      release(key, std::move(conn.stream));
    } else {
      spdlog::trace("[transport] Server closed connection to {}", key);
    }

    co_return http_response{ .status = res.result_int(), .body = std::move(res.body()) };
  } catch (const boost::system::system_error &e) {
    spdlog::debug("[transport] POST {}{} failed: {}", key, request.target, e.code().message());
    throw core::transport_error(
      e.code(), fmt::format("POST https://{}{} failed: {}", key, request.target, e.code().message()));
  }
}

auto async_https_session::acquire(const std::string &host, const std::string &port, bool allow_reuse)
  -> boost::asio::awaitable<connection>
{
  const auto key = connection_key(host, port);

  if (not allow_reuse) {
    idle_connections_.erase(key);
  } else if (auto iter = idle_connections_.find(key); iter != idle_connections_.end() and not iter->second.empty()) {
    auto stream = std::move(iter->second.back());
    iter->second.pop_back();
    spdlog::trace("[transport] Reusing connection to {}", key);
    co_return connection{ .stream = std::move(stream), .reused = true };
  }

  co_return connection{ .stream = co_await connect(host, port), .reused = false };
}

auto async_https_session::connect(const std::string &host, const std::string &port)
  -> boost::asio::awaitable<std::shared_ptr<stream_t>>
{
  namespace beast = boost::beast;

  auto stream = std::make_shared<stream_t>(io_context_->get_executor(), ssl_context_);

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
  if (not SSL_set_tlsext_host_name(stream->native_handle(), host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
    throw boost::system::system_error(
      boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()));
  }
  stream->set_verify_callback(boost::asio::ssl::host_name_verification(host));

  boost::asio::ip::tcp::resolver resolver(io_context_->get_executor());
  const auto results = co_await resolver.async_resolve(host, port, boost::asio::use_awaitable);

  beast::get_lowest_layer(*stream).expires_after(timeout_);
  co_await beast::get_lowest_layer(*stream).async_connect(results, boost::asio::use_awaitable);

  beast::get_lowest_layer(*stream).expires_after(timeout_);
  co_await stream->async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

  spdlog::debug("[transport] Connected to {}:{}", host, port);
  co_return stream;
}

auto async_https_session::exchange(stream_t &stream, const request_t &request, parser_t &parser)
  -> boost::asio::awaitable<boost::system::error_code>
{
  namespace beast = boost::beast;

  boost::system::error_code error;

  beast::get_lowest_layer(stream).expires_after(timeout_);
  co_await beast::http::async_write(stream, request, boost::asio::redirect_error(boost::asio::use_awaitable, error));
  if (error) { co_return error; }

  beast::flat_buffer buffer;
  beast::get_lowest_layer(stream).expires_after(timeout_);
  co_await beast::http::async_read(stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, error));
  beast::get_lowest_layer(stream).expires_never();

  co_return error;
}

auto async_https_session::release(const std::string &key, std::shared_ptr<stream_t> stream) -> void
{
  idle_connections_[key].push_back(std::move(stream));
}

}// namespace devicecheck::transport

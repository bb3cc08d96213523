#pragma once

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <transport/http_message.hpp>

namespace devicecheck::concepts {

/**
 * @brief Concept for a blocking HTTPS session.
 *
 * post() occupies the calling thread until the response arrives and reports
 * network failures as core::transport_error.
 */
template<typename T>
concept http_session = requires(T &session, const transport::http_request &request) {
  { session.post(request) } -> std::same_as<transport::http_response>;
};

/**
 * @brief Concept for a coroutine based HTTPS session.
 *
 * async_post() suspends at the I/O boundary and reports network failures as
 * core::transport_error.
 */
template<typename T>
concept async_http_session = requires(T &session, transport::http_request request) {
  { session.async_post(request) } -> std::same_as<boost::asio::awaitable<transport::http_response>>;
};

}// namespace devicecheck::concepts

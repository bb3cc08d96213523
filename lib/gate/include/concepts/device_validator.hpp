#pragma once

#include <api/response.hpp>

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <string>

namespace devicecheck::concepts {

/**
 * @brief Concept for anything that validates a device token with a blocking call.
 */
template<typename T>
concept device_validator = requires(T &validator, const std::string &device_token) {
  { validator.validate_device_token(device_token) } -> std::same_as<api::result>;
};

/**
 * @brief Concept for anything that validates a device token in a coroutine.
 */
template<typename T>
concept async_device_validator = requires(T &validator, std::string device_token) {
  { validator.validate_device_token(device_token) } -> std::same_as<boost::asio::awaitable<api::result>>;
};

}// namespace devicecheck::concepts

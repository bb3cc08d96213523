#pragma once

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace devicecheck::gate {

/// Header names checked for a device token, in order
inline constexpr std::array<std::string_view, 8> device_token_header_keys{ "Device-Token",
  "Device-token",
  "DEVICE_TOKEN",
  "HTTP_DEVICE_TOKEN",
  "DEVICETOKEN",
  "HTTP_DEVICETOKEN",
  "device-token",
  "devicetoken" };

/// JSON body keys checked for a device token when no header carries one, in order
inline constexpr std::array<std::string_view, 4> device_token_body_keys{ "device_token",
  "deviceToken",
  "devicetoken",
  "device-token" };

/// Returns the value of a header, or std::nullopt when the request lacks it
using header_lookup = std::function<std::optional<std::string>(std::string_view name)>;

/**
 * @brief Returns the first non-empty header value among device_token_header_keys.
 */
[[nodiscard]] auto find_token_in_headers(const header_lookup &lookup) -> std::optional<std::string>;

/**
 * @brief Returns the first non-empty string value among device_token_body_keys.
 *
 * Bodies that are empty, not JSON or not a JSON object yield std::nullopt.
 */
[[nodiscard]] auto find_token_in_json_body(std::string_view body) -> std::optional<std::string>;

/**
 * @brief Looks for a device token in the headers first, then in the JSON body.
 *
 * @param lookup Header accessor of the inbound request
 * @param body Raw request body
 * @param source Request kind, for log messages
 */
[[nodiscard]] auto find_device_token(const header_lookup &lookup, std::string_view body, std::string_view source)
  -> std::optional<std::string>;

}// namespace devicecheck::gate

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace devicecheck::api {

/// Endpoint paths, relative to an environment's base URL
namespace paths {
  inline constexpr std::string_view validate_device_token = "v1/validate_device_token";
  inline constexpr std::string_view query_two_bits = "v1/query_two_bits";
  inline constexpr std::string_view update_two_bits = "v1/update_two_bits";
}// namespace paths

/**
 * @brief Body of one DeviceCheck call.
 *
 * Built fresh for every logical call; the wrong-environment retry re-sends the
 * same instance so timestamp and transaction id stay identical.
 */
struct operation_request
{
  std::int64_t timestamp_ms{};///< Milliseconds since the Unix epoch
  std::string transaction_id;///< Random UUID correlating the call upstream
  std::string device_token;///< Base64 device token produced by the app
  std::optional<bool> bit0;///< Only sent by update_two_bits when set
  std::optional<bool> bit1;///< Only sent by update_two_bits when set

  /**
   * @brief Serializes the request to its JSON wire form.
   */
  [[nodiscard]] auto serialize() const -> std::string;
};

/**
 * @brief Creates a request stamped with the current time and a new transaction id.
 *
 * @param device_token Device token to send
 * @param bit0 First bit, omitted from the body when unset
 * @param bit1 Second bit, omitted from the body when unset
 */
[[nodiscard]] auto make_operation_request(std::string device_token,
  std::optional<bool> bit0 = std::nullopt,
  std::optional<bool> bit1 = std::nullopt) -> operation_request;

auto to_json(nlohmann::json &json_obj, const operation_request &request) -> void;

}// namespace devicecheck::api

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace devicecheck::api {

/// Reported by the upstream service, sometimes with a 200 status, when no bits were ever stored
inline constexpr std::string_view bit_state_not_found = "Bit State Not Found";
inline constexpr std::string_view failed_to_find_bit_state = "Failed to find bit state";

/**
 * @brief Result of a call whose body carries no structured data.
 */
struct status_result
{
  unsigned status_code{};///< HTTP status code
  std::string description;///< Raw response body (often empty)
  bool ok{ false };///< 200 and no bit-state error
};

/**
 * @brief Result of a call whose body is a JSON object.
 */
struct data_result
{
  unsigned status_code{};///< HTTP status code
  nlohmann::json payload;///< Decoded response body
  bool ok{ false };///< 200 and no bit-state error in the payload
  std::optional<bool> bit0;///< First stored bit, when reported
  std::optional<bool> bit1;///< Second stored bit, when reported
  std::optional<std::string> last_update_time;///< Month of the last bit update, "YYYY-MM"
};

using result = std::variant<status_result, data_result>;

/**
 * @brief Normalizes a raw upstream response.
 *
 * A body that decodes to a JSON object yields a data_result, anything else
 * (empty, plain text, JSON scalars) a status_result carrying the body
 * verbatim. The "Bit State Not Found" checks mirror a quirk of the upstream
 * API, which may report a missing bit state with a 200 status.
 *
 * @param body Response body
 * @param status_code HTTP status code
 * @param raise_on_error Throw instead of returning a non-ok result
 * @return Normalized result
 * @throws core::upstream_error if raise_on_error is set and the result is not ok
 */
[[nodiscard]] auto parse_response(std::string_view body, unsigned status_code, bool raise_on_error = false) -> result;

[[nodiscard]] auto is_ok(const result &res) -> bool;

[[nodiscard]] auto status_code(const result &res) -> unsigned;

/**
 * @brief Renders a result for logs and the command line.
 *
 * e.g. "200 {"bit0":true,"bit1":false} Bits: true false. Last update time: 2024-01"
 */
[[nodiscard]] auto to_string(const result &res) -> std::string;

}// namespace devicecheck::api

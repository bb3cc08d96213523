#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace devicecheck::gate {

inline constexpr std::string_view skip_gate_env = "DEVICECHECK_SKIP_GATE";
inline constexpr std::string_view mock_token_env = "DEVICECHECK_MOCK_TOKEN";

/**
 * @brief Test and development switches of a device gate.
 */
struct gate_options
{
  bool skip = false;///< Admit every request without looking for a token
  std::optional<std::string> mock_token;///< Admit only this token, without calling the upstream service
};

/**
 * @brief Reads gate options from DEVICECHECK_SKIP_GATE and DEVICECHECK_MOCK_TOKEN.
 */
[[nodiscard]] auto gate_options_from_env() -> gate_options;

}// namespace devicecheck::gate

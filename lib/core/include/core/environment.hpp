#pragma once

#include <cstdint>
#include <string_view>

namespace devicecheck::core {

/**
 * @brief Upstream deployment a request is sent to.
 */
enum class environment : std::uint8_t {
  production,///< Live devices
  development,///< Sandbox, for simulators and development builds
};

inline constexpr std::string_view production_url = "https://api.devicecheck.apple.com";
inline constexpr std::string_view development_url = "https://api.development.devicecheck.apple.com";

/**
 * @brief Returns the opposite environment, used by the wrong-environment retry.
 */
[[nodiscard]] constexpr auto other(environment env) noexcept -> environment
{
  return env == environment::production ? environment::development : environment::production;
}

/**
 * @brief Human readable environment name ("production" or "development").
 */
[[nodiscard]] auto to_string(environment env) -> std::string_view;

}// namespace devicecheck::core

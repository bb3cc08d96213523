#pragma once

#include <optional>
#include <string>

namespace devicecheck::platform {

/**
 * @brief Reads an environment variable.
 *
 * @param name Variable name
 * @return Variable value, or std::nullopt when unset
 */
[[nodiscard]] auto get_env(const std::string &name) -> std::optional<std::string>;

/**
 * @brief Reads an environment variable as a boolean switch.
 *
 * Accepts "1", "true", "True", "TRUE", "yes" and "on" as enabled.
 *
 * @param name Variable name
 * @return true if the variable is set to an enabled value
 */
[[nodiscard]] auto get_env_flag(const std::string &name) -> bool;

}// namespace devicecheck::platform

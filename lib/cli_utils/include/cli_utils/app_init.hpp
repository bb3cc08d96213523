#pragma once

#include <api/response.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/client_config.hpp>
#include <core/environment.hpp>
#include <fmt/core.h>
#include <internal_use_only/config.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <utility>

namespace devicecheck::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::cfg::load_env_levels();

  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_version() -> void { fmt::print("DeviceCheck v{}\n", devicecheck::cmake::project_version); }

[[nodiscard]] inline auto make_client_config(const cli_args &args, std::string private_key) -> core::client_config
{
  core::client_config config;
  config.team_id = args.team_id;
  config.bundle_id = args.bundle_id;
  config.key_id = args.key_id;
  config.private_key = std::move(private_key);
  config.env = args.dev_environment ? core::environment::development : core::environment::production;
  config.retry_wrong_environment = args.retry_wrong_env;
  config.raise_on_error = args.raise_on_error;
  config.token_validity = std::chrono::seconds(args.validity_seconds);
  return config;
}

/**
 * @brief Runs the parsed subcommand against a client.
 *
 * @tparam Client Blocking client exposing the three DeviceCheck operations
 */
template<typename Client> [[nodiscard]] auto execute_cli_command(const cli_args &args, Client &client) -> api::result
{
  if (args.update_parsed) { return client.update_two_bits(args.device_token, args.bit0, args.bit1); }
  if (args.query_parsed) { return client.query_two_bits(args.device_token); }
  return client.validate_device_token(args.device_token);
}

inline auto print_result(const api::result &result) -> void
{
  fmt::print("{} {}\n", api::is_ok(result) ? "OK" : "FAILED", api::to_string(result));
}

}// namespace devicecheck::cli_utils

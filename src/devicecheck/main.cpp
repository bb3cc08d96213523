#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <devicecheck/devicecheck.hpp>
#include <platform/env_utils.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <string>

namespace {

constexpr int exit_ok = 0;
constexpr int exit_failed = 1;

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = devicecheck::cli_utils::parse_cli_args(argc, argv);

  devicecheck::cli_utils::configure_logging(args);

  if (args.show_version) {
    devicecheck::cli_utils::print_version();
    return exit_ok;
  }

  if (not devicecheck::cli_utils::validate_cli_args(args)) { return devicecheck::cli_utils::usage_exit_code; }

  auto private_key = devicecheck::platform::get_env(std::string(devicecheck::cli_utils::private_key_env));
  if (not private_key.has_value() or private_key->empty()) {
    spdlog::error("{} must hold the PEM contents of the DeviceCheck private key", devicecheck::cli_utils::private_key_env);
    return devicecheck::cli_utils::usage_exit_code;
  }

  try {
    auto client = devicecheck::make_blocking_client(devicecheck::cli_utils::make_client_config(args, *private_key));

    auto result = devicecheck::cli_utils::execute_cli_command(args, *client);
    devicecheck::cli_utils::print_result(result);

    return devicecheck::api::is_ok(result) ? exit_ok : exit_failed;
  } catch (const devicecheck::core::configuration_error &e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return devicecheck::cli_utils::usage_exit_code;
  } catch (const devicecheck::core::upstream_error &e) {
    fmt::print("FAILED {}\n", e.what());
    return exit_failed;
  } catch (const devicecheck::core::error &e) {
    spdlog::error("{}", e.what());
    return exit_failed;
  }
}

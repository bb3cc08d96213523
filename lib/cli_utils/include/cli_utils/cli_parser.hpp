#pragma once

#include <CLI/CLI.hpp>
#include <auth/credential_signer.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace devicecheck::cli_utils {

/// Environment variable holding the PEM contents of the AuthKey .p8 file
inline constexpr std::string_view private_key_env = "DEVICECHECK_PRIVATE_KEY";

/// Process exit code for invalid command lines
inline constexpr int usage_exit_code = 2;

struct cli_args
{
  std::string team_id;
  std::string bundle_id;
  std::string key_id;
  bool dev_environment = false;
  bool retry_wrong_env = false;
  bool raise_on_error = false;
  int validity_seconds = static_cast<int>(auth::credential_signer::default_validity.count());
  bool verbose = false;
  bool show_version = false;

  bool validate_parsed = false;
  bool query_parsed = false;
  bool update_parsed = false;
  std::string device_token;
  std::string bit0_arg;
  std::string bit1_arg;
  std::optional<bool> bit0;
  std::optional<bool> bit1;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

[[nodiscard]] inline auto parse_bit(const std::string &value) -> std::optional<bool>
{
  if (value == "true" or value == "1") { return true; }
  if (value == "false" or value == "0") { return false; }
  return std::nullopt;
}

/**
 * @brief Prints a parse error through CLI11 and picks the exit code.
 *
 * Help and version requests keep CLI11's success code; every other parse
 * failure exits with usage_exit_code.
 */
[[nodiscard]] inline auto parse_error_exit_code(const CLI::App &app, const CLI::ParseError &error) -> int
{
  const int code = app.exit(error);
  return code == static_cast<int>(CLI::ExitCodes::Success) ? code : usage_exit_code;
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "DeviceCheck - query and update per-device bits", "devicecheck" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    std::exit(parse_error_exit_code(app, e));// NOLINT(concurrency-mt-unsafe)
  }

  args.bit0 = parse_bit(args.bit0_arg);
  args.bit1 = parse_bit(args.bit1_arg);

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  static constexpr int max_validity_seconds = static_cast<int>(auth::credential_signer::max_validity.count());

  app.add_option("--team-id", args.team_id, "Apple developer team identifier")->envname("DEVICECHECK_TEAM_ID");
  app.add_option("--bundle-id", args.bundle_id, "Bundle identifier of the app")->envname("DEVICECHECK_BUNDLE_ID");
  app.add_option("--key-id", args.key_id, "Identifier of the DeviceCheck signing key")->envname("DEVICECHECK_KEY_ID");
  app.add_flag("--dev", args.dev_environment, "Use the development environment");
  app.add_flag("--retry-wrong-env", args.retry_wrong_env, "Retry once on the other environment after a failure");
  app.add_flag("--raise", args.raise_on_error, "Treat non-ok responses as errors");
  app.add_option("--validity", args.validity_seconds, "Credential lifetime in seconds")
    ->check(CLI::Range(1, max_validity_seconds));
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");

  auto *validate_cmd = app.add_subcommand("validate", "Validate a device token");
  validate_cmd->add_option("token", args.device_token, "Device token")->required();
  validate_cmd->callback([&args]() { args.validate_parsed = true; });

  auto *query_cmd = app.add_subcommand("query", "Query the two bits of a device");
  query_cmd->add_option("token", args.device_token, "Device token")->required();
  query_cmd->callback([&args]() { args.query_parsed = true; });

  auto *update_cmd = app.add_subcommand("update", "Update the bits of a device");
  update_cmd->add_option("token", args.device_token, "Device token")->required();
  update_cmd->add_option("--bit0", args.bit0_arg, "New value of the first bit")
    ->check(CLI::IsMember({ "true", "false", "1", "0" }));
  update_cmd->add_option("--bit1", args.bit1_arg, "New value of the second bit")
    ->check(CLI::IsMember({ "true", "false", "1", "0" }));
  update_cmd->callback([&args]() { args.update_parsed = true; });

  app.require_subcommand(0, 1);
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  const auto commands = static_cast<int>(args.validate_parsed) + static_cast<int>(args.query_parsed)
                        + static_cast<int>(args.update_parsed);
  if (commands != 1) {
    spdlog::error("Exactly one of validate, query or update is required");
    return false;
  }

  if (args.team_id.empty() or args.bundle_id.empty() or args.key_id.empty()) {
    spdlog::error("--team-id, --bundle-id and --key-id are required");
    return false;
  }

  if (args.validity_seconds <= 0 or args.validity_seconds > auth::credential_signer::max_validity.count()) {
    spdlog::error("Invalid credential validity: {} seconds", args.validity_seconds);
    return false;
  }

  if (args.device_token.empty()) {
    spdlog::error("A device token is required");
    return false;
  }

  if (args.update_parsed and not args.bit0.has_value() and not args.bit1.has_value()) {
    spdlog::error("Update command requires --bit0 or --bit1");
    return false;
  }

  return true;
}

}// namespace devicecheck::cli_utils

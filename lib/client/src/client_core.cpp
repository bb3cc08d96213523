#include <client/client_core.hpp>
#include <core/errors.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace devicecheck::client {

namespace {

  constexpr unsigned status_ok = 200;

}// namespace

client_core::client_core(core::client_config config, auth::credential_signer::clock_fn clock)
  : config_(std::move(config)),
    signer_(config_.team_id, config_.bundle_id, config_.key_id, config_.private_key, std::move(clock)),
    production_(transport::parse_url(config_.production_url)),
    development_(transport::parse_url(config_.development_url))
{
  if (config_.token_validity > auth::credential_signer::max_validity
      or config_.token_validity <= std::chrono::seconds::zero()) {
    throw core::configuration_error(
      fmt::format("Token valid time must be between 1 and {} seconds, got {} seconds",
        auth::credential_signer::max_validity.count(),
        config_.token_validity.count()));
  }

  if (config_.env == core::environment::development) {
    spdlog::warn("[client] Using development environment. Switch to production for released apps!");
  }
}

auto client_core::should_retry(unsigned status) const -> bool
{
  return config_.retry_wrong_environment and status != status_ok;
}

auto client_core::build_request(std::string_view path,
  const api::operation_request &request,
  core::environment target_env) -> transport::http_request
{
  const auto &target = endpoint(target_env);

  transport::http_request http_request{ .host = target.host,
    .port = target.port,
    .target = transport::join_target(target.path, path),
    .body = request.serialize(),
    .bearer_token = signer_.current_or_refreshed(config_.token_validity, config_.force_token_refresh) };

  spdlog::debug("[client] Sending request to {} https://{}:{}{} with data {}",
    core::to_string(target_env),
    http_request.host,
    http_request.port,
    http_request.target,
    http_request.body);

  return http_request;
}

auto client_core::parse(const transport::http_response &response) const -> api::result
{
  spdlog::debug("[client] Response: {} {}", response.status, response.body);
  return api::parse_response(response.body, response.status, config_.raise_on_error);
}

}// namespace devicecheck::client

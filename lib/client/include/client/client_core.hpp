#pragma once

#include <api/operation_request.hpp>
#include <api/response.hpp>
#include <auth/credential_signer.hpp>
#include <core/client_config.hpp>
#include <core/environment.hpp>
#include <transport/http_message.hpp>
#include <transport/url.hpp>

#include <optional>
#include <string_view>

namespace devicecheck::client {

/**
 * @brief Call policy shared by the blocking and the coroutine client.
 *
 * Owns the configuration and the credential signer, turns operation requests
 * into HTTP requests for a given environment, decides on the wrong-environment
 * retry and normalizes responses. Keeping this in one place guarantees both
 * execution modes behave identically.
 */
class client_core
{
public:
  /**
   * @brief Constructs the policy.
   *
   * @param config Client configuration
   * @param clock Wall clock for the credential signer
   * @throws core::configuration_error for malformed base URLs or token validity
   */
  explicit client_core(core::client_config config,
    auth::credential_signer::clock_fn clock = std::chrono::system_clock::now);

  /**
   * @brief Environment of the first attempt.
   */
  [[nodiscard]] auto primary_environment(std::optional<core::environment> override_env) const -> core::environment
  {
    return override_env.value_or(config_.env);
  }

  /**
   * @brief Whether a first attempt that returned status should be retried on the other environment.
   */
  [[nodiscard]] auto should_retry(unsigned status) const -> bool;

  /**
   * @brief Builds the HTTP request for one attempt, attaching the current credential.
   *
   * @param path Endpoint path, e.g. api::paths::query_two_bits
   * @param request Operation request, identical across attempts
   * @param target_env Environment the attempt is sent to
   * @throws core::configuration_error or core::crypto_error if no credential can be produced
   */
  [[nodiscard]] auto build_request(std::string_view path,
    const api::operation_request &request,
    core::environment target_env) -> transport::http_request;

  /**
   * @brief Logs and normalizes a response according to the raise-on-error setting.
   */
  [[nodiscard]] auto parse(const transport::http_response &response) const -> api::result;

  [[nodiscard]] auto config() const -> const core::client_config & { return config_; }

  [[nodiscard]] auto signer() -> auth::credential_signer & { return signer_; }

private:
  [[nodiscard]] auto endpoint(core::environment target_env) const -> const transport::url_parts &
  {
    return target_env == core::environment::development ? development_ : production_;
  }

  core::client_config config_;
  auth::credential_signer signer_;
  transport::url_parts production_;
  transport::url_parts development_;
};

}// namespace devicecheck::client

#pragma once

#include <core/environment.hpp>

#include <chrono>
#include <string>

namespace devicecheck::core {

/**
 * @brief Settings for a DeviceCheck client.
 *
 * The team, bundle and key identifiers come from the Apple developer account;
 * private_key holds the PEM contents of the AuthKey_XXXXXXXXXX.p8 file.
 */
struct client_config
{
  std::string team_id;///< Issuer of the credential (iss)
  std::string bundle_id;///< Subject of the credential (sub)
  std::string key_id;///< Key identifier placed in the JWT header (kid)
  std::string private_key;///< PEM encoded EC P-256 private key

  environment env = environment::production;///< Environment used for the first attempt
  bool retry_wrong_environment = false;///< Retry once on the other environment after a non-200
  bool raise_on_error = false;///< Throw upstream_error instead of returning a non-ok result

  std::chrono::seconds token_validity{ 500 };///< Lifetime of minted credentials, at most 1200 s
  bool force_token_refresh = false;///< Mint a new credential for every call
  std::chrono::seconds request_timeout{ 30 };///< Per I/O step timeout of the HTTPS session

  std::string production_url{ core::production_url };
  std::string development_url{ core::development_url };

  [[nodiscard]] auto base_url(environment target) const -> const std::string &
  {
    return target == environment::development ? development_url : production_url;
  }
};

}// namespace devicecheck::core

#pragma once

#include <chrono>
#include <string>

namespace devicecheck::auth {

/**
 * @brief A signed, time-bounded assertion of the calling application.
 *
 * Immutable once issued; the signer replaces it as a whole on refresh.
 */
struct credential
{
  std::string issuer_id;///< Team identifier (iss)
  std::string subject_id;///< Bundle identifier (sub)
  std::string key_id;///< Signing key identifier (kid header)
  std::chrono::sys_seconds issued_at;///< iat
  std::chrono::sys_seconds expires_at;///< exp
  std::string token;///< Compact ES256 JWS sent as the bearer credential
};

}// namespace devicecheck::auth

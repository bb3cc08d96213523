#pragma once

#include <auth/credential.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace devicecheck::auth {

/**
 * @brief Mints and caches the ES256 credential attached to every request.
 *
 * Holds a single credential slot guarded by a mutex, so concurrent callers
 * serialize on refresh and never observe a partially replaced credential.
 */
class credential_signer
{
public:
  using clock_fn = std::function<std::chrono::system_clock::time_point()>;

  /// Upper bound imposed by the upstream service (20 minutes)
  static constexpr std::chrono::seconds max_validity{ 1200 };
  static constexpr std::chrono::seconds default_validity{ 500 };

  /**
   * @brief Constructs a signer.
   *
   * @param team_id Issuer identifier (iss)
   * @param bundle_id Subject identifier (sub)
   * @param key_id Key identifier (kid)
   * @param private_key PEM encoded EC P-256 private key
   * @param clock Wall clock, replaceable for tests
   */
  credential_signer(std::string team_id,
    std::string bundle_id,
    std::string key_id,
    std::string private_key,
    clock_fn clock = std::chrono::system_clock::now);

  /**
   * @brief Returns the cached credential token, minting a new one if needed.
   *
   * The cached token is returned unchanged while its expiry lies strictly in
   * the future and no refresh is forced.
   *
   * @param validity Lifetime of a newly minted credential
   * @param force_refresh Mint a new credential even if the cached one is valid
   * @return Compact JWS token
   * @throws core::configuration_error if validity is not in (0, 1200] seconds
   * @throws core::crypto_error if the key cannot sign ES256
   */
  [[nodiscard]] auto current_or_refreshed(std::chrono::seconds validity = default_validity, bool force_refresh = false)
    -> std::string;

  /**
   * @brief Returns a copy of the cached credential, if any has been minted.
   */
  [[nodiscard]] auto current() const -> std::optional<credential>;

  credential_signer(const credential_signer &) = delete;
  auto operator=(const credential_signer &) -> credential_signer & = delete;
  credential_signer(credential_signer &&) = delete;
  auto operator=(credential_signer &&) -> credential_signer & = delete;
  ~credential_signer() = default;

private:
  [[nodiscard]] auto sign(std::chrono::sys_seconds now, std::chrono::seconds validity) const -> credential;

  std::string team_id_;
  std::string bundle_id_;
  std::string key_id_;
  std::string private_key_;
  clock_fn clock_;

  mutable std::mutex mutex_;
  std::optional<credential> current_;
};

}// namespace devicecheck::auth

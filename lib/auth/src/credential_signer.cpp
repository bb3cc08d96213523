#include <auth/credential_signer.hpp>
#include <core/errors.hpp>

#include <fmt/format.h>
#include <jwt-cpp/jwt.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace devicecheck::auth {

credential_signer::credential_signer(std::string team_id,
  std::string bundle_id,
  std::string key_id,
  std::string private_key,
  clock_fn clock)
  : team_id_(std::move(team_id)), bundle_id_(std::move(bundle_id)), key_id_(std::move(key_id)),
    private_key_(std::move(private_key)), clock_(std::move(clock))
{}

auto credential_signer::current_or_refreshed(std::chrono::seconds validity, bool force_refresh) -> std::string
{
  if (validity > max_validity) {
    throw core::configuration_error(fmt::format(
      "Token valid time is limited to 20 minutes ({} seconds), got {} seconds", max_validity.count(), validity.count()));
  }
  if (validity <= std::chrono::seconds::zero()) {
    throw core::configuration_error(
      fmt::format("Token valid time must be positive, got {} seconds", validity.count()));
  }

  const auto now = std::chrono::floor<std::chrono::seconds>(clock_());

  const std::scoped_lock lock(mutex_);

  if (not force_refresh and current_ and current_->expires_at > now) {
    spdlog::debug("[auth] Token still valid for {} seconds", (current_->expires_at - now).count());
    return current_->token;
  }

  current_ = sign(now, validity);
  spdlog::debug("[auth] Generated token for key {} valid for {} seconds", key_id_, validity.count());
  return current_->token;
}

auto credential_signer::current() const -> std::optional<credential>
{
  const std::scoped_lock lock(mutex_);
  return current_;
}

auto credential_signer::sign(std::chrono::sys_seconds now, std::chrono::seconds validity) const -> credential
{
  const auto expires_at = now + validity;

  std::string token;
  try {
    token = jwt::create()
              .set_type("JWT")
              .set_key_id(key_id_)
              .set_issuer(team_id_)
              .set_issued_at(now)
              .set_expires_at(expires_at)
              .set_subject(bundle_id_)
              .sign(jwt::algorithm::es256("", private_key_));
  } catch (const std::exception &ex) {
    throw core::crypto_error(fmt::format("Unable to sign ES256 token with key {}: {}", key_id_, ex.what()));
  }

  return credential{ .issuer_id = team_id_,
    .subject_id = bundle_id_,
    .key_id = key_id_,
    .issued_at = now,
    .expires_at = expires_at,
    .token = std::move(token) };
}

}// namespace devicecheck::auth

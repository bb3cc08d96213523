#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

namespace devicecheck::core {

/**
 * @brief Base class for every error raised by the devicecheck library.
 */
class error : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Invalid client or credential configuration.
 *
 * Raised before any network or cryptographic work is attempted, e.g. for a
 * credential lifetime above the 20 minute limit or a malformed base URL.
 */
class configuration_error : public error
{
public:
  using error::error;
};

/**
 * @brief The signing key is malformed or does not fit the ES256 algorithm.
 */
class crypto_error : public error
{
public:
  using error::error;
};

/**
 * @brief Network failure while talking to the upstream service.
 */
class transport_error : public error
{
public:
  transport_error(boost::system::error_code code, const std::string &what) : error(what), code_(code) {}

  [[nodiscard]] auto code() const noexcept -> boost::system::error_code { return code_; }

private:
  boost::system::error_code code_;
};

/**
 * @brief Non-ok upstream result, raised only when raise-on-error is enabled.
 */
class upstream_error : public error
{
public:
  upstream_error(unsigned status_code, std::string description);

  [[nodiscard]] auto status_code() const noexcept -> unsigned { return status_code_; }
  [[nodiscard]] auto description() const noexcept -> const std::string & { return description_; }

private:
  unsigned status_code_;
  std::string description_;
};

}// namespace devicecheck::core

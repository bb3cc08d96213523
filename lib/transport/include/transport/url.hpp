#pragma once

#include <string>
#include <string_view>

namespace devicecheck::transport {

/**
 * @brief Components of an https:// base URL.
 */
struct url_parts
{
  std::string host;
  std::string port;
  std::string path;///< Always starts with '/'
};

/**
 * @brief Splits an https:// URL into host, port and path.
 *
 * The port defaults to 443 and the path to "/".
 *
 * @param url URL such as "https://api.devicecheck.apple.com"
 * @return Parsed components
 * @throws core::configuration_error for non-https or host-less URLs
 */
[[nodiscard]] auto parse_url(std::string_view url) -> url_parts;

/**
 * @brief Appends a relative endpoint path to a base path.
 *
 * @param base_path Base path, e.g. "/" or "/devicecheck/"
 * @param endpoint Relative endpoint, e.g. "v1/query_two_bits"
 * @return Request target, e.g. "/v1/query_two_bits"
 */
[[nodiscard]] auto join_target(std::string_view base_path, std::string_view endpoint) -> std::string;

}// namespace devicecheck::transport

#pragma once

#include <string>

namespace devicecheck::transport {

/**
 * @brief A JSON POST to the upstream service.
 */
struct http_request
{
  std::string host;///< Hostname used for resolving, SNI and the Host header
  std::string port;///< Port number (typically "443")
  std::string target;///< Request target, e.g. "/v1/query_two_bits"
  std::string body;///< JSON body
  std::string bearer_token;///< Credential sent as "Authorization: Bearer <token>"
};

/**
 * @brief Status code and body of an upstream response.
 */
struct http_response
{
  unsigned status{};
  std::string body;
};

}// namespace devicecheck::transport

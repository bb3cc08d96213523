#include <core/errors.hpp>
#include <transport/url.hpp>

#include <fmt/format.h>

namespace devicecheck::transport {

auto parse_url(const std::string_view url) -> url_parts
{
  static constexpr std::string_view https_prefix = "https://";

  if (url.starts_with("http://")) {
    throw core::configuration_error(fmt::format("Insecure URL (http://) not supported: {}. Use https://", url));
  }
  if (not url.starts_with(https_prefix)) {
    throw core::configuration_error(fmt::format("Unsupported URL scheme: {}", url));
  }

  auto remainder = std::string(url.substr(https_prefix.size()));

  url_parts parts{ .host = "", .port = "443", .path = "/" };

  auto slash_pos = remainder.find('/');
  if (slash_pos != std::string::npos) {
    parts.host = remainder.substr(0, slash_pos);
    parts.path = remainder.substr(slash_pos);
  } else {
    parts.host = remainder;
  }

  auto colon_pos = parts.host.find(':');
  if (colon_pos != std::string::npos) {
    parts.port = parts.host.substr(colon_pos + 1);
    parts.host.resize(colon_pos);
  }

  if (parts.host.empty()) { throw core::configuration_error(fmt::format("URL has no host: {}", url)); }
  if (parts.port.empty()) { throw core::configuration_error(fmt::format("URL has an empty port: {}", url)); }

  return parts;
}

auto join_target(const std::string_view base_path, const std::string_view endpoint) -> std::string
{
  std::string target(base_path);
  if (target.empty() or target.back() != '/') { target.push_back('/'); }

  auto relative = endpoint;
  while (relative.starts_with('/')) { relative.remove_prefix(1); }

  target.append(relative);
  return target;
}

}// namespace devicecheck::transport

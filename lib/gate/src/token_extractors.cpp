#include <gate/beast_token_extractor.hpp>
#include <gate/generic_token_extractor.hpp>
#include <gate/token_lookup.hpp>

namespace devicecheck::gate {

auto generic_token_extractor::extract(const generic_request &request) const -> std::optional<std::string>
{
  return find_device_token(
    [&request](std::string_view name) -> std::optional<std::string> {
      auto iter = request.headers.find(name);
      if (iter == request.headers.end()) { return std::nullopt; }
      return iter->second;
    },
    request.body,
    "generic");
}

auto beast_token_extractor::extract(const beast_request &request) const -> std::optional<std::string>
{
  return find_device_token(
    [&request](std::string_view name) -> std::optional<std::string> {
      auto iter = request.find(boost::beast::string_view(name.data(), name.size()));
      if (iter == request.end()) { return std::nullopt; }
      const auto value = iter->value();
      return std::string(value.data(), value.size());
    },
    request.body(),
    "beast");
}

}// namespace devicecheck::gate

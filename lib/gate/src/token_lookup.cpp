#include <gate/token_lookup.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace devicecheck::gate {

auto find_token_in_headers(const header_lookup &lookup) -> std::optional<std::string>
{
  for (const auto key : device_token_header_keys) {
    auto value = lookup(key);
    if (value.has_value() and not value->empty()) {
      spdlog::debug("[gate] Found device token in header {}", key);
      return value;
    }
  }
  return std::nullopt;
}

auto find_token_in_json_body(std::string_view body) -> std::optional<std::string>
{
  if (body.empty()) { return std::nullopt; }

  nlohmann::json json_obj;
  try {
    json_obj = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    spdlog::debug("[gate] Unable to parse request body as JSON: {}", e.what());
    return std::nullopt;
  }
  if (not json_obj.is_object()) { return std::nullopt; }

  for (const auto key : device_token_body_keys) {
    auto iter = json_obj.find(key);
    if (iter != json_obj.end() and iter->is_string() and not iter->get_ref<const std::string &>().empty()) {
      spdlog::debug("[gate] Found device token in body key {}", key);
      return iter->get<std::string>();
    }
  }
  return std::nullopt;
}

auto find_device_token(const header_lookup &lookup, std::string_view body, std::string_view source)
  -> std::optional<std::string>
{
  if (auto token = find_token_in_headers(lookup)) { return token; }
  if (auto token = find_token_in_json_body(body)) { return token; }

  spdlog::info("[gate] No device token found in {} request", source);
  return std::nullopt;
}

}// namespace devicecheck::gate

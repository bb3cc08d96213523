#include <api/response.hpp>
#include <core/errors.hpp>
#include <core/overload.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace devicecheck::api {

namespace {

  constexpr unsigned status_ok = 200;

  auto parse_json_object(std::string_view body) -> std::optional<nlohmann::json>
  {
    if (body.empty()) { return std::nullopt; }

    try {
      auto json_obj = nlohmann::json::parse(body);
      if (not json_obj.is_object()) { return std::nullopt; }
      return json_obj;
    } catch (const nlohmann::json::parse_error &e) {
      spdlog::trace("[response] Body is not JSON: {}", e.what());
      return std::nullopt;
    }
  }

  auto optional_bool(const nlohmann::json &payload, const char *key) -> std::optional<bool>
  {
    auto iter = payload.find(key);
    if (iter == payload.end() or not iter->is_boolean()) { return std::nullopt; }
    return iter->get<bool>();
  }

  auto optional_string(const nlohmann::json &payload, const char *key) -> std::optional<std::string>
  {
    auto iter = payload.find(key);
    if (iter == payload.end() or not iter->is_string()) { return std::nullopt; }
    return iter->get<std::string>();
  }

  auto make_data_result(unsigned status_code, nlohmann::json payload) -> data_result
  {
    data_result data{ .status_code = status_code,
      .payload = std::move(payload),
      .ok = false,
      .bit0 = std::nullopt,
      .bit1 = std::nullopt,
      .last_update_time = std::nullopt };

    data.bit0 = optional_bool(data.payload, "bit0");
    data.bit1 = optional_bool(data.payload, "bit1");
    data.last_update_time = optional_string(data.payload, "last_update_time");
    data.ok = status_code == status_ok and data.payload.dump().find(bit_state_not_found) == std::string::npos;

    return data;
  }

  auto make_status_result(unsigned status_code, std::string_view body) -> status_result
  {
    const bool bit_state_error = body == bit_state_not_found or body == failed_to_find_bit_state;
    return status_result{
      .status_code = status_code, .description = std::string(body), .ok = status_code == status_ok and not bit_state_error
    };
  }

}// namespace

auto parse_response(std::string_view body, unsigned status_code, bool raise_on_error) -> result
{
  if (auto payload = parse_json_object(body)) {
    auto data = make_data_result(status_code, std::move(*payload));
    if (raise_on_error and not data.ok) { throw core::upstream_error(status_code, std::string(body)); }
    return data;
  }

  auto status = make_status_result(status_code, body);
  if (raise_on_error and not status.ok) { throw core::upstream_error(status_code, status.description); }
  return status;
}

auto is_ok(const result &res) -> bool
{
  return std::visit([](const auto &alternative) { return alternative.ok; }, res);
}

auto status_code(const result &res) -> unsigned
{
  return std::visit([](const auto &alternative) { return alternative.status_code; }, res);
}

auto to_string(const result &res) -> std::string
{
  return std::visit(core::overload{ [](const status_result &status) {
                                     if (status.description.empty()) { return fmt::format("{}", status.status_code); }
                                     return fmt::format("{} {}", status.status_code, status.description);
                                   },
                      [](const data_result &data) {
                        auto text = fmt::format("{} {}", data.status_code, data.payload.dump());
                        if (data.bit0.has_value() or data.bit1.has_value()) {
                          const auto bit_text = [](const std::optional<bool> &bit) -> std::string_view {
                            if (not bit.has_value()) { return "unset"; }
                            return *bit ? "true" : "false";
                          };
                          text += fmt::format(" Bits: {} {}.", bit_text(data.bit0), bit_text(data.bit1));
                        }
                        if (data.last_update_time.has_value()) {
                          text += fmt::format(" Last update time: {}", *data.last_update_time);
                        }
                        return text;
                      } },
    res);
}

}// namespace devicecheck::api

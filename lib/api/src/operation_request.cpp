#include <api/operation_request.hpp>
#include <core/transaction_id.hpp>
#include <platform/time_utils.hpp>

#include <utility>

namespace devicecheck::api {

auto make_operation_request(std::string device_token, std::optional<bool> bit0, std::optional<bool> bit1)
  -> operation_request
{
  return operation_request{ .timestamp_ms = platform::epoch_milliseconds(),
    .transaction_id = core::generate_transaction_id(),
    .device_token = std::move(device_token),
    .bit0 = bit0,
    .bit1 = bit1 };
}

auto to_json(nlohmann::json &json_obj, const operation_request &request) -> void
{
  json_obj = nlohmann::json::object();
  json_obj["timestamp"] = request.timestamp_ms;
  json_obj["transaction_id"] = request.transaction_id;
  json_obj["device_token"] = request.device_token;

  if (request.bit0.has_value()) { json_obj["bit0"] = *request.bit0; }
  if (request.bit1.has_value()) { json_obj["bit1"] = *request.bit1; }
}

auto operation_request::serialize() const -> std::string
{
  const nlohmann::json json_obj = *this;
  return json_obj.dump();
}

}// namespace devicecheck::api

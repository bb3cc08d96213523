#pragma once

#include <gate/token_extractor.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace devicecheck::gate {

/**
 * @brief Framework neutral request: exact-name headers plus a raw body.
 *
 * Fallback for servers without a dedicated extractor; callers copy the
 * headers and body of their own request type into it.
 */
struct generic_request
{
  std::map<std::string, std::string, std::less<>> headers;
  std::string body;
};

class generic_token_extractor final : public token_extractor<generic_request>
{
public:
  [[nodiscard]] auto extract(const generic_request &request) const -> std::optional<std::string> override;
};

}// namespace devicecheck::gate

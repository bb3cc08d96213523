#pragma once

#include <optional>
#include <string>

namespace devicecheck::gate {

/**
 * @brief Extracts a device token from an inbound request of one request type.
 *
 * There is one implementation per supported request type; callers pick the
 * extractor matching their request type explicitly.
 *
 * @tparam Request Inbound request type
 */
template<typename Request> class token_extractor
{
public:
  token_extractor() = default;
  token_extractor(const token_extractor &) = default;
  auto operator=(const token_extractor &) -> token_extractor & = default;
  token_extractor(token_extractor &&) noexcept = default;
  auto operator=(token_extractor &&) noexcept -> token_extractor & = default;
  virtual ~token_extractor() = default;

  /**
   * @brief Returns the device token carried by the request, if any.
   */
  [[nodiscard]] virtual auto extract(const Request &request) const -> std::optional<std::string> = 0;
};

}// namespace devicecheck::gate

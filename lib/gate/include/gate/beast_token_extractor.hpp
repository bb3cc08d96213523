#pragma once

#include <gate/token_extractor.hpp>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>

namespace devicecheck::gate {

using beast_request = boost::beast::http::request<boost::beast::http::string_body>;

/**
 * @brief Token extractor for Boost.Beast requests.
 *
 * Header names are matched case-insensitively, as Beast does.
 */
class beast_token_extractor final : public token_extractor<beast_request>
{
public:
  [[nodiscard]] auto extract(const beast_request &request) const -> std::optional<std::string> override;
};

}// namespace devicecheck::gate

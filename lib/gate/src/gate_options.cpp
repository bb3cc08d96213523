#include <gate/gate_options.hpp>
#include <platform/env_utils.hpp>

#include <utility>

namespace devicecheck::gate {

auto gate_options_from_env() -> gate_options
{
  gate_options options;
  options.skip = platform::get_env_flag(std::string(skip_gate_env));

  auto mock_token = platform::get_env(std::string(mock_token_env));
  if (mock_token.has_value() and not mock_token->empty()) { options.mock_token = std::move(mock_token); }

  return options;
}

}// namespace devicecheck::gate

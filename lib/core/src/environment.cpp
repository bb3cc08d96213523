#include <core/environment.hpp>

namespace devicecheck::core {

auto to_string(environment env) -> std::string_view
{
  switch (env) {
  case environment::production:
    return "production";
  case environment::development:
    return "development";
  }
  return "unknown";
}

}// namespace devicecheck::core

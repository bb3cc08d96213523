#include <platform/env_utils.hpp>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <mutex>
#include <string_view>

#ifdef _WIN32
#include <memory>
#endif

namespace devicecheck::platform {

auto get_env(const std::string &name) -> std::optional<std::string>
{
#ifdef _WIN32
  char *value_raw = nullptr;
  size_t len = 0;
  if (_dupenv_s(&value_raw, &len, name.c_str()) == 0 and value_raw != nullptr) {
    const std::unique_ptr<char, decltype(&free)> value(value_raw, &free);
    return std::string{ value.get() };
  }
  return std::nullopt;
#else
  static std::mutex env_mutex;
  const std::scoped_lock lock(env_mutex);

  const char *value = std::getenv(name.c_str());// NOLINT(concurrency-mt-unsafe)
  if (value == nullptr) { return std::nullopt; }
  return std::string{ value };
#endif
}

auto get_env_flag(const std::string &name) -> bool
{
  static constexpr std::array<std::string_view, 6> enabled_values{ "1", "true", "True", "TRUE", "yes", "on" };

  const auto value = get_env(name);
  if (not value) { return false; }

  return std::ranges::find(enabled_values, *value) != enabled_values.end();
}

}// namespace devicecheck::platform

#pragma once

namespace devicecheck::core {

/**
 * @brief Helper for std::visit with overload pattern.
 *
 * @code
 * std::visit(overload{
 *   [](const api::status_result &status) { ... },
 *   [](const api::data_result &data) { ... }
 * }, result);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace devicecheck::core

#pragma once

#include <chrono>
#include <cstdint>

namespace devicecheck::platform {

/**
 * @brief Milliseconds since the Unix epoch for the current wall-clock time.
 */
[[nodiscard]] auto epoch_milliseconds() -> std::int64_t;

}// namespace devicecheck::platform

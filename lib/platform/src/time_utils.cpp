#include <platform/time_utils.hpp>

namespace devicecheck::platform {

auto epoch_milliseconds() -> std::int64_t
{
  using namespace std::chrono;

  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}// namespace devicecheck::platform

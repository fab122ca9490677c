#include "platform_time.h"

#include <time.h>

namespace pc::platform {

std::uint64_t NowSteadyMs() {
  timespec ts{};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec) * 1000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec) / 1000000ULL;
}

std::uint64_t NowUnixSeconds() {
  timespec ts{};
  if (::clock_gettime(CLOCK_REALTIME, &ts) != 0 || ts.tv_sec <= 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(ts.tv_sec);
}

}  // namespace pc::platform

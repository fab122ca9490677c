#ifndef PC_TRANSPORT_PLATFORM_TIME_H
#define PC_TRANSPORT_PLATFORM_TIME_H

#include <cstdint>

namespace pc::platform {

std::uint64_t NowSteadyMs();
std::uint64_t NowUnixSeconds();

}  // namespace pc::platform

#endif  // PC_TRANSPORT_PLATFORM_TIME_H

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace docsandbox::common {

using SteadyTime = std::chrono::steady_clock::time_point;

using ClockFn = std::function<SteadyTime()>;

[[nodiscard]] SteadyTime steady_now();
[[nodiscard]] ClockFn default_clock();

[[nodiscard]] std::chrono::system_clock::time_point to_system_time(SteadyTime instant,
                                                                   SteadyTime steady_reference);

[[nodiscard]] std::string to_rfc3339(std::chrono::system_clock::time_point instant);
[[nodiscard]] std::string now_rfc3339();

} // namespace docsandbox::common

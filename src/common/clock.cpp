#include "docsandbox/common/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace docsandbox::common {

SteadyTime steady_now() { return std::chrono::steady_clock::now(); }

ClockFn default_clock() { return [] { return std::chrono::steady_clock::now(); }; }

std::chrono::system_clock::time_point to_system_time(const SteadyTime instant,
                                                     const SteadyTime steady_reference) {
  const auto offset = steady_reference - instant;
  return std::chrono::system_clock::now() -
         std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
}

std::string to_rfc3339(const std::chrono::system_clock::time_point instant) {
  const auto t = std::chrono::system_clock::to_time_t(instant);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          instant.time_since_epoch()) %
                      1000;

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis.count() < 0 ? millis.count() + 1000 : millis.count()) << 'Z';
  return out.str();
}

std::string now_rfc3339() { return to_rfc3339(std::chrono::system_clock::now()); }

} // namespace docsandbox::common

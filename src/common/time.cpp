#include "skyhost/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace skyhost::common {

std::string format_rfc3339(const std::chrono::system_clock::time_point instant) {
  const auto t = std::chrono::system_clock::to_time_t(instant);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

} // namespace skyhost::common

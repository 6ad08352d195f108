#pragma once

#include <chrono>
#include <string>

namespace skyhost::common {

[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point instant);

} // namespace skyhost::common

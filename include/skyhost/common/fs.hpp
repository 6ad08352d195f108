#pragma once

#include "skyhost/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace skyhost::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &glue);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace skyhost::common

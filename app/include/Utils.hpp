#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <filesystem>
#include <string>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

bool is_valid_directory(const std::string& path);

/**
 * @brief Birth time of the file where the platform records it, last write time otherwise.
 * @throws std::filesystem::filesystem_error when the file cannot be inspected.
 */
std::chrono::system_clock::time_point file_creation_time(const std::filesystem::path& path);

/**
 * @brief Calendar date of the time point in the local time zone.
 */
std::chrono::year_month_day local_date(std::chrono::system_clock::time_point time);

/**
 * @brief Today's date in the local time zone.
 */
std::chrono::year_month_day local_today();

std::string get_executable_path();

} // namespace Utils

#endif

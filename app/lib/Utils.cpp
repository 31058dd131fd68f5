#include "Utils.hpp"

#include <ctime>
#include <system_error>

#ifdef __linux__
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <limits.h>
#endif

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
    const auto utf8 = path.u8string();
    return std::string(utf8.begin(), utf8.end());
}


std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


bool is_valid_directory(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(utf8_to_path(path), ec);
}


std::chrono::system_clock::time_point file_creation_time(const std::filesystem::path& path)
{
#if defined(__linux__) && defined(STATX_BTIME)
    struct statx stx {};
    if (statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME, &stx) == 0 && (stx.stx_mask & STATX_BTIME)) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(stx.stx_btime.tv_sec)
                + std::chrono::nanoseconds(stx.stx_btime.tv_nsec)));
    }
#endif
    const auto write_time = std::filesystem::last_write_time(path);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(write_time));
}


std::chrono::year_month_day local_date(std::chrono::system_clock::time_point time)
{
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    return std::chrono::year_month_day{
        std::chrono::year{local.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(local.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(local.tm_mday)}};
}


std::chrono::year_month_day local_today()
{
    return local_date(std::chrono::system_clock::now());
}


std::string get_executable_path()
{
#ifdef __linux__
    char result[PATH_MAX];
    const ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
    if (count > 0) {
        return path_to_utf8(std::filesystem::path(std::string(result, static_cast<size_t>(count))).parent_path());
    }
#endif
    std::error_code ec;
    return path_to_utf8(std::filesystem::current_path(ec));
}

} // namespace Utils

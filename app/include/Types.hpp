#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

enum class DateSource {
    Filename,
    ScannedPrefix,
    TextScan,
    FsTimestamp,
    User
};

inline std::string to_string(DateSource source) {
    switch (source) {
        case DateSource::Filename: return "FILENAME";
        case DateSource::ScannedPrefix: return "SCANNED_PREFIX";
        case DateSource::TextScan: return "TEXT_SCAN";
        case DateSource::FsTimestamp: return "FS_TIMESTAMP";
        case DateSource::User: return "USER";
        default: return "UNKNOWN";
    }
}

/**
 * @brief A date proposed by one stage of the resolution chain.
 */
struct DateCandidate {
    int year{0};
    int month{0};
    int day{0};
    DateSource source{DateSource::TextScan};
    bool confident{false};

    /**
     * @brief Flat YYYYMMDD rendering used for folder names and prompts.
     */
    std::string stamp() const {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d", year, month, day);
        return buffer;
    }

    bool same_date(const DateCandidate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator==(const DateCandidate& other) const = default;
};

/**
 * @brief Output of DateResolver::resolve.
 */
struct DateResolution {
    std::optional<DateCandidate> candidate;
    bool needs_confirmation{true};
};

struct RawFileEntry {
    std::filesystem::path path;
    std::string file_name;
    std::chrono::system_clock::time_point creation_time;
};

struct RefileTarget {
    std::filesystem::path dest_folder;
    std::filesystem::path dest_file;
};

struct RefileOutcome {
    RefileTarget target;
    bool moved{false};
    bool source_removed{false};
};

enum class FileScanOptions {
    None        = 0,
    HiddenFiles = 1 << 0
};

inline bool has_flag(FileScanOptions value, FileScanOptions flag) {
    return (static_cast<int>(value) & static_cast<int>(flag)) != 0;
}

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        default: return "info";
    }
}

inline std::optional<LogLevel> log_level_from_string(const std::string& value) {
    if (value == "debug") return LogLevel::Debug;
    if (value == "info") return LogLevel::Info;
    if (value == "warning") return LogLevel::Warning;
    if (value == "error") return LogLevel::Error;
    return std::nullopt;
}

#endif

#include "Settings.hpp"
#include "Types.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <cstdio>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <utility>


namespace {
constexpr const char* kAppName = "PdfRefile";
constexpr const char* kSection = "Settings";

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::optional<int> parse_int(const std::string& value) {
    try {
        size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed, 10);
        if (consumed != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool parse_bool_or(const std::string& value, bool fallback) {
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return fallback;
}
}


Settings::Settings()
    : Settings(define_config_path())
{
}


Settings::Settings(std::string config_file)
    : config_path(std::move(config_file))
{
}


std::string Settings::define_config_path()
{
    if (const char* override_root = std::getenv("PDF_REFILE_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / kAppName / "config.ini").string();
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return "config.ini";
    }
#if defined(__APPLE__)
    return std::string(home) + "/Library/Application Support/" + kAppName + "/config.ini";
#else
    return std::string(home) + "/.config/" + kAppName + "/config.ini";
#endif
}


std::string Settings::get_config_path() const
{
    return config_path;
}


int Settings::read_int(const std::string& key, int fallback, int min_value, int max_value) const
{
    if (!config.hasValue(kSection, key)) {
        return fallback;
    }
    const std::string raw = config.getValue(kSection, key);
    const auto parsed = parse_int(raw);
    if (!parsed || *parsed < min_value || *parsed > max_value) {
        settings_log(spdlog::level::warn, "Invalid value '{}' for {} in '{}'; using {}",
                     raw, key, config_path, fallback);
        return fallback;
    }
    return *parsed;
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    scan_dir = config.getValue(kSection, "ScanDir", scan_dir);
    dest_dir = config.getValue(kSection, "DestDir", dest_dir);
    log_file = config.getValue(kSection, "LogFile", log_file);
    dry_run = parse_bool_or(config.getValue(kSection, "DryRun", "false"), dry_run);
    include_hidden = parse_bool_or(config.getValue(kSection, "IncludeHidden", "false"), include_hidden);

    const std::string level_value = config.getValue(kSection, "LogLevel", to_string(log_level));
    if (auto level = log_level_from_string(level_value)) {
        log_level = *level;
    } else {
        settings_log(spdlog::level::warn, "Invalid value '{}' for LogLevel in '{}'; using {}",
                     level_value, config_path, to_string(log_level));
    }

    max_days_from_today = read_int("MaxDaysFromToday", max_days_from_today, 0, 36500);
    two_digit_year_pivot = read_int("TwoDigitYearPivot", two_digit_year_pivot, 0, 99);
    min_year = read_int("MinYear", min_year, 1, 9999);
    max_year = read_int("MaxYear", max_year, 1, 9999);
    ocr_timeout_seconds = read_int("OcrTimeoutSeconds", ocr_timeout_seconds, 1, 86400);

    if (min_year > max_year) {
        settings_log(spdlog::level::warn, "MinYear {} is after MaxYear {} in '{}'; using 1900-2050",
                     min_year, max_year, config_path);
        min_year = 1900;
        max_year = 2050;
    }

    settings_log(spdlog::level::debug,
                 "Loaded settings from '{}' (scan dir: '{}', dest dir: '{}', log level: {}, dry run: {})",
                 config_path, scan_dir, dest_dir, to_string(log_level), dry_run);
    return true;
}


bool Settings::save()
{
    config.setValue(kSection, "ScanDir", scan_dir);
    config.setValue(kSection, "DestDir", dest_dir);
    config.setValue(kSection, "LogLevel", to_string(log_level));
    config.setValue(kSection, "DryRun", dry_run ? "true" : "false");
    config.setValue(kSection, "LogFile", log_file);
    config.setValue(kSection, "IncludeHidden", include_hidden ? "true" : "false");
    config.setValue(kSection, "MaxDaysFromToday", std::to_string(max_days_from_today));
    config.setValue(kSection, "TwoDigitYearPivot", std::to_string(two_digit_year_pivot));
    config.setValue(kSection, "MinYear", std::to_string(min_year));
    config.setValue(kSection, "MaxYear", std::to_string(max_year));
    config.setValue(kSection, "OcrTimeoutSeconds", std::to_string(ocr_timeout_seconds));

    const std::filesystem::path config_dir = std::filesystem::path(config_path).parent_path();
    if (!config_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_dir, ec);
        if (ec) {
            settings_log(spdlog::level::err, "Error creating configuration directory: {}", ec.message());
            return false;
        }
    }
    return config.save(config_path);
}


std::string Settings::get_scan_dir() const
{
    return scan_dir;
}


void Settings::set_scan_dir(const std::string& path)
{
    scan_dir = path;
}


std::string Settings::get_dest_dir() const
{
    return dest_dir;
}


void Settings::set_dest_dir(const std::string& path)
{
    dest_dir = path;
}


LogLevel Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(LogLevel level)
{
    log_level = level;
}


bool Settings::get_dry_run() const
{
    return dry_run;
}


void Settings::set_dry_run(bool value)
{
    dry_run = value;
}


std::string Settings::get_log_file() const
{
    return log_file;
}


void Settings::set_log_file(const std::string& path)
{
    log_file = path;
}


bool Settings::get_include_hidden() const
{
    return include_hidden;
}


void Settings::set_include_hidden(bool value)
{
    include_hidden = value;
}


int Settings::get_max_days_from_today() const
{
    return max_days_from_today;
}


int Settings::get_two_digit_year_pivot() const
{
    return two_digit_year_pivot;
}


int Settings::get_min_year() const
{
    return min_year;
}


int Settings::get_max_year() const
{
    return max_year;
}


int Settings::get_ocr_timeout_seconds() const
{
    return ocr_timeout_seconds;
}


DateParser::Settings Settings::parser_settings() const
{
    DateParser::Settings settings;
    settings.two_digit_year_pivot = two_digit_year_pivot;
    settings.min_year = min_year;
    settings.max_year = max_year;
    return settings;
}


DateResolver::Settings Settings::resolver_settings() const
{
    DateResolver::Settings settings;
    settings.max_days_from_today = max_days_from_today;
    return settings;
}

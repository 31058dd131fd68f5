#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <DateParser.hpp>
#include <DateResolver.hpp>
#include <string>
#include <filesystem>


class Settings
{
public:
    Settings();
    explicit Settings(std::string config_file);

    /**
     * @brief Read the config file. A missing file keeps the defaults and returns false.
     */
    bool load();
    bool save();

    std::string get_scan_dir() const;
    void set_scan_dir(const std::string& path);

    std::string get_dest_dir() const;
    void set_dest_dir(const std::string& path);

    LogLevel get_log_level() const;
    void set_log_level(LogLevel level);

    bool get_dry_run() const;
    void set_dry_run(bool value);

    std::string get_log_file() const;
    void set_log_file(const std::string& path);

    bool get_include_hidden() const;
    void set_include_hidden(bool value);

    int get_max_days_from_today() const;
    int get_two_digit_year_pivot() const;
    int get_min_year() const;
    int get_max_year() const;
    int get_ocr_timeout_seconds() const;

    DateParser::Settings parser_settings() const;
    DateResolver::Settings resolver_settings() const;

    static std::string define_config_path();
    std::string get_config_path() const;

private:
    int read_int(const std::string& key, int fallback, int min_value, int max_value) const;

    std::string config_path;
    IniConfig config;

    std::string scan_dir;
    std::string dest_dir;
    LogLevel log_level{LogLevel::Info};
    bool dry_run{false};
    std::string log_file;
    bool include_hidden{false};
    int max_days_from_today{365};
    int two_digit_year_pivot{50};
    int min_year{1900};
    int max_year{2050};
    int ocr_timeout_seconds{600};
};

#endif

#include "IniConfig.hpp"
#include "Logger.hpp"
#include <cstdio>
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string trim_copy(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

bool should_skip_line(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

bool parse_section_header(const std::string& line, std::string& section)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        section = trim_copy(line.substr(1, line.size() - 2));
        return true;
    }
    return false;
}

// "value ; comment" -> "value"; quoted values keep everything between the quotes.
std::string clean_value(const std::string& raw)
{
    std::string value = trim_copy(raw);
    if (value.size() >= 2 && value.front() == '"') {
        const auto closing = value.find('"', 1);
        if (closing != std::string::npos) {
            return value.substr(1, closing - 1);
        }
    }
    for (size_t i = 1; i < value.size(); ++i) {
        if ((value[i] == ';' || value[i] == '#') && (value[i - 1] == ' ' || value[i - 1] == '\t')) {
            return trim_copy(value.substr(0, i));
        }
    }
    return value;
}

std::optional<std::pair<std::string, std::string>> parse_key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = trim_copy(line.substr(0, delimiter));
    std::string value = clean_value(line.substr(delimiter + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}

bool needs_quotes(const std::string& value)
{
    return !value.empty()
        && (value.front() == ' ' || value.back() == ' '
            || value.find(';') != std::string::npos || value.find('#') != std::string::npos);
}
}


bool IniConfig::load(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "Config file not readable: {}", filename);
        return false;
    }

    std::string raw_line;
    std::string section;
    int line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = trim_copy(raw_line);
        if (should_skip_line(line)) {
            continue;
        }
        if (parse_section_header(line, section)) {
            continue;
        }
        if (auto key_value = parse_key_value(line)) {
            data[section][key_value->first] = key_value->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed line {} in {}: '{}'", line_number, filename, line);
        }
    }
    return true;
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const {
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}


void IniConfig::setValue(const std::string &section, const std::string &key, const std::string &value) {
    data[section][key] = value;
}


bool IniConfig::save(const std::string &filename) const
{
    std::ofstream file(filename);

    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto &section : data) {
        file << "[" << section.first << "]\n";
        for (const auto &pair : section.second) {
            if (needs_quotes(pair.second)) {
                file << pair.first << " = \"" << pair.second << "\"\n";
            } else {
                file << pair.first << " = " << pair.second << "\n";
            }
        }
        file << "\n";
    }

    return static_cast<bool>(file);
}

bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return false;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it != sec_it->second.end();
}

#include "DateParser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <sstream>

namespace {

// A whole date shaped token with optional spaces around its two delimiters.
const std::regex kSpacedDateToken(
    R"((^|\s)(\d{2,4})\s*([-./])\s*(\d{2})\s*\3\s*(\d{2,4})(?=\s|$))");
const std::regex kDateToken(R"(^(\d{2,4})([-./])(\d{2})\2(\d{2,4})$)");
const std::regex kStamp(R"(^(\d{4})(\d{2})(\d{2})$)");
const std::regex kMonthNameDate(R"(^\s*([A-Za-z]+)\s+(\d{1,2}),\s*(\d{4})\s*$)");

constexpr std::array<const char*, 12> kMonthNames = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december"
};

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

int month_from_name(const std::string& name) {
    const std::string lowered = to_lower_copy(name);
    for (size_t i = 0; i < kMonthNames.size(); ++i) {
        const std::string full = kMonthNames[i];
        if (lowered == full || lowered == full.substr(0, 3)) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

// Components are at most four digits, so std::stoi cannot overflow; it always reads base 10.
int to_int(const std::string& digits) {
    return std::stoi(digits, nullptr, 10);
}

} // namespace


DateParser::DateParser()
    : DateParser(Settings{})
{
}


DateParser::DateParser(Settings settings)
    : settings_(settings)
{
}


std::string DateParser::normalize_delimiters(const std::string& line)
{
    return std::regex_replace(line, kSpacedDateToken, "$1$2$3$4$3$5");
}


std::optional<DateCandidate> DateParser::parse(const std::string& line) const
{
    const std::string normalized = normalize_delimiters(line);

    std::istringstream tokens(normalized);
    std::string token;
    std::smatch match;
    while (tokens >> token) {
        if (!std::regex_match(token, match, kDateToken)) {
            continue;
        }

        const std::string first = match.str(1);
        const char delimiter = match.str(2).front();
        const std::string second = match.str(3);
        const std::string third = match.str(4);

        std::string year_digits;
        std::string month_digits;
        std::string day_digits;
        if (delimiter == '/') {
            month_digits = first;
            day_digits = second;
            year_digits = third;
        } else if (first.size() == 4) {
            year_digits = first;
            month_digits = second;
            day_digits = third;
        } else {
            day_digits = first;
            month_digits = second;
            year_digits = third;
        }

        return make_candidate(expand_year(year_digits), to_int(month_digits),
                              to_int(day_digits), DateSource::TextScan);
    }
    return std::nullopt;
}


std::optional<DateCandidate> DateParser::parse_stamp(const std::string& text,
                                                     DateSource source) const
{
    std::smatch match;
    if (!std::regex_match(text, match, kStamp)) {
        return std::nullopt;
    }
    return make_candidate(to_int(match.str(1)), to_int(match.str(2)),
                          to_int(match.str(3)), source);
}


std::optional<DateCandidate> DateParser::parse_month_name(const std::string& text,
                                                          DateSource source) const
{
    std::smatch match;
    if (!std::regex_match(text, match, kMonthNameDate)) {
        return std::nullopt;
    }
    const int month = month_from_name(match.str(1));
    if (month == 0) {
        return std::nullopt;
    }
    return make_candidate(to_int(match.str(3)), month, to_int(match.str(2)), source);
}


bool DateParser::is_valid(int year, int month, int day) const
{
    return year >= settings_.min_year && year <= settings_.max_year
        && month >= 1 && month <= 12
        && day >= 1 && day <= 31;
}


std::optional<DateCandidate> DateParser::make_candidate(int year, int month, int day,
                                                        DateSource source) const
{
    if (!is_valid(year, month, day)) {
        return std::nullopt;
    }
    return DateCandidate{year, month, day, source, true};
}


int DateParser::expand_year(const std::string& digits) const
{
    const int value = to_int(digits);
    if (digits.size() != 2) {
        return value;
    }
    return value > settings_.two_digit_year_pivot ? 1900 + value : 2000 + value;
}

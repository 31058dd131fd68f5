#ifndef DATE_PARSER_HPP
#define DATE_PARSER_HPP

#include "Types.hpp"

#include <optional>
#include <string>

/**
 * @brief Finds a plausible date in one line of OCR text and normalizes it.
 *
 * Tokens shaped like D{2,4}<d>D{2}<d>D{2,4} are considered, with <d> one of
 * '-', '.', '/' used on both sides. A slash means month/day/year; any other
 * delimiter means year/month/day when the first group has four digits and
 * day/month/year otherwise.
 */
class DateParser {
public:
    /**
     * @brief Heuristics of the parser.
     */
    struct Settings {
        /**
         * @brief Two-digit years above this value map to 19xx, the rest to 20xx.
         */
        int two_digit_year_pivot = 50;
        /**
         * @brief Smallest accepted year.
         */
        int min_year = 1900;
        /**
         * @brief Largest accepted year.
         */
        int max_year = 2050;
    };

    DateParser();
    explicit DateParser(Settings settings);

    /**
     * @brief Parse the first date-shaped token of the line.
     * @return Candidate tagged TextScan, or std::nullopt when the line has no valid date.
     */
    std::optional<DateCandidate> parse(const std::string& line) const;

    /**
     * @brief Parse a flat YYYYMMDD stamp (exactly 8 digits, nothing else).
     */
    std::optional<DateCandidate> parse_stamp(const std::string& text,
                                             DateSource source) const;

    /**
     * @brief Parse "May 17, 2024" or "Sep 3, 2021" style dates.
     */
    std::optional<DateCandidate> parse_month_name(const std::string& text,
                                                  DateSource source) const;

    bool is_valid(int year, int month, int day) const;

    /**
     * @brief Remove whitespace around '-', '.' and '/' so "12 / 03 / 2020" reads "12/03/2020".
     *
     * Only spaced tokens that form a complete date shape are joined; a
     * separator between ordinary words, as in "Date - 15.03.2020", is left alone.
     */
    static std::string normalize_delimiters(const std::string& line);

private:
    std::optional<DateCandidate> make_candidate(int year, int month, int day,
                                                DateSource source) const;
    int expand_year(const std::string& digits) const;

    Settings settings_;
};

#endif

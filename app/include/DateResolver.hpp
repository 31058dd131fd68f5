#ifndef DATE_RESOLVER_HPP
#define DATE_RESOLVER_HPP

#include "DateParser.hpp"
#include "ITextExtractor.hpp"
#include "Types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

/**
 * @brief Picks the date of a document from its name, its text or its timestamp.
 *
 * Rules run in order and the first success wins:
 *   1. "YYYYMMDD-name.pdf" (or "YYYYMMDD_name.pdf")
 *   2. "Scanned_YYYYMMDD-name.pdf"
 *   3. "Vendor - Store - May 17, 2024.pdf"
 *   4. first line of extracted text holding a date
 *   5. file creation time, always confirmed by the operator
 * Text dates further than max_days_from_today from today are demoted to a
 * suggestion that needs confirmation. Filename dates are never demoted.
 */
class DateResolver {
public:
    struct Settings {
        int max_days_from_today = 365;
    };

    using TodayProvider = std::function<std::chrono::year_month_day()>;
    using LineSourceFactory = std::function<std::unique_ptr<TextLineSource>()>;

    DateResolver(DateParser parser,
                 Settings settings,
                 TodayProvider today,
                 std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Resolve using an already opened line source.
     */
    DateResolution resolve(const std::string& file_name,
                           std::chrono::system_clock::time_point creation_time,
                           TextLineSource& lines) const;

    /**
     * @brief Resolve, opening the line source only when the file name carries no date.
     */
    DateResolution resolve(const std::string& file_name,
                           std::chrono::system_clock::time_point creation_time,
                           const LineSourceFactory& open_lines) const;

    std::optional<DateCandidate> from_file_name(const std::string& file_name) const;
    std::optional<DateCandidate> from_text(TextLineSource& lines) const;
    std::optional<DateCandidate> from_timestamp(std::chrono::system_clock::time_point time) const;

    long days_from_today(const DateCandidate& candidate) const;
    bool is_stale(const DateCandidate& candidate) const;

private:
    DateResolution finish(std::optional<DateCandidate> candidate,
                          const std::string& file_name,
                          std::chrono::system_clock::time_point creation_time) const;

    DateParser parser_;
    Settings settings_;
    TodayProvider today_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif

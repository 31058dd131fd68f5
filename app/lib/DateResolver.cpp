#include "DateResolver.hpp"
#include "ErrorMessages.hpp"
#include "Utils.hpp"

#include <cstdlib>
#include <regex>
#include <utility>

#include <fmt/format.h>

namespace {
const std::regex kDatedFileName(R"(^(\d{8})[-_].*\.pdf$)");
const std::regex kScannedFileName(R"(^Scanned_(\d{8})-.*\.pdf$)");
const std::regex kReceiptFileName(R"(^.*\s-\s.*\s-\s([A-Za-z]+\s\d{1,2},\s\d{4})\.pdf$)");
}


DateResolver::DateResolver(DateParser parser,
                           Settings settings,
                           TodayProvider today,
                           std::shared_ptr<spdlog::logger> logger)
    : parser_(std::move(parser)),
      settings_(settings),
      today_(today ? std::move(today) : TodayProvider(&Utils::local_today)),
      logger_(std::move(logger))
{
}


DateResolution DateResolver::resolve(const std::string& file_name,
                                     std::chrono::system_clock::time_point creation_time,
                                     TextLineSource& lines) const
{
    auto candidate = from_file_name(file_name);
    if (!candidate) {
        candidate = from_text(lines);
    }
    return finish(std::move(candidate), file_name, creation_time);
}


DateResolution DateResolver::resolve(const std::string& file_name,
                                     std::chrono::system_clock::time_point creation_time,
                                     const LineSourceFactory& open_lines) const
{
    auto candidate = from_file_name(file_name);
    if (!candidate && open_lines) {
        if (auto lines = open_lines()) {
            candidate = from_text(*lines);
        }
    }
    return finish(std::move(candidate), file_name, creation_time);
}


DateResolution DateResolver::finish(std::optional<DateCandidate> candidate,
                                    const std::string& file_name,
                                    std::chrono::system_clock::time_point creation_time) const
{
    if (candidate) {
        if (candidate->source == DateSource::TextScan && is_stale(*candidate)) {
            if (logger_) {
                logger_->info("{}", fmt::format(fmt::runtime(MSG_STALE_DATE), settings_.max_days_from_today));
            }
            candidate->confident = false;
            return DateResolution{candidate, true};
        }
        return DateResolution{candidate, !candidate->confident};
    }

    if (logger_) {
        logger_->info("{}", fmt::format(fmt::runtime(MSG_NO_DATE_STAMP), file_name));
    }
    return DateResolution{from_timestamp(creation_time), true};
}


std::optional<DateCandidate> DateResolver::from_file_name(const std::string& file_name) const
{
    if (logger_) {
        logger_->debug("Attempting to extract date stamp from the file name...");
    }

    std::smatch match;
    std::optional<DateCandidate> candidate;
    if (std::regex_match(file_name, match, kDatedFileName)) {
        candidate = parser_.parse_stamp(match.str(1), DateSource::Filename);
    }
    if (!candidate && std::regex_match(file_name, match, kScannedFileName)) {
        candidate = parser_.parse_stamp(match.str(1), DateSource::ScannedPrefix);
    }
    if (!candidate && std::regex_match(file_name, match, kReceiptFileName)) {
        candidate = parser_.parse_month_name(match.str(1), DateSource::Filename);
    }

    if (candidate && logger_) {
        logger_->debug("Date stamp extracted from the file name: {}", candidate->stamp());
    }
    return candidate;
}


std::optional<DateCandidate> DateResolver::from_text(TextLineSource& lines) const
{
    if (logger_) {
        logger_->debug("Attempting to extract date stamp from the OCR'd text...");
    }

    while (auto line = lines.next_line()) {
        if (logger_) {
            logger_->trace("Trying to parse: {}", *line);
        }
        if (auto candidate = parser_.parse(*line)) {
            if (logger_) {
                logger_->debug("Date stamp extracted from OCR'd text: {} (line '{}')",
                               candidate->stamp(), *line);
            }
            return candidate;
        }
    }
    return std::nullopt;
}


std::optional<DateCandidate> DateResolver::from_timestamp(std::chrono::system_clock::time_point time) const
{
    const auto date = Utils::local_date(time);
    const int year = static_cast<int>(date.year());
    const int month = static_cast<int>(static_cast<unsigned>(date.month()));
    const int day = static_cast<int>(static_cast<unsigned>(date.day()));
    if (!parser_.is_valid(year, month, day)) {
        if (logger_) {
            logger_->debug("File timestamp {:04}-{:02}-{:02} is outside the accepted range",
                           year, month, day);
        }
        return std::nullopt;
    }
    return DateCandidate{year, month, day, DateSource::FsTimestamp, false};
}


long DateResolver::days_from_today(const DateCandidate& candidate) const
{
    // sys_days accepts days 29-31 of short months by rolling into the next month.
    const std::chrono::year_month_day date{
        std::chrono::year{candidate.year},
        std::chrono::month{static_cast<unsigned>(candidate.month)},
        std::chrono::day{static_cast<unsigned>(candidate.day)}};
    const auto difference = std::chrono::sys_days{today_()} - std::chrono::sys_days{date};
    return static_cast<long>(difference.count());
}


bool DateResolver::is_stale(const DateCandidate& candidate) const
{
    return std::labs(days_from_today(candidate)) > settings_.max_days_from_today;
}

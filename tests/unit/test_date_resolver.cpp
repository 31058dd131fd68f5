#include <catch2/catch_test_macros.hpp>
#include "DateResolver.hpp"
#include "Utils.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono;

namespace {
DateResolver make_resolver(year_month_day today, int max_days = 365) {
    DateResolver::Settings settings;
    settings.max_days_from_today = max_days;
    return DateResolver(DateParser{}, settings, [today]() { return today; });
}

const year_month_day kToday{year{2024}, month{6}, day{1}};

system_clock::time_point local_noon(int y, unsigned m, unsigned d) {
    // Noon keeps the local calendar date stable for any UTC offset below twelve hours.
    return sys_days{year_month_day{year{y}, month{m}, day{d}}} + hours{12};
}
}

TEST_CASE("dated file name wins without confirmation") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines({"Date: 2019-01-01"});

    const auto result = resolver.resolve("20240315-invoice.pdf", system_clock::now(), lines);
    REQUIRE(result.candidate.has_value());
    CHECK(result.candidate->stamp() == "20240315");
    CHECK(result.candidate->source == DateSource::Filename);
    CHECK(result.candidate->confident);
    CHECK_FALSE(result.needs_confirmation);
    CHECK(lines.consumed() == 0);
}

TEST_CASE("underscore separated dated file name is accepted") {
    auto resolver = make_resolver(kToday);
    const auto candidate = resolver.from_file_name("20240315_invoice.pdf");
    REQUIRE(candidate.has_value());
    CHECK(candidate->stamp() == "20240315");
}

TEST_CASE("scanned prefix is recognized") {
    auto resolver = make_resolver(kToday);
    const auto candidate = resolver.from_file_name("Scanned_20230102-letter.pdf");
    REQUIRE(candidate.has_value());
    CHECK(candidate->source == DateSource::ScannedPrefix);
    CHECK(candidate->stamp() == "20230102");
}

TEST_CASE("receipt file names carry a month name date") {
    auto resolver = make_resolver(kToday);
    const auto candidate = resolver.from_file_name("Receipt - CVS - May 17, 2024.pdf");
    REQUIRE(candidate.has_value());
    CHECK(candidate->source == DateSource::Filename);
    CHECK(candidate->stamp() == "20240517");
}

TEST_CASE("filename dates are never demoted for staleness") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines(std::vector<std::string>{});
    const auto result = resolver.resolve("19990101-old.pdf", system_clock::now(), lines);
    REQUIRE(result.candidate.has_value());
    CHECK(result.candidate->stamp() == "19990101");
    CHECK(result.candidate->confident);
    CHECK_FALSE(result.needs_confirmation);
}

TEST_CASE("invalid filename prefix falls through to the text") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines({"nothing", "Date: 2024-05-30", "2024-01-01"});

    const auto result = resolver.resolve("20241399-bad.pdf", system_clock::now(), lines);
    REQUIRE(result.candidate.has_value());
    CHECK(result.candidate->source == DateSource::TextScan);
    CHECK(result.candidate->stamp() == "20240530");
    CHECK_FALSE(result.needs_confirmation);
}

TEST_CASE("text scan stops pulling after the first match") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines({"header", "2024-05-30", "2024-05-31", "tail"});

    const auto candidate = resolver.from_text(lines);
    REQUIRE(candidate.has_value());
    CHECK(candidate->stamp() == "20240530");
    CHECK(lines.consumed() == 2);
}

TEST_CASE("line source factory is not called when the name has a date") {
    auto resolver = make_resolver(kToday);
    int opened = 0;
    const auto result = resolver.resolve("20240101-x.pdf", system_clock::now(), [&opened]() {
        ++opened;
        return std::unique_ptr<TextLineSource>(std::make_unique<VectorLineSource>(std::vector<std::string>{}));
    });
    CHECK(opened == 0);
    REQUIRE(result.candidate.has_value());
    CHECK(result.candidate->stamp() == "20240101");
}

TEST_CASE("text date further than the window needs confirmation") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines({"2020-01-01"});

    const auto result = resolver.resolve("scan.pdf", system_clock::now(), lines);
    REQUIRE(result.candidate.has_value());
    CHECK(result.candidate->stamp() == "20200101");
    CHECK(result.candidate->source == DateSource::TextScan);
    CHECK_FALSE(result.candidate->confident);
    CHECK(result.needs_confirmation);
}

TEST_CASE("staleness window boundary is strict") {
    // 2024-06-01 minus 365 days is 2023-06-02; minus 366 days is 2023-06-01.
    auto resolver = make_resolver(kToday);
    const DateCandidate exactly{2023, 6, 2, DateSource::TextScan, true};
    const DateCandidate one_more{2023, 6, 1, DateSource::TextScan, true};
    const DateCandidate future{2025, 6, 3, DateSource::TextScan, true};

    CHECK(resolver.days_from_today(exactly) == 365);
    CHECK_FALSE(resolver.is_stale(exactly));
    CHECK(resolver.days_from_today(one_more) == 366);
    CHECK(resolver.is_stale(one_more));
    CHECK(resolver.is_stale(future));
}

TEST_CASE("no date anywhere falls back to the file timestamp") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines({"hello", "world"});

    const auto result = resolver.resolve("scan.pdf", local_noon(2024, 2, 29), lines);
    REQUIRE(result.candidate.has_value());
    CHECK(result.candidate->source == DateSource::FsTimestamp);
    CHECK_FALSE(result.candidate->confident);
    CHECK(result.needs_confirmation);

    const auto expected = Utils::local_date(local_noon(2024, 2, 29));
    CHECK(result.candidate->year == static_cast<int>(expected.year()));
    CHECK(result.candidate->month == static_cast<int>(static_cast<unsigned>(expected.month())));
}

TEST_CASE("timestamp outside the accepted years leaves no suggestion") {
    auto resolver = make_resolver(kToday);
    VectorLineSource lines(std::vector<std::string>{});

    const auto result = resolver.resolve("scan.pdf", local_noon(1880, 1, 15), lines);
    CHECK_FALSE(result.candidate.has_value());
    CHECK(result.needs_confirmation);
}

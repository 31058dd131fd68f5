#include <catch2/catch_test_macros.hpp>
#include "DateParser.hpp"

#include <string>

namespace {
std::string stamp_of(const DateParser& parser, const std::string& line) {
    const auto candidate = parser.parse(line);
    return candidate ? candidate->stamp() : std::string("NONE");
}
}

TEST_CASE("four digit year first means year month day") {
    DateParser parser;
    CHECK(stamp_of(parser, "Invoice date 2020-03-15 due soon") == "20200315");
    CHECK(stamp_of(parser, "2020.03.15") == "20200315");
}

TEST_CASE("slash means month day year") {
    DateParser parser;
    CHECK(stamp_of(parser, "Statement 03/15/2020") == "20200315");
    CHECK(stamp_of(parser, "12/03/20") == "20201203");
}

TEST_CASE("dash or dot with short first group means day month year") {
    DateParser parser;
    CHECK(stamp_of(parser, "15-03-2020") == "20200315");
    CHECK(stamp_of(parser, "15.03.99") == "19990315");
}

TEST_CASE("whitespace around delimiters is collapsed") {
    DateParser parser;
    CHECK(stamp_of(parser, "Date: 12 / 03 / 2020") == "20201203");
    CHECK(DateParser::normalize_delimiters("15 - 03 - 2020 total") == "15-03-2020 total");
    CHECK(stamp_of(parser, "2020 / 03 / 15 report") == stamp_of(parser, "2020/03/15 report"));
}

TEST_CASE("separators between words do not swallow a date token") {
    DateParser parser;
    CHECK(stamp_of(parser, "Date - 15.03.2020") == "20200315");
    CHECK(stamp_of(parser, "Invoice no 4 - 15-03-2020") == "20200315");
    CHECK(stamp_of(parser, "Total / 12/03/2020") == "20201203");
    CHECK(DateParser::normalize_delimiters("Date - 15.03.2020") == "Date - 15.03.2020");
}

TEST_CASE("two digit years pivot at fifty") {
    DateParser parser;
    CHECK(stamp_of(parser, "01-02-50") == "20500201");
    CHECK(stamp_of(parser, "01-02-51") == "19510201");
    CHECK(stamp_of(parser, "01-02-00") == "20000201");
}

TEST_CASE("mixed delimiters do not match") {
    DateParser parser;
    CHECK(stamp_of(parser, "2020-03/15") == "NONE");
    CHECK(stamp_of(parser, "15.03-2020") == "NONE");
}

TEST_CASE("out of range components yield no date") {
    DateParser parser;
    CHECK(stamp_of(parser, "13/40/2020") == "NONE");
    CHECK(stamp_of(parser, "2020-13-01") == "NONE");
    CHECK(stamp_of(parser, "2051-01-01") == "NONE");
    CHECK(stamp_of(parser, "1899-12-31") == "NONE");
}

TEST_CASE("components with a leading zero are read as decimal") {
    DateParser parser;
    CHECK(stamp_of(parser, "2020-08-09") == "20200809");
    CHECK(stamp_of(parser, "09/08/2020") == "20200908");
}

TEST_CASE("year first with a slash is month day year and fails validation") {
    DateParser parser;
    CHECK(stamp_of(parser, "2020/03/15") == "NONE");
}

TEST_CASE("only whole tokens are considered") {
    DateParser parser;
    CHECK(stamp_of(parser, "ref2020-03-15") == "NONE");
    CHECK(stamp_of(parser, "no dates here, only 42 words") == "NONE");
    CHECK(stamp_of(parser, "") == "NONE");
}

TEST_CASE("first date shaped token wins") {
    DateParser parser;
    CHECK(stamp_of(parser, "from 2021-01-02 to 2021-05-06") == "20210102");
}

TEST_CASE("parse result is a confident text scan candidate") {
    DateParser parser;
    const auto candidate = parser.parse("2022-07-04");
    REQUIRE(candidate.has_value());
    CHECK(candidate->source == DateSource::TextScan);
    CHECK(candidate->confident);
    CHECK(candidate->year == 2022);
    CHECK(candidate->month == 7);
    CHECK(candidate->day == 4);
}

TEST_CASE("parse_stamp accepts exactly eight valid digits") {
    DateParser parser;
    const auto candidate = parser.parse_stamp("20240517", DateSource::User);
    REQUIRE(candidate.has_value());
    CHECK(candidate->source == DateSource::User);
    CHECK(candidate->stamp() == "20240517");

    CHECK_FALSE(parser.parse_stamp("2024051", DateSource::User));
    CHECK_FALSE(parser.parse_stamp("202405170", DateSource::User));
    CHECK_FALSE(parser.parse_stamp("2024-05-17", DateSource::User));
    CHECK_FALSE(parser.parse_stamp("20241317", DateSource::User));
    CHECK_FALSE(parser.parse_stamp("30000101", DateSource::User));
}

TEST_CASE("parse_month_name reads full and short month names") {
    DateParser parser;
    const auto full = parser.parse_month_name("May 17, 2024", DateSource::Filename);
    REQUIRE(full.has_value());
    CHECK(full->stamp() == "20240517");

    const auto short_name = parser.parse_month_name("sep 3, 2021", DateSource::Filename);
    REQUIRE(short_name.has_value());
    CHECK(short_name->stamp() == "20210903");

    CHECK_FALSE(parser.parse_month_name("Smarch 3, 2021", DateSource::Filename));
    CHECK_FALSE(parser.parse_month_name("May 17 2024", DateSource::Filename));
}

TEST_CASE("year bounds and pivot are configurable") {
    DateParser::Settings settings;
    settings.two_digit_year_pivot = 30;
    settings.min_year = 1930;
    settings.max_year = 2100;
    DateParser parser(settings);

    CHECK(stamp_of(parser, "01-02-40") == "19400201");
    CHECK(stamp_of(parser, "01-02-2099") == "20990201");
    CHECK(stamp_of(parser, "01-02-1920") == "NONE");
    CHECK_FALSE(parser.is_valid(1929, 1, 1));
    CHECK(parser.is_valid(2100, 12, 31));
}

#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "Refiler.hpp"
#include "TestHelpers.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <sstream>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

namespace {
const DateCandidate kDate{2024, 3, 15, DateSource::Filename, true};
}

TEST_CASE("date folder is YYYY/MM/DD under the destination") {
    CHECK(Refiler::date_folder("/archive", kDate) == std::filesystem::path("/archive/2024/03/15"));
    const DateCandidate early{2001, 1, 2, DateSource::User, true};
    CHECK(Refiler::date_folder("/archive", early) == std::filesystem::path("/archive/2001/01/02"));
}

TEST_CASE("refile moves the processed file and removes the original") {
    TempDir scan;
    TempDir dest;
    const auto original = scan.path() / "invoice.pdf";
    const auto processed = scan.path() / "processed.pdf";
    write_file(original, "original");
    write_file(processed, "searchable");

    Refiler refiler;
    const auto outcome = refiler.refile(original, processed, "invoice.pdf", kDate, dest.path(), false);

    const auto expected = dest.path() / "2024" / "03" / "15" / "invoice.pdf";
    CHECK(outcome.target.dest_file == expected);
    CHECK(outcome.moved);
    CHECK(outcome.source_removed);
    CHECK(read_file(expected) == "searchable");
    CHECK_FALSE(std::filesystem::exists(original));
    CHECK_FALSE(std::filesystem::exists(processed));
}

TEST_CASE("existing names get a numeric suffix") {
    TempDir scan;
    TempDir dest;
    const auto folder = dest.path() / "2024" / "03" / "15";
    write_file(folder / "name.pdf", "first");
    write_file(folder / "name_1.pdf", "second");

    const auto original = scan.path() / "name.pdf";
    const auto processed = scan.path() / "work.pdf";
    write_file(original, "original");
    write_file(processed, "third");

    Refiler refiler;
    const auto outcome = refiler.refile(original, processed, "name.pdf", kDate, dest.path(), false);
    CHECK(outcome.target.dest_file == folder / "name_2.pdf");
    CHECK(read_file(folder / "name.pdf") == "first");
    CHECK(read_file(folder / "name_1.pdf") == "second");
    CHECK(read_file(folder / "name_2.pdf") == "third");
}

TEST_CASE("unique_destination keeps free names") {
    TempDir dest;
    CHECK(Refiler::unique_destination(dest.path(), "a.pdf") == dest.path() / "a.pdf");
    write_file(dest.path() / "a.pdf");
    CHECK(Refiler::unique_destination(dest.path(), "a.pdf") == dest.path() / "a_1.pdf");
}

TEST_CASE("reserved paths count as taken") {
    TempDir dest;
    const std::set<std::filesystem::path> reserved{dest.path() / "a.pdf", dest.path() / "a_1.pdf"};
    CHECK(Refiler::unique_destination(dest.path(), "a.pdf", reserved) == dest.path() / "a_2.pdf");

    Refiler refiler;
    const auto folder = dest.path() / "2024" / "03" / "15";
    const auto target = refiler.plan("x.pdf", kDate, dest.path(), {folder / "x.pdf"});
    CHECK(target.dest_file == folder / "x_1.pdf");
}

TEST_CASE("dry run plans without touching anything") {
    TempDir scan;
    TempDir dest;
    const auto original = scan.path() / "invoice.pdf";
    const auto processed = scan.path() / "processed.pdf";
    write_file(original);
    write_file(processed);

    Refiler refiler;
    const auto outcome = refiler.refile(original, processed, "invoice.pdf", kDate, dest.path(), true);
    CHECK(outcome.target.dest_file == dest.path() / "2024" / "03" / "15" / "invoice.pdf");
    CHECK_FALSE(outcome.moved);
    CHECK_FALSE(outcome.source_removed);
    CHECK(std::filesystem::exists(original));
    CHECK(std::filesystem::exists(processed));
    CHECK_FALSE(std::filesystem::exists(dest.path() / "2024"));
}

TEST_CASE("missing processed file fails and keeps the original") {
    TempDir scan;
    TempDir dest;
    const auto original = scan.path() / "invoice.pdf";
    write_file(original);

    Refiler refiler;
    try {
        refiler.refile(original, scan.path() / "gone.pdf", "invoice.pdf", kDate, dest.path(), false);
        FAIL("refile should throw");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::FILE_NOT_FOUND);
    }
    CHECK(std::filesystem::exists(original));
}

TEST_CASE("blocked date folder fails without deleting the original") {
    TempDir scan;
    TempDir dest;
    write_file(dest.path() / "2024", "a file where the year folder should be");
    const auto original = scan.path() / "invoice.pdf";
    const auto processed = scan.path() / "processed.pdf";
    write_file(original);
    write_file(processed);

    Refiler refiler;
    try {
        refiler.refile(original, processed, "invoice.pdf", kDate, dest.path(), false);
        FAIL("refile should throw");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::DIRECTORY_CREATE_FAILED);
    }
    CHECK(std::filesystem::exists(original));
    CHECK(std::filesystem::exists(processed));
}

TEST_CASE("failing to delete the original after the move is reported but not fatal") {
    TempDir scan;
    TempDir dest;
    const auto processed = scan.path() / "processed.pdf";
    write_file(processed, "searchable");

    std::ostringstream log_output;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
    auto logger = std::make_shared<spdlog::logger>("refiler_test", sink);

    Refiler refiler(logger);
    RefileOutcome outcome;
    REQUIRE_NOTHROW(outcome = refiler.refile(scan.path() / "already-gone.pdf", processed,
                                             "invoice.pdf", kDate, dest.path(), false));
    logger->flush();

    const auto expected = dest.path() / "2024" / "03" / "15" / "invoice.pdf";
    CHECK(outcome.moved);
    CHECK_FALSE(outcome.source_removed);
    CHECK(outcome.target.dest_file == expected);
    CHECK(read_file(expected) == "searchable");
    CHECK(log_output.str().find("Error 1202") != std::string::npos);
}

#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "RefilePipeline.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

using namespace std::chrono;
namespace fs = std::filesystem;

namespace {
DateResolver fixed_resolver() {
    return DateResolver(DateParser{}, DateResolver::Settings{},
                        []() { return year_month_day{year{2024}, month{6}, day{1}}; });
}

struct PipelineFixture {
    explicit PipelineFixture(std::vector<std::string> text_lines = {"Statement date: 2024-05-30"},
                             const std::string& operator_input = "")
        : extractor(std::move(text_lines)),
          input(operator_input),
          confirm(DateParser{}, input, output),
          pipeline(FileScanner{}, ocr, extractor, fixed_resolver(), confirm, Refiler{})
    {
    }

    QtCoreContext qt;
    TempDir scan;
    TempDir dest;
    CopyingOcrEngine ocr;
    FixedTextExtractor extractor;
    std::istringstream input;
    std::ostringstream output;
    InteractiveConfirm confirm;
    RefilePipeline pipeline;
};
}

TEST_CASE("pipeline refiles every document into the datetree") {
    PipelineFixture fixture;
    write_file(fixture.scan.path() / "20240315-invoice.pdf", "invoice");
    write_file(fixture.scan.path() / "scan.pdf", "scan");

    const auto summary = fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), false);
    CHECK(summary.processed_count() == 2);
    CHECK(summary.skipped_count() == 0);

    CHECK(read_file(fixture.dest.path() / "2024" / "03" / "15" / "20240315-invoice.pdf") == "invoice");
    CHECK(read_file(fixture.dest.path() / "2024" / "05" / "30" / "scan.pdf") == "scan");
    CHECK_FALSE(fs::exists(fixture.scan.path() / "20240315-invoice.pdf"));
    CHECK_FALSE(fs::exists(fixture.scan.path() / "scan.pdf"));
    CHECK(fixture.extractor.open_count == 1);
}

TEST_CASE("same name on the same date gets a suffix") {
    PipelineFixture fixture;
    write_file(fixture.scan.path() / "a" / "name.pdf", "first");
    write_file(fixture.scan.path() / "b" / "name.pdf", "second");

    const auto summary = fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), false);
    REQUIRE(summary.processed_count() == 2);

    const auto folder = fixture.dest.path() / "2024" / "05" / "30";
    CHECK(read_file(folder / "name.pdf") == "first");
    CHECK(read_file(folder / "name_1.pdf") == "second");
}

TEST_CASE("dry run plans the same suffixes as a real run") {
    PipelineFixture fixture;
    write_file(fixture.scan.path() / "a" / "name.pdf", "first");
    write_file(fixture.scan.path() / "b" / "name.pdf", "second");

    const auto summary = fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), true);
    REQUIRE(summary.processed_count() == 2);

    const auto folder = fixture.dest.path() / "2024" / "05" / "30";
    std::vector<fs::path> planned;
    for (const auto& result : summary.results) {
        planned.push_back(std::get<ProcessedFile>(result).outcome.target.dest_file);
    }
    CHECK(planned == std::vector<fs::path>{folder / "name.pdf", folder / "name_1.pdf"});
    CHECK_FALSE(fs::exists(fixture.dest.path() / "2024"));
}

TEST_CASE("dry run leaves scan and destination untouched") {
    PipelineFixture fixture;
    write_file(fixture.scan.path() / "scan.pdf", "scan");

    const auto summary = fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), true);
    REQUIRE(summary.results.size() == 1);
    const auto* processed = std::get_if<ProcessedFile>(&summary.results.front());
    REQUIRE(processed != nullptr);
    CHECK_FALSE(processed->outcome.moved);
    CHECK(processed->outcome.target.dest_file == fixture.dest.path() / "2024" / "05" / "30" / "scan.pdf");

    CHECK(read_file(fixture.scan.path() / "scan.pdf") == "scan");
    CHECK(fs::is_empty(fixture.dest.path()));
}

TEST_CASE("OCR failure skips the file and the run continues") {
    PipelineFixture fixture;
    fixture.ocr.failing_names = {"bad.pdf"};
    write_file(fixture.scan.path() / "bad.pdf", "bad");
    write_file(fixture.scan.path() / "good.pdf", "good");

    const auto summary = fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), false);
    REQUIRE(summary.results.size() == 2);
    CHECK(summary.processed_count() == 1);
    CHECK(summary.skipped_count() == 1);

    const auto* skipped = std::get_if<SkippedFile>(&summary.results.front());
    REQUIRE(skipped != nullptr);
    CHECK(skipped->entry.file_name == "bad.pdf");
    CHECK(skipped->code == ErrorCodes::Code::PROCESSING_OCR_FAILED);
    CHECK(fs::exists(fixture.scan.path() / "bad.pdf"));
    CHECK(fs::exists(fixture.dest.path() / "2024" / "05" / "30" / "good.pdf"));
}

TEST_CASE("documents without a date are confirmed by the operator") {
    PipelineFixture fixture({"no date in this text"}, "20240101\n");
    write_file(fixture.scan.path() / "letter.pdf", "letter");

    const auto summary = fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), false);
    REQUIRE(summary.processed_count() == 1);
    const auto& processed = std::get<ProcessedFile>(summary.results.front());
    CHECK(processed.date.source == DateSource::User);
    CHECK(fs::exists(fixture.dest.path() / "2024" / "01" / "01" / "letter.pdf"));
    CHECK(fixture.output.str().find("letter.pdf (YYYYMMDD)") != std::string::npos);
}

TEST_CASE("temporary workspace is removed after the run") {
    PipelineFixture fixture;
    write_file(fixture.scan.path() / "scan.pdf");

    fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), true);
    REQUIRE_FALSE(fixture.ocr.outputs.empty());
    CHECK_FALSE(fs::exists(fixture.ocr.outputs.front().parent_path()));
}

TEST_CASE("closed operator input aborts the run and still removes the workspace") {
    PipelineFixture fixture({"nothing useful"}, "");
    write_file(fixture.scan.path() / "first.pdf", "first");
    write_file(fixture.scan.path() / "second.pdf", "second");

    try {
        fixture.pipeline.run(fixture.scan.path(), fixture.dest.path(), false);
        FAIL("run should be interrupted");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::PROCESSING_INTERRUPTED);
    }

    REQUIRE(fixture.ocr.outputs.size() == 1);
    CHECK_FALSE(fs::exists(fixture.ocr.outputs.front().parent_path()));
    CHECK(fs::exists(fixture.scan.path() / "first.pdf"));
    CHECK(fs::exists(fixture.scan.path() / "second.pdf"));
}

TEST_CASE("missing destination is fatal before any file is processed") {
    PipelineFixture fixture;
    write_file(fixture.scan.path() / "scan.pdf");

    try {
        fixture.pipeline.run(fixture.scan.path(), fixture.dest.path() / "absent", false);
        FAIL("run should throw");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::DIRECTORY_NOT_FOUND);
    }
    CHECK(fixture.ocr.outputs.empty());
}

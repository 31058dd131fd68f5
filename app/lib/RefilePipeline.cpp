#include "RefilePipeline.hpp"
#include "AppException.hpp"
#include "InterruptGuard.hpp"
#include "Utils.hpp"

#include <QDir>
#include <QTemporaryDir>

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {
void remove_artifact(const fs::path& path)
{
    std::error_code ec;
    fs::remove(path, ec);
}
}


size_t RunSummary::processed_count() const
{
    return static_cast<size_t>(std::count_if(results.begin(), results.end(), [](const FileResult& result) {
        return std::holds_alternative<ProcessedFile>(result);
    }));
}


size_t RunSummary::skipped_count() const
{
    return results.size() - processed_count();
}


RefilePipeline::RefilePipeline(FileScanner scanner,
                               IOcrEngine& ocr,
                               ITextExtractor& extractor,
                               DateResolver resolver,
                               const InteractiveConfirm& confirm,
                               Refiler refiler,
                               std::shared_ptr<spdlog::logger> logger,
                               FileScanOptions scan_options)
    : scanner_(std::move(scanner)),
      ocr_(ocr),
      extractor_(extractor),
      resolver_(std::move(resolver)),
      confirm_(confirm),
      refiler_(std::move(refiler)),
      logger_(std::move(logger)),
      scan_options_(scan_options)
{
}


RunSummary RefilePipeline::run(const fs::path& scan_dir, const fs::path& dest_dir, bool dry_run)
{
    const std::string dest_label = Utils::path_to_utf8(dest_dir);
    if (!Utils::is_valid_directory(dest_label)) {
        if (logger_) {
            logger_->error("Destination directory {} does not exist.", dest_label);
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, dest_label);
    }
    const auto entries = scanner_.get_pdf_entries(Utils::path_to_utf8(scan_dir), scan_options_);

    QTemporaryDir workspace(QDir::tempPath() + QStringLiteral("/pdf-refile-XXXXXX"));
    if (!workspace.isValid()) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_INIT_FAILED,
                        "temporary workspace: " + workspace.errorString().toStdString());
    }
    const fs::path workspace_path = Utils::utf8_to_path(workspace.path().toStdString());
    if (logger_) {
        logger_->debug("Working directory: {}", workspace.path().toStdString());
    }

    RunSummary summary;
    summary.dry_run = dry_run;
    // Dry-run destinations, so later files with the same name and date get the next suffix.
    std::set<fs::path> planned;
    size_t index = 0;
    for (const auto& entry : entries) {
        InterruptGuard::throw_if_interrupted("Run stopped before " + entry.file_name);
        const fs::path processed_path = workspace_path / (std::to_string(++index) + ".pdf");
        summary.results.push_back(process_file(entry, processed_path, dest_dir, dry_run, planned));
        remove_artifact(processed_path);
        if (const auto* processed = std::get_if<ProcessedFile>(&summary.results.back());
            processed && dry_run) {
            planned.insert(processed->outcome.target.dest_file);
        }
    }

    log_summary(summary);
    return summary;
}


FileResult RefilePipeline::process_file(const RawFileEntry& entry,
                                        const fs::path& processed_path,
                                        const fs::path& dest_dir,
                                        bool dry_run,
                                        const std::set<fs::path>& planned)
{
    const std::string label = Utils::path_to_utf8(entry.path);
    if (logger_) {
        logger_->info("Processing {}...", label);
    }

    try {
        std::error_code ec;
        if (!fs::exists(entry.path, ec)) {
            THROW_APP_ERROR(ErrorCodes::Code::FILE_NOT_FOUND, label);
        }

        ocr_.make_searchable(entry.path, processed_path);

        const DateResolution resolution = resolver_.resolve(
            entry.file_name, entry.creation_time,
            [&]() { return extractor_.open(processed_path); });
        const DateCandidate date = confirm_.confirm(resolution, entry.path);
        if (logger_) {
            logger_->info("Date stamp: {}", date.stamp());
            logger_->debug("Date source: {}", to_string(date.source));
        }

        RefileOutcome outcome = refiler_.refile(entry.path, processed_path, entry.file_name,
                                                date, dest_dir, dry_run, planned);
        return ProcessedFile{entry, date, std::move(outcome)};
    } catch (const ErrorCodes::AppException& ex) {
        if (ex.get_error_code() == ErrorCodes::Code::PROCESSING_INTERRUPTED) {
            throw;
        }
        if (logger_) {
            logger_->warn("Skipping {}: {}", label, ex.what());
        }
        return SkippedFile{entry, ex.what(), ex.get_error_code()};
    } catch (const fs::filesystem_error& ex) {
        if (logger_) {
            logger_->warn("Skipping {}: {}", label, ex.what());
        }
        return SkippedFile{entry, ex.what(), ErrorCodes::Code::FILE_MOVE_FAILED};
    }
}


void RefilePipeline::log_summary(const RunSummary& summary) const
{
    if (!logger_) {
        return;
    }
    for (const auto& result : summary.results) {
        if (const auto* skipped = std::get_if<SkippedFile>(&result)) {
            logger_->warn("Not refiled: {} ({})", Utils::path_to_utf8(skipped->entry.path), skipped->reason);
        }
    }
    logger_->info("{} {} file(s), skipped {}",
                  summary.dry_run ? "Dry run planned" : "Refiled",
                  summary.processed_count(), summary.skipped_count());
}

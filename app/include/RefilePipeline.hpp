#ifndef REFILE_PIPELINE_HPP
#define REFILE_PIPELINE_HPP

#include "DateResolver.hpp"
#include "ErrorCode.hpp"
#include "FileScanner.hpp"
#include "IOcrEngine.hpp"
#include "ITextExtractor.hpp"
#include "InteractiveConfirm.hpp"
#include "Refiler.hpp"
#include "Types.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <spdlog/logger.h>

struct ProcessedFile {
    RawFileEntry entry;
    DateCandidate date;
    RefileOutcome outcome;
};

struct SkippedFile {
    RawFileEntry entry;
    std::string reason;
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
};

using FileResult = std::variant<ProcessedFile, SkippedFile>;

struct RunSummary {
    std::vector<FileResult> results;
    bool dry_run{false};

    size_t processed_count() const;
    size_t skipped_count() const;
};

/**
 * @brief One refiling pass: scan, OCR, date, confirm, move. Files are handled one at a time.
 *
 * The OCR engine, the text extractor and the prompt are borrowed and must
 * outlive the pipeline.
 */
class RefilePipeline {
public:
    RefilePipeline(FileScanner scanner,
                   IOcrEngine& ocr,
                   ITextExtractor& extractor,
                   DateResolver resolver,
                   const InteractiveConfirm& confirm,
                   Refiler refiler,
                   std::shared_ptr<spdlog::logger> logger = nullptr,
                   FileScanOptions scan_options = FileScanOptions::None);

    /**
     * @brief Process every PDF under scan_dir into the datetree rooted at dest_dir.
     *
     * Per-file failures become SkippedFile results.
     * @throws ErrorCodes::AppException DIRECTORY_NOT_FOUND or SYSTEM_INIT_FAILED before any file
     *         is touched, PROCESSING_INTERRUPTED on a signal or closed operator input.
     */
    RunSummary run(const std::filesystem::path& scan_dir,
                   const std::filesystem::path& dest_dir,
                   bool dry_run);

private:
    FileResult process_file(const RawFileEntry& entry,
                            const std::filesystem::path& processed_path,
                            const std::filesystem::path& dest_dir,
                            bool dry_run,
                            const std::set<std::filesystem::path>& planned);
    void log_summary(const RunSummary& summary) const;

    FileScanner scanner_;
    IOcrEngine& ocr_;
    ITextExtractor& extractor_;
    DateResolver resolver_;
    const InteractiveConfirm& confirm_;
    Refiler refiler_;
    std::shared_ptr<spdlog::logger> logger_;
    FileScanOptions scan_options_;
};

#endif

#ifndef EXTERNAL_TOOLS_HPP
#define EXTERNAL_TOOLS_HPP

#include "IOcrEngine.hpp"
#include "ITextExtractor.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace ExternalTools {

/**
 * @brief Absolute path of an executable found on PATH.
 */
std::optional<std::string> find_executable(const std::string& name);

/**
 * @throws ErrorCodes::AppException SYSTEM_DEPENDENCY_MISSING naming the first tool not on PATH.
 */
void check_dependencies(const std::vector<std::string>& names);

/**
 * @brief Hand the document to the desktop viewer without waiting for it.
 */
bool open_in_viewer(const std::filesystem::path& document);

} // namespace ExternalTools


/**
 * @brief OCR through the ocrmypdf command line tool.
 *
 * Pages that already carry text are left alone (--skip-text).
 */
class OcrMyPdfEngine : public IOcrEngine {
public:
    explicit OcrMyPdfEngine(int timeout_seconds = 600,
                            std::shared_ptr<spdlog::logger> logger = nullptr);

    void make_searchable(const std::filesystem::path& input,
                         const std::filesystem::path& output) override;

private:
    int timeout_seconds_;
    std::shared_ptr<spdlog::logger> logger_;
};


/**
 * @brief Text lines streamed from "pdftotext <pdf> -".
 */
class PdfToTextExtractor : public ITextExtractor {
public:
    explicit PdfToTextExtractor(int timeout_seconds = 600,
                                std::shared_ptr<spdlog::logger> logger = nullptr);

    std::unique_ptr<TextLineSource> open(const std::filesystem::path& searchable_pdf) override;

private:
    int timeout_seconds_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif

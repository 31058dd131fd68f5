#ifndef FILE_SCANNER_HPP
#define FILE_SCANNER_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include "Types.hpp"

#include <spdlog/logger.h>

namespace fs = std::filesystem;

class FileScanner {
public:
    FileScanner() = default;
    explicit FileScanner(std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief PDF files of the directory and of its direct sub-directories, sorted by path.
     * @throws ErrorCodes::AppException DIRECTORY_NOT_FOUND when the directory is missing.
     */
    std::vector<RawFileEntry>
        get_pdf_entries(const std::string &directory_path,
                        FileScanOptions options) const;

private:
    struct ScanContext;
    std::optional<RawFileEntry> build_entry(const fs::directory_entry& entry,
                                            const ScanContext& context) const;
    bool should_skip_entry(const fs::path& entry_path,
                           const std::string& file_name,
                           const ScanContext& context,
                           const std::string& full_path) const;
    bool is_file_hidden(const fs::path &path) const;
    bool is_pdf(const fs::path& path) const;

    std::shared_ptr<spdlog::logger> logger_;
};

#endif

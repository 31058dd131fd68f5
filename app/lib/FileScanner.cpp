#include "FileScanner.hpp"
#include "AppException.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace {
// The scan directory itself is depth 0; its direct sub-directories are depth 1.
constexpr int kMaxDescentDepth = 1;
}

struct FileScanner::ScanContext {
    bool include_hidden{false};
};

FileScanner::FileScanner(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
}

std::vector<RawFileEntry>
FileScanner::get_pdf_entries(const std::string &directory_path,
                             FileScanOptions options) const
{
    std::vector<RawFileEntry> entries;

    if (logger_) {
        logger_->debug("Scanning directory '{}' with options mask {}", directory_path, static_cast<int>(options));
    }

    if (!Utils::is_valid_directory(directory_path)) {
        if (logger_) {
            logger_->error("Directory {} does not exist.", directory_path);
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_NOT_FOUND, directory_path);
    }

    ScanContext context;
    context.include_hidden = has_flag(options, FileScanOptions::HiddenFiles);

    try {
        const fs::path scan_path = Utils::utf8_to_path(directory_path);
        for (auto it = fs::recursive_directory_iterator(scan_path,
                                                        fs::directory_options::skip_permission_denied);
             it != fs::recursive_directory_iterator(); ++it) {
            const auto& entry = *it;
            if (entry.is_directory()) {
                const bool hidden = is_file_hidden(entry.path()) && !context.include_hidden;
                if (hidden || it.depth() >= kMaxDescentDepth) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (auto entry_info = build_entry(entry, context)) {
                entries.push_back(std::move(*entry_info));
            }
        }
    } catch (const fs::filesystem_error& ex) {
        if (logger_) {
            logger_->warn("Error while scanning '{}': {}", directory_path, ex.what());
        }
        throw;
    }

    std::sort(entries.begin(), entries.end(), [](const RawFileEntry& lhs, const RawFileEntry& rhs) {
        return lhs.path < rhs.path;
    });

    if (logger_) {
        logger_->debug("Directory scan complete for '{}': {} PDF file(s) queued", directory_path,
                       entries.size());
    }

    return entries;
}


bool FileScanner::is_file_hidden(const fs::path &path) const {
#ifdef _WIN32
    DWORD attrs = GetFileAttributesW(path.c_str());
    return (attrs != INVALID_FILE_ATTRIBUTES) &&
           (attrs & FILE_ATTRIBUTE_HIDDEN);
#else
    return path.filename().string().starts_with(".");
#endif
}


bool FileScanner::is_pdf(const fs::path& path) const {
    return path.extension() == ".pdf";
}

std::optional<RawFileEntry> FileScanner::build_entry(const fs::directory_entry& entry,
                                                     const ScanContext& context) const
{
    const fs::path& entry_path = entry.path();
    std::string full_path = Utils::path_to_utf8(entry_path);
    std::string file_name = Utils::path_to_utf8(entry_path.filename());

    if (should_skip_entry(entry_path, file_name, context, full_path)) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!entry.is_regular_file(ec) || !is_pdf(entry_path)) {
        return std::nullopt;
    }

    try {
        return RawFileEntry{entry_path, std::move(file_name), Utils::file_creation_time(entry_path)};
    } catch (const fs::filesystem_error& ex) {
        if (logger_) {
            logger_->warn("Skipping '{}': {}", full_path, ex.what());
        }
        return std::nullopt;
    }
}

bool FileScanner::should_skip_entry(const fs::path& entry_path,
                                    const std::string& file_name,
                                    const ScanContext& context,
                                    const std::string& full_path) const
{
    if (is_file_hidden(entry_path) && !context.include_hidden) {
        if (logger_) {
            logger_->trace("Skipping hidden entry '{}' ({})", full_path, file_name);
        }
        return true;
    }

    return false;
}

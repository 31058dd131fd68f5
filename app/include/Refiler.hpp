#ifndef REFILER_HPP
#define REFILER_HPP

#include "Types.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <string>

#include <spdlog/logger.h>

namespace fs = std::filesystem;

/**
 * @brief Moves processed documents into dest_root/YYYY/MM/DD without clobbering.
 *
 * A name already taken in the date folder gets "_1", "_2", ... inserted
 * before its extension. The original is deleted only after the processed
 * copy reached its destination.
 */
class Refiler {
public:
    explicit Refiler(std::shared_ptr<spdlog::logger> logger = nullptr);

    /**
     * @brief Compute the destination without touching the file system.
     *
     * Paths in @p reserved count as taken, so a dry run over several files
     * reports the same suffixes a real run would produce.
     */
    RefileTarget plan(const std::string& file_name,
                      const DateCandidate& date,
                      const fs::path& dest_root,
                      const std::set<fs::path>& reserved = {}) const;

    /**
     * @brief Create the date folder, move the processed file in and delete the original.
     *
     * In dry-run mode nothing is created, moved or deleted; the planned target is returned.
     * @throws ErrorCodes::AppException DIRECTORY_CREATE_FAILED or FILE_MOVE_FAILED.
     */
    RefileOutcome refile(const fs::path& original_path,
                         const fs::path& processed_path,
                         const std::string& file_name,
                         const DateCandidate& date,
                         const fs::path& dest_root,
                         bool dry_run,
                         const std::set<fs::path>& reserved = {}) const;

    static fs::path date_folder(const fs::path& dest_root, const DateCandidate& date);
    static fs::path unique_destination(const fs::path& folder,
                                       const std::string& file_name,
                                       const std::set<fs::path>& reserved = {});

private:
    void create_date_dirs(const fs::path& folder) const;
    void move_file(const fs::path& source, const fs::path& destination) const;
    bool remove_original(const fs::path& original) const;

    std::shared_ptr<spdlog::logger> logger_;
};

#endif

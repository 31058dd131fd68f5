#include "Refiler.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <system_error>
#include <utility>

namespace {
bool path_taken(const fs::path& path)
{
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}
}


Refiler::Refiler(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
}


fs::path Refiler::date_folder(const fs::path& dest_root, const DateCandidate& date)
{
    const std::string stamp = date.stamp();
    return dest_root / stamp.substr(0, 4) / stamp.substr(4, 2) / stamp.substr(6, 2);
}


fs::path Refiler::unique_destination(const fs::path& folder,
                                     const std::string& file_name,
                                     const std::set<fs::path>& reserved)
{
    const fs::path file_segment = Utils::utf8_to_path(file_name);
    fs::path candidate = folder / file_segment;

    const std::string stem = Utils::path_to_utf8(file_segment.stem());
    const std::string extension = Utils::path_to_utf8(file_segment.extension());
    for (int counter = 1; path_taken(candidate) || reserved.count(candidate) > 0; ++counter) {
        candidate = folder / Utils::utf8_to_path(stem + "_" + std::to_string(counter) + extension);
    }
    return candidate;
}


RefileTarget Refiler::plan(const std::string& file_name,
                           const DateCandidate& date,
                           const fs::path& dest_root,
                           const std::set<fs::path>& reserved) const
{
    RefileTarget target;
    target.dest_folder = date_folder(dest_root, date);
    target.dest_file = unique_destination(target.dest_folder, file_name, reserved);
    return target;
}


RefileOutcome Refiler::refile(const fs::path& original_path,
                              const fs::path& processed_path,
                              const std::string& file_name,
                              const DateCandidate& date,
                              const fs::path& dest_root,
                              bool dry_run,
                              const std::set<fs::path>& reserved) const
{
    RefileOutcome outcome;
    if (dry_run) {
        outcome.target = plan(file_name, date, dest_root, reserved);
        if (logger_) {
            logger_->info("Moving processed file to {}", Utils::path_to_utf8(outcome.target.dest_file));
            logger_->info("Dry-run mode enabled. Not moving {} to {}",
                          Utils::path_to_utf8(processed_path),
                          Utils::path_to_utf8(outcome.target.dest_file));
        }
        return outcome;
    }

    outcome.target.dest_folder = date_folder(dest_root, date);
    create_date_dirs(outcome.target.dest_folder);
    outcome.target.dest_file = unique_destination(outcome.target.dest_folder, file_name, reserved);

    if (logger_) {
        logger_->info("Moving processed file to {}", Utils::path_to_utf8(outcome.target.dest_file));
    }
    move_file(processed_path, outcome.target.dest_file);
    outcome.moved = true;
    outcome.source_removed = remove_original(original_path);
    return outcome;
}


void Refiler::create_date_dirs(const fs::path& folder) const
{
    std::error_code ec;
    fs::create_directories(folder, ec);
    if (ec || !fs::is_directory(folder)) {
        const std::string details = Utils::path_to_utf8(folder) + ": "
            + (ec ? ec.message() : std::string("not a directory"));
        if (logger_) {
            logger_->error("Failed to create destination folder {}", details);
        }
        THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_CREATE_FAILED, details);
    }
}


void Refiler::move_file(const fs::path& source, const fs::path& destination) const
{
    const std::string source_label = Utils::path_to_utf8(source);
    const std::string destination_label = Utils::path_to_utf8(destination);

    if (!fs::exists(source)) {
        if (logger_) {
            logger_->error("Processed file missing when moving to '{}': {}", destination_label, source_label);
        }
        THROW_APP_ERROR(ErrorCodes::Code::FILE_NOT_FOUND, source_label);
    }
    if (path_taken(destination)) {
        if (logger_) {
            logger_->error("Destination '{}' appeared while refiling; not overwriting", destination_label);
        }
        THROW_APP_ERROR(ErrorCodes::Code::FILE_MOVE_FAILED, destination_label + " already exists");
    }

    std::error_code ec;
    fs::rename(source, destination, ec);
    if (!ec) {
        return;
    }

    if (ec != std::errc::cross_device_link) {
        if (logger_) {
            logger_->error("Failed to move {} to {}: {}", source_label, destination_label, ec.message());
        }
        THROW_APP_ERROR(ErrorCodes::Code::FILE_MOVE_FAILED,
                        source_label + " -> " + destination_label + ": " + ec.message());
    }

    // Different file systems: copy without overwrite, then drop the source copy.
    std::error_code copy_ec;
    fs::copy_file(source, destination, fs::copy_options::none, copy_ec);
    if (copy_ec) {
        std::error_code cleanup_ec;
        if (copy_ec != std::errc::file_exists && path_taken(destination)) {
            fs::remove(destination, cleanup_ec);
        }
        if (logger_) {
            logger_->error("Failed to copy {} to {}: {}", source_label, destination_label, copy_ec.message());
        }
        THROW_APP_ERROR(ErrorCodes::Code::FILE_MOVE_FAILED,
                        source_label + " -> " + destination_label + ": " + copy_ec.message());
    }

    std::error_code remove_ec;
    if (!fs::remove(source, remove_ec) && logger_) {
        logger_->warn("Copied {} but could not remove it: {}", source_label, remove_ec.message());
    }
}


bool Refiler::remove_original(const fs::path& original) const
{
    std::error_code ec;
    if (fs::remove(original, ec)) {
        return true;
    }
    if (logger_) {
        const auto info = ErrorCodes::ErrorCatalog::get_error_info(
            ErrorCodes::Code::FILE_DELETE_FAILED,
            Utils::path_to_utf8(original) + ": " + (ec ? ec.message() : std::string("file not found")));
        logger_->error("{}", info.get_full_details());
    }
    return false;
}

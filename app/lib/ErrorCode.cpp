#include "ErrorCode.hpp"
#include "ErrorMessages.hpp"

#include <sstream>

namespace ErrorCodes {

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << ": " << message;
    if (!technical_details.empty()) {
        oss << "\nDetails: " << technical_details;
    }
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    switch (code) {
        case Code::FILE_NOT_FOUND:
            return {code, _("File not found."),
                    _("Check that the file was not moved or deleted during processing."), context};
        case Code::FILE_MOVE_FAILED:
            return {code, _("Failed to move the processed file into the datetree."),
                    _("Check free space and write permissions on the destination directory."), context};
        case Code::FILE_DELETE_FAILED:
            return {code, _("Failed to remove the original file."),
                    _("The processed copy is in place; remove the original manually."), context};
        case Code::DIRECTORY_NOT_FOUND:
            return {code, _("Directory does not exist."),
                    _("Create the directory or pass an existing one with -s/-d."), context};
        case Code::DIRECTORY_CREATE_FAILED:
            return {code, _("Failed to create destination folder."),
                    _("Check write permissions on the destination directory."), context};
        case Code::CONFIG_SAVE_FAILED:
            return {code, _("Failed to save configuration."),
                    _("Check write permissions on the configuration directory."), context};
        case Code::SYSTEM_DEPENDENCY_MISSING:
            return {code, _("A required utility is not installed."),
                    _("Install ocrmypdf and poppler-utils (pdftotext) and make sure they are on PATH."), context};
        case Code::SYSTEM_INIT_FAILED:
            return {code, _("Initialization failed."),
                    _("Check that the temporary directory is writable."), context};
        case Code::PROCESSING_OCR_FAILED:
            return {code, _("OCR processing failed."),
                    _("Run ocrmypdf on the file manually to see the detailed error."), context};
        case Code::PROCESSING_TEXT_EXTRACTION_FAILED:
            return {code, _("Text extraction failed."),
                    _("Run pdftotext on the file manually to see the detailed error."), context};
        case Code::PROCESSING_INTERRUPTED:
            return {code, _("Processing interrupted."),
                    "", context};
        case Code::UNKNOWN_ERROR:
        default:
            return {code, _("An unknown error occurred."), "", context};
    }
}

} // namespace ErrorCodes

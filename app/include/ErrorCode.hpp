#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

/*
 * Error Code Categories:
 *
 * File System (1200-1299)
 * Configuration (1500-1599)
 * System (1700-1799)
 * Processing (2000-2099)
 */
enum class Code {
    UNKNOWN_ERROR = 1,

    FILE_NOT_FOUND = 1200,
    FILE_MOVE_FAILED = 1201,
    FILE_DELETE_FAILED = 1202,
    DIRECTORY_NOT_FOUND = 1210,
    DIRECTORY_CREATE_FAILED = 1211,

    CONFIG_SAVE_FAILED = 1502,

    SYSTEM_DEPENDENCY_MISSING = 1700,
    SYSTEM_INIT_FAILED = 1701,

    PROCESSING_OCR_FAILED = 2000,
    PROCESSING_TEXT_EXTRACTION_FAILED = 2001,
    PROCESSING_INTERRUPTED = 2002
};

// Message, resolution hint and technical context for one error code
struct ErrorInfo {
    Code code;
    std::string message;
    std::string resolution;
    std::string technical_details;

    ErrorInfo(Code code,
              std::string message,
              std::string resolution,
              std::string technical_details = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          technical_details(std::move(technical_details)) {}

    // Message followed by the resolution hint
    std::string get_user_message() const;

    // Everything, including the numeric code and the context
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP

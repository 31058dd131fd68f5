#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "Types.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

/**
 * @brief Registry of the named spdlog loggers used by the application.
 *
 * "core_logger" carries pipeline progress, "tools_logger" carries output from
 * the external OCR and text extraction utilities.
 */
class Logger {
public:
    /**
     * @brief Create and register all loggers.
     * @param level Console verbosity chosen on the command line or in the config.
     * @param log_file Optional path of a file that receives every message at debug level.
     */
    static void setup_loggers(LogLevel level = LogLevel::Info,
                              const std::string& log_file = "");

    /**
     * @brief Return a registered logger, or nullptr before setup_loggers().
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    /**
     * @brief Drop all registered loggers and flush their sinks.
     */
    static void shutdown();

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

#endif

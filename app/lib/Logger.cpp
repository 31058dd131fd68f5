#include "Logger.hpp"

#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace {

constexpr const char* kConsolePattern = "[%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
const std::vector<std::string> kLoggerNames = {"core_logger", "tools_logger"};

// Debug and info go to stdout, warnings and errors to stderr.
class SplitConsoleSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    SplitConsoleSink()
        : out_(std::make_shared<spdlog::sinks::stdout_color_sink_st>()),
          err_(std::make_shared<spdlog::sinks::stderr_color_sink_st>()) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override
    {
        if (msg.level >= spdlog::level::warn) {
            err_->log(msg);
        } else {
            out_->log(msg);
        }
    }

    void flush_() override
    {
        out_->flush();
        err_->flush();
    }

    void set_pattern_(const std::string& pattern) override
    {
        out_->set_pattern(pattern);
        err_->set_pattern(pattern);
    }

    void set_formatter_(std::unique_ptr<spdlog::formatter> sink_formatter) override
    {
        out_->set_formatter(sink_formatter->clone());
        err_->set_formatter(std::move(sink_formatter));
    }

private:
    std::shared_ptr<spdlog::sinks::stdout_color_sink_st> out_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_st> err_;
};

} // namespace


spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        default: return spdlog::level::info;
    }
}


void Logger::setup_loggers(LogLevel level, const std::string& log_file)
{
    const auto console_level = to_spdlog_level(level);

    auto console_sink = std::make_shared<SplitConsoleSink>();
    console_sink->set_pattern(kConsolePattern);
    console_sink->set_level(console_level);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    auto logger_level = console_level;
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
        file_sink->set_pattern(kFilePattern);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
        logger_level = spdlog::level::debug;
    }

    for (const auto& name : kLoggerNames) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(logger_level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::shutdown()
{
    for (const auto& name : kLoggerNames) {
        if (auto logger = spdlog::get(name)) {
            logger->flush();
        }
        spdlog::drop(name);
    }
}

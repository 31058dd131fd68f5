#include "ExternalTools.hpp"
#include "AppException.hpp"
#include "InterruptGuard.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <QByteArray>
#include <QElapsedTimer>
#include <QProcess>
#include <QStandardPaths>
#include <QString>
#include <QStringList>

#include <utility>

namespace {
constexpr int kPollIntervalMs = 200;

QString to_qstring(const std::filesystem::path& path)
{
    return QString::fromStdString(Utils::path_to_utf8(path));
}

std::string trimmed_output(const QByteArray& bytes)
{
    return QString::fromUtf8(bytes).trimmed().toStdString();
}

void stop_process(QProcess& process)
{
    if (process.state() != QProcess::NotRunning) {
        process.kill();
        process.waitForFinished();
    }
}

class ProcessLineSource : public TextLineSource {
public:
    ProcessLineSource(std::unique_ptr<QProcess> process,
                      std::string document,
                      qint64 timeout_ms,
                      std::shared_ptr<spdlog::logger> logger)
        : process_(std::move(process)),
          document_(std::move(document)),
          timeout_ms_(timeout_ms),
          logger_(std::move(logger))
    {
        elapsed_.start();
    }

    ~ProcessLineSource() override
    {
        stop_process(*process_);
    }

    std::optional<std::string> next_line() override
    {
        while (true) {
            if (auto line = take_line()) {
                return line;
            }
            if (finished_) {
                if (buffer_.empty()) {
                    return std::nullopt;
                }
                std::string rest;
                rest.swap(buffer_);
                if (!rest.empty() && rest.back() == '\r') {
                    rest.pop_back();
                }
                return rest;
            }
            InterruptGuard::throw_if_interrupted("Text extraction of " + document_);
            pump();
        }
    }

private:
    std::optional<std::string> take_line()
    {
        const auto newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            return std::nullopt;
        }
        std::string line = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return line;
    }

    void append_output()
    {
        const QByteArray chunk = process_->readAllStandardOutput();
        buffer_.append(chunk.constData(), static_cast<size_t>(chunk.size()));
    }

    void pump()
    {
        if (elapsed_.hasExpired(timeout_ms_)) {
            if (logger_) {
                logger_->warn("pdftotext timed out after {} ms on '{}'", timeout_ms_, document_);
            }
            stop_process(*process_);
            append_output();
            finished_ = true;
            return;
        }

        process_->waitForReadyRead(kPollIntervalMs);
        append_output();
        if (process_->state() != QProcess::NotRunning) {
            return;
        }

        append_output();
        finished_ = true;
        const std::string diagnostics = trimmed_output(process_->readAllStandardError());
        if (process_->exitStatus() != QProcess::NormalExit || process_->exitCode() != 0) {
            if (logger_) {
                logger_->warn("pdftotext failed on '{}' (exit code {}): {}",
                              document_, process_->exitCode(), diagnostics);
            }
        } else if (logger_ && !diagnostics.empty()) {
            logger_->debug("pdftotext: {}", diagnostics);
        }
    }

    std::unique_ptr<QProcess> process_;
    std::string document_;
    qint64 timeout_ms_;
    std::shared_ptr<spdlog::logger> logger_;
    QElapsedTimer elapsed_;
    std::string buffer_;
    bool finished_{false};
};
}


namespace ExternalTools {

std::optional<std::string> find_executable(const std::string& name)
{
    const QString exe = QStandardPaths::findExecutable(QString::fromStdString(name));
    if (exe.isEmpty()) {
        return std::nullopt;
    }
    return exe.toStdString();
}


void check_dependencies(const std::vector<std::string>& names)
{
    auto logger = Logger::get_logger("tools_logger");
    for (const auto& name : names) {
        const auto location = find_executable(name);
        if (!location) {
            if (logger) {
                logger->error("Required tool '{}' was not found on PATH", name);
            }
            THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DEPENDENCY_MISSING, name);
        }
        if (logger) {
            logger->debug("Using {} at {}", name, *location);
        }
    }
}


bool open_in_viewer(const std::filesystem::path& document)
{
#if defined(__APPLE__)
    const QString program = QStringLiteral("open");
#else
    const QString program = QStringLiteral("xdg-open");
#endif
    const bool started = QProcess::startDetached(program, {to_qstring(document)});
    if (!started) {
        if (auto logger = Logger::get_logger("tools_logger")) {
            logger->warn("Could not open '{}' with {}", Utils::path_to_utf8(document),
                         program.toStdString());
        }
    }
    return started;
}

} // namespace ExternalTools


OcrMyPdfEngine::OcrMyPdfEngine(int timeout_seconds, std::shared_ptr<spdlog::logger> logger)
    : timeout_seconds_(timeout_seconds),
      logger_(std::move(logger))
{
}


void OcrMyPdfEngine::make_searchable(const std::filesystem::path& input,
                                     const std::filesystem::path& output)
{
    const std::string input_name = Utils::path_to_utf8(input);
    const auto exe = ExternalTools::find_executable("ocrmypdf");
    if (!exe) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DEPENDENCY_MISSING, "ocrmypdf");
    }

    const QStringList args{QStringLiteral("-q"),
                           QStringLiteral("--skip-text"),
                           QStringLiteral("--output-type"),
                           QStringLiteral("pdf"),
                           to_qstring(input),
                           to_qstring(output)};
    if (logger_) {
        logger_->debug("Running {} {}", *exe, args.join(QLatin1Char(' ')).toStdString());
    }

    QProcess process;
    process.start(QString::fromStdString(*exe), args);
    if (!process.waitForStarted()) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESSING_OCR_FAILED,
                        input_name + ": " + process.errorString().toStdString());
    }

    QElapsedTimer elapsed;
    elapsed.start();
    const qint64 timeout_ms = static_cast<qint64>(timeout_seconds_) * 1000;
    while (!process.waitForFinished(kPollIntervalMs)) {
        if (InterruptGuard::interrupted()) {
            stop_process(process);
            InterruptGuard::throw_if_interrupted("OCR of " + input_name);
        }
        if (elapsed.hasExpired(timeout_ms)) {
            stop_process(process);
            THROW_APP_ERROR(ErrorCodes::Code::PROCESSING_OCR_FAILED,
                            input_name + ": timed out after " + std::to_string(timeout_seconds_) + "s");
        }
    }

    const std::string diagnostics = trimmed_output(process.readAllStandardError());
    if (process.exitStatus() != QProcess::NormalExit) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESSING_OCR_FAILED, input_name + ": ocrmypdf crashed");
    }
    if (process.exitCode() != 0) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESSING_OCR_FAILED,
                        input_name + ": exit code " + std::to_string(process.exitCode())
                        + (diagnostics.empty() ? std::string() : ", " + diagnostics));
    }
    if (logger_ && !diagnostics.empty()) {
        logger_->debug("ocrmypdf: {}", diagnostics);
    }
}


PdfToTextExtractor::PdfToTextExtractor(int timeout_seconds, std::shared_ptr<spdlog::logger> logger)
    : timeout_seconds_(timeout_seconds),
      logger_(std::move(logger))
{
}


std::unique_ptr<TextLineSource> PdfToTextExtractor::open(const std::filesystem::path& searchable_pdf)
{
    const std::string document = Utils::path_to_utf8(searchable_pdf);
    const auto exe = ExternalTools::find_executable("pdftotext");
    if (!exe) {
        THROW_APP_ERROR(ErrorCodes::Code::SYSTEM_DEPENDENCY_MISSING, "pdftotext");
    }

    auto process = std::make_unique<QProcess>();
    process->start(QString::fromStdString(*exe), {to_qstring(searchable_pdf), QStringLiteral("-")});
    if (!process->waitForStarted()) {
        THROW_APP_ERROR(ErrorCodes::Code::PROCESSING_TEXT_EXTRACTION_FAILED,
                        document + ": " + process->errorString().toStdString());
    }
    if (logger_) {
        logger_->debug("Extracting text from '{}'", document);
    }
    return std::make_unique<ProcessLineSource>(std::move(process), document,
                                               static_cast<qint64>(timeout_seconds_) * 1000,
                                               logger_);
}

#include "AppException.hpp"
#include "DateParser.hpp"
#include "DateResolver.hpp"
#include "ExternalTools.hpp"
#include "FileScanner.hpp"
#include "InteractiveConfirm.hpp"
#include "InterruptGuard.hpp"
#include "Logger.hpp"
#include "RefilePipeline.hpp"
#include "Refiler.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include <locale.h>
#include <libintl.h>

#ifndef PDF_REFILE_VERSION
#define PDF_REFILE_VERSION "0.0.0"
#endif


bool initialize_loggers(LogLevel level, const std::string& log_file)
{
    try {
        Logger::setup_loggers(level, log_file);
        return true;
    } catch (const std::exception &e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Failed to initialize loggers: {}", e.what());
        } else {
            std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        }
        return false;
    }
}

namespace {

constexpr int kExitUsage = 2;

struct CommandLine {
    QCommandLineOption scan_dir{{QStringLiteral("s"), QStringLiteral("scan-dir")},
                                QStringLiteral("Directory to scan for PDF files."),
                                QStringLiteral("dir")};
    QCommandLineOption dest_dir{{QStringLiteral("d"), QStringLiteral("dest-dir")},
                                QStringLiteral("Root of the YYYY/MM/DD datetree."),
                                QStringLiteral("dir")};
    QCommandLineOption log_level{{QStringLiteral("l"), QStringLiteral("log-level")},
                                 QStringLiteral("One of debug, info, warning, error."),
                                 QStringLiteral("level")};
    QCommandLineOption dry_run{{QStringLiteral("n"), QStringLiteral("dry-run")},
                               QStringLiteral("Show what would be moved without touching any file.")};
    QCommandLineOption test_date{{QStringLiteral("t"), QStringLiteral("test-date")},
                                 QStringLiteral("Print the YYYYMMDD stamp parsed from the text and exit."),
                                 QStringLiteral("text")};
    QCommandLineOption config{{QStringLiteral("c"), QStringLiteral("config")},
                              QStringLiteral("Use this configuration file."),
                              QStringLiteral("file")};
    QCommandLineOption save_config{QStringLiteral("save-config"),
                                   QStringLiteral("Write the effective settings to the configuration file and exit.")};

    QCommandLineParser parser;
    QCommandLineOption help_option{parser.addHelpOption()};
    QCommandLineOption version_option{parser.addVersionOption()};

    CommandLine()
    {
        parser.setApplicationDescription(
            QStringLiteral("OCR scanned PDF documents and refile them into a YYYY/MM/DD tree by document date."));
        parser.addOptions({scan_dir, dest_dir, log_level, dry_run, test_date, config, save_config});
    }
};

int usage_error(const CommandLine& cli, const QString& message)
{
    std::fprintf(stderr, "%s\n\n%s", message.toLocal8Bit().constData(),
                 cli.parser.helpText().toLocal8Bit().constData());
    return kExitUsage;
}

int run_date_test(const Settings& settings, const std::string& text)
{
    const DateParser parser(settings.parser_settings());
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (const auto candidate = parser.parse(line)) {
            std::cout << candidate->stamp() << std::endl;
            return EXIT_SUCCESS;
        }
    }
    return EXIT_FAILURE;
}

void apply_overrides(const CommandLine& cli, Settings& settings)
{
    if (cli.parser.isSet(cli.scan_dir)) {
        settings.set_scan_dir(cli.parser.value(cli.scan_dir).toStdString());
    }
    if (cli.parser.isSet(cli.dest_dir)) {
        settings.set_dest_dir(cli.parser.value(cli.dest_dir).toStdString());
    }
    if (cli.parser.isSet(cli.dry_run)) {
        settings.set_dry_run(true);
    }
}

int refile_documents(const Settings& settings)
{
    auto core_logger = Logger::get_logger("core_logger");
    auto tools_logger = Logger::get_logger("tools_logger");

    std::filesystem::path scan_dir = settings.get_scan_dir().empty()
        ? std::filesystem::current_path()
        : Utils::utf8_to_path(settings.get_scan_dir());
    std::filesystem::path dest_dir = settings.get_dest_dir().empty()
        ? scan_dir
        : Utils::utf8_to_path(settings.get_dest_dir());

    ExternalTools::check_dependencies({"ocrmypdf", "pdftotext"});

    OcrMyPdfEngine ocr(settings.get_ocr_timeout_seconds(), tools_logger);
    PdfToTextExtractor extractor(settings.get_ocr_timeout_seconds(), tools_logger);
    const DateParser date_parser(settings.parser_settings());
    DateResolver resolver(date_parser, settings.resolver_settings(), nullptr, core_logger);
    const InteractiveConfirm confirm(date_parser, std::cin, std::cout, core_logger,
                                     [](const std::filesystem::path& document) {
                                         ExternalTools::open_in_viewer(document);
                                     });

    RefilePipeline pipeline(FileScanner(core_logger), ocr, extractor, std::move(resolver), confirm,
                            Refiler(core_logger), core_logger,
                            settings.get_include_hidden() ? FileScanOptions::HiddenFiles
                                                          : FileScanOptions::None);

    InterruptGuard interrupt_guard;
    pipeline.run(scan_dir, dest_dir, settings.get_dry_run());
    return EXIT_SUCCESS;
}

int run_application(int argc, char** argv)
{
    setlocale(LC_ALL, "");
    const std::string locale_path = Utils::get_executable_path() + "/locale";
    bindtextdomain("pdf-refile", locale_path.c_str());
    textdomain("pdf-refile");

    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pdf-refile"));
    QCoreApplication::setApplicationVersion(QStringLiteral(PDF_REFILE_VERSION));

    CommandLine cli;
    if (!cli.parser.parse(app.arguments())) {
        return usage_error(cli, cli.parser.errorText());
    }
    if (cli.parser.isSet(cli.help_option)) {
        std::fputs(cli.parser.helpText().toLocal8Bit().constData(), stdout);
        return EXIT_SUCCESS;
    }
    if (cli.parser.isSet(cli.version_option)) {
        std::printf("%s %s\n", "pdf-refile", PDF_REFILE_VERSION);
        return EXIT_SUCCESS;
    }
    if (!cli.parser.positionalArguments().isEmpty()) {
        return usage_error(cli, QStringLiteral("Unexpected argument: ")
                                + cli.parser.positionalArguments().join(QLatin1Char(' ')));
    }

    Settings settings = cli.parser.isSet(cli.config)
        ? Settings(cli.parser.value(cli.config).toStdString())
        : Settings();
    settings.load();

    if (cli.parser.isSet(cli.log_level)) {
        const auto level = log_level_from_string(cli.parser.value(cli.log_level).toStdString());
        if (!level) {
            return usage_error(cli, QStringLiteral("Invalid log level: ") + cli.parser.value(cli.log_level));
        }
        settings.set_log_level(*level);
    }
    apply_overrides(cli, settings);

    if (!initialize_loggers(settings.get_log_level(), settings.get_log_file())) {
        return EXIT_FAILURE;
    }

    if (cli.parser.isSet(cli.test_date)) {
        return run_date_test(settings, cli.parser.value(cli.test_date).toStdString());
    }

    if (cli.parser.isSet(cli.save_config)) {
        auto logger = Logger::get_logger("core_logger");
        if (!settings.save()) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_SAVE_FAILED, "could not write " + settings.get_config_path());
        }
        logger->info("Settings saved to {}", settings.get_config_path());
        return EXIT_SUCCESS;
    }

    return refile_documents(settings);
}

} // namespace


int main(int argc, char **argv) {
    int result = EXIT_FAILURE;
    try {
        result = run_application(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        auto logger = Logger::get_logger("core_logger");
        if (ex.get_error_code() == ErrorCodes::Code::PROCESSING_INTERRUPTED) {
            if (logger) {
                logger->warn("{}", ex.what());
            } else {
                std::fprintf(stderr, "%s\n", ex.what());
            }
        } else if (logger) {
            logger->critical("{}", ex.get_full_details());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.get_full_details().c_str());
        }
        result = EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        result = EXIT_FAILURE;
    }
    Logger::shutdown();
    return result;
}

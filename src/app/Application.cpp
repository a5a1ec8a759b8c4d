#include "Application.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "files/FileProcessor.hpp"
#include "processing/EmojiStripper.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <iostream>

#include <plog/Log.h>

Application::Application(int argc, char** argv)
    : out_(std::cout)
    , err_(std::cerr)
{
    if (argc > 0 && argv[0])
    {
        program_ = std::filesystem::path(argv[0]).filename().string();
    }
    for (int i = 1; i < argc; ++i)
    {
        args_.emplace_back(argv[i]);
    }
}

Application::Application(std::vector<std::string> args, std::ostream& out, std::ostream& err)
    : args_(std::move(args))
    , out_(out)
    , err_(err)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    std::string error;
    if (!CommandLine::Parse(args_, options_, error))
    {
        err_ << program_ << ": " << error << '\n'
             << "Try '" << program_ << " --help' for more information.\n";
        return kExitUsage;
    }

    if (options_.show_help)
    {
        out_ << CommandLine::Usage(program_);
        return kExitSuccess;
    }
    if (options_.show_version)
    {
        out_ << program_ << ' ' << NEJ_VERSION_STRING << '\n';
        return kExitSuccess;
    }

    if (!initializeConfig())
    {
        printPendingReports();
        return kExitUsage;
    }

    applyCommandLineOverrides();

    if (!initializeLogging())
    {
        printPendingReports();
        return kExitUsage;
    }
    printPendingReports();

    return processFiles();
}

bool Application::initializeConfig()
{
    const bool explicit_path = options_.config_path.has_value();
    ConfigManager config(options_.config_path.value_or("nej.toml"), explicit_path);

    if (!RegisterSettingsTables(config, settings_))
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Failed to register settings",
                                          config.lastError());
        return false;
    }

    // Bad values only cost their defaults; an explicit file that cannot be
    // read is fatal.
    if (!config.load() && explicit_path && !config.fileLoaded())
        return false;

    return true;
}

void Application::applyCommandLineOverrides()
{
    if (options_.removal)
    {
        settings_.processing.removal = *options_.removal;
    }

    if (options_.verbose)
    {
        settings_.logging.level = plog::debug;
        settings_.logging.console = true;
    }
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(settings_.logging))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    if (!utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                .filepath = settings_.logging.file,
                                                .level_override = std::nullopt,
                                                .max_file_size = settings_.logging.max_file_size,
                                                .backup_count = settings_.logging.backup_count,
                                                .add_console_appender = settings_.logging.console }))
    {
        return false;
    }

    PLOG_INFO << program_ << ' ' << NEJ_VERSION_STRING << " starting, removal="
              << processing::RemovalModeToString(settings_.processing.removal)
              << ", binary probe=" << settings_.processing.binary_probe_bytes << " bytes";
    return true;
}

int Application::processFiles()
{
    files::FileProcessor processor(processing::EmojiStripper(settings_.processing.removal),
                                   settings_.processing.binary_probe_bytes, out_);
    if (options_.verbose)
    {
        processor.enablePreview();
    }

    std::vector<files::FileReport> reports;
    reports.reserve(options_.paths.size());

    for (const auto& path : options_.paths)
    {
        files::FileTask task;
        task.path = path;
        task.mode = options_.mode;
        task.backup_suffix = options_.backup_suffix;

        reports.push_back(processor.process(task));
        PLOG_DEBUG << path << ": " << files::FileOutcomeToString(reports.back().outcome);
        printPendingReports();
    }

    return ExitCodeFor(reports);
}

void Application::printPendingReports()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        err_ << program_ << ": " << utils::ErrorReporter::FormatForUser(report) << '\n';
    }
    err_.flush();
}

int Application::ExitCodeFor(const std::vector<files::FileReport>& reports)
{
    for (const auto& report : reports)
    {
        if (report.failed())
            return kExitFileError;
    }
    return kExitSuccess;
}

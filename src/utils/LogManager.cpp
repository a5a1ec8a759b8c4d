#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "config/Settings.hpp"

#include <algorithm>
#include <filesystem>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_default_level = plog::warning;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<int> LogManager::s_registered_instances;

bool LogManager::Initialize(const LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    s_default_level = settings.level;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    if (config.filepath.empty() && !config.add_console_appender)
        return true;

    const plog::Severity level = config.level_override.value_or(s_default_level);

    // plog cannot detach appenders, so a second registration only restores
    // the severity that Shutdown() lowered.
    if (std::find(s_registered_instances.begin(), s_registered_instances.end(), InstanceId) !=
        s_registered_instances.end())
    {
        if (auto logger = plog::get<InstanceId>())
            logger->setMaxSeverity(level);
        PLOG_DEBUG_(InstanceId) << "Logger '" << config.name << "' already registered, keeping its appenders";
        return true;
    }

    try
    {
        plog::Logger<InstanceId>& logger = plog::init<InstanceId>(level);
        logger.setMaxSeverity(level);

        if (!config.filepath.empty())
        {
            if (!PrepareLogDirectory(config.filepath))
                return false;

            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
            logger.addAppender(file_appender.get());
            s_appenders.push_back(std::move(file_appender));
        }

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_registered_instances.push_back(InstanceId);

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

// plog keeps raw pointers to its appenders and cannot drop them, so the
// appenders stay owned here for the life of the process.
void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_initialized = false;
}

std::optional<plog::Severity> LogManager::ParseSeverity(std::string_view text)
{
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '6')
        return static_cast<plog::Severity>(text[0] - '0');

    if (text == "none")
        return plog::none;
    if (text == "fatal")
        return plog::fatal;
    if (text == "error")
        return plog::error;
    if (text == "warning" || text == "warn")
        return plog::warning;
    if (text == "info")
        return plog::info;
    if (text == "debug")
        return plog::debug;
    if (text == "verbose")
        return plog::verbose;
    return std::nullopt;
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils

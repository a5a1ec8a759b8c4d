#pragma once

#include "processing/TextProcessingTypes.hpp"

#include <cstddef>
#include <string>
#include <plog/Severity.h>

class ConfigManager;

struct ProcessingSettings
{
    processing::RemovalMode removal = processing::RemovalMode::Space;
    std::size_t binary_probe_bytes = 8 * 1024;
};

struct LoggingSettings
{
    plog::Severity level = plog::warning;
    std::string file;                         // Rolling log file, empty disables
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
    bool console = false;                     // Mirror the log on stderr
};

struct AppSettings
{
    ProcessingSettings processing;
    LoggingSettings logging;
};

// Binds the [processing] and [logging] tables to `settings`. The settings
// object must outlive every ConfigManager::load() call.
bool RegisterSettingsTables(ConfigManager& config, AppSettings& settings);

#include "Settings.hpp"
#include "ConfigManager.hpp"
#include "processing/EmojiStripper.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <cstdint>

#include <plog/Log.h>

namespace
{

void reportInvalid(const std::string& key, const std::string& reason)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Ignoring invalid configuration value",
                                        key + ": " + reason);
}

bool loadProcessing(const toml::table& section, ProcessingSettings& out)
{
    bool ok = true;

    if (auto removal = section["removal"].value<std::string>())
    {
        if (auto mode = processing::ParseRemovalMode(*removal))
            out.removal = *mode;
        else
        {
            reportInvalid("processing.removal", "expected space, elide or width, got '" + *removal + "'");
            ok = false;
        }
    }

    if (auto probe = section["binary_probe_bytes"].value<int64_t>())
    {
        if (*probe > 0)
            out.binary_probe_bytes = static_cast<std::size_t>(*probe);
        else
        {
            reportInvalid("processing.binary_probe_bytes", "must be positive");
            ok = false;
        }
    }

    return ok;
}

bool loadLogging(const toml::table& section, LoggingSettings& out)
{
    bool ok = true;

    if (auto level = section["level"].value<std::string>())
    {
        if (auto severity = utils::LogManager::ParseSeverity(*level))
            out.level = *severity;
        else
        {
            reportInvalid("logging.level", "unknown level '" + *level + "'");
            ok = false;
        }
    }
    else if (auto level_int = section["level"].value<int64_t>())
    {
        if (*level_int >= 0 && *level_int <= 6)
            out.level = static_cast<plog::Severity>(*level_int);
        else
        {
            reportInvalid("logging.level", "expected 0-6");
            ok = false;
        }
    }

    if (auto file = section["file"].value<std::string>())
        out.file = *file;

    if (auto size = section["max_file_size"].value<int64_t>())
    {
        if (*size > 0)
            out.max_file_size = static_cast<std::size_t>(*size);
        else
        {
            reportInvalid("logging.max_file_size", "must be positive");
            ok = false;
        }
    }

    if (auto count = section["backup_count"].value<int64_t>())
    {
        if (*count >= 0)
            out.backup_count = static_cast<std::size_t>(*count);
        else
        {
            reportInvalid("logging.backup_count", "must not be negative");
            ok = false;
        }
    }

    return ok;
}

} // namespace

bool RegisterSettingsTables(ConfigManager& config, AppSettings& settings)
{
    bool ok = config.registerTable(
        "processing", { [&settings](const toml::table& section) { return loadProcessing(section, settings.processing); } },
        { "removal", "binary_probe_bytes" });

    ok = config.registerTable(
             "logging", { [&settings](const toml::table& section) { return loadLogging(section, settings.logging); } },
             { "level", "file", "max_file_size", "backup_count" }) &&
         ok;

    return ok;
}

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

struct LoggingSettings;

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;                       // Empty: no file appender
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;          // Writes to stderr
    };

    static bool Initialize(const LoggingSettings& settings);

    // Installs the appenders for one plog instance. Returns true without
    // touching plog when the config asks for neither a file nor the console,
    // which leaves every PLOG_* statement a no-op. Appenders are installed
    // once per instance; later calls only reset its severity.
    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    // "none", "fatal", "error", "warning", "info", "debug", "verbose" or "0".."6"
    static std::optional<plog::Severity> ParseSeverity(std::string_view text);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<int> s_registered_instances;
};

} // namespace utils

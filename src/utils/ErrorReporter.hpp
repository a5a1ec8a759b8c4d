#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logging setup, command line
    Configuration,  // TOML parsing, invalid values
    FileAccess,     // Missing, unreadable or non-regular input
    FileWrite,      // Temporary file, backup or rename failures
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded behaviour, processing continues
    Error,   // The current file failed, later files still run
    Fatal    // Nothing further can be processed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short message printed for the user
    std::string technical_details; // Path, errno text, parser position
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe collector for user-facing problems
 *
 * Every report is logged through plog and queued. The command-line front end
 * drains the queue after each file and prints it on the error stream.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::FileAccess, "Cannot open file",
 *                              "notes.txt: No such file or directory");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::FormatForUser(report) << '\n';
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static void ReportInfo(ErrorCategory category, const std::string& user_message,
                           const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Returns all queued reports and clears the queue
    static std::vector<ErrorReport> GetPendingErrors();

    /// Drops queued reports without returning them
    static void Reset();

    /// "<message>: <details>", or just the message
    static std::string FormatForUser(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils

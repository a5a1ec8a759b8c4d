#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"

using namespace utils;

TEST_CASE("ErrorReporter - queue drains in order", "[errors]")
{
    ErrorReporter::Reset();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());

    ErrorReporter::ReportInfo(ErrorCategory::FileAccess, "Skipping binary file", "a.bin");
    ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown configuration key", "processing.x");
    ErrorReporter::ReportError(ErrorCategory::FileWrite, "Cannot write file", "b.txt");
    REQUIRE(ErrorReporter::HasPendingErrors());

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 3);
    REQUIRE(reports[0].severity == ErrorSeverity::Info);
    REQUIRE(reports[1].severity == ErrorSeverity::Warning);
    REQUIRE(reports[2].severity == ErrorSeverity::Error);
    REQUIRE(reports[2].category == ErrorCategory::FileWrite);
    REQUIRE_FALSE(reports[2].timestamp.empty());

    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
}

TEST_CASE("ErrorReporter - reset discards queued reports", "[errors]")
{
    ErrorReporter::ReportFatal(ErrorCategory::Initialization, "Failed to register settings");
    ErrorReporter::Reset();
    REQUIRE_FALSE(ErrorReporter::HasPendingErrors());
    REQUIRE(ErrorReporter::GetPendingErrors().empty());
}

TEST_CASE("ErrorReporter - queue is bounded", "[errors]")
{
    ErrorReporter::Reset();
    for (int i = 0; i < 150; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Unknown, "w" + std::to_string(i));

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 100);
    REQUIRE(reports.front().user_message == "w50");
    REQUIRE(reports.back().user_message == "w149");
    ErrorReporter::Reset();
}

TEST_CASE("ErrorReporter - formatting", "[errors]")
{
    ErrorReport with_details(ErrorCategory::FileAccess, ErrorSeverity::Error, "Cannot open file",
                             "x.txt: No such file or directory");
    REQUIRE(ErrorReporter::FormatForUser(with_details) == "Cannot open file: x.txt: No such file or directory");

    ErrorReport bare(ErrorCategory::Unknown, ErrorSeverity::Fatal, "Out of memory", "");
    REQUIRE(ErrorReporter::FormatForUser(bare) == "Out of memory");

    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::FileAccess) == "File Access");
    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Configuration) == "Configuration");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Warning) == "Warning");
}

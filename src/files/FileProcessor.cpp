#include "files/FileProcessor.hpp"
#include "files/AtomicFileWriter.hpp"
#include "utils/ErrorReporter.hpp"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <string>
#include <system_error>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace files
{

const char* FileOutcomeToString(FileOutcome outcome) noexcept
{
    switch (outcome)
    {
    case FileOutcome::SkippedBinary:
        return "skipped (binary)";
    case FileOutcome::Reported:
        return "reported";
    case FileOutcome::Written:
        return "written";
    case FileOutcome::Unchanged:
        return "unchanged";
    case FileOutcome::Printed:
        return "printed";
    case FileOutcome::Failed:
        return "failed";
    case FileOutcome::WriteFailed:
        return "write failed";
    default:
        return "unknown";
    }
}

FileProcessor::FileProcessor(processing::EmojiStripper stripper, std::size_t binary_probe_bytes, std::ostream& out)
    : stripper_(stripper)
    , detector_(binary_probe_bytes)
    , out_(out)
{
}

void FileProcessor::enablePreview(std::size_t max_bytes)
{
    preview_.emplace(max_bytes);
}

std::string FileProcessor::FormatDryRunLine(const fs::path& path, std::size_t removed)
{
    return "File: \"" + path.string() + "\", Emojis removed: " + std::to_string(removed);
}

FileReport FileProcessor::process(const FileTask& task)
{
    FileReport report;
    report.path = task.path;

    std::optional<std::string> input = readInput(task.path, report);
    if (!input)
        return report;

    const processing::ProcessingResult result = stripper_.strip(*input);
    report.removed_count = result.removed_count;
    report.recovered_count = result.recovered_count;

    PLOG_DEBUG << task.path.string() << ": " << result.removed_count << " emoji, " << result.recovered_count
               << " malformed sequences";
    if (preview_ && result.removed_count > 0)
    {
        PLOG_DEBUG << "Result preview: " << preview_->render(result.output);
    }

    switch (task.mode)
    {
    case ProcessingMode::DryRun:
        out_ << FormatDryRunLine(task.path, result.removed_count) << '\n';
        report.outcome = FileOutcome::Reported;
        break;

    case ProcessingMode::Stdout:
        out_.write(result.output.data(), static_cast<std::streamsize>(result.output.size()));
        report.outcome = FileOutcome::Printed;
        break;

    case ProcessingMode::InPlace:
        if (result.removed_count == 0)
        {
            report.outcome = FileOutcome::Unchanged;
            break;
        }
        if (!AtomicFileWriter::Replace(task.path, result.output, task.backup_suffix, report.error))
        {
            report.outcome = FileOutcome::WriteFailed;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::FileWrite, "Cannot write file", report.error);
            break;
        }
        PLOG_INFO << "Removed " << result.removed_count << " emoji from " << task.path.string();
        report.outcome = FileOutcome::Written;
        break;
    }

    out_.flush();
    return report;
}

std::optional<std::string> FileProcessor::readInput(const fs::path& path, FileReport& report)
{
    report.outcome = FileOutcome::Failed;

    std::error_code ec;
    const fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status))
    {
        report.error = path.string() + ": " + (ec ? ec.message() : std::string("No such file or directory"));
        utils::ErrorReporter::ReportError(utils::ErrorCategory::FileAccess, "Cannot open file", report.error);
        return std::nullopt;
    }
    if (fs::is_directory(status))
    {
        report.error = path.string() + ": Is a directory";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::FileAccess, "Cannot open file", report.error);
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        report.error = path.string() + ": " + std::error_code(errno, std::generic_category()).message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::FileAccess, "Cannot open file", report.error);
        return std::nullopt;
    }

    if (detector_.isBinary(in))
    {
        report.outcome = FileOutcome::SkippedBinary;
        utils::ErrorReporter::ReportInfo(utils::ErrorCategory::FileAccess, "Skipping binary file", path.string());
        return std::nullopt;
    }

    const std::uintmax_t size = fs::file_size(path, ec);
    if (ec)
    {
        report.error = path.string() + ": " + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::FileAccess, "Cannot read file", report.error);
        return std::nullopt;
    }

    in.clear();
    in.seekg(0, std::ios::beg);

    std::string contents;
    if (!ReadExactly(in, static_cast<std::size_t>(size), contents))
    {
        report.error = path.string() + ": read " + std::to_string(contents.size()) + " of " +
                       std::to_string(size) + " bytes";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::FileAccess, "Cannot read file", report.error);
        return std::nullopt;
    }

    return contents;
}

bool FileProcessor::ReadExactly(std::istream& in, std::size_t expected, std::string& out)
{
    out.assign(expected, '\0');
    in.read(out.data(), static_cast<std::streamsize>(expected));
    const auto got = static_cast<std::size_t>(in.gcount());
    out.resize(got);
    if (in.bad() || got != expected)
        return false;

    // More bytes than the size reported means the file changed under us.
    return in.peek() == std::char_traits<char>::eof();
}

} // namespace files

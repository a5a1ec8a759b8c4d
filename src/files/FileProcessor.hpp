#pragma once

#include "files/BinaryDetector.hpp"
#include "processing/EmojiStripper.hpp"
#include "processing/TextPreview.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace files
{

enum class ProcessingMode
{
    DryRun,  // Report counts only
    InPlace, // Rewrite files that contain emoji
    Stdout   // Print the stripped text
};

struct FileTask
{
    std::filesystem::path path;
    ProcessingMode mode = ProcessingMode::Stdout;
    std::optional<std::string> backup_suffix; // In-place only
};

// Terminal state of one file task
enum class FileOutcome
{
    SkippedBinary,
    Reported,    // Dry run line printed
    Written,     // Replaced in place
    Unchanged,   // In place, nothing to remove
    Printed,     // Stripped text on the output stream
    Failed,      // Could not be opened or read
    WriteFailed  // Temporary file, backup or rename failed
};

struct FileReport
{
    std::filesystem::path path;
    FileOutcome outcome = FileOutcome::Failed;
    std::size_t removed_count = 0;
    std::size_t recovered_count = 0;
    std::string error;

    [[nodiscard]] bool failed() const noexcept
    {
        return outcome == FileOutcome::Failed || outcome == FileOutcome::WriteFailed;
    }
};

[[nodiscard]] const char* FileOutcomeToString(FileOutcome outcome) noexcept;

// Runs one FileTask at a time. Normal output (dry-run lines, stripped text)
// goes to the stream given at construction; problems are reported through
// utils::ErrorReporter and never stop the caller from moving on.
class FileProcessor
{
public:
    FileProcessor(processing::EmojiStripper stripper, std::size_t binary_probe_bytes, std::ostream& out);

    FileReport process(const FileTask& task);

    // Logs a bounded preview of each changed result at debug level
    void enablePreview(std::size_t max_bytes = processing::TextPreview::kDefaultMaxBytes);

    // "File: \"<path>\", Emojis removed: <N>"
    [[nodiscard]] static std::string FormatDryRunLine(const std::filesystem::path& path, std::size_t removed);

    // Reads exactly `expected` bytes and checks that nothing follows. A short
    // read, a stream error or trailing data fails; `out` keeps what was read.
    [[nodiscard]] static bool ReadExactly(std::istream& in, std::size_t expected, std::string& out);

private:
    [[nodiscard]] std::optional<std::string> readInput(const std::filesystem::path& path, FileReport& report);

    processing::EmojiStripper stripper_;
    BinaryDetector detector_;
    std::ostream& out_;
    std::optional<processing::TextPreview> preview_;
};

} // namespace files

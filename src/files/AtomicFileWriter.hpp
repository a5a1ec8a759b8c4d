#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace files
{

// Replaces a file's contents so that readers only ever see the old or the
// new bytes: the data goes to a temporary file in the target's directory,
// which is then renamed over the target.
class AtomicFileWriter
{
public:
    // "<dir>/.<name>.<pid>.<nanoseconds>.<counter>.tmp"
    static std::filesystem::path MakeTempPath(const std::filesystem::path& target);

    // Writes `contents` to a temporary file, copies the target's permission
    // bits onto it, copies the target to "<target><backup_suffix>" when a
    // suffix is given, then renames the temporary file over the target.
    // On failure the temporary file is removed, `error` says what went wrong
    // and the target is left as it was.
    static bool Replace(const std::filesystem::path& target, std::string_view contents,
                        const std::optional<std::string>& backup_suffix, std::string& error);

private:
    static bool WriteTemp(const std::filesystem::path& temp, std::string_view contents, std::string& error);
    static void DiscardTemp(const std::filesystem::path& temp);
};

} // namespace files

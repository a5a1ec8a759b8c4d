#include "files/AtomicFileWriter.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>

#include <plog/Log.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace files
{

namespace
{

std::atomic<std::uint64_t> g_temp_counter{ 0 };

std::string errnoMessage()
{
    return std::error_code(errno, std::generic_category()).message();
}

} // namespace

fs::path AtomicFileWriter::MakeTempPath(const fs::path& target)
{
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch();
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    const std::uint64_t sequence = g_temp_counter.fetch_add(1, std::memory_order_relaxed);

    std::string name = ".";
    name += target.filename().string();
    name += '.';
    name += std::to_string(static_cast<long long>(::getpid()));
    name += '.';
    name += std::to_string(nanos);
    name += '.';
    name += std::to_string(sequence);
    name += ".tmp";

    return target.parent_path() / name;
}

bool AtomicFileWriter::Replace(const fs::path& target, std::string_view contents,
                               const std::optional<std::string>& backup_suffix, std::string& error)
{
    const fs::path temp = MakeTempPath(target);
    PLOG_DEBUG << "Writing " << contents.size() << " bytes to " << temp.string();

    if (!WriteTemp(temp, contents, error))
    {
        DiscardTemp(temp);
        return false;
    }

    std::error_code ec;
    const fs::perms perms = fs::status(target, ec).permissions();
    if (!ec)
    {
        fs::permissions(temp, perms, fs::perm_options::replace, ec);
    }
    if (ec)
    {
        PLOG_WARNING << "Could not carry permissions over to " << temp.string() << ": " << ec.message();
        ec.clear();
    }

    if (backup_suffix && !backup_suffix->empty())
    {
        fs::path backup = target;
        backup += *backup_suffix;
        fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            error = "cannot create backup " + backup.string() + ": " + ec.message();
            DiscardTemp(temp);
            return false;
        }
        PLOG_DEBUG << "Backed up " << target.string() << " to " << backup.string();
    }

    fs::rename(temp, target, ec);
    if (ec)
    {
        error = "cannot replace " + target.string() + ": " + ec.message();
        DiscardTemp(temp);
        return false;
    }

    return true;
}

bool AtomicFileWriter::WriteTemp(const fs::path& temp, std::string_view contents, std::string& error)
{
    std::ofstream ofs(temp, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        error = "cannot create temporary file " + temp.string() + ": " + errnoMessage();
        return false;
    }

    ofs.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    ofs.flush();
    if (!ofs)
    {
        error = "cannot write temporary file " + temp.string() + ": " + errnoMessage();
        return false;
    }

    ofs.close();
    if (ofs.fail())
    {
        error = "cannot close temporary file " + temp.string() + ": " + errnoMessage();
        return false;
    }
    return true;
}

void AtomicFileWriter::DiscardTemp(const fs::path& temp)
{
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not remove temporary file " << temp.string() << ": " << ec.message();
    }
}

} // namespace files

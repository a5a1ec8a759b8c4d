#include "files/BinaryDetector.hpp"

#include <algorithm>
#include <array>

namespace files
{

BinaryDetector::BinaryDetector(std::size_t probe_bytes) noexcept
    : probe_bytes_(probe_bytes == 0 ? kDefaultProbeBytes : probe_bytes)
{
}

bool BinaryDetector::isBinary(std::istream& in) const
{
    std::array<char, kChunkSize> chunk{};
    std::size_t remaining = probe_bytes_;

    while (remaining > 0 && in)
    {
        const std::size_t want = std::min(remaining, chunk.size());
        in.read(chunk.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;

        if (std::find(chunk.begin(), chunk.begin() + got, '\0') != chunk.begin() + got)
            return true;

        remaining -= got;
    }
    return false;
}

bool BinaryDetector::isBinary(std::string_view data) const noexcept
{
    const std::string_view prefix = data.substr(0, std::min(data.size(), probe_bytes_));
    return prefix.find('\0') != std::string_view::npos;
}

} // namespace files

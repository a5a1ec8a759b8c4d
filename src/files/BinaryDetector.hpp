#pragma once

#include <cstddef>
#include <istream>
#include <string_view>

namespace files
{

// Classifies a file as binary when a NUL byte shows up in its first
// `probe_bytes` bytes.
class BinaryDetector
{
public:
    static constexpr std::size_t kDefaultProbeBytes = 8 * 1024;
    static constexpr std::size_t kChunkSize = 4096;

    explicit BinaryDetector(std::size_t probe_bytes = kDefaultProbeBytes) noexcept;

    // Reads at most probeBytes() from the current position, chunk by chunk,
    // stopping at the first NUL. The stream is left wherever reading stopped.
    [[nodiscard]] bool isBinary(std::istream& in) const;

    [[nodiscard]] bool isBinary(std::string_view data) const noexcept;

    [[nodiscard]] std::size_t probeBytes() const noexcept { return probe_bytes_; }

private:
    std::size_t probe_bytes_;
};

} // namespace files

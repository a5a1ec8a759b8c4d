#pragma once

#include <cstddef>
#include <string>

namespace processing {

// Core data contracts shared by the decoder, classifier and stripper.

// A decoded Unicode code point (U+0000..U+10FFFF, no surrogates)
using ScalarValue = char32_t;

// Written in place of a malformed UTF-8 sequence
constexpr ScalarValue kPlaceholder = U'?';

enum class DecodeStatus {
    Valid,     // Well-formed sequence, value is the decoded scalar
    Recovered  // Malformed sequence, value is kPlaceholder
};

// One scalar value with the byte span it was decoded from
struct DecodedScalar {
    ScalarValue value = 0;
    DecodeStatus status = DecodeStatus::Valid;
    std::size_t offset = 0;                   // Byte offset into the input
    std::size_t length = 0;                   // Bytes consumed (1-4)

    [[nodiscard]] bool valid() const noexcept { return status == DecodeStatus::Valid; }
};

// Run of scalars classified together as one user-perceived emoji
struct GraphemeSpan {
    std::size_t scalar_count = 0;
    std::size_t byte_offset = 0;
    std::size_t byte_length = 0;
    ScalarValue base = 0;                     // First scalar of the run
};

// What happens to a removed span in the output
enum class RemovalMode {
    Space, // One U+0020 per removed span
    Elide, // Nothing is written
    Width  // Display width of the base scalar, in spaces
};

// Result of stripping one buffer
struct ProcessingResult {
    std::string output;
    std::size_t removed_count = 0;            // Grapheme spans removed
    std::size_t recovered_count = 0;          // Malformed sequences replaced by kPlaceholder
};

} // namespace processing

#pragma once

#include "processing/TextProcessingTypes.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace processing
{

/// Lazy UTF-8 decoder over a borrowed buffer.
///
/// Every call to next() yields one scalar until the input is exhausted.
/// Malformed input never fails: the offending bytes come back as a
/// Recovered scalar carrying kPlaceholder, and decoding resumes after them.
class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view input) noexcept
        : input_(input)
    {
    }

    [[nodiscard]] std::optional<DecodedScalar> next();

    [[nodiscard]] bool done() const noexcept { return pos_ >= input_.size(); }

    // Bytes to skip for a malformed sequence starting at bytes[0].
    // A byte that cannot lead a sequence is skipped alone; a lead byte takes
    // the continuation bytes that follow it, up to its announced length.
    [[nodiscard]] static std::size_t recoveryLength(std::string_view bytes) noexcept;

private:
    std::string_view input_;
    std::size_t pos_ = 0;
};

} // namespace processing

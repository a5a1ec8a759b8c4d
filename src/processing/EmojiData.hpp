#pragma once

#include "processing/TextProcessingTypes.hpp"

#include <cstddef>

namespace processing
{

/// Inclusive codepoint range
struct CodepointRange
{
    ScalarValue first;
    ScalarValue last;
};

/// Read-only view over one of the compiled-in range tables
struct RangeTable
{
    const CodepointRange* data;
    std::size_t size;

    [[nodiscard]] const CodepointRange* begin() const noexcept { return data; }
    [[nodiscard]] const CodepointRange* end() const noexcept { return data + size; }
};

constexpr ScalarValue kZeroWidthJoiner = 0x200D;
constexpr ScalarValue kTextPresentationSelector = 0xFE0E;
constexpr ScalarValue kEmojiPresentationSelector = 0xFE0F;
constexpr ScalarValue kCombiningKeycap = 0x20E3;
constexpr ScalarValue kCancelTag = 0xE007F;

/// Codepoints rendered as emoji on their own
[[nodiscard]] RangeTable emojiPresentationRanges() noexcept;

/// Codepoints rendered as emoji only when followed by U+FE0F
[[nodiscard]] RangeTable textDefaultEmojiRanges() noexcept;

/// Binary search over a sorted, disjoint table
[[nodiscard]] bool containsCodepoint(RangeTable table, ScalarValue cp) noexcept;

[[nodiscard]] bool isEmojiPresentation(ScalarValue cp) noexcept;
[[nodiscard]] bool isTextDefaultEmoji(ScalarValue cp) noexcept;

/// Either of the above; what may follow a ZWJ inside a sequence
[[nodiscard]] bool isEmojiEligible(ScalarValue cp) noexcept;

[[nodiscard]] bool isRegionalIndicator(ScalarValue cp) noexcept;
[[nodiscard]] bool isSkinToneModifier(ScalarValue cp) noexcept;
[[nodiscard]] bool isVariationSelector(ScalarValue cp) noexcept;
[[nodiscard]] bool isTagCharacter(ScalarValue cp) noexcept;
[[nodiscard]] bool isKeycapBase(ScalarValue cp) noexcept;

} // namespace processing

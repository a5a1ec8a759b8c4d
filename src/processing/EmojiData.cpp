#include "processing/EmojiData.hpp"

#include <algorithm>
#include <array>

namespace processing
{

namespace
{

// Default emoji presentation. The pictograph, emoticon, transport and
// supplemental blocks of the SMP are taken whole; the BMP entries are the
// individual symbols and dingbats that render as emoji without a selector.
// Must stay sorted and disjoint.
constexpr std::array<CodepointRange, 55> kPresentationRanges = { {
    { 0x231A, 0x231B },   // watch, hourglass
    { 0x23E9, 0x23EC },
    { 0x23F0, 0x23F0 },
    { 0x23F3, 0x23F3 },
    { 0x25FD, 0x25FE },
    { 0x2614, 0x2615 },
    { 0x2648, 0x2653 },   // zodiac
    { 0x267F, 0x267F },
    { 0x2693, 0x2693 },
    { 0x26A1, 0x26A1 },
    { 0x26AA, 0x26AB },
    { 0x26BD, 0x26BE },
    { 0x26C4, 0x26C5 },
    { 0x26CE, 0x26CE },
    { 0x26D4, 0x26D4 },
    { 0x26EA, 0x26EA },
    { 0x26F2, 0x26F3 },
    { 0x26F5, 0x26F5 },
    { 0x26FA, 0x26FA },
    { 0x26FD, 0x26FD },
    { 0x2705, 0x2705 },
    { 0x270A, 0x270B },
    { 0x2728, 0x2728 },
    { 0x274C, 0x274C },
    { 0x274E, 0x274E },
    { 0x2753, 0x2755 },
    { 0x2757, 0x2757 },
    { 0x2795, 0x2797 },
    { 0x27B0, 0x27B0 },
    { 0x27BF, 0x27BF },
    { 0x2B1B, 0x2B1C },
    { 0x2B50, 0x2B50 },
    { 0x2B55, 0x2B55 },
    { 0x1F004, 0x1F004 }, // mahjong red dragon
    { 0x1F0CF, 0x1F0CF }, // joker
    { 0x1F18E, 0x1F18E },
    { 0x1F191, 0x1F19A }, // squared CL .. VS
    { 0x1F201, 0x1F201 },
    { 0x1F21A, 0x1F21A },
    { 0x1F22F, 0x1F22F },
    { 0x1F232, 0x1F236 },
    { 0x1F238, 0x1F23A },
    { 0x1F250, 0x1F251 },
    { 0x1F300, 0x1F5FF }, // misc symbols and pictographs
    { 0x1F600, 0x1F64F }, // emoticons
    { 0x1F680, 0x1F6FF }, // transport and map
    { 0x1F7E0, 0x1F7EB }, // coloured circles and squares
    { 0x1F7F0, 0x1F7F0 },
    { 0x1F90C, 0x1F93A }, // supplemental symbols and pictographs
    { 0x1F93C, 0x1F945 },
    { 0x1F947, 0x1F9FF },
    { 0x1FA70, 0x1FA7C }, // symbols and pictographs extended-A
    { 0x1FA80, 0x1FAC6 },
    { 0x1FACE, 0x1FAE9 },
    { 0x1FAF0, 0x1FAF8 },
} };

// Text presentation by default; emoji only with U+FE0F.
constexpr std::array<CodepointRange, 76> kTextDefaultRanges = { {
    { 0x00A9, 0x00A9 },   // copyright
    { 0x00AE, 0x00AE },   // registered
    { 0x203C, 0x203C },
    { 0x2049, 0x2049 },
    { 0x2122, 0x2122 },   // trade mark
    { 0x2139, 0x2139 },
    { 0x2194, 0x2199 },   // arrows
    { 0x21A9, 0x21AA },
    { 0x2328, 0x2328 },
    { 0x23CF, 0x23CF },
    { 0x23ED, 0x23EF },
    { 0x23F1, 0x23F2 },
    { 0x23F8, 0x23FA },
    { 0x24C2, 0x24C2 },
    { 0x25AA, 0x25AB },
    { 0x25B6, 0x25B6 },
    { 0x25C0, 0x25C0 },
    { 0x25FB, 0x25FC },
    { 0x2600, 0x2604 },
    { 0x260E, 0x260E },
    { 0x2611, 0x2611 },
    { 0x2618, 0x2618 },
    { 0x261D, 0x261D },
    { 0x2620, 0x2620 },
    { 0x2622, 0x2623 },
    { 0x2626, 0x2626 },
    { 0x262A, 0x262A },
    { 0x262E, 0x262F },
    { 0x2638, 0x263A },
    { 0x2640, 0x2640 },   // female sign
    { 0x2642, 0x2642 },   // male sign
    { 0x265F, 0x2660 },
    { 0x2663, 0x2663 },
    { 0x2665, 0x2666 },
    { 0x2668, 0x2668 },
    { 0x267B, 0x267B },
    { 0x267E, 0x267E },
    { 0x2692, 0x2692 },
    { 0x2694, 0x2697 },
    { 0x2699, 0x2699 },
    { 0x269B, 0x269C },
    { 0x26A0, 0x26A0 },
    { 0x26A7, 0x26A7 },
    { 0x26B0, 0x26B1 },
    { 0x26C8, 0x26C8 },
    { 0x26CF, 0x26CF },
    { 0x26D1, 0x26D1 },
    { 0x26D3, 0x26D3 },
    { 0x26E9, 0x26E9 },
    { 0x26F0, 0x26F1 },
    { 0x26F4, 0x26F4 },
    { 0x26F7, 0x26F9 },
    { 0x2702, 0x2702 },
    { 0x2708, 0x2709 },
    { 0x270C, 0x270D },
    { 0x270F, 0x270F },
    { 0x2712, 0x2712 },
    { 0x2714, 0x2714 },
    { 0x2716, 0x2716 },
    { 0x271D, 0x271D },
    { 0x2721, 0x2721 },
    { 0x2733, 0x2734 },
    { 0x2744, 0x2744 },
    { 0x2747, 0x2747 },
    { 0x2763, 0x2764 },   // heavy heart
    { 0x27A1, 0x27A1 },
    { 0x2934, 0x2935 },
    { 0x2B05, 0x2B07 },
    { 0x3030, 0x3030 },
    { 0x303D, 0x303D },
    { 0x3297, 0x3297 },
    { 0x3299, 0x3299 },
    { 0x1F170, 0x1F171 }, // negative squared A, B
    { 0x1F17E, 0x1F17F },
    { 0x1F202, 0x1F202 },
    { 0x1F237, 0x1F237 },
} };

} // namespace

RangeTable emojiPresentationRanges() noexcept
{
    return { kPresentationRanges.data(), kPresentationRanges.size() };
}

RangeTable textDefaultEmojiRanges() noexcept
{
    return { kTextDefaultRanges.data(), kTextDefaultRanges.size() };
}

bool containsCodepoint(RangeTable table, ScalarValue cp) noexcept
{
    // First range whose upper bound is not below cp
    const CodepointRange* it = std::lower_bound(table.begin(), table.end(), cp,
                                                [](const CodepointRange& range, ScalarValue value)
                                                { return range.last < value; });
    return it != table.end() && it->first <= cp;
}

bool isEmojiPresentation(ScalarValue cp) noexcept
{
    // Nothing below U+231A renders as emoji by default.
    if (cp < 0x231Au)
        return false;
    return containsCodepoint(emojiPresentationRanges(), cp);
}

bool isTextDefaultEmoji(ScalarValue cp) noexcept
{
    if (cp < 0x00A9u)
        return false;
    return containsCodepoint(textDefaultEmojiRanges(), cp);
}

bool isEmojiEligible(ScalarValue cp) noexcept
{
    return isEmojiPresentation(cp) || isTextDefaultEmoji(cp);
}

bool isRegionalIndicator(ScalarValue cp) noexcept
{
    return cp >= 0x1F1E6u && cp <= 0x1F1FFu;
}

bool isSkinToneModifier(ScalarValue cp) noexcept
{
    return cp >= 0x1F3FBu && cp <= 0x1F3FFu;
}

bool isVariationSelector(ScalarValue cp) noexcept
{
    return cp == kTextPresentationSelector || cp == kEmojiPresentationSelector;
}

bool isTagCharacter(ScalarValue cp) noexcept
{
    return cp >= 0xE0020u && cp <= kCancelTag;
}

bool isKeycapBase(ScalarValue cp) noexcept
{
    return (cp >= U'0' && cp <= U'9') || cp == U'#' || cp == U'*';
}

} // namespace processing

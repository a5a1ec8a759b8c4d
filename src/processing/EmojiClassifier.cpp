#include "processing/EmojiClassifier.hpp"
#include "processing/EmojiData.hpp"

namespace processing
{

namespace
{

bool peekIs(ScalarWindow& window, std::size_t index, ScalarValue expected)
{
    const DecodedScalar* scalar = window.peek(index);
    return scalar && scalar->valid() && scalar->value == expected;
}

bool peekIsRegionalIndicator(ScalarWindow& window, std::size_t index)
{
    const DecodedScalar* scalar = window.peek(index);
    return scalar && scalar->valid() && isRegionalIndicator(scalar->value);
}

} // namespace

std::optional<GraphemeSpan> EmojiClassifier::match(ScalarWindow& window) const
{
    const DecodedScalar* first = window.peek(0);
    if (!first || !first->valid())
        return std::nullopt;

    const ScalarValue cp = first->value;

    // Flags pair up; a lone indicator still renders as a letter tile.
    if (isRegionalIndicator(cp))
    {
        const std::size_t count = peekIsRegionalIndicator(window, 1) ? 2 : 1;
        return makeSpan(window, count);
    }

    if (isKeycapBase(cp))
    {
        const std::size_t count = matchKeycap(window);
        if (count == 0)
            return std::nullopt;
        return makeSpan(window, count);
    }

    if (isEmojiPresentation(cp) || (isTextDefaultEmoji(cp) && startsEmojiSequence(window)))
        return makeSpan(window, extend(window, 1));

    return std::nullopt;
}

// A text-default symbol is emoji when VS16, a skin tone or a ZWJ joining
// another emoji follows it.
bool EmojiClassifier::startsEmojiSequence(ScalarWindow& window) const
{
    const DecodedScalar* next = window.peek(1);
    if (!next || !next->valid())
        return false;

    if (next->value == kEmojiPresentationSelector || isSkinToneModifier(next->value))
        return true;

    if (next->value == kZeroWidthJoiner)
    {
        const DecodedScalar* joined = window.peek(2);
        return joined && joined->valid() && isEmojiEligible(joined->value);
    }
    return false;
}

// "1" U+FE0F U+20E3, or "1" U+20E3
std::size_t EmojiClassifier::matchKeycap(ScalarWindow& window) const
{
    std::size_t index = 1;
    if (peekIs(window, index, kEmojiPresentationSelector))
        ++index;
    if (!peekIs(window, index, kCombiningKeycap))
        return 0;
    return index + 1;
}

std::size_t EmojiClassifier::extend(ScalarWindow& window, std::size_t count) const
{
    while (count < kMaxSpanScalars)
    {
        const DecodedScalar* next = window.peek(count);
        if (!next || !next->valid())
            break;

        const ScalarValue cp = next->value;
        if (isVariationSelector(cp) || isSkinToneModifier(cp) || isTagCharacter(cp) || cp == kCombiningKeycap)
        {
            ++count;
            continue;
        }

        if (cp == kZeroWidthJoiner)
        {
            const DecodedScalar* joined = window.peek(count + 1);
            if (joined && joined->valid() && isEmojiEligible(joined->value))
            {
                count += 2;
                continue;
            }
        }

        break;
    }
    return count;
}

GraphemeSpan EmojiClassifier::makeSpan(ScalarWindow& window, std::size_t count) const
{
    const DecodedScalar* first = window.peek(0);
    const DecodedScalar* last = window.peek(count - 1);

    GraphemeSpan span;
    span.scalar_count = count;
    span.base = first->value;
    span.byte_offset = first->offset;
    span.byte_length = last->offset + last->length - first->offset;
    return span;
}

} // namespace processing

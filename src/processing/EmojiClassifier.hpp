#pragma once

#include "processing/ScalarWindow.hpp"
#include "processing/TextProcessingTypes.hpp"

#include <cstddef>
#include <optional>

namespace processing
{

/// Finds the emoji grapheme, if any, that starts at the cursor of a
/// ScalarWindow. Matching is greedy: a span is always extended as far as
/// its joiners, selectors, modifiers and tags allow.
class EmojiClassifier
{
public:
    // Longest span the classifier will look at. Standardised sequences stay
    // well below this; longer runs are cut into several spans.
    static constexpr std::size_t kMaxSpanScalars = 32;

    [[nodiscard]] std::optional<GraphemeSpan> match(ScalarWindow& window) const;

private:
    [[nodiscard]] bool startsEmojiSequence(ScalarWindow& window) const;
    [[nodiscard]] std::size_t matchKeycap(ScalarWindow& window) const;
    [[nodiscard]] std::size_t extend(ScalarWindow& window, std::size_t count) const;
    [[nodiscard]] GraphemeSpan makeSpan(ScalarWindow& window, std::size_t count) const;
};

} // namespace processing

#pragma once

#include "processing/EmojiClassifier.hpp"
#include "processing/TextProcessingTypes.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace processing
{

class EmojiStripper
{
public:
    explicit EmojiStripper(RemovalMode mode = RemovalMode::Space) noexcept
        : mode_(mode)
    {
    }

    // Removes every emoji grapheme from UTF-8 input. Each removed span counts
    // once, however many scalars it holds. Malformed sequences come out as
    // kPlaceholder. Deterministic and free of side effects.
    [[nodiscard]] ProcessingResult strip(std::string_view input) const;

    [[nodiscard]] RemovalMode mode() const noexcept { return mode_; }

private:
    void writeReplacement(const GraphemeSpan& span, std::string& out) const;

    EmojiClassifier classifier_;
    RemovalMode mode_;
};

[[nodiscard]] std::optional<RemovalMode> ParseRemovalMode(std::string_view name);
[[nodiscard]] const char* RemovalModeToString(RemovalMode mode) noexcept;

} // namespace processing

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// One-line rendering of stripped text for debug logs. Works scalar by
// scalar, so a multi-byte character is either shown whole or not at all.
// Line breaks and tabs print as \n \r \t, other control characters and
// malformed bytes as \xNN.
class TextPreview
{
public:
    static constexpr std::size_t kDefaultMaxBytes = 160;

    explicit TextPreview(std::size_t max_bytes = kDefaultMaxBytes) noexcept;

    // Appends "... (<size> bytes)" when the text did not fit.
    [[nodiscard]] std::string render(std::string_view text) const;

private:
    std::size_t max_bytes_;
};

} // namespace processing

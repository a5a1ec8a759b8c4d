#include "processing/EmojiStripper.hpp"
#include "processing/ScalarWindow.hpp"

#include <utf8proc.h>

namespace processing
{

ProcessingResult EmojiStripper::strip(std::string_view input) const
{
    ProcessingResult result;
    result.output.reserve(input.size());

    ScalarWindow window(input, EmojiClassifier::kMaxSpanScalars);
    while (!window.atEnd())
    {
        const DecodedScalar* scalar = window.peek(0);
        if (auto span = classifier_.match(window))
        {
            writeReplacement(*span, result.output);
            ++result.removed_count;
            window.consume(span->scalar_count);
            continue;
        }

        if (scalar->valid())
        {
            result.output.append(input.substr(scalar->offset, scalar->length));
        }
        else
        {
            result.output.push_back(static_cast<char>(kPlaceholder));
            ++result.recovered_count;
        }
        window.consume(1);
    }

    return result;
}

void EmojiStripper::writeReplacement(const GraphemeSpan& span, std::string& out) const
{
    switch (mode_)
    {
    case RemovalMode::Space:
        out.push_back(' ');
        break;
    case RemovalMode::Elide:
        break;
    case RemovalMode::Width:
    {
        int width = utf8proc_charwidth(static_cast<utf8proc_int32_t>(span.base));
        if (width < 1)
            width = 1;
        out.append(static_cast<std::size_t>(width), ' ');
        break;
    }
    }
}

std::optional<RemovalMode> ParseRemovalMode(std::string_view name)
{
    if (name == "space")
        return RemovalMode::Space;
    if (name == "elide")
        return RemovalMode::Elide;
    if (name == "width")
        return RemovalMode::Width;
    return std::nullopt;
}

const char* RemovalModeToString(RemovalMode mode) noexcept
{
    switch (mode)
    {
    case RemovalMode::Space:
        return "space";
    case RemovalMode::Elide:
        return "elide";
    case RemovalMode::Width:
        return "width";
    default:
        return "unknown";
    }
}

} // namespace processing

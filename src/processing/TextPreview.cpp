#include "processing/TextPreview.hpp"
#include "processing/Utf8Decoder.hpp"

namespace processing
{

namespace
{

void appendHexByte(std::string& out, unsigned char byte)
{
    static constexpr char kDigits[] = "0123456789ABCDEF";
    out += "\\x";
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
}

std::string escapeScalar(std::string_view text, const DecodedScalar& scalar)
{
    const std::string_view bytes = text.substr(scalar.offset, scalar.length);
    std::string piece;

    if (!scalar.valid())
    {
        for (char byte : bytes)
            appendHexByte(piece, static_cast<unsigned char>(byte));
        return piece;
    }

    switch (scalar.value)
    {
    case U'\n':
        return "\\n";
    case U'\r':
        return "\\r";
    case U'\t':
        return "\\t";
    default:
        break;
    }

    if (scalar.value < 0x20 || scalar.value == 0x7F)
    {
        appendHexByte(piece, static_cast<unsigned char>(scalar.value));
        return piece;
    }

    return std::string(bytes);
}

} // namespace

TextPreview::TextPreview(std::size_t max_bytes) noexcept
    : max_bytes_(max_bytes == 0 ? 1 : max_bytes)
{
}

std::string TextPreview::render(std::string_view text) const
{
    std::string out;
    bool truncated = false;

    Utf8Decoder decoder(text);
    while (auto scalar = decoder.next())
    {
        // The budget counts input bytes; escapes may lengthen the line.
        if (scalar->offset + scalar->length > max_bytes_)
        {
            truncated = true;
            break;
        }
        out += escapeScalar(text, *scalar);
    }

    if (truncated)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

} // namespace processing

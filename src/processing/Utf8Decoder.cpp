#include "processing/Utf8Decoder.hpp"

#include <utf8proc.h>

namespace processing
{

namespace
{

std::size_t announcedLength(unsigned char lead) noexcept
{
    if (lead >= 0xC2u && lead <= 0xDFu)
        return 2;
    if (lead >= 0xE0u && lead <= 0xEFu)
        return 3;
    if (lead >= 0xF0u && lead <= 0xF4u)
        return 4;
    return 1;
}

bool isContinuation(unsigned char c) noexcept
{
    return (c & 0xC0u) == 0x80u;
}

} // namespace

std::optional<DecodedScalar> Utf8Decoder::next()
{
    if (done())
        return std::nullopt;

    DecodedScalar scalar;
    scalar.offset = pos_;

    const unsigned char lead = static_cast<unsigned char>(input_[pos_]);
    if (lead < 0x80u)
    {
        scalar.value = lead;
        scalar.length = 1;
        ++pos_;
        return scalar;
    }

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(input_.data() + pos_);
    const auto remaining = static_cast<utf8proc_ssize_t>(input_.size() - pos_);

    utf8proc_int32_t codepoint = -1;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, remaining, &codepoint);
    if (bytes > 0 && codepoint >= 0)
    {
        scalar.value = static_cast<ScalarValue>(codepoint);
        scalar.length = static_cast<std::size_t>(bytes);
    }
    else
    {
        scalar.value = kPlaceholder;
        scalar.status = DecodeStatus::Recovered;
        scalar.length = recoveryLength(input_.substr(pos_));
    }

    pos_ += scalar.length;
    return scalar;
}

std::size_t Utf8Decoder::recoveryLength(std::string_view bytes) noexcept
{
    if (bytes.empty())
        return 0;

    const std::size_t expected = announcedLength(static_cast<unsigned char>(bytes[0]));
    std::size_t length = 1;
    while (length < expected && length < bytes.size() &&
           isContinuation(static_cast<unsigned char>(bytes[length])))
    {
        ++length;
    }
    return length;
}

} // namespace processing

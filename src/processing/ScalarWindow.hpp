#pragma once

#include "processing/Utf8Decoder.hpp"

#include <cstddef>
#include <deque>
#include <string_view>

namespace processing
{

// Bounded lookahead over a Utf8Decoder. Scalars are decoded only when
// peeked, and dropped once consumed.
class ScalarWindow
{
public:
    ScalarWindow(std::string_view input, std::size_t max_lookahead);

    // Scalar `index` positions ahead of the cursor, or nullptr past the end
    // of input or beyond the lookahead bound.
    [[nodiscard]] const DecodedScalar* peek(std::size_t index = 0);

    void consume(std::size_t count);

    [[nodiscard]] bool atEnd();

private:
    Utf8Decoder decoder_;
    std::deque<DecodedScalar> buffer_;
    std::size_t max_lookahead_;
};

} // namespace processing

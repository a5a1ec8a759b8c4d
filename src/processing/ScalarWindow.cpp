#include "processing/ScalarWindow.hpp"

#include <algorithm>

namespace processing
{

ScalarWindow::ScalarWindow(std::string_view input, std::size_t max_lookahead)
    : decoder_(input)
    , max_lookahead_(std::max<std::size_t>(max_lookahead, 1))
{
}

const DecodedScalar* ScalarWindow::peek(std::size_t index)
{
    if (index >= max_lookahead_)
        return nullptr;

    while (buffer_.size() <= index)
    {
        auto scalar = decoder_.next();
        if (!scalar)
            return nullptr;
        buffer_.push_back(*scalar);
    }
    return &buffer_[index];
}

void ScalarWindow::consume(std::size_t count)
{
    while (count > 0)
    {
        if (buffer_.empty())
        {
            // Skipping past what was peeked; decode and drop.
            if (!decoder_.next())
                return;
        }
        else
        {
            buffer_.pop_front();
        }
        --count;
    }
}

bool ScalarWindow::atEnd()
{
    return peek(0) == nullptr;
}

} // namespace processing

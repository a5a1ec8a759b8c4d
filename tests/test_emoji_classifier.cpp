#include <catch2/catch_test_macros.hpp>

#include "processing/EmojiClassifier.hpp"
#include "processing/EmojiData.hpp"

#include <optional>
#include <string>
#include <string_view>

using namespace processing;

namespace
{
std::optional<GraphemeSpan> matchAtStart(std::string_view text)
{
    ScalarWindow window(text, EmojiClassifier::kMaxSpanScalars);
    EmojiClassifier classifier;
    return classifier.match(window);
}

bool sortedAndDisjoint(RangeTable table)
{
    for (std::size_t i = 0; i < table.size; ++i)
    {
        if (table.data[i].first > table.data[i].last)
            return false;
        if (i > 0 && table.data[i - 1].last >= table.data[i].first)
            return false;
    }
    return true;
}
} // namespace

TEST_CASE("EmojiData - tables are sorted and disjoint", "[emoji][data]")
{
    REQUIRE(emojiPresentationRanges().size > 0);
    REQUIRE(textDefaultEmojiRanges().size > 0);
    REQUIRE(sortedAndDisjoint(emojiPresentationRanges()));
    REQUIRE(sortedAndDisjoint(textDefaultEmojiRanges()));

    for (const auto& range : textDefaultEmojiRanges())
    {
        REQUIRE_FALSE(isEmojiPresentation(range.first));
        REQUIRE_FALSE(isEmojiPresentation(range.last));
    }
}

TEST_CASE("EmojiData - range lookup boundaries", "[emoji][data]")
{
    SECTION("pictograph block edges")
    {
        REQUIRE(isEmojiPresentation(0x1F300));
        REQUIRE(isEmojiPresentation(0x1F64F));
        REQUIRE_FALSE(isEmojiPresentation(0x1F2FF));
        REQUIRE_FALSE(isEmojiPresentation(0x1F650));
    }

    SECTION("single entries")
    {
        REQUIRE(isEmojiPresentation(0x2B50)); // star
        REQUIRE_FALSE(isEmojiPresentation(0x2B51));
        REQUIRE(isEmojiPresentation(0x231A));
        REQUIRE_FALSE(isEmojiPresentation(0x2319));
    }

    SECTION("text-default symbols")
    {
        REQUIRE(isTextDefaultEmoji(0x00A9));
        REQUIRE(isTextDefaultEmoji(0x2764));
        REQUIRE_FALSE(isTextDefaultEmoji(U'A'));
        REQUIRE_FALSE(isEmojiPresentation(0x2764));
        REQUIRE(isEmojiEligible(0x2764));
    }

    SECTION("plain text is never emoji")
    {
        for (ScalarValue cp : { U'a', U'Z', U'0', U' ', U'\n', ScalarValue(0x00E9), ScalarValue(0x3042),
                                ScalarValue(0x4E16) })
        {
            REQUIRE_FALSE(isEmojiEligible(cp));
        }
    }
}

TEST_CASE("EmojiData - component predicates", "[emoji][data]")
{
    REQUIRE(isRegionalIndicator(0x1F1E6));
    REQUIRE(isRegionalIndicator(0x1F1FF));
    REQUIRE_FALSE(isRegionalIndicator(0x1F200));

    REQUIRE(isSkinToneModifier(0x1F3FB));
    REQUIRE(isSkinToneModifier(0x1F3FF));
    REQUIRE_FALSE(isSkinToneModifier(0x1F3FA));

    REQUIRE(isVariationSelector(kEmojiPresentationSelector));
    REQUIRE(isVariationSelector(kTextPresentationSelector));
    REQUIRE_FALSE(isVariationSelector(0xFE00));

    REQUIRE(isTagCharacter(0xE0067));
    REQUIRE(isTagCharacter(kCancelTag));
    REQUIRE_FALSE(isTagCharacter(0xE001F));

    REQUIRE(isKeycapBase(U'7'));
    REQUIRE(isKeycapBase(U'#'));
    REQUIRE(isKeycapBase(U'*'));
    REQUIRE_FALSE(isKeycapBase(U'a'));
}

TEST_CASE("EmojiClassifier - no span on plain text", "[emoji][classifier]")
{
    REQUIRE_FALSE(matchAtStart("Hello").has_value());
    REQUIRE_FALSE(matchAtStart("").has_value());
    REQUIRE_FALSE(matchAtStart("日本").has_value());
    REQUIRE_FALSE(matchAtStart("\xFF").has_value());
}

TEST_CASE("EmojiClassifier - single codepoint emoji", "[emoji][classifier]")
{
    auto span = matchAtStart("\U0001F600 trailing");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 1);
    REQUIRE(span->byte_offset == 0);
    REQUIRE(span->byte_length == 4);
    REQUIRE(span->base == 0x1F600u);
}

TEST_CASE("EmojiClassifier - skin tone modifier extends the span", "[emoji][classifier]")
{
    auto span = matchAtStart("\U0001F44B\U0001F3FD!");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 2);
    REQUIRE(span->byte_length == 8);
}

TEST_CASE("EmojiClassifier - ZWJ family is one span", "[emoji][classifier]")
{
    // man, woman, girl, boy joined by three ZWJs
    auto span = matchAtStart("\U0001F468\u200D\U0001F469\u200D\U0001F467\u200D\U0001F466 end");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 7);
    REQUIRE(span->byte_length == 4 * 4 + 3 * 3);
}

TEST_CASE("EmojiClassifier - ZWJ sequences with selectors and text-default parts", "[emoji][classifier]")
{
    SECTION("rainbow flag")
    {
        auto span = matchAtStart("\U0001F3F3\uFE0F\u200D\U0001F308");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 4);
    }

    SECTION("heart on fire starts from a text-default heart")
    {
        auto span = matchAtStart("❤\uFE0F\u200D\U0001F525");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 4);
    }

    SECTION("woman health worker joins a text-default symbol")
    {
        auto span = matchAtStart("\U0001F469\u200D⚕\uFE0F");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 4);
    }
}

TEST_CASE("EmojiClassifier - ZWJ not followed by emoji ends the span", "[emoji][classifier]")
{
    auto span = matchAtStart("\U0001F600\u200DA");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 1);
    REQUIRE(span->byte_length == 4);

    auto trailing = matchAtStart("\U0001F600\u200D");
    REQUIRE(trailing.has_value());
    REQUIRE(trailing->scalar_count == 1);
}

TEST_CASE("EmojiClassifier - regional indicators pair into flags", "[emoji][classifier]")
{
    SECTION("one flag")
    {
        auto span = matchAtStart("\U0001F1EF\U0001F1F5");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 2);
        REQUIRE(span->byte_length == 8);
    }

    SECTION("two flags in a row match one at a time")
    {
        auto span = matchAtStart("\U0001F1EF\U0001F1F5\U0001F1FA\U0001F1F8");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 2);
    }

    SECTION("lone indicator")
    {
        auto span = matchAtStart("\U0001F1EF x");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 1);
    }
}

TEST_CASE("EmojiClassifier - keycap sequences", "[emoji][classifier]")
{
    SECTION("digit, VS16, keycap")
    {
        auto span = matchAtStart("1\uFE0F\u20E3");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 3);
        REQUIRE(span->byte_length == 1 + 3 + 3);
    }

    SECTION("hash without selector")
    {
        auto span = matchAtStart("#\u20E3");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 2);
    }

    SECTION("bare digits are text")
    {
        REQUIRE_FALSE(matchAtStart("123").has_value());
        REQUIRE_FALSE(matchAtStart("1\uFE0F").has_value());
    }
}

TEST_CASE("EmojiClassifier - text-default symbols need VS16", "[emoji][classifier]")
{
    REQUIRE_FALSE(matchAtStart("© 2024").has_value());
    REQUIRE_FALSE(matchAtStart("❤").has_value());
    REQUIRE_FALSE(matchAtStart("❤\uFE0E").has_value());

    auto span = matchAtStart("©\uFE0F");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 2);
}

TEST_CASE("EmojiClassifier - text-default bases take modifiers and joiners", "[emoji][classifier]")
{
    SECTION("index finger with skin tone")
    {
        auto span = matchAtStart("\u261D\U0001F3FB!");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 2);
        REQUIRE(span->byte_length == 3 + 4);
        REQUIRE(span->base == 0x261Du);
    }

    SECTION("ball player with skin tone, ZWJ and gender sign")
    {
        auto span = matchAtStart("\u26F9\U0001F3FB\u200D\u2640\uFE0F rest");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 5);
        REQUIRE(span->byte_length == 3 + 4 + 3 + 3 + 3);
    }

    SECTION("heart joined without VS16")
    {
        auto span = matchAtStart("\u2764\u200D\U0001F525");
        REQUIRE(span.has_value());
        REQUIRE(span->scalar_count == 3);
    }

    SECTION("joiner followed by plain text does not qualify")
    {
        REQUIRE_FALSE(matchAtStart("\u2764\u200DA").has_value());
    }
}

TEST_CASE("EmojiClassifier - tag sequence subdivision flag", "[emoji][classifier]")
{
    // black flag + "gbeng" tags + cancel tag
    auto span = matchAtStart("\U0001F3F4\U000E0067\U000E0062\U000E0065\U000E006E\U000E0067\U000E007F");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 7);
    REQUIRE(span->byte_length == 7 * 4);
}

TEST_CASE("EmojiClassifier - malformed bytes break a sequence", "[emoji][classifier]")
{
    auto span = matchAtStart("\U0001F600\xFF\U0001F3FB");
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == 1);
}

TEST_CASE("EmojiClassifier - span length is bounded", "[emoji][classifier]")
{
    std::string text = "\U0001F600";
    for (int i = 0; i < 40; ++i)
        text += "\uFE0F";

    auto span = matchAtStart(text);
    REQUIRE(span.has_value());
    REQUIRE(span->scalar_count == EmojiClassifier::kMaxSpanScalars);
}

#include <catch2/catch_test_macros.hpp>

#include "processing/EmojiStripper.hpp"

#include <string>

using namespace processing;

TEST_CASE("EmojiStripper - text without emoji passes through", "[emoji][stripper]")
{
    EmojiStripper stripper;

    SECTION("empty input")
    {
        auto result = stripper.strip("");
        REQUIRE(result.output.empty());
        REQUIRE(result.removed_count == 0);
        REQUIRE(result.recovered_count == 0);
    }

    SECTION("ASCII")
    {
        const std::string text = "line one\nline two\twith tab\r\n";
        auto result = stripper.strip(text);
        REQUIRE(result.output == text);
        REQUIRE(result.removed_count == 0);
    }

    SECTION("Japanese and accented text")
    {
        const std::string text = "こんにちは、世界。café ñ €";
        auto result = stripper.strip(text);
        REQUIRE(result.output == text);
        REQUIRE(result.removed_count == 0);
    }
}

TEST_CASE("EmojiStripper - removal modes", "[emoji][stripper]")
{
    const std::string text = "Hello \U0001F44B World!";

    SECTION("space leaves one space per emoji")
    {
        auto result = EmojiStripper(RemovalMode::Space).strip(text);
        REQUIRE(result.output == "Hello   World!");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("elide removes the bytes outright")
    {
        auto result = EmojiStripper(RemovalMode::Elide).strip(text);
        REQUIRE(result.output == "Hello  World!");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("width pads to the display width")
    {
        auto result = EmojiStripper(RemovalMode::Width).strip("\U0001F600");
        REQUIRE(result.output == "  ");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("default is space")
    {
        REQUIRE(EmojiStripper().mode() == RemovalMode::Space);
    }
}

TEST_CASE("EmojiStripper - sequences count once", "[emoji][stripper]")
{
    EmojiStripper stripper(RemovalMode::Elide);

    SECTION("ZWJ family")
    {
        auto result = stripper.strip("A\U0001F468\u200D\U0001F469\u200D\U0001F467\u200D\U0001F466B");
        REQUIRE(result.output == "AB");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("skin tone")
    {
        auto result = stripper.strip("\U0001F44D\U0001F3FE ok");
        REQUIRE(result.output == " ok");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("mixed emoji and flags")
    {
        auto result = EmojiStripper(RemovalMode::Space).strip("a\U0001F600b\U0001F1EF\U0001F1F5c");
        REQUIRE(result.output == "a b c");
        REQUIRE(result.removed_count == 2);
    }

    SECTION("adjacent emoji are separate spans")
    {
        auto result = stripper.strip("\U0001F600\U0001F601\U0001F602");
        REQUIRE(result.output.empty());
        REQUIRE(result.removed_count == 3);
    }
}

TEST_CASE("EmojiStripper - text-default symbols and keycaps", "[emoji][stripper]")
{
    EmojiStripper stripper(RemovalMode::Elide);

    SECTION("bare copyright sign is kept")
    {
        auto result = stripper.strip("© 2024");
        REQUIRE(result.output == "© 2024");
        REQUIRE(result.removed_count == 0);
    }

    SECTION("copyright with VS16 is removed")
    {
        auto result = stripper.strip("©\uFE0F 2024");
        REQUIRE(result.output == " 2024");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("digits stay, keycaps go")
    {
        auto result = stripper.strip("1 2 3\uFE0F\u20E3");
        REQUIRE(result.output == "1 2 ");
        REQUIRE(result.removed_count == 1);
    }

    SECTION("ZWJ between letters is untouched")
    {
        auto result = stripper.strip("A\u200DB");
        REQUIRE(result.output == "A\u200DB");
        REQUIRE(result.removed_count == 0);
    }
}

TEST_CASE("EmojiStripper - sequences on text-default bases are removed whole", "[emoji][stripper]")
{
    EmojiStripper stripper;

    auto finger = stripper.strip("a\u261D\U0001F3FB" "b");
    REQUIRE(finger.output == "a b");
    REQUIRE(finger.removed_count == 1);

    auto victory = stripper.strip("a\u270C\U0001F3FD" "b");
    REQUIRE(victory.output == "a b");
    REQUIRE(victory.removed_count == 1);

    auto player = stripper.strip("a\u26F9\U0001F3FB\u200D\u2640\uFE0F" "b");
    REQUIRE(player.output == "a b");
    REQUIRE(player.removed_count == 1);

    auto heart = stripper.strip("a\u2764\u200D\U0001F525" "b");
    REQUIRE(heart.output == "a b");
    REQUIRE(heart.removed_count == 1);
}

TEST_CASE("EmojiStripper - malformed input is replaced, not fatal", "[emoji][stripper][malformed]")
{
    EmojiStripper stripper;

    auto result = stripper.strip("abc\xF0\x9F");
    REQUIRE(result.output == "abc?");
    REQUIRE(result.recovered_count == 1);
    REQUIRE(result.removed_count == 0);

    auto mixed = stripper.strip("\xFF\U0001F600x");
    REQUIRE(mixed.output == "? x");
    REQUIRE(mixed.recovered_count == 1);
    REQUIRE(mixed.removed_count == 1);
}

TEST_CASE("EmojiStripper - stripping is idempotent", "[emoji][stripper]")
{
    for (RemovalMode mode : { RemovalMode::Space, RemovalMode::Elide, RemovalMode::Width })
    {
        EmojiStripper stripper(mode);
        auto once = stripper.strip("Good \U0001F31F job \U0001F44F\U0001F3FB! ❤\uFE0F \U0001F1EB\U0001F1F7 done");
        REQUIRE(once.removed_count == 4);

        auto twice = stripper.strip(once.output);
        REQUIRE(twice.output == once.output);
        REQUIRE(twice.removed_count == 0);
    }
}

TEST_CASE("EmojiStripper - overlong selector run is split at the lookahead bound", "[emoji][stripper]")
{
    std::string text = "\U0001F600";
    for (int i = 0; i < 40; ++i)
        text += "\uFE0F";

    std::string leftover;
    for (std::size_t i = 0; i < 40 - (EmojiClassifier::kMaxSpanScalars - 1); ++i)
        leftover += "\uFE0F";

    auto result = EmojiStripper(RemovalMode::Space).strip(text);
    REQUIRE(result.removed_count == 1);
    REQUIRE(result.output == " " + leftover);
}

TEST_CASE("EmojiStripper - removal mode names", "[emoji][stripper]")
{
    REQUIRE(ParseRemovalMode("space") == RemovalMode::Space);
    REQUIRE(ParseRemovalMode("elide") == RemovalMode::Elide);
    REQUIRE(ParseRemovalMode("width") == RemovalMode::Width);
    REQUIRE_FALSE(ParseRemovalMode("Space").has_value());
    REQUIRE_FALSE(ParseRemovalMode("").has_value());

    REQUIRE(std::string(RemovalModeToString(RemovalMode::Elide)) == "elide");
    REQUIRE(std::string(RemovalModeToString(RemovalMode::Width)) == "width");
}

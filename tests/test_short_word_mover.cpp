#include <catch2/catch_test_macros.hpp>
#include "text/ShortWordMover.hpp"
#include <string>

using namespace namekit::text;

TEST_CASE("ShortWordMover - moves leading short words", "[short_word]")
{
    REQUIRE(move_short_word("The Beatles") == "Beatles, The");
    REQUIRE(move_short_word("THE CURE") == "CURE, THE");
    REQUIRE(move_short_word("the xx") == "xx, the");
    REQUIRE(move_short_word("A Perfect Circle") == "Perfect Circle, A");
    REQUIRE(move_short_word("a ha") == "ha, a");
}

TEST_CASE("ShortWordMover - requires the exact lead word", "[short_word]")
{
    REQUIRE(move_short_word("Theatre of Tragedy") == "Theatre of Tragedy");
    REQUIRE(move_short_word("Them Crooked Vultures") == "Them Crooked Vultures");
    REQUIRE(move_short_word("tHe Band") == "tHe Band");
    REQUIRE(move_short_word(" The Band") == " The Band");
    REQUIRE(move_short_word("") == "");
}

TEST_CASE("ShortWordMover - undo restores the canonical lead word", "[short_word]")
{
    SECTION("Faithful inverse for The")
    {
        REQUIRE(move_short_word("Beatles, The", true) == "The Beatles");
    }

    SECTION("Other trailing forms also come back as The")
    {
        REQUIRE(move_short_word("CURE, THE", true) == "The CURE");
        REQUIRE(move_short_word("Perfect Circle, A", true) == "The Perfect Circle");
        REQUIRE(move_short_word("ha, a", true) == "The ha");
    }

    SECTION("Text without a trailing form is unchanged")
    {
        REQUIRE(move_short_word("Beatles", true) == "Beatles");
        REQUIRE(move_short_word("", true) == "");
    }
}

TEST_CASE("ShortWordMover - undo on text no longer than the suffix", "[short_word]")
{
    REQUIRE(move_short_word(", A", true) == "The");
    REQUIRE(move_short_word(", The", true) == "The");
    REQUIRE(move_short_word("A", true) == "A");
}

TEST_CASE("ShortWordMover - only the first matching entry applies", "[short_word]")
{
    REQUIRE(move_short_word("The A Team") == "A Team, The");
    REQUIRE(move_short_word("A The Band") == "The Band, A");
    REQUIRE(move_short_word("Team, A, The", true) == "The Team, A");
}

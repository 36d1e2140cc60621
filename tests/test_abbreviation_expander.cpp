#include <catch2/catch_test_macros.hpp>
#include "text/AbbreviationExpander.hpp"
#include <string>

using namespace namekit::text;

TEST_CASE("expand_abbreviations - ampersand", "[abbreviations]")
{
    REQUIRE(expand_abbreviations("Simon & Garfunkel") == "Simon and Garfunkel");
    REQUIRE(expand_abbreviations("R&B") == "R and B");
}

TEST_CASE("expand_abbreviations - separators become spaces", "[abbreviations]")
{
    REQUIRE(expand_abbreviations("AC/DC") == "AC DC");
    REQUIRE(expand_abbreviations("blink-182") == "blink 182");
}

TEST_CASE("expand_abbreviations - plus and at", "[abbreviations]")
{
    REQUIRE(expand_abbreviations("Florence + The Machine") == "Florence plus The Machine");
    REQUIRE(expand_abbreviations("C+D") == "C plus D");
    REQUIRE(expand_abbreviations("Live @ Wembley") == "Live at Wembley");
    REQUIRE(expand_abbreviations("me@home") == "me at home");
}

TEST_CASE("expand_abbreviations - titles", "[abbreviations]")
{
    REQUIRE(expand_abbreviations("Mr. Big") == "Mister Big");
    REQUIRE(expand_abbreviations("Mrs. Robinson") == "Misses Robinson");
    REQUIRE(expand_abbreviations("Ms. Jackson") == "Miss Jackson");
    REQUIRE(expand_abbreviations("Sammy Davis Jr.") == "Sammy Davis Junior");
}

TEST_CASE("expand_abbreviations - table keeps spaced forms ahead of bare ones", "[abbreviations]")
{
    const auto& table = abbreviation_table();
    REQUIRE(table.size() == 12);
    REQUIRE(table[0].pattern == " & ");
    REQUIRE(table[1].pattern == "&");
    REQUIRE(table[4].pattern == " + ");
    REQUIRE(table[5].pattern == "+");
}

TEST_CASE("expand_abbreviations - handles empty and plain text", "[abbreviations]")
{
    REQUIRE(expand_abbreviations("") == "");
    REQUIRE(expand_abbreviations("Nothing to do") == "Nothing to do");
}

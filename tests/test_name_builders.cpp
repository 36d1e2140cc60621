#include <catch2/catch_test_macros.hpp>
#include "text/NameBuilders.hpp"
#include "text/PlatformCharset.hpp"
#include "text/TextUtils.hpp"
#include <string>
#include <vector>

using namespace namekit::text;

TEST_CASE("to_sortable_name - full pipeline", "[sortable]")
{
    REQUIRE(to_sortable_name("blink-182") == "Blink 182");
    REQUIRE(to_sortable_name("The Beatles") == "Beatles, The");
    REQUIRE(to_sortable_name("Simon & Garfunkel") == "Simon and Garfunkel");
    REQUIRE(to_sortable_name("Motörhead") == "Motorhead");
    REQUIRE(to_sortable_name("AC/DC") == "AC DC");
    REQUIRE(to_sortable_name("Guns N' Roses") == "Guns N' Roses");
    REQUIRE(to_sortable_name("Mr. Bungle") == "Mister Bungle");
    REQUIRE(to_sortable_name("Beyoncé!") == "Beyonce");
}

TEST_CASE("to_sortable_name - stage order", "[sortable]")
{
    SECTION("Parentheses are removed before the short word moves")
    {
        REQUIRE(to_sortable_name("The Jimi Hendrix Experience (Live)") == "Jimi Hendrix Experience Live, The");
    }

    SECTION("Capitalization runs after the move")
    {
        REQUIRE(to_sortable_name("the who") == "Who, the");
    }

    SECTION("Abbreviations see the raw punctuation")
    {
        REQUIRE(to_sortable_name("Tom Petty & the Heartbreakers") == "Tom Petty and the Heartbreakers");
    }

    SECTION("Space runs collapse")
    {
        REQUIRE(to_sortable_name("AC / DC") == "AC DC");
        REQUIRE(to_sortable_name("Earth, Wind & Fire") == "Earth Wind and Fire");
    }
}

TEST_CASE("to_sortable_name - handles empty string", "[sortable]")
{
    REQUIRE(to_sortable_name("") == "");
}

TEST_CASE("acronym - initials of multiple words", "[acronym]")
{
    REQUIRE(acronym("Guns N' Roses") == "GNR");
    REQUIRE(acronym("red hot chili peppers") == "RHCP");
    REQUIRE(acronym("AC/DC") == "AD");
    REQUIRE(acronym("Sigur Rós") == "SR");
    REQUIRE(acronym("édith piaf") == "ÉP");
}

TEST_CASE("acronym - single word falls back without upper-casing", "[acronym]")
{
    REQUIRE(acronym("Tool") == "Tool");
    REQUIRE(acronym("tool") == "tool");
    REQUIRE(acronym("Motörhead") == "Motorhead");
    REQUIRE(acronym("!!!Tool!!!") == "Tool");
    REQUIRE(acronym("") == "");
}

TEST_CASE("to_key - alphanumerics only", "[key]")
{
    REQUIRE(to_key("Back in Black") == "BackinBlack");
    REQUIRE(to_key("AC/DC: Live!") == "ACDCLive");
}

TEST_CASE("to_key - collision with the song title", "[key]")
{
    REQUIRE(to_key("Song Title", "Song Title") == "SongTitleSong");
    REQUIRE(to_key("SongTitle", "Song Title") == "SongTitleSong");
    REQUIRE(to_key("Song Title", "Other") == "SongTitle");
}

TEST_CASE("to_key - empty input", "[key]")
{
    REQUIRE(to_key("", "") == "Song");
    REQUIRE(to_key("", "Title") == "");
    REQUIRE(to_key("!!!", "") == "Song");
}

TEST_CASE("to_key - length cap", "[key]")
{
    REQUIRE(to_key("Twenty Nine Characters Exactly", "Twenty Nine Characters Exactly") ==
            "TwentyNineCharactersExactlySon");

    const std::vector<std::string> samples = {
        "The Quick Brown Fox Jumps Over The Lazy Dog Again And Again",
        "Ünïcödé Tïtlé wïth äccénts",
        "1234567890123456789012345678901234567890",
        "",
        "短い",
    };

    for (const auto& sample : samples)
    {
        std::string key = to_key(sample, sample);
        REQUIRE(key.size() <= kMaxKeyLength);
        for (char c : key)
        {
            REQUIRE(isAsciiAlnum(static_cast<unsigned char>(c)));
        }
    }
}

TEST_CASE("build_short_filename - artist, title and version", "[short_filename]")
{
    const auto windows = charset_for(Platform::Windows);
    const auto posix = charset_for(Platform::Posix);

    SECTION("Display-name artist")
    {
        REQUIRE(build_short_filename("Guns N' Roses", "Sweet Child O' Mine", "1", false, windows) ==
                "Guns-N'-Roses_Sweet-Child-O'-Mine_1");
    }

    SECTION("Acronym artist")
    {
        REQUIRE(build_short_filename("Guns N' Roses", "Sweet Child O' Mine", "1", true, windows) ==
                "GNR_Sweet-Child-O'-Mine_1");
    }

    SECTION("Reserved characters depend on the platform")
    {
        REQUIRE(build_short_filename("AC/DC", "Back In Black?", "2", false, windows) == "ACDC_Back-In-Black_2");
        REQUIRE(build_short_filename("AC/DC", "Back In Black?", "2", false, posix) == "ACDC_Back-In-Black?_2");
    }
}

TEST_CASE("to_inlay_name - leading junk and frets", "[inlay]")
{
    REQUIRE(to_inlay_name("01 Dragon Flames") == "Dragon_Flames");
    REQUIRE(to_inlay_name("--Skulls") == "Skulls");
    REQUIRE(to_inlay_name("Dragon 24 Flames", true) == "Dragon_Flames_24");
    REQUIRE(to_inlay_name("Skulls", true) == "Skulls_24");
    REQUIRE(to_inlay_name("24 Skulls", true) == "Skulls_24");
    REQUIRE(to_inlay_name("Skulls_24", true) == "Skulls_24");
}

TEST_CASE("to_inlay_name - symbol before underscore and space", "[inlay]")
{
    REQUIRE(to_inlay_name("Dragon!_ Flames") == "DragonFlames");
    REQUIRE(to_inlay_name("Fire -_ Ice") == "Fire_Ice");
    REQUIRE(to_inlay_name("#_ Skulls") == "Skulls");
    // a letter before "_ " is not a symbol
    REQUIRE(to_inlay_name("Skull_ Bones") == "Skull__Bones");
}

#pragma once

#include <string>
#include <string_view>

namespace namekit::text
{

struct ShortWord
{
    std::string_view lead;  // "The "
    std::string_view trail; // ", The"
};

/// Lead words and their trailing forms, in priority order
constexpr ShortWord kShortWords[] = {
    { "The ", ", The" },
    { "THE ", ", THE" },
    { "the ", ", the" },
    { "A ", ", A" },
    { "a ", ", a" },
};

/// Moves a leading short word to the end: "The Beatles" -> "Beatles, The".
/// Matching is exact and case-sensitive; the first table entry that matches
/// wins and the result is trimmed.
///
/// With `undo` set, a trailing form is removed and "The " is put in front,
/// whichever entry matched: "Perfect Circle, A" -> "The Perfect Circle".
[[nodiscard]] std::string move_short_word(const std::string& text, bool undo = false);

} // namespace namekit::text

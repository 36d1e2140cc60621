#pragma once

#include <string>

namespace namekit::text
{

/// UTF-8 to UTF-32 conversion. Invalid sequences are skipped byte by byte.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

bool isAsciiDigit(char32_t cp);
bool isAsciiAlpha(char32_t cp);
bool isAsciiAlnum(char32_t cp);

/// Any code point in a Unicode letter category (Lu, Ll, Lt, Lm, Lo)
bool isUnicodeLetter(char32_t cp);

/// Word character in the regex sense: letters, nonspacing marks,
/// decimal digits and connector punctuation (underscore included)
bool isWordChar(char32_t cp);

/// ASCII control whitespace, NEL and the Unicode separator categories
bool isWhitespace(char32_t cp);

/// Keeps the code points of `text` for which `keep(cp)` holds
template<typename Pred>
std::string filter_codepoints(const std::string& text, Pred keep)
{
    if (text.empty())
        return std::string();

    std::u32string kept;
    for (char32_t cp : utf8ToUtf32(text))
    {
        if (keep(cp))
            kept.push_back(cp);
    }
    return utf32ToUtf8(kept);
}

/// Replaces every occurrence of `from` with `to`, scanning left to right
/// over the original string. An empty `from` leaves the text unchanged.
[[nodiscard]] std::string replace_all(const std::string& text, const std::string& from, const std::string& to);

/// Removes leading and trailing whitespace
[[nodiscard]] std::string trim(const std::string& text);

/// Upper-cases the first code point, leaves the rest untouched
[[nodiscard]] std::string capitalize(const std::string& text);

/// Collapses runs of two or more spaces into a single space
[[nodiscard]] std::string strip_excess_whitespace(const std::string& text);

/// Trims, then replaces every whitespace code point with `replacement`
[[nodiscard]] std::string replace_space_with(const std::string& text, const std::string& replacement = "_");

} // namespace namekit::text

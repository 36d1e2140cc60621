#include "NameBuilders.hpp"
#include "AbbreviationExpander.hpp"
#include "CharacterFilters.hpp"
#include "DiacriticFolder.hpp"
#include "ShortWordMover.hpp"
#include "TextUtils.hpp"

#include <utility>
#include <vector>

#include <utf8proc.h>

namespace namekit::text
{

namespace
{

std::vector<std::u32string> split_words(const std::u32string& cps)
{
    std::vector<std::u32string> words;
    std::u32string current;
    for (char32_t cp : cps)
    {
        if (isWordChar(cp))
        {
            current.push_back(cp);
        }
        else if (!current.empty())
        {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        words.push_back(std::move(current));
    return words;
}

// Applied in order, each on the result of the previous one
const std::pair<const char*, const char*> kFret24Removals[] = {
    { "_24_", "_" }, { "_24", "" }, { "24_", "" }, { " 24 ", " " }, { "24 ", " " }, { " 24", " " }, { "24", "" },
};

// Removes every "<symbol>_ " sequence, where the symbol is any code point
// other than an ASCII letter or digit. Matches do not overlap.
std::string strip_symbol_underscore_space(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    std::u32string result;
    result.reserve(cps.size());

    size_t pos = 0;
    while (pos < cps.size())
    {
        if (pos + 2 < cps.size() && !isAsciiAlnum(cps[pos]) && cps[pos + 1] == U'_' && cps[pos + 2] == U' ')
        {
            pos += 3;
            continue;
        }
        result.push_back(cps[pos++]);
    }
    return utf32ToUtf8(result);
}

} // namespace

std::string to_sortable_name(const std::string& text)
{
    if (text.empty())
        return std::string();

    std::string value = expand_abbreviations(text);
    value = fold_diacritics(value);
    value = to_sortable_fragment(value);
    value = move_short_word(value);
    value = capitalize(value);
    value = trim(strip_excess_whitespace(value));
    return value;
}

std::string acronym(const std::string& text)
{
    std::vector<std::u32string> words = split_words(utf8ToUtf32(text));

    if (words.size() > 1)
    {
        std::u32string initials;
        for (const auto& word : words)
        {
            initials.push_back(
                static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(word.front()))));
        }
        return utf32ToUtf8(initials);
    }

    // Single word: no upper-casing here, only the multi-word path does that
    return strip_non_alphanumeric(fold_diacritics(text));
}

std::string to_key(const std::string& text, const std::string& reference_title)
{
    std::string key = strip_non_alphanumeric(text);

    if (key == replace_all(reference_title, " ", ""))
        key += kKeyCollisionSuffix;

    if (key.size() > kMaxKeyLength)
        key.resize(kMaxKeyLength);

    return key;
}

std::string build_short_filename(const std::string& artist, const std::string& title, const std::string& version,
                                 bool use_acronym, const PlatformCharset& charset)
{
    std::string artist_part = use_acronym ? acronym(artist) : to_display_name(artist);
    std::string name = artist_part + "_" + to_display_name(title) + "_" + version;

    name = replace_all(name, " ", "-");
    return strip_excess_whitespace(to_filename(name, charset));
}

std::string to_inlay_name(const std::string& text, bool frets24)
{
    std::string value = strip_symbol_underscore_space(text);
    value = strip_leading_special_characters(strip_leading_numbers(value));

    if (frets24)
    {
        if (value.find("24") != std::string::npos)
        {
            for (const auto& removal : kFret24Removals)
                value = replace_all(value, removal.first, removal.second);
        }
        value = trim(value) + " 24";
    }

    return replace_space_with(value, "_");
}

} // namespace namekit::text

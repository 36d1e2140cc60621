#include "DiacriticFolder.hpp"
#include "TextUtils.hpp"

#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <plog/Log.h>
#include <utf8proc.h>

namespace namekit::text
{

namespace
{

struct FoldRule
{
    std::u32string_view sources;
    std::string_view replacement;
};

// Each source set maps to one replacement; sets are disjoint.
constexpr FoldRule kFoldRules[] = {
    { U"ÀÁÂÃÅÄĀĂĄǍǺ", "A" },
    { U"ǻǎàáâãäåąāă", "a" },
    { U"ÇĆĈĊČ", "C" },
    { U"çčćĉċ", "c" },
    { U"ĎĐ", "D" },
    { U"ďđ", "d" },
    { U"ÈÉÊËĒĔĖĘĚ", "E" },
    { U"ěèéêëēĕėę", "e" },
    { U"ĜĞĠĢ", "G" },
    { U"ģĝğġ", "g" },
    { U"Ĥ", "H" },
    { U"ĥ", "h" },
    { U"ÌÍÎÏĨĪĬĮİǏ", "I" },
    { U"ǐıįĭīĩìíîï", "i" },
    { U"Ĵ", "J" },
    { U"ĵ", "j" },
    { U"Ķ", "K" },
    { U"ķĸ", "k" },
    { U"ĹĻĽĿŁ", "L" },
    { U"ŀľļĺł", "l" },
    { U"ÑŃŅŇŊ", "N" },
    { U"ñńņňŉŋ", "n" },
    { U"ÒÓÔÖÕŌŎŐƠǑǾ", "O" },
    { U"ǿǒơòóôõöøōŏő", "o" },
    { U"ŔŖŘ", "R" },
    { U"ŗŕř", "r" },
    { U"ŚŜŞŠ", "S" },
    { U"şŝśš", "s" },
    { U"ŢŤ", "T" },
    { U"ťţ", "t" },
    { U"ÙÚÛÜŨŪŬŮŰŲƯǓǕǗǙǛ", "U" },
    { U"ǜǚǘǖǔưũùúûūŭůűų", "u" },
    { U"Ŵ", "W" },
    { U"ŵ", "w" },
    { U"ÝŶŸ", "Y" },
    { U"ýÿŷ", "y" },
    { U"ŹŻŽ", "Z" },
    { U"žźż", "z" },
    { U"œ", "oe" },
    { U"Œ", "Oe" },
    { U"°", "o" },
    { U"¡", "!" },
    { U"¿", "?" },
    { U"«»“”„‟″‶", "\"" },
    { U"…", "..." },
};

const std::unordered_map<char32_t, std::string_view>& fold_table()
{
    static const std::unordered_map<char32_t, std::string_view> table = [] {
        std::unordered_map<char32_t, std::string_view> t;
        for (const auto& rule : kFoldRules)
        {
            for (char32_t cp : rule.sources)
                t.emplace(cp, rule.replacement);
        }
        return t;
    }();
    return table;
}

// Code points representable in ISO-8859-8 besides ASCII
bool inIso88598Repertoire(char32_t cp)
{
    if (cp < 0x80)
        return true;
    if (cp == 0xA0 || (cp >= 0xA2 && cp <= 0xA9) || (cp >= 0xAB && cp <= 0xB9) || (cp >= 0xBB && cp <= 0xBE))
        return true;
    if (cp == 0xD7 || cp == 0xF7)
        return true;
    if (cp >= 0x05D0 && cp <= 0x05EA)
        return true;
    return cp == 0x2017 || cp == 0x200E || cp == 0x200F;
}

// Runs utf8proc_map with the given options, falls back to the input on failure
std::string map_utf8(const std::string& text, int options, const char* what)
{
    utf8proc_uint8_t* mapped = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &mapped,
                                        static_cast<utf8proc_option_t>(options));
    if (len < 0 || !mapped)
    {
        PLOG_WARNING << what << " failed (" << utf8proc_errmsg(len) << "), using undecomposed text";
        std::free(mapped);
        return text;
    }

    std::string result(reinterpret_cast<char*>(mapped), static_cast<size_t>(len));
    std::free(mapped);
    return result;
}

} // namespace

std::string fold_diacritics(const std::string& text)
{
    if (text.empty())
        return std::string();

    const auto& table = fold_table();
    std::string result;
    result.reserve(text.size());

    for (char32_t cp : utf8ToUtf32(text))
    {
        auto it = table.find(cp);
        if (it != table.end())
        {
            result.append(it->second.data(), it->second.size());
        }
        else
        {
            result += utf32ToUtf8(std::u32string(1, cp));
        }
    }
    return result;
}

std::string strip_diacritics(const std::string& text)
{
    if (text.empty())
        return std::string();

    std::string decomposed = map_utf8(text, UTF8PROC_STABLE | UTF8PROC_DECOMPOSE, "NFD decomposition");
    return filter_codepoints(decomposed, [](char32_t cp) { return isAsciiAlpha(cp) || cp == U' '; });
}

std::string fold_diacritics_fast(const std::string& text)
{
    if (text.empty())
        return std::string();

    std::string stripped =
        map_utf8(text, UTF8PROC_STABLE | UTF8PROC_COMPOSE | UTF8PROC_STRIPMARK, "Mark stripping");

    std::u32string cps = utf8ToUtf32(stripped);
    for (char32_t& cp : cps)
    {
        if (!inIso88598Repertoire(cp))
            cp = U'?';
    }
    return utf32ToUtf8(cps);
}

} // namespace namekit::text

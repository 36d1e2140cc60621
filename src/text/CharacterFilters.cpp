#include "CharacterFilters.hpp"
#include "TextUtils.hpp"

#include <string_view>

namespace namekit::text
{

namespace
{

constexpr std::u32string_view kDisplayPunctuation = U"-_/&',!.?()\"# ";
constexpr std::u32string_view kSortablePunctuation = U" _#'.";

bool contains(std::u32string_view set, char32_t cp)
{
    return set.find(cp) != std::u32string_view::npos;
}

} // namespace

std::string to_display_name(const std::string& text)
{
    return filter_codepoints(text, [](char32_t cp) {
        return isAsciiAlnum(cp) || isUnicodeLetter(cp) || contains(kDisplayPunctuation, cp);
    });
}

std::string to_sortable_fragment(const std::string& text)
{
    return filter_codepoints(text, [](char32_t cp) { return isAsciiAlnum(cp) || contains(kSortablePunctuation, cp); });
}

std::string strip_non_alphanumeric(const std::string& text)
{
    return filter_codepoints(text, [](char32_t cp) { return isAsciiAlnum(cp); });
}

std::string to_filename(const std::string& text, const PlatformCharset& charset)
{
    return filter_codepoints(text, [&charset](char32_t cp) { return !charset.isInvalidFileNameChar(cp); });
}

std::string to_path(const std::string& text, const PlatformCharset& charset)
{
    return filter_codepoints(text, [&charset](char32_t cp) { return !charset.isInvalidPathChar(cp); });
}

std::string to_file_path(const std::string& path, const PlatformCharset& charset)
{
    if (path.empty())
        return std::string();

    std::u32string cps = utf8ToUtf32(path);
    size_t split = std::u32string::npos;
    for (size_t i = cps.size(); i > 0; --i)
    {
        if (charset.isDirectorySeparator(cps[i - 1]))
        {
            split = i - 1;
            break;
        }
    }

    if (split == std::u32string::npos)
        return to_filename(path, charset);

    std::string directory = utf32ToUtf8(cps.substr(0, split));
    std::string separator = utf32ToUtf8(cps.substr(split, 1));
    std::string file_name = utf32ToUtf8(cps.substr(split + 1));

    return to_path(directory, charset) + separator + to_filename(file_name, charset);
}

std::string strip_leading_numbers(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    size_t pos = 0;
    while (pos < cps.size() && isAsciiDigit(cps[pos]))
        ++pos;
    while (pos < cps.size() && isWhitespace(cps[pos]))
        ++pos;
    return utf32ToUtf8(cps.substr(pos));
}

std::string strip_leading_special_characters(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    size_t pos = 0;
    while (pos < cps.size() && !isAsciiAlnum(cps[pos]) && cps[pos] != U'(')
        ++pos;
    return utf32ToUtf8(cps.substr(pos));
}

} // namespace namekit::text

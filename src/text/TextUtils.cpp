#include "TextUtils.hpp"
#include <utf8proc.h>

namespace namekit::text
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isAsciiDigit(char32_t cp)
{
    return cp >= U'0' && cp <= U'9';
}

bool isAsciiAlpha(char32_t cp)
{
    return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

bool isAsciiAlnum(char32_t cp)
{
    return isAsciiAlpha(cp) || isAsciiDigit(cp);
}

bool isUnicodeLetter(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
        return true;
    default:
        return false;
    }
}

bool isWordChar(char32_t cp)
{
    if (isAsciiAlnum(cp) || cp == U'_')
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_MN:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_PC:
        return true;
    default:
        return false;
    }
}

bool isWhitespace(char32_t cp)
{
    if ((cp >= U'\t' && cp <= U'\r') || cp == U' ' || cp == U'\u0085')
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::string replace_all(const std::string& text, const std::string& from, const std::string& to)
{
    if (text.empty() || from.empty())
        return text;

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size())
    {
        size_t hit = text.find(from, pos);
        if (hit == std::string::npos)
        {
            result.append(text, pos, std::string::npos);
            break;
        }
        result.append(text, pos, hit - pos);
        result.append(to);
        pos = hit + from.size();
    }
    return result;
}

std::string trim(const std::string& text)
{
    if (text.empty())
        return text;

    std::u32string cps = utf8ToUtf32(text);
    size_t begin = 0;
    while (begin < cps.size() && isWhitespace(cps[begin]))
        ++begin;

    size_t end = cps.size();
    while (end > begin && isWhitespace(cps[end - 1]))
        --end;

    return utf32ToUtf8(cps.substr(begin, end - begin));
}

std::string capitalize(const std::string& text)
{
    if (text.empty())
        return std::string();

    std::u32string cps = utf8ToUtf32(text);
    if (cps.empty())
        return std::string();

    cps[0] = static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cps[0])));
    return utf32ToUtf8(cps);
}

std::string strip_excess_whitespace(const std::string& text)
{
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == ' ' && i + 1 < text.size() && text[i + 1] == ' ')
        {
            // emit one space for the whole run
            while (i + 1 < text.size() && text[i + 1] == ' ')
                ++i;
        }
        result.push_back(text[i]);
    }
    return result;
}

std::string replace_space_with(const std::string& text, const std::string& replacement)
{
    std::u32string cps = utf8ToUtf32(trim(text));
    std::u32string repl = utf8ToUtf32(replacement);

    std::u32string out;
    out.reserve(cps.size());
    for (char32_t cp : cps)
    {
        if (isWhitespace(cp))
            out += repl;
        else
            out.push_back(cp);
    }
    return utf32ToUtf8(out);
}

} // namespace namekit::text

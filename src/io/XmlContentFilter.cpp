#include "XmlContentFilter.hpp"
#include "../text/TextUtils.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace namekit::io
{

namespace
{

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

enum class Encoding
{
    Utf8,
    Utf16LE,
    Utf16BE,
    Utf32LE,
    Utf32BE
};

struct ByteOrderMark
{
    std::string_view bytes;
    Encoding encoding;
    const char* name;
};

// UTF-32LE first: its mark starts with the UTF-16LE one
constexpr ByteOrderMark kByteOrderMarks[] = {
    { std::string_view("\xFF\xFE\x00\x00", 4), Encoding::Utf32LE, "UTF-32LE" },
    { std::string_view("\x00\x00\xFE\xFF", 4), Encoding::Utf32BE, "UTF-32BE" },
    { std::string_view("\xFF\xFE", 2), Encoding::Utf16LE, "UTF-16LE" },
    { std::string_view("\xFE\xFF", 2), Encoding::Utf16BE, "UTF-16BE" },
};

char32_t read_unit(const std::string& raw, size_t pos, size_t width, bool big_endian)
{
    char32_t unit = 0;
    for (size_t i = 0; i < width; ++i)
    {
        const auto byte = static_cast<unsigned char>(raw[pos + (big_endian ? i : width - 1 - i)]);
        unit = (unit << 8) | byte;
    }
    return unit;
}

// Unpaired surrogates and a trailing partial code unit are skipped
std::u32string decode_utf16(const std::string& raw, size_t offset, bool big_endian)
{
    std::u32string result;
    result.reserve((raw.size() - offset) / 2);

    size_t pos = offset;
    while (pos + 2 <= raw.size())
    {
        char32_t unit = read_unit(raw, pos, 2, big_endian);
        pos += 2;

        if (unit >= 0xD800 && unit <= 0xDBFF)
        {
            if (pos + 2 > raw.size())
                break;
            char32_t low = read_unit(raw, pos, 2, big_endian);
            if (low >= 0xDC00 && low <= 0xDFFF)
            {
                result.push_back(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                pos += 2;
            }
            continue;
        }
        if (unit >= 0xDC00 && unit <= 0xDFFF)
            continue;

        result.push_back(unit);
    }
    return result;
}

// Surrogates and values past U+10FFFF are skipped
std::u32string decode_utf32(const std::string& raw, size_t offset, bool big_endian)
{
    std::u32string result;
    result.reserve((raw.size() - offset) / 4);

    for (size_t pos = offset; pos + 4 <= raw.size(); pos += 4)
    {
        char32_t cp = read_unit(raw, pos, 4, big_endian);
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            continue;
        result.push_back(cp);
    }
    return result;
}

// Converts file bytes to UTF-8 according to their byte-order mark. Bytes
// without a UTF-16 or UTF-32 mark are taken as UTF-8 and returned as is.
std::string decode_to_utf8(const std::string& raw, const std::string& path)
{
    for (const auto& bom : kByteOrderMarks)
    {
        if (raw.compare(0, bom.bytes.size(), bom.bytes.data(), bom.bytes.size()) != 0)
            continue;

        PLOG_DEBUG << "XML content filter: " << path << " is " << bom.name;
        switch (bom.encoding)
        {
        case Encoding::Utf16LE:
            return text::utf32ToUtf8(decode_utf16(raw, bom.bytes.size(), false));
        case Encoding::Utf16BE:
            return text::utf32ToUtf8(decode_utf16(raw, bom.bytes.size(), true));
        case Encoding::Utf32LE:
            return text::utf32ToUtf8(decode_utf32(raw, bom.bytes.size(), false));
        case Encoding::Utf32BE:
            return text::utf32ToUtf8(decode_utf32(raw, bom.bytes.size(), true));
        case Encoding::Utf8:
            break;
        }
    }
    return raw;
}

} // namespace

bool is_illegal_xml_char(char32_t cp)
{
    return (cp >= 0x01 && cp <= 0x08) || cp == 0x0B || cp == 0x0C || (cp >= 0x0E && cp <= 0x1F) ||
           (cp >= 0x7F && cp <= 0x84) || (cp >= 0x86 && cp <= 0x9F);
}

std::string strip_illegal_xml_chars_text(const std::string& content)
{
    if (content.empty())
        return std::string();

    std::string body = content;
    if (body.compare(0, 3, kUtf8Bom) == 0)
        body.erase(0, 3);

    return text::filter_codepoints(body, [](char32_t cp) { return !is_illegal_xml_char(cp); });
}

FilterResult strip_illegal_xml_chars(const std::string& path)
{
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (ec)
    {
        PLOG_WARNING << "XML content filter: cannot stat " << path << ": " << ec.message();
        return FilterResult::failure(FilterError::Unreadable, "Cannot access file: " + path + " (" + ec.message() + ")");
    }
    if (!exists)
    {
        PLOG_WARNING << "XML content filter: file not found: " << path;
        return FilterResult::failure(FilterError::FileNotFound, "File not found: " + path);
    }
    const bool is_directory = fs::is_directory(path, ec);
    if (ec)
    {
        PLOG_WARNING << "XML content filter: cannot stat " << path << ": " << ec.message();
        return FilterResult::failure(FilterError::Unreadable, "Cannot access file: " + path + " (" + ec.message() + ")");
    }
    if (is_directory)
    {
        PLOG_WARNING << "XML content filter: path is a directory: " << path;
        return FilterResult::failure(FilterError::Unreadable, "Not a regular file: " + path);
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        PLOG_WARNING << "XML content filter: cannot open " << path;
        return FilterResult::failure(FilterError::Unreadable, "Cannot open file: " + path);
    }

    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        PLOG_WARNING << "XML content filter: read error on " << path;
        return FilterResult::failure(FilterError::Unreadable, "Read error: " + path);
    }

    std::string filtered = strip_illegal_xml_chars_text(decode_to_utf8(raw, path));
    PLOG_DEBUG << "XML content filter: " << path << " " << raw.size() << " -> " << filtered.size() << " bytes";
    return FilterResult::success(std::move(filtered));
}

const char* to_string(FilterError error)
{
    switch (error)
    {
    case FilterError::None:
        return "none";
    case FilterError::FileNotFound:
        return "file not found";
    case FilterError::Unreadable:
        return "unreadable";
    }
    return "unknown";
}

} // namespace namekit::io

#include "PlatformCharset.hpp"

#include <algorithm>
#include <cctype>

namespace namekit::text
{

namespace
{

std::u32string control_chars()
{
    std::u32string s;
    for (char32_t cp = 0; cp < 0x20; ++cp)
        s.push_back(cp);
    return s;
}

} // namespace

bool PlatformCharset::isInvalidFileNameChar(char32_t cp) const
{
    return invalid_file_name_chars.find(cp) != std::u32string::npos;
}

bool PlatformCharset::isInvalidPathChar(char32_t cp) const
{
    return invalid_path_chars.find(cp) != std::u32string::npos;
}

bool PlatformCharset::isDirectorySeparator(char32_t cp) const
{
    return directory_separators.find(cp) != std::u32string::npos;
}

PlatformCharset charset_for(Platform platform)
{
    PlatformCharset charset;
    switch (platform)
    {
    case Platform::Windows:
        charset.invalid_path_chars = U"\"<>|" + control_chars();
        charset.invalid_file_name_chars = U"\"<>|" + control_chars() + U":*?\\/";
        charset.directory_separators = U"\\/";
        break;
    case Platform::Posix:
        charset.invalid_path_chars = std::u32string(1, U'\0');
        charset.invalid_file_name_chars = std::u32string(1, U'\0') + U"/";
        charset.directory_separators = U"/";
        break;
    }
    return charset;
}

bool parse_platform(const std::string& name, Platform& out)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "windows")
    {
        out = Platform::Windows;
        return true;
    }
    if (lower == "posix")
    {
        out = Platform::Posix;
        return true;
    }
    return false;
}

const char* to_string(Platform platform)
{
    switch (platform)
    {
    case Platform::Windows:
        return "windows";
    case Platform::Posix:
        return "posix";
    }
    return "unknown";
}

} // namespace namekit::text

#pragma once

#include <string>

namespace namekit::text
{

enum class Platform
{
    Windows,
    Posix
};

// Reserved characters of a target filesystem. Passed to the file and path
// filters instead of querying the host, so output does not depend on
// where the tool runs.
struct PlatformCharset
{
    std::u32string invalid_file_name_chars;
    std::u32string invalid_path_chars;
    std::u32string directory_separators; // first one is used when joining

    [[nodiscard]] bool isInvalidFileNameChar(char32_t cp) const;
    [[nodiscard]] bool isInvalidPathChar(char32_t cp) const;
    [[nodiscard]] bool isDirectorySeparator(char32_t cp) const;
};

/// Reserved sets of the given platform: NTFS/Win32 rules for Windows,
/// NUL and '/' for POSIX.
PlatformCharset charset_for(Platform platform);

/// Parses "windows" / "posix" (case-insensitive). Returns false on anything else.
bool parse_platform(const std::string& name, Platform& out);

const char* to_string(Platform platform);

} // namespace namekit::text

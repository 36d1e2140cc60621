#pragma once

#include <optional>
#include <string>
#include <utility>

namespace namekit::io
{

enum class FilterError
{
    None,
    FileNotFound,
    Unreadable
};

struct FilterResult
{
    std::string content;                    // UTF-8, no byte-order mark
    bool succeeded = true;
    FilterError error = FilterError::None;
    std::optional<std::string> error_message;

    static FilterResult success(std::string c)
    {
        FilterResult res;
        res.content = std::move(c);
        return res;
    }

    static FilterResult failure(FilterError kind, const std::string& message)
    {
        FilterResult res;
        res.succeeded = false;
        res.error = kind;
        res.error_message = message;
        return res;
    }
};

/// True for the control code points XML 1.1 does not allow in content:
/// U+01-08, U+0B-0C, U+0E-1F, U+7F-84 and U+86-9F. Tab, LF, CR and NEL stay.
[[nodiscard]] bool is_illegal_xml_char(char32_t cp);

/// Removes XML-illegal control characters from UTF-8 text. A leading BOM
/// is dropped and invalid UTF-8 sequences are skipped.
[[nodiscard]] std::string strip_illegal_xml_chars_text(const std::string& content);

/// Reads `path` and returns its content filtered by
/// strip_illegal_xml_chars_text(). Files with a UTF-16 or UTF-32
/// byte-order mark are converted to UTF-8 first; anything else is read
/// as UTF-8. A missing file yields FilterError::FileNotFound, any other
/// read failure FilterError::Unreadable.
[[nodiscard]] FilterResult strip_illegal_xml_chars(const std::string& path);

const char* to_string(FilterError error);

} // namespace namekit::io

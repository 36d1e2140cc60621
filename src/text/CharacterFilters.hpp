#pragma once

#include "PlatformCharset.hpp"

#include <string>

namespace namekit::text
{

// Each filter walks the code points and keeps or drops them; nothing is
// substituted. Empty input always yields an empty string.

/// Display-safe artist/title/album: ASCII alphanumerics, Unicode letters,
/// space and - _ / & ' , ! . ? ( ) " #
[[nodiscard]] std::string to_display_name(const std::string& text);

/// Residue trim for sortable names: ASCII alphanumerics, space and _ # ' .
[[nodiscard]] std::string to_sortable_fragment(const std::string& text);

/// ASCII alphanumerics only. No spaces, no punctuation.
[[nodiscard]] std::string strip_non_alphanumeric(const std::string& text);

/// Drops the platform's reserved file-name characters
[[nodiscard]] std::string to_filename(const std::string& text, const PlatformCharset& charset);

/// Drops the platform's reserved path characters
[[nodiscard]] std::string to_path(const std::string& text, const PlatformCharset& charset);

/// Splits at the last directory separator, cleans the directory part with
/// to_path() and the file part with to_filename(), then joins them again
/// with the separator that was found.
[[nodiscard]] std::string to_file_path(const std::string& path, const PlatformCharset& charset);

/// Removes leading ASCII digits and the whitespace right after them
[[nodiscard]] std::string strip_leading_numbers(const std::string& text);

/// Removes leading code points other than ASCII alphanumerics and '('
[[nodiscard]] std::string strip_leading_special_characters(const std::string& text);

} // namespace namekit::text

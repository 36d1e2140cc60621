#pragma once

#include "PlatformCharset.hpp"

#include <cstddef>
#include <string>

namespace namekit::text
{

constexpr std::size_t kMaxKeyLength = 30;
constexpr const char* kKeyCollisionSuffix = "Song";

/// Sortable artist/title/album name, e.g. "The Beatles & Me" ->
/// "Beatles and Me, The". Stages run in this fixed order:
///   1. expand_abbreviations  (needs the raw '&', '.', '-')
///   2. fold_diacritics
///   3. to_sortable_fragment
///   4. move_short_word       (after punctuation cleanup)
///   5. capitalize
///   6. strip_excess_whitespace + trim
[[nodiscard]] std::string to_sortable_name(const std::string& text);

/// First letter of every word, upper-cased: "Guns N' Roses" -> "GNR".
/// A single word is folded and stripped to alphanumerics instead and keeps
/// its case: "Tool" -> "Tool".
[[nodiscard]] std::string acronym(const std::string& text);

/// Machine key: ASCII alphanumerics, at most kMaxKeyLength characters.
/// When the key equals `reference_title` without spaces, kKeyCollisionSuffix
/// is appended before truncation.
[[nodiscard]] std::string to_key(const std::string& text, const std::string& reference_title = "");

/// "{artist}_{title}_{version}" with spaces turned into hyphens, reserved
/// file-name characters removed and space runs collapsed. The artist is
/// acronymized when `use_acronym` is set, otherwise display-filtered.
[[nodiscard]] std::string build_short_filename(const std::string& artist, const std::string& title,
                                               const std::string& version, bool use_acronym,
                                               const PlatformCharset& charset);

/// Inlay asset name: "<symbol>_ " sequences and leading numbers and
/// symbols removed, spaces turned into underscores. With `frets24` any
/// "24" is pulled out and re-added as a trailing "_24".
[[nodiscard]] std::string to_inlay_name(const std::string& text, bool frets24 = false);

} // namespace namekit::text

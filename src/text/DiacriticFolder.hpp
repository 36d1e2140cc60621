#pragma once

#include <string>

namespace namekit::text
{

/// Replaces accented letters and typographic symbols with their closest
/// ASCII form using a fixed table (e.g. "Über" -> "Uber", "œ" -> "oe",
/// "…" -> "..."). Code points missing from the table pass through, so the
/// result is a fixed point: folding twice equals folding once.
[[nodiscard]] std::string fold_diacritics(const std::string& text);

/// Decomposes to NFD and keeps only [A-Za-z ] afterwards. Digits and all
/// punctuation are dropped along with the combining marks.
[[nodiscard]] std::string strip_diacritics(const std::string& text);

/// Lossy fold through the ISO-8859-8 repertoire: combining marks are
/// stripped, then anything the code page cannot hold becomes '?'.
///
/// Differs from fold_diacritics() for letters without a decomposition
/// (ø, æ, ß, ł, đ, œ), for typographic quotes and for "…": all of these
/// come out as '?'. Use it only when table coverage does not matter.
[[nodiscard]] std::string fold_diacritics_fast(const std::string& text);

} // namespace namekit::text

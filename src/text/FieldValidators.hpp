#pragma once

#include <string>

namespace namekit::text
{

constexpr const char* kDefaultTempo = "120";
constexpr const char* kDefaultVersion = "1";

/// Parses a decimal number with '.' as separator regardless of locale,
/// rounds half to even and returns the integer if 0 < bpm < 300.
/// Anything else, unparsable text included, gives kDefaultTempo.
[[nodiscard]] std::string valid_tempo(const std::string& text);

/// Returns the input when it starts with 19xx or 200x/201x, else "".
/// Years from 2020 on are rejected; callers rely on that range.
[[nodiscard]] std::string valid_year(const std::string& text);

/// Leading run of digits and dots ("1.2b" -> "1.2"), kDefaultVersion if empty
[[nodiscard]] std::string valid_version(const std::string& text);

/// True iff the text is '2' followed by exactly five ASCII digits
[[nodiscard]] bool is_six_digit_app_id(const std::string& text);

} // namespace namekit::text

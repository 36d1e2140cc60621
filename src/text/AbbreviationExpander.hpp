#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace namekit::text
{

struct Abbreviation
{
    std::string_view pattern;
    std::string_view replacement;
};

/// The replacement table in application order. Space-delimited forms of a
/// symbol come before the bare symbol so isolated tokens keep single spacing.
const std::vector<Abbreviation>& abbreviation_table();

/// Applies every table entry as a literal replace-all, each one on the
/// output of the previous ("AC/DC & Mr. X" -> "AC DC and Mister X").
[[nodiscard]] std::string expand_abbreviations(const std::string& text);

} // namespace namekit::text

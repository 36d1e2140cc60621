#include "AbbreviationExpander.hpp"
#include "TextUtils.hpp"

namespace namekit::text
{

const std::vector<Abbreviation>& abbreviation_table()
{
    static const std::vector<Abbreviation> table = {
        { " & ", " and " },
        { "&", " and " },
        { "/", " " },
        { "-", " " },
        { " + ", " plus " },
        { "+", " plus " },
        { " @ ", " at " },
        { "@", " at " },
        { "Mr.", "Mister" },
        { "Mrs.", "Misses" },
        { "Ms.", "Miss" },
        { "Jr.", "Junior" },
    };
    return table;
}

std::string expand_abbreviations(const std::string& text)
{
    if (text.empty())
        return std::string();

    std::string result = text;
    for (const auto& abbr : abbreviation_table())
    {
        result = replace_all(result, std::string(abbr.pattern), std::string(abbr.replacement));
    }
    return result;
}

} // namespace namekit::text

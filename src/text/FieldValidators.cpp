#include "FieldValidators.hpp"
#include "TextUtils.hpp"

#include <cmath>
#include <locale>
#include <sstream>

#include <plog/Log.h>

namespace namekit::text
{

namespace
{

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

// Whole-string parse in the classic locale; false on trailing garbage
bool parse_invariant_float(const std::string& text, float& out)
{
    if (text.empty())
        return false;

    std::istringstream iss(text);
    iss.imbue(std::locale::classic());

    float value = 0.0f;
    iss >> value;
    if (iss.fail())
        return false;

    iss >> std::ws;
    if (!iss.eof())
        return false;

    out = value;
    return true;
}

} // namespace

std::string valid_tempo(const std::string& text)
{
    float tempo = 0.0f;
    if (!parse_invariant_float(trim(text), tempo))
    {
        PLOG_DEBUG << "Tempo '" << text << "' is not a number, treating as 0";
        tempo = 0.0f;
    }

    // nearbyint follows the default rounding mode, which rounds halves to even
    double bpm = std::nearbyint(static_cast<double>(tempo));
    if (std::isfinite(bpm) && bpm > 0.0 && bpm < 300.0)
        return std::to_string(static_cast<int>(bpm));

    return kDefaultTempo;
}

std::string valid_year(const std::string& text)
{
    if (text.size() < 4)
        return std::string();

    bool nineteen = text[0] == '1' && text[1] == '9' && is_digit(text[2]) && is_digit(text[3]);
    bool twenty = text[0] == '2' && text[1] == '0' && (text[2] == '0' || text[2] == '1') && is_digit(text[3]);

    if (nineteen || twenty)
        return text;

    return std::string();
}

std::string valid_version(const std::string& text)
{
    size_t len = 0;
    while (len < text.size() && (is_digit(text[len]) || text[len] == '.'))
        ++len;

    std::string version = trim(text.substr(0, len));
    if (version.empty())
        return kDefaultVersion;

    return version;
}

bool is_six_digit_app_id(const std::string& text)
{
    if (text.size() != 6 || text[0] != '2')
        return false;

    for (size_t i = 1; i < text.size(); ++i)
    {
        if (!is_digit(text[i]))
            return false;
    }
    return true;
}

} // namespace namekit::text

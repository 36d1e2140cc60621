#include "ShortWordMover.hpp"
#include "TextUtils.hpp"

namespace namekit::text
{

namespace
{

bool starts_with(const std::string& text, std::string_view prefix)
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix.data(), prefix.size()) == 0;
}

bool ends_with(const std::string& text, std::string_view suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix.data(), suffix.size()) == 0;
}

} // namespace

std::string move_short_word(const std::string& text, bool undo)
{
    if (text.empty())
        return std::string();

    const std::string_view canonical_lead = kShortWords[0].lead;

    for (const auto& word : kShortWords)
    {
        if (undo)
        {
            if (ends_with(text, word.trail))
            {
                // ends_with() guarantees the suffix fits, so the length never underflows
                std::string body = text.substr(0, text.size() - word.trail.size());
                return trim(std::string(canonical_lead) + body);
            }
        }
        else if (starts_with(text, word.lead))
        {
            std::string body = text.substr(word.lead.size());
            return trim(body + std::string(word.trail));
        }
    }

    return text;
}

} // namespace namekit::text

#include "ByteStrings.hpp"
#include "TextUtils.hpp"

namespace namekit::text
{

namespace
{

size_t unpadded_size(const std::vector<std::uint8_t>& bytes)
{
    size_t len = bytes.size();
    while (len > 0 && bytes[len - 1] == 0)
        --len;
    return len;
}

} // namespace

std::string from_null_terminated_ascii(const std::vector<std::uint8_t>& bytes)
{
    const size_t len = unpadded_size(bytes);
    std::string result;
    result.reserve(len);
    for (size_t i = 0; i < len; ++i)
    {
        result.push_back(bytes[i] < 0x80 ? static_cast<char>(bytes[i]) : '?');
    }
    return result;
}

std::string from_null_terminated_utf8(const std::vector<std::uint8_t>& bytes)
{
    const size_t len = unpadded_size(bytes);
    if (len == 0)
        return std::string();

    std::string raw(reinterpret_cast<const char*>(bytes.data()), len);
    return utf32ToUtf8(utf8ToUtf32(raw));
}

} // namespace namekit::text

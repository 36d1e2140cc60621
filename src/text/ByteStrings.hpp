#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace namekit::text
{

/// Decodes a fixed-size ASCII field, dropping trailing NUL padding.
/// Bytes outside 7-bit ASCII become '?'.
[[nodiscard]] std::string from_null_terminated_ascii(const std::vector<std::uint8_t>& bytes);

/// Decodes a fixed-size UTF-8 field, dropping trailing NUL padding.
/// Invalid sequences are skipped.
[[nodiscard]] std::string from_null_terminated_utf8(const std::vector<std::uint8_t>& bytes);

} // namespace namekit::text

#pragma once

#include <string>
#include <string_view>

namespace codecheck {

// Escapes quotes, backslashes and control characters. Bytes >= 0x80 are
// passed through unchanged.
std::string EscapeJson(std::string_view value);
std::string QuoteJson(std::string_view value);

// Replaces every malformed UTF-8 sequence with U+FFFD.
std::string ReplaceInvalidUtf8(std::string_view value);

} // namespace codecheck

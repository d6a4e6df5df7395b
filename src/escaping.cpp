#include <codecheck/escaping.h>

#include <cstdio>

namespace codecheck {

namespace {

constexpr char kReplacementCharacter[] = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at value[index], or 0.
std::size_t Utf8SequenceLength(std::string_view value, std::size_t index) {
  const auto lead = static_cast<unsigned char>(value[index]);
  std::size_t length = 0;
  unsigned char min_second = 0x80;
  unsigned char max_second = 0xBF;
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      min_second = 0xA0;
    } else if (lead == 0xED) {
      max_second = 0x9F;
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      min_second = 0x90;
    } else if (lead == 0xF4) {
      max_second = 0x8F;
    }
  } else {
    return 0;
  }
  if (index + length > value.size()) {
    return 0;
  }
  for (std::size_t offset = 1; offset < length; ++offset) {
    const auto next = static_cast<unsigned char>(value[index + offset]);
    const auto low = offset == 1 ? min_second : 0x80;
    const auto high = offset == 1 ? max_second : 0xBF;
    if (next < low || next > high) {
      return 0;
    }
  }
  return length;
}

} // namespace

std::string EscapeJson(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      break;
    case '\\':
      escaped.append("\\\\");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\b':
      escaped.append("\\b");
      break;
    case '\f':
      escaped.append("\\f");
      break;
    default:
      if (static_cast<unsigned char>(character) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned>(character));
        escaped.append(buffer);
      } else {
        escaped.push_back(character);
      }
      break;
    }
  }
  return escaped;
}

std::string QuoteJson(std::string_view value) {
  return "\"" + EscapeJson(value) + "\"";
}

std::string ReplaceInvalidUtf8(std::string_view value) {
  std::string sanitized;
  sanitized.reserve(value.size());
  std::size_t index = 0;
  while (index < value.size()) {
    const auto length = Utf8SequenceLength(value, index);
    if (length == 0) {
      sanitized.append(kReplacementCharacter);
      ++index;
      continue;
    }
    sanitized.append(value.substr(index, length));
    index += length;
  }
  return sanitized;
}

} // namespace codecheck

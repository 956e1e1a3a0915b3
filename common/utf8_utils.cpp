#include "utf8_utils.h"

#include <cctype>

namespace pbr::common {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

bool InRange(std::uint8_t b, std::uint8_t lo, std::uint8_t hi) {
  return b >= lo && b <= hi;
}

void AppendUtf8(char32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Decodes one code point at data[pos]. Returns the number of bytes consumed;
// on an invalid sequence `cp` is U+FFFD and the count covers the maximal
// valid prefix (at least one byte).
std::size_t DecodeOne(const std::uint8_t* data, std::size_t len,
                      std::size_t pos, char32_t& cp) {
  const std::uint8_t lead = data[pos];
  if (lead < 0x80) {
    cp = lead;
    return 1;
  }
  std::size_t need = 0;
  std::uint8_t lo = 0x80;
  std::uint8_t hi = 0xBF;
  if (InRange(lead, 0xC2, 0xDF)) {
    need = 1;
    cp = lead & 0x1F;
  } else if (InRange(lead, 0xE0, 0xEF)) {
    need = 2;
    cp = lead & 0x0F;
    if (lead == 0xE0) {
      lo = 0xA0;
    } else if (lead == 0xED) {
      hi = 0x9F;
    }
  } else if (InRange(lead, 0xF0, 0xF4)) {
    need = 3;
    cp = lead & 0x07;
    if (lead == 0xF0) {
      lo = 0x90;
    } else if (lead == 0xF4) {
      hi = 0x8F;
    }
  } else {
    cp = kReplacementChar;
    return 1;
  }

  std::size_t used = 1;
  for (std::size_t i = 0; i < need; ++i) {
    if (pos + used >= len) {
      cp = kReplacementChar;
      return used;
    }
    const std::uint8_t b = data[pos + used];
    const std::uint8_t min = (i == 0) ? lo : 0x80;
    const std::uint8_t max = (i == 0) ? hi : 0xBF;
    if (!InRange(b, min, max)) {
      cp = kReplacementChar;
      return used;
    }
    cp = (cp << 6) | (b & 0x3F);
    ++used;
  }
  return used;
}

char32_t LowerCodePoint(char32_t cp) {
  if (cp >= 'A' && cp <= 'Z') {
    return cp + 32;
  }
  if (cp < 0x80) {
    return cp;
  }
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
    return cp + 32;
  }
  if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
      (cp >= 0x14A && cp <= 0x177)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  if (cp == 0x178) {
    return 0xFF;
  }
  if (cp == 0x386) {
    return 0x3AC;
  }
  if (cp >= 0x388 && cp <= 0x38A) {
    return cp + 37;
  }
  if (cp == 0x38C) {
    return 0x3CC;
  }
  if (cp == 0x38E || cp == 0x38F) {
    return cp + 63;
  }
  if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) {
    return cp + 32;
  }
  if (cp >= 0x400 && cp <= 0x40F) {
    return cp + 80;
  }
  if (cp >= 0x410 && cp <= 0x42F) {
    return cp + 32;
  }
  if ((cp >= 0x460 && cp <= 0x481) || (cp >= 0x48A && cp <= 0x4BF)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  return cp;
}

}  // namespace

std::string DecodeUtf8Lossy(const std::uint8_t* data, std::size_t len) {
  std::string out;
  if (!data || len == 0) {
    return out;
  }
  out.reserve(len);
  std::size_t pos = 0;
  while (pos < len) {
    char32_t cp = 0;
    const std::size_t used = DecodeOne(data, len, pos, cp);
    if (cp == kReplacementChar || used > 1) {
      AppendUtf8(cp, out);
    } else {
      out.push_back(static_cast<char>(data[pos]));
    }
    pos += used;
  }
  return out;
}

std::string ToLowerUtf8(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  const auto* data = reinterpret_cast<const std::uint8_t*>(text.data());
  std::size_t pos = 0;
  while (pos < text.size()) {
    char32_t cp = 0;
    const std::size_t used = DecodeOne(data, text.size(), pos, cp);
    AppendUtf8(LowerCodePoint(cp), out);
    pos += used;
  }
  return out;
}

bool ContainsFolded(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  return ToLowerUtf8(haystack).find(ToLowerUtf8(needle)) != std::string::npos;
}

std::string DigitsOnly(std::string_view text) {
  std::string out;
  for (const char ch : text) {
    if (ch >= '0' && ch <= '9') {
      out.push_back(ch);
    }
  }
  return out;
}

std::string TrimAscii(std::string_view text) {
  const auto is_space = [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
  };
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

}  // namespace pbr::common

#ifndef PBR_UTF8_UTILS_H
#define PBR_UTF8_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace pbr::common {

// Decodes bytes as UTF-8, replacing each maximal invalid subsequence with
// U+FFFD. Never fails.
std::string DecodeUtf8Lossy(const std::uint8_t* data, std::size_t len);

// Simple lowercase mapping for ASCII, Latin-1, Latin Extended-A, Greek and
// Cyrillic. Other code points pass through unchanged: Latin Extended-B and
// Additional, Armenian, Georgian, Coptic, Glagolitic, Cherokee, Deseret,
// fullwidth Latin and the other cased supplementary scripts are not folded.
// Final sigma is not special-cased; U+03A3 always maps to U+03C3.
std::string ToLowerUtf8(std::string_view text);

bool ContainsFolded(std::string_view haystack, std::string_view needle);

std::string DigitsOnly(std::string_view text);

// Strips ASCII whitespace only. Unicode spaces such as U+00A0 and U+3000
// are kept.
std::string TrimAscii(std::string_view text);

}  // namespace pbr::common

#endif  // PBR_UTF8_UTILS_H

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "hex_utils.h"
#include "secure_buffer.h"
#include "utf8_utils.h"

using pbr::common::ContainsFolded;
using pbr::common::DecodeUtf8Lossy;
using pbr::common::DigitsOnly;
using pbr::common::ToLowerUtf8;
using pbr::common::TrimAscii;

static std::string Lossy(const std::vector<std::uint8_t>& bytes) {
  return DecodeUtf8Lossy(bytes.data(), bytes.size());
}

int main() {
  const std::string kReplacement = "\xEF\xBF\xBD";

  {
    assert(Lossy({'a', 'b', 'c'}) == "abc");
    assert(Lossy({0xD0, 0x9F}) == "\xD0\x9F");
    assert(Lossy({0xF0, 0x9F, 0x98, 0x80}) == "\xF0\x9F\x98\x80");
    assert(Lossy({0x80}) == kReplacement);
    assert(Lossy({0xC0, 0x80}) == kReplacement + kReplacement);
    // Truncated three byte sequence is one maximal subpart.
    assert(Lossy({0xE2, 0x82, 'x'}) == kReplacement + "x");
    // Surrogates are not valid UTF-8.
    assert(Lossy({0xED, 0xA0, 0x80}) ==
           kReplacement + kReplacement + kReplacement);
    assert(Lossy({0xF4, 0x90, 0x80, 0x80}).size() == 4 * kReplacement.size());
    assert(DecodeUtf8Lossy(nullptr, 0).empty());
  }

  {
    assert(ToLowerUtf8("Hello World") == "hello world");
    assert(ToLowerUtf8("\xC3\x84\xC3\x96") == "\xC3\xA4\xC3\xB6");
    assert(ToLowerUtf8("\xD0\x9F\xD0\xA0\xD0\x98") ==
           "\xD0\xBF\xD1\x80\xD0\xB8");
    assert(ToLowerUtf8("\xCE\xA9") == "\xCF\x89");
    assert(ToLowerUtf8("\xC5\x81") == "\xC5\x82");
    // Word-final capital sigma still maps to the medial form.
    assert(ToLowerUtf8("\xCE\x9F\xCE\xA3") == "\xCE\xBF\xCF\x83");
    // Armenian and fullwidth Latin capitals are left alone.
    assert(ToLowerUtf8("\xD4\xB1") == "\xD4\xB1");
    assert(ToLowerUtf8("\xEF\xBC\xA1") == "\xEF\xBC\xA1");
    assert(ContainsFolded("Meeting at NOON", "noon"));
    assert(ContainsFolded("\xD0\x9F\xD1\x80\xD0\xB8\xD0\xB2\xD0\xB5\xD1\x82",
                          "\xD0\xBF\xD1\x80\xD0\xB8"));
    assert(ContainsFolded("anything", ""));
    assert(!ContainsFolded("abc", "abd"));
  }

  {
    assert(DigitsOnly("+1 (555) 123-4567") == "15551234567");
    assert(DigitsOnly("alice").empty());
    assert(TrimAscii("  bob \t\n") == "bob");
    assert(TrimAscii("   ").empty());
    assert(TrimAscii("\xC2\xA0" "bob ") == "\xC2\xA0" "bob");
  }

  {
    const std::vector<std::uint8_t> bytes = {0x00, 0xAB, 0xFF};
    const std::string hex = pbr::common::BytesToHex(bytes);
    assert(hex == "00abff");
    std::vector<std::uint8_t> back;
    assert(pbr::common::HexToBytes("00ABff", back));
    assert(back == bytes);
    assert(!pbr::common::HexToBytes("abc", back));
    assert(!pbr::common::HexToBytes("zz", back));
  }

  {
    std::vector<std::uint8_t> secret = {1, 2, 3, 4};
    {
      pbr::common::ScopedWipe wipe(secret);
    }
    for (const auto b : secret) {
      assert(b == 0);
    }
    std::string text = "passphrase";
    pbr::common::SecureWipe(text);
    assert(text.find_first_not_of('\0') == std::string::npos);
  }

  return 0;
}

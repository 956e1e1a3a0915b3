#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "message_codec.h"

using pbr::archive::MakeByteView;
using pbr::archive::MessageKey;
using pbr::archive::MessageValueFields;
using pbr::archive::ParseMessageValue;

int main() {
  {
    MessageKey key;
    key.peer_id = 42;
    key.name_space = 0;
    key.timestamp = 1700000000;
    key.message_id = 7;
    const auto raw = pbr::archive::EncodeMessageKey(key);
    assert(raw[7] == 42);
    assert(raw[0] == 0);
    // 1700000000 == 0x6553F100, big-endian at offset 12.
    assert(raw[12] == 0x65 && raw[13] == 0x53 && raw[14] == 0xF1 &&
           raw[15] == 0x00);
    assert(raw[19] == 7);

    MessageKey parsed;
    assert(pbr::archive::ParseMessageKey(MakeByteView(raw.data(), raw.size()),
                                         parsed));
    assert(parsed.peer_id == 42);
    assert(parsed.name_space == 0);
    assert(parsed.timestamp == 1700000000);
    assert(parsed.message_id == 7);

    assert(!pbr::archive::ParseMessageKey(MakeByteView(raw.data(), 19),
                                          parsed));

    const auto prefix = pbr::archive::EncodePeerPrefix(42);
    for (std::size_t i = 0; i < prefix.size(); ++i) {
      assert(prefix[i] == raw[i]);
    }

    key.peer_id = -2;
    const auto negative = pbr::archive::EncodeMessageKey(key);
    assert(negative[0] == 0xFF && negative[7] == 0xFE);
  }

  {
    MessageValueFields f;
    f.flags = pbr::archive::message_flags::kIncoming;
    f.author_id = 555;
    f.text = "hello there";
    const auto bytes = pbr::archive::EncodeMessageValue(f);
    const auto v = ParseMessageValue(MakeByteView(bytes));
    assert(v.has_value());
    assert(v->text == "hello there");
    assert(v->incoming);
    assert(v->author_id.has_value() && *v->author_id == 555);
    assert(!v->forward_info.has_value());
  }

  {
    // Optional header fields and a fully populated forward block.
    MessageValueFields f;
    f.data_flags = 0x3F;
    f.forward_flags = 0x3E;
    f.forward.author_id = 99;
    f.forward.date = 1600000000;
    f.text = "forwarded";
    const auto bytes = pbr::archive::EncodeMessageValue(f);
    const auto v = ParseMessageValue(MakeByteView(bytes));
    assert(v.has_value());
    assert(v->text == "forwarded");
    assert(!v->incoming);
    assert(!v->author_id.has_value());
    assert(v->forward_info.has_value());
    assert(v->forward_info->author_id == 99);
    assert(v->forward_info->date == 1600000000);
  }

  {
    // Each forward flag gates only its own field.
    const std::int8_t singles[] = {
        pbr::archive::forward_info_flags::kSourceId,
        pbr::archive::forward_info_flags::kSourceMessage,
        pbr::archive::forward_info_flags::kSignature,
        pbr::archive::forward_info_flags::kPsaType,
        pbr::archive::forward_info_flags::kFlags};
    for (const std::int8_t flag : singles) {
      MessageValueFields f;
      f.forward_flags = flag;
      f.forward.author_id = 5;
      f.text = "x";
      const auto bytes = pbr::archive::EncodeMessageValue(f);
      const auto v = ParseMessageValue(MakeByteView(bytes));
      assert(v.has_value());
      assert(v->text == "x");
      assert(v->forward_info->author_id == 5);
    }
  }

  {
    MessageValueFields f;
    f.text = "complete";
    const auto bytes = pbr::archive::EncodeMessageValue(f);
    for (std::size_t cut = 0; cut < bytes.size(); ++cut) {
      const std::vector<std::uint8_t> part(bytes.begin(), bytes.begin() + cut);
      assert(!ParseMessageValue(MakeByteView(part)).has_value());
    }

    std::vector<std::uint8_t> other_type = bytes;
    other_type[0] = 1;
    assert(!ParseMessageValue(MakeByteView(other_type)).has_value());
  }

  {
    MessageValueFields f;
    f.text = "";
    const auto bytes = pbr::archive::EncodeMessageValue(f);
    const auto v = ParseMessageValue(MakeByteView(bytes));
    assert(v.has_value());
    assert(v->text.empty());
  }

  return 0;
}

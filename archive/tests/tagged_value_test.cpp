#include <cassert>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "tagged_value.h"

using pbr::archive::DecodeAll;
using pbr::archive::MakeByteView;
using pbr::archive::SeekField;
using pbr::archive::TaggedFields;
using pbr::archive::TaggedStreamWriter;
using pbr::archive::ValueType;

static std::vector<std::uint8_t> Nested(const std::string& name) {
  TaggedStreamWriter w;
  w.PutString("n", name);
  return w.Take();
}

int main() {
  TaggedStreamWriter w;
  w.PutInt32("i32", -5);
  w.PutInt64("i64", 1LL << 40);
  w.PutBool("b", true);
  w.PutDouble("d", 2.25);
  w.PutString("s", "text");
  w.PutObject("o", 77, Nested("inner"));
  w.PutInt32Array("a32", {1, 2, 3});
  w.PutInt64Array("a64", {-1, 1LL << 50});
  w.PutObjectArray("oa", 9, {Nested("x"), Nested("y")});
  w.PutObjectDictionary("od", 3, {{Nested("k1"), Nested("v1")},
                                  {Nested("k2"), Nested("v2")}});
  w.PutBytes("by", {0xDE, 0xAD});
  w.PutNil("nil");
  w.PutStringArray("sa", {"a", "", "c"});
  w.PutBytesArray("ba", {{0x01}, {}});
  const std::vector<std::uint8_t> stream = w.bytes();

  {
    const TaggedFields f = DecodeAll(MakeByteView(stream));
    assert(f.size() == 14);
    assert(f.at("i32").type == ValueType::kInt32);
    assert(f.at("i32").int32_value == -5);
    assert(f.at("i64").int64_value == (1LL << 40));
    assert(f.at("b").bool_value);
    assert(f.at("d").double_value == 2.25);
    assert(f.at("s").string_value == "text");
    assert(f.at("o").object_type_hash == 77);
    const TaggedFields inner = pbr::archive::DecodeNested(f.at("o"));
    assert(inner.at("n").string_value == "inner");
    assert((f.at("a32").int32_array == std::vector<std::int32_t>{1, 2, 3}));
    assert(f.at("a64").int64_array.size() == 2);
    assert(f.at("a64").int64_array[1] == (1LL << 50));
    assert(f.at("oa").bytes_array.size() == 2);
    assert(DecodeAll(MakeByteView(f.at("oa").bytes_array[1]))
               .at("n")
               .string_value == "y");
    assert(f.at("od").type == ValueType::kObjectDictionary);
    assert(f.at("od").dictionary_size == 2);
    assert((f.at("by").bytes_value == std::vector<std::uint8_t>{0xDE, 0xAD}));
    assert(f.at("nil").type == ValueType::kNil);
    assert(f.at("sa").string_array.size() == 3);
    assert(f.at("sa").string_array[2] == "c");
    assert(f.at("ba").bytes_array.size() == 2);
    assert(f.at("ba").bytes_array[1].empty());
  }

  {
    // Seeking skips every earlier tag and agrees with the full decode.
    const TaggedFields all = DecodeAll(MakeByteView(stream));
    for (const auto& entry : all) {
      const auto found = SeekField(MakeByteView(stream), entry.first,
                                   entry.second.type);
      assert(found.has_value());
      assert(found->type == entry.second.type);
      assert(found->int32_value == entry.second.int32_value);
      assert(found->int64_value == entry.second.int64_value);
      assert(found->string_value == entry.second.string_value);
      assert(found->bytes_value == entry.second.bytes_value);
      assert(found->bytes_array == entry.second.bytes_array);
      assert(found->string_array == entry.second.string_array);
    }
    assert(!SeekField(MakeByteView(stream), "s", ValueType::kInt32));
    assert(!SeekField(MakeByteView(stream), "missing", ValueType::kString));
  }

  {
    for (std::uint8_t raw = 0; raw <= pbr::archive::kMaxValueType; ++raw) {
      ValueType t = ValueType::kNil;
      assert(pbr::archive::ValueTypeFromByte(raw, t));
      assert(static_cast<std::uint8_t>(t) == raw);
      assert(std::string(pbr::archive::ValueTypeName(t)) != "unknown");
    }
    ValueType t = ValueType::kNil;
    assert(!pbr::archive::ValueTypeFromByte(14, t));
  }

  {
    // Decoding stops at an unknown tag and keeps what came before.
    TaggedStreamWriter ok;
    ok.PutString("first", "kept");
    std::vector<std::uint8_t> bad = ok.Take();
    bad.push_back(1);
    bad.push_back('z');
    bad.push_back(0x40);
    bad.push_back(0x00);
    const TaggedFields f = DecodeAll(MakeByteView(bad));
    assert(f.size() == 1);
    assert(f.at("first").string_value == "kept");
  }

  {
    // Truncation anywhere never reads past the end.
    for (std::size_t cut = 0; cut < stream.size(); ++cut) {
      const pbr::archive::ByteView view{stream.data(), cut};
      const TaggedFields f = DecodeAll(view);
      assert(f.size() < 14);
      (void)SeekField(view, "ba", ValueType::kBytesArray);
    }
  }

  {
    // A huge declared count must not allocate or succeed.
    std::vector<std::uint8_t> evil = {1, 'a',
                                      static_cast<std::uint8_t>(
                                          ValueType::kInt64Array),
                                      0xFF, 0xFF, 0xFF, 0x7F};
    assert(DecodeAll(MakeByteView(evil)).empty());
    std::size_t off = 3;
    assert(!pbr::archive::SkipValue(MakeByteView(evil), off,
                                    ValueType::kInt64Array));
    assert(off == 3);
  }

  {
    TaggedStreamWriter dup;
    dup.PutString("k", "one");
    dup.PutString("k", "two");
    const auto bytes = dup.Take();
    assert(DecodeAll(MakeByteView(bytes)).at("k").string_value == "two");
    assert(SeekField(MakeByteView(bytes), "k", ValueType::kString)
               ->string_value == "one");
  }

  return 0;
}

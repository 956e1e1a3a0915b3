#ifndef PBR_ARCHIVE_TAGGED_VALUE_H
#define PBR_ARCHIVE_TAGGED_VALUE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "byte_reader.h"

namespace pbr::archive {

// Value tags of the postbox key/value serialization. Every record in a
// stream is: uint8 key length, key bytes, uint8 tag, payload.
enum class ValueType : std::uint8_t {
  kInt32 = 0,
  kInt64 = 1,
  kBool = 2,
  kDouble = 3,
  kString = 4,
  kObject = 5,
  kInt32Array = 6,
  kInt64Array = 7,
  kObjectArray = 8,
  kObjectDictionary = 9,
  kBytes = 10,
  kNil = 11,
  kStringArray = 12,
  kBytesArray = 13,
};

inline constexpr std::uint8_t kMaxValueType = 13;

bool ValueTypeFromByte(std::uint8_t raw, ValueType& out);
const char* ValueTypeName(ValueType type);

// A decoded payload. Only the members matching `type` are meaningful.
// Object and ObjectArray keep their raw nested streams (see DecodeNested);
// ObjectDictionary contents are skipped and only counted.
struct TaggedValue {
  ValueType type{ValueType::kNil};
  std::int32_t int32_value{0};
  std::int64_t int64_value{0};
  bool bool_value{false};
  double double_value{0.0};
  std::string string_value;
  std::int32_t object_type_hash{0};
  std::vector<std::uint8_t> bytes_value;
  std::vector<std::int32_t> int32_array;
  std::vector<std::int64_t> int64_array;
  std::vector<std::string> string_array;
  std::vector<std::vector<std::uint8_t>> bytes_array;
  std::size_t dictionary_size{0};
};

using TaggedFields = std::unordered_map<std::string, TaggedValue>;

bool ReadFieldHeader(ByteView data, std::size_t& offset, std::string& key,
                     ValueType& type);

// Decodes one payload of `type` at `offset`, advancing `offset` by exactly
// the bytes consumed. False on truncation or malformed lengths.
bool ReadValue(ByteView data, std::size_t& offset, ValueType type,
               TaggedValue& out);

// Byte-for-byte mirror of ReadValue that materializes nothing.
bool SkipValue(ByteView data, std::size_t& offset, ValueType type);

// Decodes a whole stream. Stops at the first malformed record and returns
// what was decoded before it. A repeated key keeps its last value.
TaggedFields DecodeAll(ByteView data);

// Returns the first record with `key` whose tag is `expected`. Records with
// a different key or tag are skipped without being decoded.
std::optional<TaggedValue> SeekField(ByteView data, std::string_view key,
                                     ValueType expected);

// DecodeAll over the stream carried by an Object value.
TaggedFields DecodeNested(const TaggedValue& object_value);

// Emits streams in the same format. Used to build fixtures and tooling
// input; the archive itself is never written.
class TaggedStreamWriter {
 public:
  void PutInt32(std::string_view key, std::int32_t v);
  void PutInt64(std::string_view key, std::int64_t v);
  void PutBool(std::string_view key, bool v);
  void PutDouble(std::string_view key, double v);
  void PutString(std::string_view key, std::string_view v);
  void PutObject(std::string_view key, std::int32_t type_hash,
                 const std::vector<std::uint8_t>& nested);
  void PutInt32Array(std::string_view key, const std::vector<std::int32_t>& v);
  void PutInt64Array(std::string_view key, const std::vector<std::int64_t>& v);
  void PutObjectArray(std::string_view key, std::int32_t type_hash,
                      const std::vector<std::vector<std::uint8_t>>& items);
  // Each entry is a (key object, value object) pair of raw streams.
  void PutObjectDictionary(
      std::string_view key, std::int32_t type_hash,
      const std::vector<std::pair<std::vector<std::uint8_t>,
                                  std::vector<std::uint8_t>>>& entries);
  void PutBytes(std::string_view key, const std::vector<std::uint8_t>& v);
  void PutNil(std::string_view key);
  void PutStringArray(std::string_view key, const std::vector<std::string>& v);
  void PutBytesArray(std::string_view key,
                     const std::vector<std::vector<std::uint8_t>>& v);

  const std::vector<std::uint8_t>& bytes() const { return out_; }
  std::vector<std::uint8_t> Take() { return std::move(out_); }

 private:
  void PutHeader(std::string_view key, ValueType type);
  void PutObjectBody(std::int32_t type_hash,
                     const std::vector<std::uint8_t>& nested);

  std::vector<std::uint8_t> out_;
};

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_TAGGED_VALUE_H

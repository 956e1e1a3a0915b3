#include "tagged_value.h"

#include <algorithm>

#include "utf8_utils.h"

namespace pbr::archive {

namespace {

constexpr std::size_t kObjectHashSize = 4;

std::size_t Remaining(ByteView data, std::size_t offset) {
  return offset <= data.size ? data.size - offset : 0;
}

// Reads an int32 element count and checks that `count * min_width` bytes can
// still follow, so a corrupt count never drives a large allocation.
bool ReadCount(ByteView data, std::size_t& offset, std::size_t min_width,
               std::size_t& out) {
  std::size_t cursor = offset;
  std::int32_t count = 0;
  if (!ReadInt32Le(data, cursor, count) || count < 0) {
    return false;
  }
  const std::size_t n = static_cast<std::size_t>(count);
  if (min_width > 0 && n > Remaining(data, cursor) / min_width) {
    return false;
  }
  offset = cursor;
  out = n;
  return true;
}

// type hash (int32, ignored) + int32 length + nested stream bytes.
bool ReadObjectBody(ByteView data, std::size_t& offset,
                    std::int32_t& type_hash, ByteView& body) {
  std::size_t cursor = offset;
  if (!ReadInt32Le(data, cursor, type_hash) ||
      !ReadLengthPrefixed(data, cursor, body)) {
    return false;
  }
  offset = cursor;
  return true;
}

bool SkipObjectBody(ByteView data, std::size_t& offset) {
  std::size_t cursor = offset;
  ByteView body;
  if (!Skip(data, cursor, kObjectHashSize) ||
      !ReadLengthPrefixed(data, cursor, body)) {
    return false;
  }
  offset = cursor;
  return true;
}

std::vector<std::uint8_t> ToVector(ByteView view) {
  if (!view.data || view.size == 0) {
    return {};
  }
  return std::vector<std::uint8_t>(view.data, view.data + view.size);
}

}  // namespace

bool ValueTypeFromByte(std::uint8_t raw, ValueType& out) {
  if (raw > kMaxValueType) {
    return false;
  }
  out = static_cast<ValueType>(raw);
  return true;
}

const char* ValueTypeName(ValueType type) {
  switch (type) {
    case ValueType::kInt32:
      return "int32";
    case ValueType::kInt64:
      return "int64";
    case ValueType::kBool:
      return "bool";
    case ValueType::kDouble:
      return "double";
    case ValueType::kString:
      return "string";
    case ValueType::kObject:
      return "object";
    case ValueType::kInt32Array:
      return "int32_array";
    case ValueType::kInt64Array:
      return "int64_array";
    case ValueType::kObjectArray:
      return "object_array";
    case ValueType::kObjectDictionary:
      return "object_dictionary";
    case ValueType::kBytes:
      return "bytes";
    case ValueType::kNil:
      return "nil";
    case ValueType::kStringArray:
      return "string_array";
    case ValueType::kBytesArray:
      return "bytes_array";
  }
  return "unknown";
}

bool ReadFieldHeader(ByteView data, std::size_t& offset, std::string& key,
                     ValueType& type) {
  std::size_t cursor = offset;
  std::uint8_t key_len = 0;
  ByteView key_bytes;
  std::uint8_t raw_type = 0;
  if (!ReadUint8(data, cursor, key_len) ||
      !ReadSpan(data, cursor, key_len, key_bytes) ||
      !ReadUint8(data, cursor, raw_type) ||
      !ValueTypeFromByte(raw_type, type)) {
    return false;
  }
  key = common::DecodeUtf8Lossy(key_bytes.data, key_bytes.size);
  offset = cursor;
  return true;
}

bool ReadValue(ByteView data, std::size_t& offset, ValueType type,
               TaggedValue& out) {
  out = TaggedValue{};
  out.type = type;
  std::size_t cursor = offset;
  std::size_t count = 0;

  switch (type) {
    case ValueType::kInt32:
      if (!ReadInt32Le(data, cursor, out.int32_value)) {
        return false;
      }
      break;
    case ValueType::kInt64:
      if (!ReadInt64Le(data, cursor, out.int64_value)) {
        return false;
      }
      break;
    case ValueType::kBool: {
      std::uint8_t raw = 0;
      if (!ReadUint8(data, cursor, raw)) {
        return false;
      }
      out.bool_value = raw != 0;
      break;
    }
    case ValueType::kDouble:
      if (!ReadDoubleLe(data, cursor, out.double_value)) {
        return false;
      }
      break;
    case ValueType::kString:
      if (!ReadLossyString(data, cursor, out.string_value)) {
        return false;
      }
      break;
    case ValueType::kObject: {
      ByteView body;
      if (!ReadObjectBody(data, cursor, out.object_type_hash, body)) {
        return false;
      }
      out.bytes_value = ToVector(body);
      break;
    }
    case ValueType::kInt32Array:
      if (!ReadCount(data, cursor, 4, count)) {
        return false;
      }
      out.int32_array.resize(count);
      for (std::size_t i = 0; i < count; ++i) {
        if (!ReadInt32Le(data, cursor, out.int32_array[i])) {
          return false;
        }
      }
      break;
    case ValueType::kInt64Array:
      if (!ReadCount(data, cursor, 8, count)) {
        return false;
      }
      out.int64_array.resize(count);
      for (std::size_t i = 0; i < count; ++i) {
        if (!ReadInt64Le(data, cursor, out.int64_array[i])) {
          return false;
        }
      }
      break;
    case ValueType::kObjectArray:
      if (!ReadCount(data, cursor, kObjectHashSize + 4, count)) {
        return false;
      }
      out.bytes_array.reserve(count);
      for (std::size_t i = 0; i < count; ++i) {
        ByteView body;
        std::int32_t hash = 0;
        if (!ReadObjectBody(data, cursor, hash, body)) {
          return false;
        }
        out.object_type_hash = hash;
        out.bytes_array.push_back(ToVector(body));
      }
      break;
    case ValueType::kObjectDictionary:
      if (!ReadCount(data, cursor, 2 * (kObjectHashSize + 4), count)) {
        return false;
      }
      for (std::size_t i = 0; i < count; ++i) {
        if (!SkipObjectBody(data, cursor) || !SkipObjectBody(data, cursor)) {
          return false;
        }
      }
      out.dictionary_size = count;
      break;
    case ValueType::kBytes: {
      ByteView body;
      if (!ReadLengthPrefixed(data, cursor, body)) {
        return false;
      }
      out.bytes_value = ToVector(body);
      break;
    }
    case ValueType::kNil:
      break;
    case ValueType::kStringArray:
      if (!ReadCount(data, cursor, 4, count)) {
        return false;
      }
      out.string_array.resize(count);
      for (std::size_t i = 0; i < count; ++i) {
        if (!ReadLossyString(data, cursor, out.string_array[i])) {
          return false;
        }
      }
      break;
    case ValueType::kBytesArray:
      if (!ReadCount(data, cursor, 4, count)) {
        return false;
      }
      out.bytes_array.reserve(count);
      for (std::size_t i = 0; i < count; ++i) {
        ByteView body;
        if (!ReadLengthPrefixed(data, cursor, body)) {
          return false;
        }
        out.bytes_array.push_back(ToVector(body));
      }
      break;
    default:
      return false;
  }
  offset = cursor;
  return true;
}

bool SkipValue(ByteView data, std::size_t& offset, ValueType type) {
  std::size_t cursor = offset;
  std::size_t count = 0;
  ByteView body;

  switch (type) {
    case ValueType::kInt32:
      if (!Skip(data, cursor, 4)) {
        return false;
      }
      break;
    case ValueType::kInt64:
    case ValueType::kDouble:
      if (!Skip(data, cursor, 8)) {
        return false;
      }
      break;
    case ValueType::kBool:
      if (!Skip(data, cursor, 1)) {
        return false;
      }
      break;
    case ValueType::kString:
    case ValueType::kBytes:
      if (!ReadLengthPrefixed(data, cursor, body)) {
        return false;
      }
      break;
    case ValueType::kObject:
      if (!SkipObjectBody(data, cursor)) {
        return false;
      }
      break;
    case ValueType::kInt32Array:
      if (!ReadCount(data, cursor, 4, count) ||
          !Skip(data, cursor, count * 4)) {
        return false;
      }
      break;
    case ValueType::kInt64Array:
      if (!ReadCount(data, cursor, 8, count) ||
          !Skip(data, cursor, count * 8)) {
        return false;
      }
      break;
    case ValueType::kObjectArray:
      if (!ReadCount(data, cursor, kObjectHashSize + 4, count)) {
        return false;
      }
      for (std::size_t i = 0; i < count; ++i) {
        if (!SkipObjectBody(data, cursor)) {
          return false;
        }
      }
      break;
    case ValueType::kObjectDictionary:
      if (!ReadCount(data, cursor, 2 * (kObjectHashSize + 4), count)) {
        return false;
      }
      for (std::size_t i = 0; i < count; ++i) {
        if (!SkipObjectBody(data, cursor) || !SkipObjectBody(data, cursor)) {
          return false;
        }
      }
      break;
    case ValueType::kNil:
      break;
    case ValueType::kStringArray:
    case ValueType::kBytesArray:
      if (!ReadCount(data, cursor, 4, count)) {
        return false;
      }
      for (std::size_t i = 0; i < count; ++i) {
        if (!ReadLengthPrefixed(data, cursor, body)) {
          return false;
        }
      }
      break;
    default:
      return false;
  }
  offset = cursor;
  return true;
}

TaggedFields DecodeAll(ByteView data) {
  TaggedFields fields;
  std::size_t offset = 0;
  while (offset < data.size) {
    std::string key;
    ValueType type = ValueType::kNil;
    TaggedValue value;
    if (!ReadFieldHeader(data, offset, key, type) ||
        !ReadValue(data, offset, type, value)) {
      break;
    }
    fields.insert_or_assign(std::move(key), std::move(value));
  }
  return fields;
}

std::optional<TaggedValue> SeekField(ByteView data, std::string_view key,
                                     ValueType expected) {
  std::size_t offset = 0;
  while (offset < data.size) {
    std::string field_key;
    ValueType type = ValueType::kNil;
    if (!ReadFieldHeader(data, offset, field_key, type)) {
      return std::nullopt;
    }
    if (type == expected && field_key == key) {
      TaggedValue value;
      if (!ReadValue(data, offset, type, value)) {
        return std::nullopt;
      }
      return value;
    }
    if (!SkipValue(data, offset, type)) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

TaggedFields DecodeNested(const TaggedValue& object_value) {
  if (object_value.type != ValueType::kObject) {
    return {};
  }
  return DecodeAll(MakeByteView(object_value.bytes_value));
}

void TaggedStreamWriter::PutHeader(std::string_view key, ValueType type) {
  const std::size_t len = std::min<std::size_t>(key.size(), 0xFF);
  WriteUint8(static_cast<std::uint8_t>(len), out_);
  out_.insert(out_.end(), key.begin(), key.begin() + len);
  WriteUint8(static_cast<std::uint8_t>(type), out_);
}

void TaggedStreamWriter::PutObjectBody(
    std::int32_t type_hash, const std::vector<std::uint8_t>& nested) {
  WriteInt32Le(type_hash, out_);
  WriteLengthPrefixed(nested.data(), nested.size(), out_);
}

void TaggedStreamWriter::PutInt32(std::string_view key, std::int32_t v) {
  PutHeader(key, ValueType::kInt32);
  WriteInt32Le(v, out_);
}

void TaggedStreamWriter::PutInt64(std::string_view key, std::int64_t v) {
  PutHeader(key, ValueType::kInt64);
  WriteInt64Le(v, out_);
}

void TaggedStreamWriter::PutBool(std::string_view key, bool v) {
  PutHeader(key, ValueType::kBool);
  WriteUint8(v ? 1 : 0, out_);
}

void TaggedStreamWriter::PutDouble(std::string_view key, double v) {
  PutHeader(key, ValueType::kDouble);
  WriteDoubleLe(v, out_);
}

void TaggedStreamWriter::PutString(std::string_view key, std::string_view v) {
  PutHeader(key, ValueType::kString);
  WriteLengthPrefixed(reinterpret_cast<const std::uint8_t*>(v.data()),
                      v.size(), out_);
}

void TaggedStreamWriter::PutObject(std::string_view key,
                                   std::int32_t type_hash,
                                   const std::vector<std::uint8_t>& nested) {
  PutHeader(key, ValueType::kObject);
  PutObjectBody(type_hash, nested);
}

void TaggedStreamWriter::PutInt32Array(std::string_view key,
                                       const std::vector<std::int32_t>& v) {
  PutHeader(key, ValueType::kInt32Array);
  WriteInt32Le(static_cast<std::int32_t>(v.size()), out_);
  for (const std::int32_t item : v) {
    WriteInt32Le(item, out_);
  }
}

void TaggedStreamWriter::PutInt64Array(std::string_view key,
                                       const std::vector<std::int64_t>& v) {
  PutHeader(key, ValueType::kInt64Array);
  WriteInt32Le(static_cast<std::int32_t>(v.size()), out_);
  for (const std::int64_t item : v) {
    WriteInt64Le(item, out_);
  }
}

void TaggedStreamWriter::PutObjectArray(
    std::string_view key, std::int32_t type_hash,
    const std::vector<std::vector<std::uint8_t>>& items) {
  PutHeader(key, ValueType::kObjectArray);
  WriteInt32Le(static_cast<std::int32_t>(items.size()), out_);
  for (const auto& item : items) {
    PutObjectBody(type_hash, item);
  }
}

void TaggedStreamWriter::PutObjectDictionary(
    std::string_view key, std::int32_t type_hash,
    const std::vector<std::pair<std::vector<std::uint8_t>,
                                std::vector<std::uint8_t>>>& entries) {
  PutHeader(key, ValueType::kObjectDictionary);
  WriteInt32Le(static_cast<std::int32_t>(entries.size()), out_);
  for (const auto& entry : entries) {
    PutObjectBody(type_hash, entry.first);
    PutObjectBody(type_hash, entry.second);
  }
}

void TaggedStreamWriter::PutBytes(std::string_view key,
                                  const std::vector<std::uint8_t>& v) {
  PutHeader(key, ValueType::kBytes);
  WriteLengthPrefixed(v.data(), v.size(), out_);
}

void TaggedStreamWriter::PutNil(std::string_view key) {
  PutHeader(key, ValueType::kNil);
}

void TaggedStreamWriter::PutStringArray(std::string_view key,
                                        const std::vector<std::string>& v) {
  PutHeader(key, ValueType::kStringArray);
  WriteInt32Le(static_cast<std::int32_t>(v.size()), out_);
  for (const auto& item : v) {
    WriteLengthPrefixed(reinterpret_cast<const std::uint8_t*>(item.data()),
                        item.size(), out_);
  }
}

void TaggedStreamWriter::PutBytesArray(
    std::string_view key, const std::vector<std::vector<std::uint8_t>>& v) {
  PutHeader(key, ValueType::kBytesArray);
  WriteInt32Le(static_cast<std::int32_t>(v.size()), out_);
  for (const auto& item : v) {
    WriteLengthPrefixed(item.data(), item.size(), out_);
  }
}

}  // namespace pbr::archive

#include "byte_reader.h"

#include <cstring>
#include <limits>

#include "utf8_utils.h"

namespace pbr::archive {

namespace {

bool HasBytes(ByteView data, std::size_t offset, std::size_t len) {
  if (offset > data.size) {
    return false;
  }
  if (len == 0) {
    return true;
  }
  return data.data != nullptr && len <= data.size - offset;
}

std::uint64_t LoadLe(const std::uint8_t* p, std::size_t width) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    v |= static_cast<std::uint64_t>(p[i]) << (i * 8);
  }
  return v;
}

std::uint64_t LoadBe(const std::uint8_t* p, std::size_t width) {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    v = (v << 8) | static_cast<std::uint64_t>(p[i]);
  }
  return v;
}

void StoreLe(std::uint64_t v, std::size_t width,
             std::vector<std::uint8_t>& out) {
  for (std::size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF));
  }
}

void StoreBe(std::uint64_t v, std::size_t width,
             std::vector<std::uint8_t>& out) {
  for (std::size_t i = width; i > 0; --i) {
    out.push_back(static_cast<std::uint8_t>((v >> ((i - 1) * 8)) & 0xFF));
  }
}

}  // namespace

bool ReadUint8(ByteView data, std::size_t& offset, std::uint8_t& out) {
  if (!HasBytes(data, offset, 1)) {
    return false;
  }
  out = data.data[offset];
  offset += 1;
  return true;
}

bool ReadInt8(ByteView data, std::size_t& offset, std::int8_t& out) {
  std::uint8_t raw = 0;
  if (!ReadUint8(data, offset, raw)) {
    return false;
  }
  out = static_cast<std::int8_t>(raw);
  return true;
}

bool ReadUint32Le(ByteView data, std::size_t& offset, std::uint32_t& out) {
  if (!HasBytes(data, offset, 4)) {
    return false;
  }
  out = static_cast<std::uint32_t>(LoadLe(data.data + offset, 4));
  offset += 4;
  return true;
}

bool ReadInt32Le(ByteView data, std::size_t& offset, std::int32_t& out) {
  std::uint32_t raw = 0;
  if (!ReadUint32Le(data, offset, raw)) {
    return false;
  }
  out = static_cast<std::int32_t>(raw);
  return true;
}

bool ReadInt64Le(ByteView data, std::size_t& offset, std::int64_t& out) {
  if (!HasBytes(data, offset, 8)) {
    return false;
  }
  out = static_cast<std::int64_t>(LoadLe(data.data + offset, 8));
  offset += 8;
  return true;
}

bool ReadDoubleLe(ByteView data, std::size_t& offset, double& out) {
  if (!HasBytes(data, offset, 8)) {
    return false;
  }
  const std::uint64_t bits = LoadLe(data.data + offset, 8);
  static_assert(sizeof(double) == sizeof(bits), "IEEE-754 double expected");
  std::memcpy(&out, &bits, sizeof(out));
  offset += 8;
  return true;
}

bool ReadInt32Be(ByteView data, std::size_t& offset, std::int32_t& out) {
  if (!HasBytes(data, offset, 4)) {
    return false;
  }
  out = static_cast<std::int32_t>(
      static_cast<std::uint32_t>(LoadBe(data.data + offset, 4)));
  offset += 4;
  return true;
}

bool ReadInt64Be(ByteView data, std::size_t& offset, std::int64_t& out) {
  if (!HasBytes(data, offset, 8)) {
    return false;
  }
  out = static_cast<std::int64_t>(LoadBe(data.data + offset, 8));
  offset += 8;
  return true;
}

bool ReadSpan(ByteView data, std::size_t& offset, std::size_t len,
              ByteView& out) {
  if (!HasBytes(data, offset, len)) {
    return false;
  }
  out = ByteView{data.data + offset, len};
  offset += len;
  return true;
}

bool Skip(ByteView data, std::size_t& offset, std::size_t len) {
  if (!HasBytes(data, offset, len)) {
    return false;
  }
  offset += len;
  return true;
}

bool ReadLengthPrefixed(ByteView data, std::size_t& offset, ByteView& out) {
  std::size_t cursor = offset;
  std::int32_t len = 0;
  if (!ReadInt32Le(data, cursor, len) || len < 0) {
    return false;
  }
  if (!ReadSpan(data, cursor, static_cast<std::size_t>(len), out)) {
    return false;
  }
  offset = cursor;
  return true;
}

bool ReadLossyString(ByteView data, std::size_t& offset, std::string& out) {
  ByteView raw;
  if (!ReadLengthPrefixed(data, offset, raw)) {
    return false;
  }
  out = common::DecodeUtf8Lossy(raw.data, raw.size);
  return true;
}

void WriteUint8(std::uint8_t v, std::vector<std::uint8_t>& out) {
  out.push_back(v);
}

void WriteUint32Le(std::uint32_t v, std::vector<std::uint8_t>& out) {
  StoreLe(v, 4, out);
}

void WriteInt32Le(std::int32_t v, std::vector<std::uint8_t>& out) {
  StoreLe(static_cast<std::uint32_t>(v), 4, out);
}

void WriteInt64Le(std::int64_t v, std::vector<std::uint8_t>& out) {
  StoreLe(static_cast<std::uint64_t>(v), 8, out);
}

void WriteDoubleLe(double v, std::vector<std::uint8_t>& out) {
  std::uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  StoreLe(bits, 8, out);
}

void WriteInt32Be(std::int32_t v, std::vector<std::uint8_t>& out) {
  StoreBe(static_cast<std::uint32_t>(v), 4, out);
}

void WriteInt64Be(std::int64_t v, std::vector<std::uint8_t>& out) {
  StoreBe(static_cast<std::uint64_t>(v), 8, out);
}

void WriteLengthPrefixed(const std::uint8_t* data, std::size_t len,
                         std::vector<std::uint8_t>& out) {
  const std::size_t capped =
      len > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)())
          ? static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)())
          : len;
  WriteInt32Le(static_cast<std::int32_t>(capped), out);
  if (data && capped > 0) {
    out.insert(out.end(), data, data + capped);
  }
}

}  // namespace pbr::archive

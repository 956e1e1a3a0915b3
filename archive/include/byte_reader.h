#ifndef PBR_ARCHIVE_BYTE_READER_H
#define PBR_ARCHIVE_BYTE_READER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pbr::archive {

struct ByteView {
  const std::uint8_t* data{nullptr};
  std::size_t size{0};
};

inline ByteView MakeByteView(const std::vector<std::uint8_t>& data) {
  return ByteView{data.data(), data.size()};
}

inline ByteView MakeByteView(const std::uint8_t* data, std::size_t size) {
  return ByteView{data, size};
}

// Cursor readers. Each returns false without touching `offset` when fewer
// bytes remain than the read needs.
bool ReadUint8(ByteView data, std::size_t& offset, std::uint8_t& out);
bool ReadInt8(ByteView data, std::size_t& offset, std::int8_t& out);
bool ReadUint32Le(ByteView data, std::size_t& offset, std::uint32_t& out);
bool ReadInt32Le(ByteView data, std::size_t& offset, std::int32_t& out);
bool ReadInt64Le(ByteView data, std::size_t& offset, std::int64_t& out);
bool ReadDoubleLe(ByteView data, std::size_t& offset, double& out);
bool ReadInt32Be(ByteView data, std::size_t& offset, std::int32_t& out);
bool ReadInt64Be(ByteView data, std::size_t& offset, std::int64_t& out);

// Consumes `len` bytes and points `out` into `data`.
bool ReadSpan(ByteView data, std::size_t& offset, std::size_t len,
              ByteView& out);
bool Skip(ByteView data, std::size_t& offset, std::size_t len);

// int32 little-endian length followed by that many bytes. Negative lengths
// are rejected.
bool ReadLengthPrefixed(ByteView data, std::size_t& offset, ByteView& out);
// int32 length prefixed text, decoded as lossy UTF-8.
bool ReadLossyString(ByteView data, std::size_t& offset, std::string& out);

void WriteUint8(std::uint8_t v, std::vector<std::uint8_t>& out);
void WriteUint32Le(std::uint32_t v, std::vector<std::uint8_t>& out);
void WriteInt32Le(std::int32_t v, std::vector<std::uint8_t>& out);
void WriteInt64Le(std::int64_t v, std::vector<std::uint8_t>& out);
void WriteDoubleLe(double v, std::vector<std::uint8_t>& out);
void WriteInt32Be(std::int32_t v, std::vector<std::uint8_t>& out);
void WriteInt64Be(std::int64_t v, std::vector<std::uint8_t>& out);
void WriteLengthPrefixed(const std::uint8_t* data, std::size_t len,
                         std::vector<std::uint8_t>& out);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_BYTE_READER_H

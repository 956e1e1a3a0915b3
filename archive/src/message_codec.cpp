#include "message_codec.h"

#include <algorithm>

namespace pbr::archive {

namespace {

bool SkipInt64(ByteView data, std::size_t& offset) {
  return Skip(data, offset, 8);
}

bool SkipUint32(ByteView data, std::size_t& offset) {
  return Skip(data, offset, 4);
}

bool SkipString(ByteView data, std::size_t& offset) {
  ByteView ignored;
  return ReadLengthPrefixed(data, offset, ignored);
}

// Optional header fields gated by the data flag byte, in wire order.
bool SkipOptionalHeader(ByteView data, std::size_t& offset,
                        std::uint8_t data_flags) {
  using namespace message_data_flags;
  if ((data_flags & kGloballyUniqueId) && !SkipInt64(data, offset)) {
    return false;
  }
  if ((data_flags & kGlobalTags) && !SkipUint32(data, offset)) {
    return false;
  }
  if ((data_flags & kGroupingKey) && !SkipInt64(data, offset)) {
    return false;
  }
  if ((data_flags & kGroupInfo) && !SkipUint32(data, offset)) {
    return false;
  }
  if ((data_flags & kLocalTags) && !SkipUint32(data, offset)) {
    return false;
  }
  if ((data_flags & kThreadId) && !SkipInt64(data, offset)) {
    return false;
  }
  return true;
}

}  // namespace

bool ParseMessageKey(ByteView key, MessageKey& out) {
  if (key.size < kMessageKeySize) {
    return false;
  }
  std::size_t offset = 0;
  return ReadInt64Be(key, offset, out.peer_id) &&
         ReadInt32Be(key, offset, out.name_space) &&
         ReadInt32Be(key, offset, out.timestamp) &&
         ReadInt32Be(key, offset, out.message_id);
}

std::array<std::uint8_t, kMessageKeySize> EncodeMessageKey(
    const MessageKey& key) {
  std::vector<std::uint8_t> buf;
  buf.reserve(kMessageKeySize);
  WriteInt64Be(key.peer_id, buf);
  WriteInt32Be(key.name_space, buf);
  WriteInt32Be(key.timestamp, buf);
  WriteInt32Be(key.message_id, buf);
  std::array<std::uint8_t, kMessageKeySize> out{};
  std::copy(buf.begin(), buf.end(), out.begin());
  return out;
}

std::array<std::uint8_t, kPeerPrefixSize> EncodePeerPrefix(
    std::int64_t peer_id) {
  std::vector<std::uint8_t> buf;
  buf.reserve(kPeerPrefixSize);
  WriteInt64Be(peer_id, buf);
  std::array<std::uint8_t, kPeerPrefixSize> out{};
  std::copy(buf.begin(), buf.end(), out.begin());
  return out;
}

bool ParseForwardInfo(ByteView data, std::size_t& offset,
                      std::optional<ForwardInfo>& out) {
  using namespace forward_info_flags;
  out.reset();
  std::size_t cursor = offset;
  std::int8_t info_flags = 0;
  if (!ReadInt8(data, cursor, info_flags)) {
    return false;
  }
  if (info_flags == 0) {
    offset = cursor;
    return true;
  }

  ForwardInfo info;
  if (!ReadInt64Le(data, cursor, info.author_id) ||
      !ReadInt32Le(data, cursor, info.date)) {
    return false;
  }
  if ((info_flags & kSourceId) && !SkipInt64(data, cursor)) {
    return false;
  }
  // Source message: peer id, namespace, message id.
  if ((info_flags & kSourceMessage) &&
      (!SkipInt64(data, cursor) || !Skip(data, cursor, 4 + 4))) {
    return false;
  }
  if ((info_flags & kSignature) && !SkipString(data, cursor)) {
    return false;
  }
  if ((info_flags & kPsaType) && !SkipString(data, cursor)) {
    return false;
  }
  if ((info_flags & kFlags) && !Skip(data, cursor, 4)) {
    return false;
  }
  out = info;
  offset = cursor;
  return true;
}

std::optional<MessageValue> ParseMessageValue(ByteView data) {
  std::size_t offset = 0;
  std::int8_t message_type = 0;
  if (!ReadInt8(data, offset, message_type) ||
      message_type != kRegularMessageType) {
    return std::nullopt;
  }

  std::uint32_t stable_id = 0;
  std::uint32_t stable_version = 0;
  std::uint8_t data_flags = 0;
  if (!ReadUint32Le(data, offset, stable_id) ||
      !ReadUint32Le(data, offset, stable_version) ||
      !ReadUint8(data, offset, data_flags) ||
      !SkipOptionalHeader(data, offset, data_flags)) {
    return std::nullopt;
  }

  std::uint32_t flags = 0;
  std::uint32_t tags = 0;
  if (!ReadUint32Le(data, offset, flags) ||
      !ReadUint32Le(data, offset, tags)) {
    return std::nullopt;
  }

  MessageValue value;
  if (!ParseForwardInfo(data, offset, value.forward_info)) {
    return std::nullopt;
  }

  std::int8_t has_author = 0;
  if (!ReadInt8(data, offset, has_author)) {
    return std::nullopt;
  }
  if (has_author == 1) {
    std::int64_t author_id = 0;
    if (!ReadInt64Le(data, offset, author_id)) {
      return std::nullopt;
    }
    value.author_id = author_id;
  }

  if (!ReadLossyString(data, offset, value.text)) {
    return std::nullopt;
  }
  value.incoming = (flags & message_flags::kIncoming) != 0;
  return value;
}

std::vector<std::uint8_t> EncodeMessageValue(const MessageValueFields& fields) {
  using namespace message_data_flags;
  std::vector<std::uint8_t> out;
  out.push_back(static_cast<std::uint8_t>(kRegularMessageType));
  WriteUint32Le(fields.stable_id, out);
  WriteUint32Le(fields.stable_version, out);
  WriteUint8(fields.data_flags, out);
  if (fields.data_flags & kGloballyUniqueId) {
    WriteInt64Le(0, out);
  }
  if (fields.data_flags & kGlobalTags) {
    WriteUint32Le(0, out);
  }
  if (fields.data_flags & kGroupingKey) {
    WriteInt64Le(0, out);
  }
  if (fields.data_flags & kGroupInfo) {
    WriteUint32Le(0, out);
  }
  if (fields.data_flags & kLocalTags) {
    WriteUint32Le(0, out);
  }
  if (fields.data_flags & kThreadId) {
    WriteInt64Le(0, out);
  }
  WriteUint32Le(fields.flags, out);
  WriteUint32Le(fields.tags, out);

  WriteUint8(static_cast<std::uint8_t>(fields.forward_flags), out);
  if (fields.forward_flags != 0) {
    using namespace forward_info_flags;
    WriteInt64Le(fields.forward.author_id, out);
    WriteInt32Le(fields.forward.date, out);
    if (fields.forward_flags & kSourceId) {
      WriteInt64Le(0, out);
    }
    if (fields.forward_flags & kSourceMessage) {
      WriteInt64Le(0, out);
      WriteInt32Le(0, out);
      WriteInt32Le(0, out);
    }
    if (fields.forward_flags & kSignature) {
      static constexpr char kSignatureText[] = "signed";
      WriteLengthPrefixed(
          reinterpret_cast<const std::uint8_t*>(kSignatureText),
          sizeof(kSignatureText) - 1, out);
    }
    if (fields.forward_flags & kPsaType) {
      WriteLengthPrefixed(nullptr, 0, out);
    }
    if (fields.forward_flags & kFlags) {
      WriteInt32Le(0, out);
    }
  }

  if (fields.author_id.has_value()) {
    WriteUint8(1, out);
    WriteInt64Le(*fields.author_id, out);
  } else {
    WriteUint8(0, out);
  }
  WriteLengthPrefixed(reinterpret_cast<const std::uint8_t*>(fields.text.data()),
                      fields.text.size(), out);
  return out;
}

}  // namespace pbr::archive

#ifndef PBR_ARCHIVE_MESSAGE_CODEC_H
#define PBR_ARCHIVE_MESSAGE_CODEC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "byte_reader.h"

namespace pbr::archive {

inline constexpr std::size_t kMessageKeySize = 20;
inline constexpr std::size_t kPeerPrefixSize = 8;

// Row key of the message table, big-endian so that byte order sorts by
// (peer, namespace, timestamp, id).
struct MessageKey {
  std::int64_t peer_id{0};
  std::int32_t name_space{0};
  std::int32_t timestamp{0};
  std::int32_t message_id{0};
};

// Message flag bits; only kIncoming is interpreted.
namespace message_flags {
inline constexpr std::uint32_t kUnsent = 1u << 0;
inline constexpr std::uint32_t kFailed = 1u << 1;
inline constexpr std::uint32_t kIncoming = 1u << 2;
inline constexpr std::uint32_t kTopIndexable = 1u << 4;
inline constexpr std::uint32_t kSending = 1u << 5;
inline constexpr std::uint32_t kWasScheduled = 1u << 7;
inline constexpr std::uint32_t kCountedAsIncoming = 1u << 8;
}  // namespace message_flags

// Presence bits for the optional header fields of a stored message.
namespace message_data_flags {
inline constexpr std::uint8_t kGloballyUniqueId = 1u << 0;
inline constexpr std::uint8_t kGlobalTags = 1u << 1;
inline constexpr std::uint8_t kGroupingKey = 1u << 2;
inline constexpr std::uint8_t kGroupInfo = 1u << 3;
inline constexpr std::uint8_t kLocalTags = 1u << 4;
inline constexpr std::uint8_t kThreadId = 1u << 5;
}  // namespace message_data_flags

namespace forward_info_flags {
inline constexpr std::int8_t kSourceId = 1 << 1;
inline constexpr std::int8_t kSourceMessage = 1 << 2;
inline constexpr std::int8_t kSignature = 1 << 3;
inline constexpr std::int8_t kPsaType = 1 << 4;
inline constexpr std::int8_t kFlags = 1 << 5;
}  // namespace forward_info_flags

inline constexpr std::int8_t kRegularMessageType = 0;

struct ForwardInfo {
  std::int64_t author_id{0};
  std::int32_t date{0};
};

struct MessageValue {
  std::string text;
  std::optional<std::int64_t> author_id;
  bool incoming{false};
  std::optional<ForwardInfo> forward_info;
};

bool ParseMessageKey(ByteView key, MessageKey& out);
std::array<std::uint8_t, kMessageKeySize> EncodeMessageKey(
    const MessageKey& key);
std::array<std::uint8_t, kPeerPrefixSize> EncodePeerPrefix(
    std::int64_t peer_id);

// Reads the forward block at `offset`. A zero flag byte means no forward
// info. False on a short buffer.
bool ParseForwardInfo(ByteView data, std::size_t& offset,
                      std::optional<ForwardInfo>& out);

// nullopt when the record is not a regular message or is truncated.
std::optional<MessageValue> ParseMessageValue(ByteView data);

// Field values for EncodeMessageValue. Zero flags leave the optional header
// fields out.
struct MessageValueFields {
  std::uint32_t stable_id{0};
  std::uint32_t stable_version{0};
  std::uint8_t data_flags{0};
  std::uint32_t flags{0};
  std::uint32_t tags{0};
  std::int8_t forward_flags{0};
  ForwardInfo forward;
  std::optional<std::int64_t> author_id;
  std::string text;
};

std::vector<std::uint8_t> EncodeMessageValue(const MessageValueFields& fields);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_MESSAGE_CODEC_H

#ifndef PBR_ARCHIVE_TYPES_H
#define PBR_ARCHIVE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>

namespace pbr::archive {

enum class ArchiveStatus : std::uint8_t {
  kOk = 0,
  // Database or key file not present. A capability answer, not a failure.
  kUnavailable = 1,
  // Key file hash mismatch; usually a passcode-protected key.
  kIntegrityError = 2,
  // The external decrypt engine failed or produced no output.
  kDecryptionError = 3,
  // The plaintext copy could not be opened or queried.
  kStoreError = 4,
};

inline const char* ArchiveStatusName(ArchiveStatus status) {
  switch (status) {
    case ArchiveStatus::kOk:
      return "ok";
    case ArchiveStatus::kUnavailable:
      return "unavailable";
    case ArchiveStatus::kIntegrityError:
      return "integrity_error";
    case ArchiveStatus::kDecryptionError:
      return "decryption_error";
    case ArchiveStatus::kStoreError:
      return "store_error";
  }
  return "unknown";
}

struct Peer {
  std::string first_name;
  std::string last_name;
  std::string username;
  std::string title;
  std::string phone;
};

struct ChatSummary {
  std::int64_t peer_id{0};
  std::string name;
  std::string username;
  std::string phone;
  std::int32_t last_message_timestamp{0};
};

struct MessageRecord {
  std::int32_t timestamp{0};
  std::string sender;
  std::string text;
  std::int64_t peer_id{0};
  std::int32_t message_id{0};
};

struct SearchHit {
  std::int32_t timestamp{0};
  std::string chat_name;
  std::string sender;
  std::string text;
  std::int64_t peer_id{0};
};

struct ArchiveMessage {
  std::int64_t peer_id{0};
  std::string peer_name;
  std::int32_t message_id{0};
  std::int32_t timestamp{0};
  std::string text;
  bool is_from_me{false};
  std::optional<std::string> sender_name;
};

struct Stats {
  std::uint64_t messages{0};
  std::uint64_t peers{0};
};

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_TYPES_H

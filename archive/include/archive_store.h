#ifndef PBR_ARCHIVE_STORE_H
#define PBR_ARCHIVE_STORE_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "byte_reader.h"

namespace pbr::archive {

inline constexpr char kPeerTable[] = "t2";
inline constexpr char kMessageTable[] = "t7";

struct BlobLoadResult {
  bool found{false};
  std::vector<std::uint8_t> data;
};

enum class ScanOrder : std::uint8_t { kAscending = 0, kDescending = 1 };

// Visitors return false to stop the scan early. Views are valid only for the
// duration of the call.
using MessageKeyVisitor = std::function<bool(ByteView key)>;
using MessageRowVisitor = std::function<bool(ByteView key, ByteView value)>;
using PeerRowVisitor =
    std::function<bool(std::int64_t peer_id, ByteView value)>;

// Read-only access to the decrypted relational store.
class ArchiveStore {
 public:
  virtual ~ArchiveStore() = default;

  virtual bool ScanMessageKeys(const MessageKeyVisitor& visit,
                               std::string& error) = 0;
  // Restricts the scan to rows of `peer_id` when set.
  virtual bool ScanMessages(std::optional<std::int64_t> peer_id,
                            ScanOrder order,
                            const MessageRowVisitor& visit,
                            std::string& error) = 0;
  virtual bool ScanPeers(const PeerRowVisitor& visit, std::string& error) = 0;
  virtual bool LoadPeer(std::int64_t peer_id, BlobLoadResult& out,
                        std::string& error) = 0;
  virtual bool CountMessages(std::uint64_t& out, std::string& error) = 0;
  virtual bool CountPeers(std::uint64_t& out, std::string& error) = 0;
};

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_STORE_H

#ifndef PBR_ARCHIVE_CHAT_STORE_H
#define PBR_ARCHIVE_CHAT_STORE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "archive_store.h"
#include "archive_types.h"
#include "config.h"
#include "store_decryptor.h"

namespace pbr::archive {

// Read-only view over one local chat archive. Decrypts lazily on first use
// and removes the plaintext copy on Close().
class ChatStore {
 public:
  explicit ChatStore(ArchiveConfig config);
  ~ChatStore();

  ChatStore(const ChatStore&) = delete;
  ChatStore& operator=(const ChatStore&) = delete;

  // Database and key file were located.
  bool Available() const;
  bool IsOpen() const { return store_ != nullptr; }

  // Runs locate, unwrap, export and open. Once attempted, the outcome is
  // reused until Close().
  ArchiveStatus Open(std::string& error);
  // Attaches an already decrypted database. The file is not deleted on
  // Close().
  ArchiveStatus OpenPlaintext(const std::filesystem::path& path,
                              std::string& error);
  void Close();

  ArchiveStatus RecentChats(std::size_t limit, std::vector<ChatSummary>& out,
                            std::string& error);
  ArchiveStatus FindChats(const std::string& query,
                          std::vector<ChatSummary>& out, std::string& error);
  ArchiveStatus FindPeerByPhone(const std::string& text,
                                std::optional<std::int64_t>& out,
                                std::string& error);
  // Numeric ids above 100000 are returned as-is; other digit strings go
  // through the phone lookup, names through FindChats.
  ArchiveStatus ResolveIdentifier(const std::string& text,
                                  std::optional<std::int64_t>& out,
                                  std::string& error);
  // Newest first. `limit` bounds the rows examined, so fewer records come
  // back when some rows carry no text.
  ArchiveStatus ReadMessages(std::int64_t peer_id, std::size_t limit,
                             std::vector<MessageRecord>& out,
                             std::string& error);
  ArchiveStatus SearchMessages(const std::string& query, std::size_t limit,
                               std::vector<SearchHit>& out,
                               std::string& error);
  // Oldest first, every message with timestamp >= since.
  ArchiveStatus ExportMessages(std::int32_t since,
                               std::vector<ArchiveMessage>& out,
                               std::string& error);
  ArchiveStatus GetStats(Stats& out, std::string& error);

 private:
  ArchiveStatus EnsureOpen(std::string& error);
  bool LookupPeer(std::int64_t peer_id, const Peer*& out, std::string& error);
  bool PeerName(std::int64_t peer_id, std::string& out, std::string& error);

  ArchiveConfig config_;
  std::unique_ptr<ArchiveStore> store_;
  PlaintextCopy plaintext_;
  std::optional<ArchiveStatus> open_status_;
  std::string open_error_;
  std::unordered_map<std::int64_t, Peer> peer_cache_;
};

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_CHAT_STORE_H

#include "chat_store.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <utility>

#include "key_derivation.h"
#include "message_codec.h"
#include "peer_codec.h"
#include "platform_log.h"
#include "sqlite_archive_store.h"
#include "utf8_utils.h"

namespace pbr::archive {

namespace {

constexpr char kLogTag[] = "archive";
constexpr char kOwnSender[] = "Me";
constexpr std::int64_t kMinDirectPeerId = 100000;

bool IsAllDigits(const std::string& text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(),
                     [](char ch) { return ch >= '0' && ch <= '9'; });
}

bool HasDigit(const std::string& text) {
  return std::any_of(text.begin(), text.end(),
                     [](char ch) { return ch >= '0' && ch <= '9'; });
}

// Digit strings that overflow an int64 are not treated as ids.
bool ParseDirectPeerId(const std::string& text, std::int64_t& out) {
  if (!IsAllDigits(text)) {
    return false;
  }
  errno = 0;
  const long long value = std::strtoll(text.c_str(), nullptr, 10);
  if (errno == ERANGE || value <= kMinDirectPeerId) {
    return false;
  }
  out = static_cast<std::int64_t>(value);
  return true;
}

// A missing or zero author id means the chat peer wrote the message.
std::int64_t AuthorOf(const MessageValue& value, std::int64_t chat_peer_id) {
  return value.author_id.value_or(0) != 0 ? *value.author_id : chat_peer_id;
}

bool MatchesChatQuery(const Peer& peer, const std::string& name,
                      const std::string& query) {
  const std::string haystack = name + " " + peer.username + " " + peer.phone;
  if (common::ContainsFolded(haystack, query)) {
    return true;
  }
  const std::string query_digits = common::DigitsOnly(query);
  if (query_digits.empty()) {
    return false;
  }
  return common::DigitsOnly(peer.phone).find(query_digits) !=
         std::string::npos;
}

void LogSkipped(const char* scan, std::size_t skipped) {
  if (skipped == 0) {
    return;
  }
  platform::log::Log(platform::log::Level::kDebug, kLogTag,
                     "records skipped",
                     {{"scan", scan}, {"count", std::to_string(skipped)}});
}

}  // namespace

ChatStore::ChatStore(ArchiveConfig config) : config_(std::move(config)) {}

ChatStore::~ChatStore() { Close(); }

bool ChatStore::Available() const {
  ArchiveLocation location;
  return LocateArchive(config_, location);
}

ArchiveStatus ChatStore::Open(std::string& error) {
  error.clear();
  if (store_) {
    return ArchiveStatus::kOk;
  }
  if (open_status_.has_value()) {
    error = open_error_;
    return *open_status_;
  }

  const auto fail = [&](ArchiveStatus status) {
    open_status_ = status;
    open_error_ = error;
    platform::log::Log(platform::log::Level::kWarn, kLogTag, "open failed",
                       {{"status", ArchiveStatusName(status)},
                        {"reason", error}});
    return status;
  };

  ArchiveLocation location;
  if (!LocateArchive(config_, location)) {
    error = "chat database not found; is the desktop client installed and "
            "logged in?";
    return fail(ArchiveStatus::kUnavailable);
  }

  KeyMaterial material;
  ArchiveStatus status =
      LoadKeyMaterial(location.key_path, config_.passphrase, material, error);
  if (status != ArchiveStatus::kOk) {
    return fail(status);
  }

  PlaintextCopy copy;
  status = ExportPlaintext(location.db_path, material, config_.decrypt, copy,
                           error);
  material.Wipe();
  if (status != ArchiveStatus::kOk) {
    return fail(status);
  }

  auto store = OpenSqliteArchiveStore(copy.path(), error);
  if (!store) {
    // `copy` removes the plaintext file on scope exit.
    return fail(ArchiveStatus::kStoreError);
  }

  store_ = std::move(store);
  plaintext_ = std::move(copy);
  open_status_ = ArchiveStatus::kOk;
  open_error_.clear();
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "archive opened",
                     {{"db_path", location.db_path.string()}});
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::OpenPlaintext(const std::filesystem::path& path,
                                       std::string& error) {
  error.clear();
  Close();
  auto store = OpenSqliteArchiveStore(path, error);
  if (!store) {
    return ArchiveStatus::kStoreError;
  }
  store_ = std::move(store);
  open_status_ = ArchiveStatus::kOk;
  return ArchiveStatus::kOk;
}

void ChatStore::Close() {
  const bool was_open = store_ != nullptr;
  store_.reset();
  plaintext_.Release();
  peer_cache_.clear();
  open_status_.reset();
  open_error_.clear();
  if (was_open) {
    platform::log::Log(platform::log::Level::kInfo, kLogTag,
                       "archive closed");
  }
}

ArchiveStatus ChatStore::EnsureOpen(std::string& error) {
  if (store_) {
    return ArchiveStatus::kOk;
  }
  return Open(error);
}

bool ChatStore::LookupPeer(std::int64_t peer_id, const Peer*& out,
                           std::string& error) {
  auto it = peer_cache_.find(peer_id);
  if (it == peer_cache_.end()) {
    BlobLoadResult row;
    if (!store_->LoadPeer(peer_id, row, error)) {
      return false;
    }
    Peer peer;
    if (row.found) {
      peer = ParsePeer(MakeByteView(row.data));
    }
    it = peer_cache_.emplace(peer_id, std::move(peer)).first;
  }
  out = &it->second;
  return true;
}

bool ChatStore::PeerName(std::int64_t peer_id, std::string& out,
                         std::string& error) {
  const Peer* peer = nullptr;
  if (!LookupPeer(peer_id, peer, error)) {
    return false;
  }
  out = DisplayName(*peer);
  return true;
}

ArchiveStatus ChatStore::RecentChats(std::size_t limit,
                                     std::vector<ChatSummary>& out,
                                     std::string& error) {
  out.clear();
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }

  std::vector<std::pair<std::int64_t, std::int32_t>> latest;
  std::unordered_map<std::int64_t, std::size_t> index;
  std::size_t skipped = 0;
  const bool ok = store_->ScanMessageKeys(
      [&](ByteView raw) {
        MessageKey key;
        if (!ParseMessageKey(raw, key)) {
          ++skipped;
          return true;
        }
        const auto found = index.find(key.peer_id);
        if (found == index.end()) {
          index.emplace(key.peer_id, latest.size());
          latest.emplace_back(key.peer_id, key.timestamp);
        } else if (key.timestamp > latest[found->second].second) {
          latest[found->second].second = key.timestamp;
        }
        return true;
      },
      error);
  if (!ok) {
    return ArchiveStatus::kStoreError;
  }
  LogSkipped("recent_chats", skipped);

  std::stable_sort(latest.begin(), latest.end(),
                   [](const auto& a, const auto& b) {
                     return a.second > b.second;
                   });
  if (latest.size() > limit) {
    latest.resize(limit);
  }

  out.reserve(latest.size());
  for (const auto& entry : latest) {
    const Peer* peer = nullptr;
    if (!LookupPeer(entry.first, peer, error)) {
      out.clear();
      return ArchiveStatus::kStoreError;
    }
    ChatSummary chat;
    chat.peer_id = entry.first;
    chat.name = DisplayName(*peer);
    chat.username = peer->username;
    chat.phone = peer->phone;
    chat.last_message_timestamp = entry.second;
    out.push_back(std::move(chat));
  }
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::FindChats(const std::string& query,
                                   std::vector<ChatSummary>& out,
                                   std::string& error) {
  out.clear();
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }

  std::size_t skipped = 0;
  const bool ok = store_->ScanPeers(
      [&](std::int64_t peer_id, ByteView value) {
        std::optional<Peer> peer = DecodePeer(value);
        if (!peer) {
          ++skipped;
          return true;
        }
        const std::string name = DisplayName(*peer);
        if (MatchesChatQuery(*peer, name, query)) {
          ChatSummary chat;
          chat.peer_id = peer_id;
          chat.name = name;
          chat.username = peer->username;
          chat.phone = peer->phone;
          out.push_back(std::move(chat));
        }
        peer_cache_.insert_or_assign(peer_id, std::move(*peer));
        return true;
      },
      error);
  if (!ok) {
    out.clear();
    return ArchiveStatus::kStoreError;
  }
  LogSkipped("find_chats", skipped);
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::FindPeerByPhone(const std::string& text,
                                         std::optional<std::int64_t>& out,
                                         std::string& error) {
  out.reset();
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }
  const std::string digits = common::DigitsOnly(text);
  if (digits.empty()) {
    return ArchiveStatus::kOk;
  }

  const bool ok = store_->ScanPeers(
      [&](std::int64_t peer_id, ByteView value) {
        std::optional<Peer> peer = DecodePeer(value);
        if (!peer) {
          return true;
        }
        const std::string phone_digits = common::DigitsOnly(peer->phone);
        peer_cache_.insert_or_assign(peer_id, std::move(*peer));
        if (phone_digits.empty() ||
            phone_digits.find(digits) == std::string::npos) {
          return true;
        }
        out = peer_id;
        return false;
      },
      error);
  if (!ok) {
    out.reset();
    return ArchiveStatus::kStoreError;
  }
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::ResolveIdentifier(const std::string& text,
                                           std::optional<std::int64_t>& out,
                                           std::string& error) {
  out.reset();
  error.clear();
  const std::string trimmed = common::TrimAscii(text);
  std::int64_t direct = 0;
  if (ParseDirectPeerId(trimmed, direct)) {
    out = direct;
    return ArchiveStatus::kOk;
  }

  if (HasDigit(trimmed)) {
    const ArchiveStatus status = FindPeerByPhone(trimmed, out, error);
    if (status != ArchiveStatus::kOk || out.has_value()) {
      return status;
    }
  }

  std::vector<ChatSummary> matches;
  const ArchiveStatus status = FindChats(trimmed, matches, error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }
  if (!matches.empty()) {
    out = matches.front().peer_id;
  }
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::ReadMessages(std::int64_t peer_id, std::size_t limit,
                                      std::vector<MessageRecord>& out,
                                      std::string& error) {
  out.clear();
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }
  if (limit == 0) {
    return ArchiveStatus::kOk;
  }

  std::size_t rows = 0;
  std::size_t skipped = 0;
  bool peer_failed = false;
  const bool ok = store_->ScanMessages(
      peer_id, ScanOrder::kDescending,
      [&](ByteView raw_key, ByteView raw_value) {
        ++rows;
        MessageKey key;
        std::optional<MessageValue> value;
        if (!ParseMessageKey(raw_key, key) ||
            !(value = ParseMessageValue(raw_value))) {
          ++skipped;
          return rows < limit;
        }
        if (value->text.empty()) {
          return rows < limit;
        }
        MessageRecord record;
        record.timestamp = key.timestamp;
        record.peer_id = key.peer_id;
        record.message_id = key.message_id;
        if (!value->incoming) {
          record.sender = kOwnSender;
        } else if (!PeerName(AuthorOf(*value, key.peer_id), record.sender,
                             error)) {
          peer_failed = true;
          return false;
        }
        record.text = std::move(value->text);
        out.push_back(std::move(record));
        return rows < limit;
      },
      error);
  if (!ok || peer_failed) {
    out.clear();
    return ArchiveStatus::kStoreError;
  }
  LogSkipped("read_messages", skipped);
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::SearchMessages(const std::string& query,
                                        std::size_t limit,
                                        std::vector<SearchHit>& out,
                                        std::string& error) {
  out.clear();
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }
  if (limit == 0) {
    return ArchiveStatus::kOk;
  }

  const std::string needle = common::ToLowerUtf8(query);
  std::size_t skipped = 0;
  bool peer_failed = false;
  const bool ok = store_->ScanMessages(
      std::nullopt, ScanOrder::kDescending,
      [&](ByteView raw_key, ByteView raw_value) {
        MessageKey key;
        std::optional<MessageValue> value;
        if (!ParseMessageKey(raw_key, key) ||
            !(value = ParseMessageValue(raw_value))) {
          ++skipped;
          return true;
        }
        if (value->text.empty() ||
            common::ToLowerUtf8(value->text).find(needle) ==
                std::string::npos) {
          return true;
        }
        SearchHit hit;
        hit.timestamp = key.timestamp;
        hit.peer_id = key.peer_id;
        if (!PeerName(key.peer_id, hit.chat_name, error)) {
          peer_failed = true;
          return false;
        }
        if (!value->incoming) {
          hit.sender = kOwnSender;
        } else if (!PeerName(AuthorOf(*value, key.peer_id), hit.sender,
                             error)) {
          peer_failed = true;
          return false;
        }
        hit.text = std::move(value->text);
        out.push_back(std::move(hit));
        return out.size() < limit;
      },
      error);
  if (!ok || peer_failed) {
    out.clear();
    return ArchiveStatus::kStoreError;
  }
  LogSkipped("search_messages", skipped);
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::ExportMessages(std::int32_t since,
                                        std::vector<ArchiveMessage>& out,
                                        std::string& error) {
  out.clear();
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }

  std::size_t skipped = 0;
  bool peer_failed = false;
  const bool ok = store_->ScanMessages(
      std::nullopt, ScanOrder::kAscending,
      [&](ByteView raw_key, ByteView raw_value) {
        MessageKey key;
        if (!ParseMessageKey(raw_key, key)) {
          ++skipped;
          return true;
        }
        if (key.timestamp < since) {
          return true;
        }
        std::optional<MessageValue> value = ParseMessageValue(raw_value);
        if (!value) {
          ++skipped;
          return true;
        }
        ArchiveMessage message;
        message.peer_id = key.peer_id;
        message.message_id = key.message_id;
        message.timestamp = key.timestamp;
        message.is_from_me = !value->incoming;
        if (!PeerName(key.peer_id, message.peer_name, error)) {
          peer_failed = true;
          return false;
        }
        if (value->incoming) {
          std::string sender;
          if (!PeerName(AuthorOf(*value, key.peer_id), sender, error)) {
            peer_failed = true;
            return false;
          }
          message.sender_name = std::move(sender);
        }
        message.text = std::move(value->text);
        out.push_back(std::move(message));
        return true;
      },
      error);
  if (!ok || peer_failed) {
    out.clear();
    return ArchiveStatus::kStoreError;
  }
  LogSkipped("export_messages", skipped);
  return ArchiveStatus::kOk;
}

ArchiveStatus ChatStore::GetStats(Stats& out, std::string& error) {
  out = Stats{};
  error.clear();
  const ArchiveStatus status = EnsureOpen(error);
  if (status != ArchiveStatus::kOk) {
    return status;
  }
  if (!store_->CountMessages(out.messages, error) ||
      !store_->CountPeers(out.peers, error)) {
    out = Stats{};
    return ArchiveStatus::kStoreError;
  }
  return ArchiveStatus::kOk;
}

}  // namespace pbr::archive

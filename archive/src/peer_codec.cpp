#include "peer_codec.h"

#include "tagged_value.h"
#include "utf8_utils.h"

namespace pbr::archive {

namespace {

// Type hash written for the root object; readers ignore it.
constexpr std::int32_t kUserTypeHash = 0x5f0a3c21;

std::string StringField(const TaggedFields& fields, const char* key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.type != ValueType::kString) {
    return {};
  }
  return it->second.string_value;
}

}  // namespace

std::optional<Peer> DecodePeer(ByteView data) {
  const auto root = SeekField(data, kPeerRootKey, ValueType::kObject);
  if (!root.has_value()) {
    return std::nullopt;
  }
  const TaggedFields fields = DecodeNested(*root);
  Peer peer;
  peer.first_name = StringField(fields, "fn");
  peer.last_name = StringField(fields, "ln");
  peer.username = StringField(fields, "un");
  peer.title = StringField(fields, "t");
  peer.phone = StringField(fields, "p");
  return peer;
}

Peer ParsePeer(ByteView data) {
  return DecodePeer(data).value_or(Peer{});
}

std::string DisplayName(const Peer& peer) {
  if (!peer.title.empty()) {
    return peer.title;
  }
  const std::string name =
      common::TrimAscii(peer.first_name + " " + peer.last_name);
  if (!name.empty()) {
    return name;
  }
  if (!peer.username.empty()) {
    return "@" + peer.username;
  }
  return "Unknown";
}

std::vector<std::uint8_t> EncodePeer(const Peer& peer) {
  TaggedStreamWriter inner;
  inner.PutInt64("i", 0);
  if (!peer.first_name.empty()) {
    inner.PutString("fn", peer.first_name);
  }
  if (!peer.last_name.empty()) {
    inner.PutString("ln", peer.last_name);
  }
  if (!peer.username.empty()) {
    inner.PutString("un", peer.username);
  }
  if (!peer.title.empty()) {
    inner.PutString("t", peer.title);
  }
  if (!peer.phone.empty()) {
    inner.PutString("p", peer.phone);
  }
  TaggedStreamWriter outer;
  outer.PutObject(kPeerRootKey, kUserTypeHash, inner.bytes());
  return outer.Take();
}

}  // namespace pbr::archive

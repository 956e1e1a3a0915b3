#ifndef PBR_ARCHIVE_PEER_CODEC_H
#define PBR_ARCHIVE_PEER_CODEC_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "archive_types.h"
#include "byte_reader.h"

namespace pbr::archive {

// Key of the root object inside a peer row.
inline constexpr char kPeerRootKey[] = "_";

// Decodes the root object of a peer row. nullopt when the row carries no
// root object or the outer stream is malformed before one is found.
std::optional<Peer> DecodePeer(ByteView data);

// Like DecodePeer but never fails: a missing root yields an empty Peer.
Peer ParsePeer(ByteView data);

// title, else "first last", else "@username", else "Unknown".
std::string DisplayName(const Peer& peer);

// Builds a peer row with the given fields under the root object.
std::vector<std::uint8_t> EncodePeer(const Peer& peer);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_PEER_CODEC_H

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "peer_codec.h"
#include "tagged_value.h"

using pbr::archive::DecodePeer;
using pbr::archive::DisplayName;
using pbr::archive::MakeByteView;
using pbr::archive::Peer;

int main() {
  {
    Peer p;
    p.first_name = "Alice";
    p.last_name = "Smith";
    p.username = "alice";
    p.phone = "+1 (555) 123-4567";
    const auto bytes = pbr::archive::EncodePeer(p);
    const auto decoded = DecodePeer(MakeByteView(bytes));
    assert(decoded.has_value());
    assert(decoded->first_name == "Alice");
    assert(decoded->last_name == "Smith");
    assert(decoded->username == "alice");
    assert(decoded->phone == "+1 (555) 123-4567");
    assert(decoded->title.empty());
    assert(DisplayName(*decoded) == "Alice Smith");
  }

  {
    Peer p;
    p.title = "Book Club";
    p.first_name = "ignored";
    assert(DisplayName(p) == "Book Club");

    Peer only_last;
    only_last.last_name = "Jones";
    assert(DisplayName(only_last) == "Jones");

    Peer only_user;
    only_user.username = "bob";
    assert(DisplayName(only_user) == "@bob");

    assert(DisplayName(Peer{}) == "Unknown");
  }

  {
    // Non-string values under a known key are ignored.
    pbr::archive::TaggedStreamWriter inner;
    inner.PutInt32("fn", 5);
    inner.PutString("ln", "Kept");
    pbr::archive::TaggedStreamWriter outer;
    outer.PutInt64("x", 1);
    outer.PutObject(pbr::archive::kPeerRootKey, 1, inner.bytes());
    const auto bytes = outer.Take();
    const auto decoded = DecodePeer(MakeByteView(bytes));
    assert(decoded.has_value());
    assert(decoded->first_name.empty());
    assert(decoded->last_name == "Kept");
  }

  {
    pbr::archive::TaggedStreamWriter no_root;
    no_root.PutString("fn", "Nobody");
    const auto bytes = no_root.Take();
    assert(!DecodePeer(MakeByteView(bytes)).has_value());
    const Peer empty = pbr::archive::ParsePeer(MakeByteView(bytes));
    assert(DisplayName(empty) == "Unknown");

    const std::vector<std::uint8_t> garbage = {0x05, 'a'};
    assert(!DecodePeer(MakeByteView(garbage)).has_value());
  }

  return 0;
}

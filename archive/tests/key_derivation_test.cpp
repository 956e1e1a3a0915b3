#include <cassert>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "key_derivation.h"
#include "platform_log.h"

using pbr::archive::ArchiveStatus;
using pbr::archive::KeyMaterial;

static KeyMaterial SampleMaterial() {
  KeyMaterial m;
  for (std::size_t i = 0; i < m.key().size(); ++i) {
    m.key()[i] = static_cast<std::uint8_t>(i * 7 + 1);
  }
  for (std::size_t i = 0; i < m.salt().size(); ++i) {
    m.salt()[i] = static_cast<std::uint8_t>(0xA0 + i);
  }
  return m;
}

static void WriteFile(const std::string& path,
                      const std::vector<std::uint8_t>& data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  f.write(reinterpret_cast<const char*>(data.data()),
          static_cast<std::streamsize>(data.size()));
}

int main() {
  pbr::platform::log::SetMinLevel(pbr::platform::log::Level::kError);

  const KeyMaterial source = SampleMaterial();
  std::vector<std::uint8_t> wrapped;
  std::string err;
  if (!pbr::archive::WrapKeyMaterial(source, pbr::archive::kDefaultPassphrase,
                                     wrapped, err)) {
    return 1;
  }
  assert(wrapped.size() == 64);

  {
    KeyMaterial out;
    const ArchiveStatus st = pbr::archive::DeriveKeyMaterial(
        wrapped, pbr::archive::kDefaultPassphrase, out, err);
    assert(st == ArchiveStatus::kOk);
    assert(out.key() == source.key());
    assert(out.salt() == source.salt());
    const std::string hex = out.HexKey();
    assert(hex.size() == 96);
    assert(hex.substr(0, 4) == "0108");
    assert(hex.substr(64, 4) == "a0a1");
    assert(pbr::archive::KeyIntegrityHash(out) ==
           pbr::archive::KeyIntegrityHash(source));
  }

  {
    // Every single-bit corruption of the key file must be caught.
    for (std::size_t byte = 0; byte < wrapped.size(); ++byte) {
      for (int bit = 0; bit < 8; ++bit) {
        std::vector<std::uint8_t> corrupt = wrapped;
        corrupt[byte] ^= static_cast<std::uint8_t>(1u << bit);
        KeyMaterial out;
        const ArchiveStatus st = pbr::archive::DeriveKeyMaterial(
            corrupt, pbr::archive::kDefaultPassphrase, out, err);
        assert(st == ArchiveStatus::kIntegrityError);
        assert(!err.empty());
      }
    }
  }

  {
    KeyMaterial out;
    const ArchiveStatus st =
        pbr::archive::DeriveKeyMaterial(wrapped, "other", out, err);
    assert(st == ArchiveStatus::kIntegrityError);
    assert(err.find("passcode") != std::string::npos);
    for (const auto b : out.key()) {
      assert(b == 0);
    }
  }

  {
    KeyMaterial out;
    std::vector<std::uint8_t> too_short(wrapped.begin(), wrapped.begin() + 48);
    assert(pbr::archive::DeriveKeyMaterial(
               too_short, pbr::archive::kDefaultPassphrase, out, err) ==
           ArchiveStatus::kIntegrityError);
    std::vector<std::uint8_t> unaligned(wrapped.begin(), wrapped.begin() + 60);
    assert(pbr::archive::DeriveKeyMaterial(
               unaligned, pbr::archive::kDefaultPassphrase, out, err) ==
           ArchiveStatus::kIntegrityError);
  }

  {
    const std::string path = "tmp_key_derivation.key";
    WriteFile(path, wrapped);
    KeyMaterial out;
    assert(pbr::archive::LoadKeyMaterial(path,
                                         pbr::archive::kDefaultPassphrase,
                                         out, err) == ArchiveStatus::kOk);
    assert(out.key() == source.key());

    KeyMaterial missing;
    assert(pbr::archive::LoadKeyMaterial("tmp_no_such_key.key",
                                         pbr::archive::kDefaultPassphrase,
                                         missing, err) ==
           ArchiveStatus::kUnavailable);
  }

  {
    KeyMaterial moved = SampleMaterial();
    KeyMaterial target(std::move(moved));
    assert(target.key()[0] == 1);
    assert(moved.key()[0] == 0);
  }

  return 0;
}

#ifndef PBR_ARCHIVE_KEY_DERIVATION_H
#define PBR_ARCHIVE_KEY_DERIVATION_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "archive_types.h"

namespace pbr::archive {

inline constexpr char kDefaultPassphrase[] = "no-matter-key";
inline constexpr std::int32_t kKeyHashSeed = -137723950;
inline constexpr std::size_t kWrappedKeyPlainSize = 32 + 16 + 4;

// Database key and salt recovered from the wrapped key file. Wiped on
// destruction.
class KeyMaterial {
 public:
  KeyMaterial() = default;
  ~KeyMaterial();

  KeyMaterial(const KeyMaterial&) = delete;
  KeyMaterial& operator=(const KeyMaterial&) = delete;
  KeyMaterial(KeyMaterial&& other) noexcept;
  KeyMaterial& operator=(KeyMaterial&& other) noexcept;

  std::array<std::uint8_t, 32>& key() { return key_; }
  const std::array<std::uint8_t, 32>& key() const { return key_; }
  std::array<std::uint8_t, 16>& salt() { return salt_; }
  const std::array<std::uint8_t, 16>& salt() const { return salt_; }

  // Lowercase hex of key || salt, the raw key form the engine expects.
  std::string HexKey() const;

  void Wipe();

 private:
  std::array<std::uint8_t, 32> key_{};
  std::array<std::uint8_t, 16> salt_{};
};

// Integrity hash over key || salt as stored in the wrapped key file.
std::int32_t KeyIntegrityHash(const KeyMaterial& material);

ArchiveStatus DeriveKeyMaterial(const std::vector<std::uint8_t>& wrapped,
                                const std::string& passphrase,
                                KeyMaterial& out,
                                std::string& error);

ArchiveStatus LoadKeyMaterial(const std::filesystem::path& key_path,
                              const std::string& passphrase,
                              KeyMaterial& out,
                              std::string& error);

// Inverse of DeriveKeyMaterial; produces a key file accepted by it.
bool WrapKeyMaterial(const KeyMaterial& material,
                     const std::string& passphrase,
                     std::vector<std::uint8_t>& out,
                     std::string& error);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_KEY_DERIVATION_H

#include "key_derivation.h"

#include <algorithm>
#include <cstring>
#include <system_error>
#include <utility>

#include "crypto.h"
#include "hex_utils.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace pbr::archive {

namespace {

constexpr char kLogTag[] = "keyfile";

bool PassphraseCipher(const std::string& passphrase, crypto::Aes256Key& key,
                      crypto::AesIv& iv) {
  crypto::Sha512Digest digest;
  if (!crypto::Sha512(reinterpret_cast<const std::uint8_t*>(passphrase.data()),
                      passphrase.size(), digest)) {
    return false;
  }
  std::copy(digest.bytes.begin(), digest.bytes.begin() + key.size(),
            key.begin());
  std::copy(digest.bytes.end() - iv.size(), digest.bytes.end(), iv.begin());
  common::SecureWipe(digest.bytes);
  return true;
}

std::int32_t LoadInt32Le(const std::uint8_t* p) {
  return static_cast<std::int32_t>(static_cast<std::uint32_t>(p[0]) |
                                   (static_cast<std::uint32_t>(p[1]) << 8) |
                                   (static_cast<std::uint32_t>(p[2]) << 16) |
                                   (static_cast<std::uint32_t>(p[3]) << 24));
}

}  // namespace

KeyMaterial::~KeyMaterial() { Wipe(); }

KeyMaterial::KeyMaterial(KeyMaterial&& other) noexcept
    : key_(other.key_), salt_(other.salt_) {
  other.Wipe();
}

KeyMaterial& KeyMaterial::operator=(KeyMaterial&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  key_ = other.key_;
  salt_ = other.salt_;
  other.Wipe();
  return *this;
}

std::string KeyMaterial::HexKey() const {
  std::array<std::uint8_t, 48> joined{};
  std::copy(key_.begin(), key_.end(), joined.begin());
  std::copy(salt_.begin(), salt_.end(), joined.begin() + key_.size());
  std::string hex = common::BytesToHex(joined.data(), joined.size());
  common::SecureWipe(joined);
  return hex;
}

void KeyMaterial::Wipe() {
  common::SecureWipe(key_);
  common::SecureWipe(salt_);
}

std::int32_t KeyIntegrityHash(const KeyMaterial& material) {
  std::array<std::uint8_t, 48> joined{};
  std::copy(material.key().begin(), material.key().end(), joined.begin());
  std::copy(material.salt().begin(), material.salt().end(),
            joined.begin() + material.key().size());
  const std::int32_t hash =
      crypto::Murmur3X86_32(joined.data(), joined.size(), kKeyHashSeed);
  common::SecureWipe(joined);
  return hash;
}

ArchiveStatus DeriveKeyMaterial(const std::vector<std::uint8_t>& wrapped,
                                const std::string& passphrase,
                                KeyMaterial& out,
                                std::string& error) {
  error.clear();
  out.Wipe();
  if (wrapped.size() < kWrappedKeyPlainSize || (wrapped.size() % 16) != 0) {
    error = "wrapped key has unexpected size " + std::to_string(wrapped.size());
    return ArchiveStatus::kIntegrityError;
  }

  crypto::Aes256Key aes_key{};
  crypto::AesIv aes_iv{};
  common::ScopedWipe wipe_key(aes_key);
  if (!PassphraseCipher(passphrase, aes_key, aes_iv)) {
    error = "sha512 of passphrase failed";
    return ArchiveStatus::kIntegrityError;
  }

  std::vector<std::uint8_t> plain;
  std::string cipher_error;
  if (!crypto::Aes256CbcDecrypt(aes_key, aes_iv, wrapped.data(),
                                wrapped.size(), plain, cipher_error)) {
    error = "wrapped key decrypt failed: " + cipher_error;
    return ArchiveStatus::kIntegrityError;
  }
  common::ScopedWipe wipe_plain(plain);

  std::memcpy(out.key().data(), plain.data(), out.key().size());
  std::memcpy(out.salt().data(), plain.data() + 32, out.salt().size());
  const std::int32_t stored_hash = LoadInt32Le(plain.data() + 48);
  const std::int32_t computed_hash = KeyIntegrityHash(out);
  if (stored_hash != computed_hash) {
    out.Wipe();
    error = "key integrity check failed (hash mismatch: " +
            std::to_string(stored_hash) + " != " +
            std::to_string(computed_hash) +
            "); a local passcode is probably set in the app, and "
            "passcode-protected keys are not supported";
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "key integrity check failed");
    return ArchiveStatus::kIntegrityError;
  }
  return ArchiveStatus::kOk;
}

ArchiveStatus LoadKeyMaterial(const std::filesystem::path& key_path,
                              const std::string& passphrase,
                              KeyMaterial& out,
                              std::string& error) {
  error.clear();
  std::error_code ec;
  if (key_path.empty() || !platform::fs::Exists(key_path, ec) || ec) {
    error = "key file not found: " + key_path.string();
    return ArchiveStatus::kUnavailable;
  }
  std::vector<std::uint8_t> wrapped;
  if (!platform::fs::ReadFileBytes(key_path, wrapped, ec)) {
    error = "key file unreadable: " + ec.message();
    return ArchiveStatus::kUnavailable;
  }
  return DeriveKeyMaterial(wrapped, passphrase, out, error);
}

bool WrapKeyMaterial(const KeyMaterial& material,
                     const std::string& passphrase,
                     std::vector<std::uint8_t>& out,
                     std::string& error) {
  out.clear();
  error.clear();
  std::vector<std::uint8_t> plain(64, 0);
  common::ScopedWipe wipe_plain(plain);
  std::memcpy(plain.data(), material.key().data(), material.key().size());
  std::memcpy(plain.data() + 32, material.salt().data(),
              material.salt().size());
  const std::uint32_t hash =
      static_cast<std::uint32_t>(KeyIntegrityHash(material));
  for (int i = 0; i < 4; ++i) {
    plain[48 + static_cast<std::size_t>(i)] =
        static_cast<std::uint8_t>((hash >> (i * 8)) & 0xFF);
  }

  crypto::Aes256Key aes_key{};
  crypto::AesIv aes_iv{};
  common::ScopedWipe wipe_key(aes_key);
  if (!PassphraseCipher(passphrase, aes_key, aes_iv)) {
    error = "sha512 of passphrase failed";
    return false;
  }
  return crypto::Aes256CbcEncrypt(aes_key, aes_iv, plain.data(), plain.size(),
                                  out, error);
}

}  // namespace pbr::archive

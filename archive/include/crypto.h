#ifndef PBR_ARCHIVE_CRYPTO_H
#define PBR_ARCHIVE_CRYPTO_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pbr::archive::crypto {

struct Sha512Digest {
  std::array<std::uint8_t, 64> bytes{};
};

using Aes256Key = std::array<std::uint8_t, 32>;
using AesIv = std::array<std::uint8_t, 16>;

bool Sha512(const std::uint8_t* data, std::size_t len, Sha512Digest& out);

// Raw AES-256-CBC without PKCS#7 padding; `len` must be a multiple of 16.
bool Aes256CbcDecrypt(const Aes256Key& key, const AesIv& iv,
                      const std::uint8_t* in, std::size_t len,
                      std::vector<std::uint8_t>& out, std::string& error);
bool Aes256CbcEncrypt(const Aes256Key& key, const AesIv& iv,
                      const std::uint8_t* in, std::size_t len,
                      std::vector<std::uint8_t>& out, std::string& error);

// MurmurHash3 x86 32-bit, returned as the signed value the key file stores.
std::int32_t Murmur3X86_32(const std::uint8_t* data, std::size_t len,
                           std::int32_t seed);

}  // namespace pbr::archive::crypto

#endif  // PBR_ARCHIVE_CRYPTO_H

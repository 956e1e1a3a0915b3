#include "crypto.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <limits>
#include <memory>

namespace pbr::archive::crypto {

namespace {

constexpr std::size_t kAesBlockSize = 16;

using CipherCtxPtr =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string OpenSslError(const char* what) {
  std::string out(what);
  const unsigned long code = ERR_get_error();
  if (code != 0) {
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    out.append(": ");
    out.append(buf);
  }
  ERR_clear_error();
  return out;
}

bool RunCbc(bool encrypt, const Aes256Key& key, const AesIv& iv,
            const std::uint8_t* in, std::size_t len,
            std::vector<std::uint8_t>& out, std::string& error) {
  out.clear();
  error.clear();
  if ((!in && len != 0) || (len % kAesBlockSize) != 0) {
    error = "cbc input not block aligned";
    return false;
  }
  if (len > static_cast<std::size_t>((std::numeric_limits<int>::max)())) {
    error = "cbc input too large";
    return false;
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx) {
    error = OpenSslError("EVP_CIPHER_CTX_new failed");
    return false;
  }
  if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(),
                        iv.data(), encrypt ? 1 : 0) != 1) {
    error = OpenSslError("EVP_CipherInit_ex failed");
    return false;
  }
  EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

  out.resize(len + kAesBlockSize);
  int produced = 0;
  if (len > 0 &&
      EVP_CipherUpdate(ctx.get(), out.data(), &produced, in,
                       static_cast<int>(len)) != 1) {
    out.clear();
    error = OpenSslError("EVP_CipherUpdate failed");
    return false;
  }
  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), out.data() + produced, &tail) != 1) {
    out.clear();
    error = OpenSslError("EVP_CipherFinal_ex failed");
    return false;
  }
  out.resize(static_cast<std::size_t>(produced + tail));
  return true;
}

inline std::uint32_t RotL(std::uint32_t x, int r) {
  return (x << r) | (x >> (32 - r));
}

inline std::uint32_t FMix(std::uint32_t h) {
  h ^= h >> 16;
  h *= 0x85ebca6bU;
  h ^= h >> 13;
  h *= 0xc2b2ae35U;
  h ^= h >> 16;
  return h;
}

}  // namespace

bool Sha512(const std::uint8_t* data, std::size_t len, Sha512Digest& out) {
  if (!data && len != 0) {
    return false;
  }
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    return false;
  }
  unsigned int written = 0;
  const bool ok =
      EVP_DigestInit_ex(ctx.get(), EVP_sha512(), nullptr) == 1 &&
      (len == 0 || EVP_DigestUpdate(ctx.get(), data, len) == 1) &&
      EVP_DigestFinal_ex(ctx.get(), out.bytes.data(), &written) == 1 &&
      written == out.bytes.size();
  if (!ok) {
    ERR_clear_error();
  }
  return ok;
}

bool Aes256CbcDecrypt(const Aes256Key& key, const AesIv& iv,
                      const std::uint8_t* in, std::size_t len,
                      std::vector<std::uint8_t>& out, std::string& error) {
  return RunCbc(false, key, iv, in, len, out, error);
}

bool Aes256CbcEncrypt(const Aes256Key& key, const AesIv& iv,
                      const std::uint8_t* in, std::size_t len,
                      std::vector<std::uint8_t>& out, std::string& error) {
  return RunCbc(true, key, iv, in, len, out, error);
}

std::int32_t Murmur3X86_32(const std::uint8_t* data, std::size_t len,
                           std::int32_t seed) {
  constexpr std::uint32_t c1 = 0xcc9e2d51U;
  constexpr std::uint32_t c2 = 0x1b873593U;

  std::uint32_t h1 = static_cast<std::uint32_t>(seed);
  const std::size_t nblocks = len / 4;

  for (std::size_t i = 0; i < nblocks; ++i) {
    const std::uint8_t* p = data + i * 4;
    std::uint32_t k1 = static_cast<std::uint32_t>(p[0]) |
                       (static_cast<std::uint32_t>(p[1]) << 8) |
                       (static_cast<std::uint32_t>(p[2]) << 16) |
                       (static_cast<std::uint32_t>(p[3]) << 24);
    k1 *= c1;
    k1 = RotL(k1, 15);
    k1 *= c2;

    h1 ^= k1;
    h1 = RotL(h1, 13);
    h1 = h1 * 5 + 0xe6546b64U;
  }

  const std::uint8_t* tail = data + nblocks * 4;
  std::uint32_t k1 = 0;
  switch (len & 3) {
    case 3:
      k1 ^= static_cast<std::uint32_t>(tail[2]) << 16;
      [[fallthrough]];
    case 2:
      k1 ^= static_cast<std::uint32_t>(tail[1]) << 8;
      [[fallthrough]];
    case 1:
      k1 ^= static_cast<std::uint32_t>(tail[0]);
      k1 *= c1;
      k1 = RotL(k1, 15);
      k1 *= c2;
      h1 ^= k1;
      break;
    default:
      break;
  }

  h1 ^= static_cast<std::uint32_t>(len);
  return static_cast<std::int32_t>(FMix(h1));
}

}  // namespace pbr::archive::crypto

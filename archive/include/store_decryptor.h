#ifndef PBR_ARCHIVE_STORE_DECRYPTOR_H
#define PBR_ARCHIVE_STORE_DECRYPTOR_H

#include <cstdint>
#include <filesystem>
#include <string>

#include "archive_types.h"
#include "key_derivation.h"

namespace pbr::archive {

struct DecryptorOptions {
  std::string sqlcipher_binary{"sqlcipher"};
  std::filesystem::path temp_dir;
  std::uint32_t plaintext_header_size{32};
};

// Owns a decrypted database file and deletes it when released.
class PlaintextCopy {
 public:
  PlaintextCopy() = default;
  explicit PlaintextCopy(std::filesystem::path path);
  ~PlaintextCopy();

  PlaintextCopy(const PlaintextCopy&) = delete;
  PlaintextCopy& operator=(const PlaintextCopy&) = delete;
  PlaintextCopy(PlaintextCopy&& other) noexcept;
  PlaintextCopy& operator=(PlaintextCopy&& other) noexcept;

  const std::filesystem::path& path() const { return path_; }
  bool empty() const { return path_.empty(); }

  // Deletes the file. Safe to call repeatedly.
  void Release();

 private:
  std::filesystem::path path_;
};

// Builds `<temp_dir>/pbr-<random hex>.sqlite`, unique per call.
bool AllocatePlaintextPath(const std::filesystem::path& temp_dir,
                           std::filesystem::path& out,
                           std::string& error);

// SQL fed to the engine on stdin.
std::string BuildExportScript(const std::string& hex_key,
                              const std::filesystem::path& output,
                              std::uint32_t plaintext_header_size);

ArchiveStatus ExportPlaintext(const std::filesystem::path& db_path,
                              const KeyMaterial& material,
                              const DecryptorOptions& options,
                              PlaintextCopy& out,
                              std::string& error);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_STORE_DECRYPTOR_H

#include "store_decryptor.h"

#include <array>
#include <chrono>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "hex_utils.h"
#include "platform_fs.h"
#include "platform_log.h"
#include "platform_process.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace pbr::archive {

namespace {

constexpr char kLogTag[] = "decrypt";
constexpr std::size_t kMaxStderrInError = 512;

std::string QuoteSqlLiteral(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('\'');
  for (const char ch : text) {
    if (ch == '\'') {
      out.push_back('\'');
    }
    out.push_back(ch);
  }
  out.push_back('\'');
  return out;
}

std::string TrimStderr(const std::string& text) {
  if (text.size() <= kMaxStderrInError) {
    return text;
  }
  return text.substr(0, kMaxStderrInError) + "...";
}

}  // namespace

PlaintextCopy::PlaintextCopy(std::filesystem::path path)
    : path_(std::move(path)) {}

PlaintextCopy::~PlaintextCopy() { Release(); }

PlaintextCopy::PlaintextCopy(PlaintextCopy&& other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

PlaintextCopy& PlaintextCopy::operator=(PlaintextCopy&& other) noexcept {
  if (this == &other) {
    return *this;
  }
  Release();
  path_ = std::move(other.path_);
  other.path_.clear();
  return *this;
}

void PlaintextCopy::Release() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  platform::fs::Remove(path_, ec);
  if (ec) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "plaintext copy not removed",
                       {{"path", path_.string()}, {"reason", ec.message()}});
  }
  path_.clear();
}

bool AllocatePlaintextPath(const std::filesystem::path& temp_dir,
                           std::filesystem::path& out,
                           std::string& error) {
  error.clear();
  std::filesystem::path dir = temp_dir;
  std::error_code ec;
  if (dir.empty()) {
    dir = platform::fs::TempDirectory(ec);
    if (ec) {
      error = "temp directory unavailable: " + ec.message();
      return false;
    }
  }
  std::array<std::uint8_t, 16> nonce{};
  if (!platform::RandomBytes(nonce.data(), nonce.size())) {
    error = "random source unavailable";
    return false;
  }
  out = dir / ("pbr-" + common::BytesToHex(nonce.data(), nonce.size()) +
               ".sqlite");
  return true;
}

std::string BuildExportScript(const std::string& hex_key,
                              const std::filesystem::path& output,
                              std::uint32_t plaintext_header_size) {
  std::ostringstream oss;
  oss << "PRAGMA key=\"x'" << hex_key << "'\";\n"
      << "PRAGMA cipher_plaintext_header_size=" << plaintext_header_size
      << ";\n"
      << "PRAGMA cipher_default_plaintext_header_size="
      << plaintext_header_size << ";\n"
      << "ATTACH DATABASE " << QuoteSqlLiteral(output.string())
      << " AS plaintext KEY '';\n"
      << "SELECT sqlcipher_export('plaintext');\n"
      << "DETACH DATABASE plaintext;\n";
  return oss.str();
}

ArchiveStatus ExportPlaintext(const std::filesystem::path& db_path,
                              const KeyMaterial& material,
                              const DecryptorOptions& options,
                              PlaintextCopy& out,
                              std::string& error) {
  error.clear();
  out.Release();

  std::error_code ec;
  if (db_path.empty() || !platform::fs::Exists(db_path, ec) || ec) {
    error = "database not found: " + db_path.string();
    return ArchiveStatus::kUnavailable;
  }

  std::filesystem::path output;
  if (!AllocatePlaintextPath(options.temp_dir, output, error)) {
    return ArchiveStatus::kDecryptionError;
  }
  // Owns the output from here on so every failure path removes it.
  PlaintextCopy copy(output);

  std::string hex_key = material.HexKey();
  common::ScopedWipe wipe_hex(hex_key);
  std::string script =
      BuildExportScript(hex_key, output, options.plaintext_header_size);
  common::ScopedWipe wipe_script(script);

  const auto started = std::chrono::steady_clock::now();
  platform::ProcessResult result;
  const std::vector<std::string> argv = {options.sqlcipher_binary,
                                         db_path.string()};
  if (!platform::RunProcess(argv, script, result, ec)) {
    error = "cannot start " + options.sqlcipher_binary + ": " + ec.message();
    platform::log::Log(platform::log::Level::kError, kLogTag, error);
    return ArchiveStatus::kDecryptionError;
  }
  if (result.exit_code != 0) {
    error = "sqlcipher export failed (exit " +
            std::to_string(result.exit_code) + ")";
    if (!result.stderr_data.empty()) {
      error += ": " + TrimStderr(result.stderr_data);
    }
    platform::log::Log(platform::log::Level::kError, kLogTag,
                       "sqlcipher export failed",
                       {{"exit", std::to_string(result.exit_code)}});
    return ArchiveStatus::kDecryptionError;
  }

  const bool exists = platform::fs::Exists(output, ec) && !ec;
  const std::uint64_t size = exists ? platform::fs::FileSize(output, ec) : 0;
  if (!exists || ec || size == 0) {
    error =
        "sqlcipher produced empty output; decryption may have failed";
    if (!result.stderr_data.empty()) {
      error += ": " + TrimStderr(result.stderr_data);
    }
    platform::log::Log(platform::log::Level::kError, kLogTag, error);
    return ArchiveStatus::kDecryptionError;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  platform::log::Log(platform::log::Level::kInfo, kLogTag,
                     "plaintext export ready",
                     {{"bytes", std::to_string(size)},
                      {"ms", std::to_string(elapsed.count())}});
  out = std::move(copy);
  return ArchiveStatus::kOk;
}

}  // namespace pbr::archive

#include "config.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include "key_derivation.h"
#include "platform_fs.h"

namespace pbr::archive {

namespace {

constexpr const char* kContainerVariants[] = {"appstore", ""};
constexpr char kAccountDirPrefix[] = "account-";

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text[0] < '0' || text[0] > '9') {
    return false;
  }
  errno = 0;
  char* end_ptr = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
  if (errno == ERANGE || *end_ptr != '\0' || value > UINT32_MAX) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

struct IniState {
  std::string section;
  ArchiveConfig* cfg{nullptr};
};

bool ApplyKV(IniState& state, const std::string& key, const std::string& value,
             std::string& error) {
  if (state.section == "archive") {
    if (key == "container_dir") {
      state.cfg->container_dir = value;
    } else if (key == "db_path") {
      state.cfg->db_path = value;
    } else if (key == "key_path") {
      state.cfg->key_path = value;
    } else if (key == "passphrase") {
      state.cfg->passphrase = value;
    }
    return true;
  }
  if (state.section == "decrypt") {
    if (key == "sqlcipher") {
      state.cfg->decrypt.sqlcipher_binary = value;
    } else if (key == "temp_dir") {
      state.cfg->decrypt.temp_dir = value;
    } else if (key == "plaintext_header_size") {
      if (!ParseUint32(value, state.cfg->decrypt.plaintext_header_size)) {
        error = "invalid plaintext_header_size: " + value;
        return false;
      }
    }
    return true;
  }
  if (state.section == "log") {
    if (key == "level" &&
        !platform::log::ParseLevel(value, state.cfg->log_level)) {
      error = "invalid log level: " + value;
      return false;
    }
    return true;
  }
  return true;
}

bool ParseIni(const std::string& path, ArchiveConfig& out,
              std::string& error) {
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }

  IniState state;
  state.cfg = &out;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    const std::string trimmed = StripInlineComment(Trim(line));
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      state.section = Trim(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, pos));
    const std::string value = Trim(trimmed.substr(pos + 1));
    if (!ApplyKV(state, key, value, error)) {
      error = "line " + std::to_string(line_no) + ": " + error;
      return false;
    }
  }
  return true;
}

bool IsFile(const std::filesystem::path& path) {
  std::error_code ec;
  return platform::fs::IsRegularFile(path, ec) && !ec;
}

std::filesystem::path FindDatabase(const std::filesystem::path& base) {
  std::error_code ec;
  std::vector<std::filesystem::path> entries;
  if (!platform::fs::ListDir(base, entries, ec)) {
    return {};
  }
  for (const auto& entry : entries) {
    const std::string name = entry.filename().string();
    if (name.rfind(kAccountDirPrefix, 0) != 0) {
      continue;
    }
    const auto candidate = entry / "postbox" / "db" / "db_sqlite";
    if (IsFile(candidate)) {
      return candidate;
    }
  }
  return {};
}

}  // namespace

std::filesystem::path DefaultContainerDir() {
  const auto home = platform::fs::HomeDirectory();
  if (home.empty()) {
    return {};
  }
  return home / kDefaultContainerSuffix;
}

ArchiveConfig DefaultConfig() {
  ArchiveConfig cfg;
  cfg.container_dir = DefaultContainerDir();
  cfg.passphrase = kDefaultPassphrase;
  return cfg;
}

bool LoadConfig(const std::string& path, ArchiveConfig& out_config,
                std::string& error) {
  error.clear();
  out_config = DefaultConfig();
  if (!ParseIni(path, out_config, error)) {
    return false;
  }
  const std::uint32_t header = out_config.decrypt.plaintext_header_size;
  if (header == 0 || header > kMaxPlaintextHeaderSize) {
    error = "plaintext_header_size out of range";
    return false;
  }
  if (out_config.decrypt.sqlcipher_binary.empty()) {
    error = "sqlcipher binary missing";
    return false;
  }
  return true;
}

bool LocateArchive(const ArchiveConfig& config, ArchiveLocation& out) {
  out = ArchiveLocation{};
  if (!config.db_path.empty() && IsFile(config.db_path)) {
    out.db_path = config.db_path;
  }
  if (!config.key_path.empty() && IsFile(config.key_path)) {
    out.key_path = config.key_path;
  }
  if (config.container_dir.empty()) {
    return out.complete();
  }
  for (const char* variant : kContainerVariants) {
    const std::filesystem::path base =
        *variant ? config.container_dir / variant : config.container_dir;
    if (out.db_path.empty() && config.db_path.empty()) {
      out.db_path = FindDatabase(base);
    }
    if (out.key_path.empty() && config.key_path.empty() &&
        IsFile(base / kKeyFileName)) {
      out.key_path = base / kKeyFileName;
    }
  }
  return out.complete();
}

}  // namespace pbr::archive

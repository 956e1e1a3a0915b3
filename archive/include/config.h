#ifndef PBR_ARCHIVE_CONFIG_H
#define PBR_ARCHIVE_CONFIG_H

#include <cstdint>
#include <filesystem>
#include <string>

#include "platform_log.h"
#include "store_decryptor.h"

namespace pbr::archive {

inline constexpr char kDefaultContainerSuffix[] =
    "Library/Group Containers/6N38VWS5BX.ru.keepcoder.Telegram";
inline constexpr char kKeyFileName[] = ".tempkeyEncrypted";
inline constexpr std::uint32_t kMaxPlaintextHeaderSize = 1024;

struct ArchiveConfig {
  // Searched when db_path / key_path are not given explicitly.
  std::filesystem::path container_dir;
  std::filesystem::path db_path;
  std::filesystem::path key_path;
  std::string passphrase;
  DecryptorOptions decrypt;
  platform::log::Level log_level{platform::log::Level::kInfo};
};

struct ArchiveLocation {
  std::filesystem::path db_path;
  std::filesystem::path key_path;

  bool complete() const { return !db_path.empty() && !key_path.empty(); }
};

std::filesystem::path DefaultContainerDir();

ArchiveConfig DefaultConfig();

// INI with [archive], [decrypt] and [log] sections; unset keys keep the
// DefaultConfig() values.
bool LoadConfig(const std::string& path, ArchiveConfig& out_config,
                std::string& error);

// Explicit paths win; otherwise `<container>/appstore` and then
// `<container>` are searched for the key file and
// `account-*/postbox/db/db_sqlite`. Returns false when either is missing.
bool LocateArchive(const ArchiveConfig& config, ArchiveLocation& out);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_CONFIG_H

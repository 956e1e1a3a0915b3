#ifndef PBR_ARCHIVE_SQLITE_ARCHIVE_STORE_H
#define PBR_ARCHIVE_SQLITE_ARCHIVE_STORE_H

#include <filesystem>
#include <memory>
#include <string>

#include "archive_store.h"

namespace pbr::archive {

// Opens a plaintext postbox database read-only.
std::unique_ptr<ArchiveStore> OpenSqliteArchiveStore(
    const std::filesystem::path& path, std::string& error);

}  // namespace pbr::archive

#endif  // PBR_ARCHIVE_SQLITE_ARCHIVE_STORE_H

#ifndef PBR_PLATFORM_FS_H
#define PBR_PLATFORM_FS_H

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace pbr::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool IsDirectory(const std::filesystem::path& path, std::error_code& ec);
bool IsRegularFile(const std::filesystem::path& path, std::error_code& ec);
std::uint64_t FileSize(const std::filesystem::path& path,
                       std::error_code& ec);
bool Remove(const std::filesystem::path& path, std::error_code& ec);
bool ListDir(const std::filesystem::path& path,
             std::vector<std::filesystem::path>& out,
             std::error_code& ec);
bool ReadFileBytes(const std::filesystem::path& path,
                   std::vector<std::uint8_t>& out,
                   std::error_code& ec);
std::filesystem::path TempDirectory(std::error_code& ec);
std::filesystem::path HomeDirectory();

}  // namespace pbr::platform::fs

#endif  // PBR_PLATFORM_FS_H

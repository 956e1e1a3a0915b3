#ifndef PBR_HEX_UTILS_H
#define PBR_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pbr::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);
std::string BytesToHex(const std::vector<std::uint8_t>& data);
bool HexToBytes(std::string_view hex, std::vector<std::uint8_t>& out);

}  // namespace pbr::common

#endif  // PBR_HEX_UTILS_H

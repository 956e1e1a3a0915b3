#ifndef PBR_PLATFORM_RANDOM_H
#define PBR_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace pbr::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace pbr::platform

#endif  // PBR_PLATFORM_RANDOM_H

#ifndef PBR_SECURE_BUFFER_H
#define PBR_SECURE_BUFFER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pbr::common {

inline void SecureWipe(void* data, std::size_t len) {
  if (!data || len == 0) {
    return;
  }
  volatile std::uint8_t* p = reinterpret_cast<volatile std::uint8_t*>(data);
  while (len--) {
    *p++ = 0;
  }
}

inline void SecureWipe(std::vector<std::uint8_t>& buf) {
  SecureWipe(buf.data(), buf.size());
}

inline void SecureWipe(std::string& text) {
  SecureWipe(text.empty() ? nullptr : &text[0], text.size());
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& buf) {
  SecureWipe(buf.data(), buf.size());
}

// Zeroes the referenced storage when the scope ends. The storage must not be
// reallocated while the guard is alive.
class ScopedWipe {
 public:
  explicit ScopedWipe(std::vector<std::uint8_t>& buf)
      : data_(buf.data()), len_(buf.size()) {}

  template <std::size_t N>
  explicit ScopedWipe(std::array<std::uint8_t, N>& buf)
      : data_(buf.data()), len_(buf.size()) {}

  explicit ScopedWipe(std::string& text)
      : data_(text.empty() ? nullptr : &text[0]), len_(text.size()) {}

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

  ~ScopedWipe() { SecureWipe(data_, len_); }

 private:
  void* data_{nullptr};
  std::size_t len_{0};
};

}  // namespace pbr::common

#endif  // PBR_SECURE_BUFFER_H

#pragma once

#include <array>
#include <cstddef>
#include <memory_resource>
#include <vector>

namespace critpath {

// Stack-backed scratch memory for per-call graph traversals. Spills to the
// heap once the inline buffer is exhausted.
template <std::size_t N = 4096>
class Arena {
public:
  Arena() : resource_(buffer_.data(), buffer_.size()) {}

  Arena(const Arena&) = delete;
  Arena& operator=(const Arena&) = delete;

  template <typename T>
  [[nodiscard]] auto vector() -> std::pmr::vector<T> {
    return std::pmr::vector<T>(&resource_);
  }

  template <typename T>
  [[nodiscard]] auto vector(std::size_t count, const T& value)
      -> std::pmr::vector<T> {
    return std::pmr::vector<T>(count, value, &resource_);
  }

private:
  std::array<std::byte, N> buffer_;
  std::pmr::monotonic_buffer_resource resource_;
};

}  // namespace critpath

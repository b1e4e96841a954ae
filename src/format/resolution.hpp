#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>

namespace camkit::format {

// Pixel geometry of a stream.
//
// Ordering is width-major, height-minor, both ascending:
//   Resolution{1, 100} < Resolution{2, 1}
// Member order below is what the defaulted comparison relies on.
struct Resolution {
  std::uint32_t width = 0U;
  std::uint32_t height = 0U;

  auto operator<=>(const Resolution& other) const = default;
  bool operator==(const Resolution& other) const = default;

  bool IsEmpty() const {
    return width == 0U || height == 0U;
  }

  // Widened so 65535x65535x4 cannot wrap.
  std::size_t PixelCount() const {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
  }
};

// `<width>x<height>`, e.g. `640x480`.
inline std::string ToString(const Resolution& resolution) {
  return std::to_string(resolution.width) + "x" + std::to_string(resolution.height);
}

} // namespace camkit::format

#pragma once

#include "core/errors/camera_error.hpp"
#include "format/resolution.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace camkit::codec {

enum class PixelLayout {
  kRgb888 = 0,
  kRgba8888,
};

const char* ToString(PixelLayout layout);

constexpr std::size_t BytesPerPixel(const PixelLayout layout) {
  return layout == PixelLayout::kRgba8888 ? 4U : 3U;
}

// Packed, row-major 8-bit pixel grid with no row padding.
struct ImageBuffer {
  format::Resolution resolution;
  PixelLayout layout = PixelLayout::kRgb888;
  std::vector<std::uint8_t> pixels;
};

// `width * height * BytesPerPixel(layout)`.
std::size_t ExpectedByteCount(format::Resolution resolution, PixelLayout layout);

// Wraps `pixels` as an image. Fails with kReadFrame when the byte count does
// not match the geometry; `image` is left untouched in that case.
bool MakeImageBuffer(format::Resolution resolution, PixelLayout layout,
                     std::vector<std::uint8_t> pixels, ImageBuffer& image,
                     core::errors::CameraError& error);

} // namespace camkit::codec

#include "codec/image_buffer.hpp"

#include <string>
#include <utility>

namespace camkit::codec {

const char* ToString(const PixelLayout layout) {
  switch (layout) {
  case PixelLayout::kRgb888:
    return "RGB888";
  case PixelLayout::kRgba8888:
    return "RGBA8888";
  }
  return "RGB888";
}

std::size_t ExpectedByteCount(const format::Resolution resolution, const PixelLayout layout) {
  return resolution.PixelCount() * BytesPerPixel(layout);
}

bool MakeImageBuffer(const format::Resolution resolution, const PixelLayout layout,
                     std::vector<std::uint8_t> pixels, ImageBuffer& image,
                     core::errors::CameraError& error) {
  const std::size_t expected = ExpectedByteCount(resolution, layout);
  if (pixels.size() != expected) {
    error = core::errors::ReadFrameError(
        std::string(ToString(layout)) + " buffer for " + format::ToString(resolution) +
        " needs " + std::to_string(expected) + " bytes, got " + std::to_string(pixels.size()));
    return false;
  }

  image.resolution = resolution;
  image.layout = layout;
  image.pixels = std::move(pixels);
  error.Clear();
  return true;
}

} // namespace camkit::codec

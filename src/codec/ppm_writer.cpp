#include "codec/ppm_writer.hpp"

#include "codec/pixel_codec.hpp"

#include <fstream>
#include <span>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace camkit::codec {

bool WritePpm(const fs::path& path, const ImageBuffer& image, std::string& error) {
  error.clear();
  if (path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  if (image.resolution.IsEmpty()) {
    error = "cannot write an image with zero area";
    return false;
  }
  if (image.pixels.size() != ExpectedByteCount(image.resolution, image.layout)) {
    error = "image byte count does not match " + format::ToString(image.resolution);
    return false;
  }

  std::vector<std::uint8_t> converted;
  std::span<const std::uint8_t> rgb(image.pixels);
  if (image.layout == PixelLayout::kRgba8888) {
    core::errors::CameraError convert_error;
    if (!RgbaToRgb888(image.pixels, converted, convert_error)) {
      error = core::errors::ToString(convert_error);
      return false;
    }
    rgb = converted;
  }

  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      error = "failed to create output directory '" + path.parent_path().string() +
              "': " + ec.message();
      return false;
    }
  }

  std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open output file '" + path.string() + "' for writing";
    return false;
  }

  out_file << "P6\n" << image.resolution.width << ' ' << image.resolution.height << "\n255\n";
  out_file.write(reinterpret_cast<const char*>(rgb.data()),
                 static_cast<std::streamsize>(rgb.size()));
  if (!out_file) {
    error = "failed while writing output file '" + path.string() + "'";
    return false;
  }
  return true;
}

} // namespace camkit::codec

#include "codec/ppm_writer.hpp"

#include "common/assertions.hpp"
#include "common/temp_dir.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main() {
  using camkit::codec::ImageBuffer;
  using camkit::codec::PixelLayout;
  using camkit::format::Resolution;
  using camkit::tests::common::Fail;
  using camkit::tests::common::ReadFileToString;

  const camkit::tests::common::ScopedTempDir temp("camkit-ppm-writer-smoke");

  ImageBuffer rgb{.resolution = Resolution{2U, 1U},
                  .layout = PixelLayout::kRgb888,
                  .pixels = {255U, 0U, 0U, 0U, 0U, 255U}};
  const std::filesystem::path rgb_path = temp.path() / "nested" / "dir" / "rgb.ppm";
  std::string error;
  if (!camkit::codec::WritePpm(rgb_path, rgb, error)) {
    Fail("rgb ppm write should succeed: " + error);
  }
  const std::string expected_header = "P6\n2 1\n255\n";
  const std::string rgb_contents = ReadFileToString(rgb_path);
  if (rgb_contents.size() != expected_header.size() + 6U ||
      rgb_contents.compare(0U, expected_header.size(), expected_header) != 0) {
    Fail("ppm should have a P6 header followed by raw pixels");
  }
  if (static_cast<unsigned char>(rgb_contents[expected_header.size()]) != 255U) {
    Fail("first pixel should be red");
  }

  ImageBuffer rgba{.resolution = Resolution{1U, 1U},
                   .layout = PixelLayout::kRgba8888,
                   .pixels = {1U, 2U, 3U, 4U}};
  const std::filesystem::path rgba_path = temp.path() / "rgba.ppm";
  if (!camkit::codec::WritePpm(rgba_path, rgba, error)) {
    Fail("rgba ppm write should succeed: " + error);
  }
  if (ReadFileToString(rgba_path) != std::string("P6\n1 1\n255\n\x01\x02\x03", 14U)) {
    Fail("rgba ppm should drop the alpha channel");
  }

  ImageBuffer empty;
  if (camkit::codec::WritePpm(temp.path() / "empty.ppm", empty, error)) {
    Fail("zero-area image should be rejected");
  }
  ImageBuffer short_image{.resolution = Resolution{2U, 2U},
                          .layout = PixelLayout::kRgb888,
                          .pixels = std::vector<std::uint8_t>(3U)};
  if (camkit::codec::WritePpm(temp.path() / "short.ppm", short_image, error)) {
    Fail("mismatched byte count should be rejected");
  }
  if (camkit::codec::WritePpm("", rgb, error)) {
    Fail("empty output path should be rejected");
  }

  std::cout << "ppm_writer_smoke: ok\n";
  return 0;
}

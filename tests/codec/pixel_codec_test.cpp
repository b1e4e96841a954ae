#include "codec/pixel_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstdint>
#include <vector>

using camkit::codec::ImageBuffer;
using camkit::codec::PixelLayout;
using camkit::core::errors::CameraError;
using camkit::core::errors::CameraErrorKind;
using camkit::format::FrameFormat;
using camkit::format::Resolution;

TEST_CASE("Yuyv444ToRgb888 maps studio black and white to full range", "[codec]") {
  REQUIRE(camkit::codec::Yuyv444ToRgb888(16, 128, 128) == std::array<std::uint8_t, 3>{0, 0, 0});
  REQUIRE(camkit::codec::Yuyv444ToRgb888(235, 128, 128) ==
          std::array<std::uint8_t, 3>{255, 255, 255});
}

TEST_CASE("Yuyv444ToRgb888 clamps out-of-range results", "[codec]") {
  // Below studio black every channel clamps at 0.
  REQUIRE(camkit::codec::Yuyv444ToRgb888(0, 128, 128) == std::array<std::uint8_t, 3>{0, 0, 0});
  // Saturated red: R clamps high, B clamps low.
  const auto red = camkit::codec::Yuyv444ToRgb888(255, 128, 255);
  REQUIRE(red[0] == 255U);
  // G = (239 * 298 - 208 * 127 + 128) >> 8 = 44934 >> 8 = 175
  REQUIRE(red[1] == 175U);
}

TEST_CASE("Yuyv422ToRgb888 emits two pixels per four bytes", "[codec]") {
  const std::vector<std::uint8_t> yuyv = {16U, 128U, 235U, 128U};
  std::vector<std::uint8_t> rgb;
  CameraError error;
  REQUIRE(camkit::codec::Yuyv422ToRgb888(yuyv, rgb, error));
  REQUIRE(error.ok());
  REQUIRE(rgb == std::vector<std::uint8_t>{0U, 0U, 0U, 255U, 255U, 255U});

  REQUIRE(camkit::codec::Yuyv422ToRgb888(std::vector<std::uint8_t>{}, rgb, error));
  REQUIRE(rgb.empty());
}

TEST_CASE("Yuyv422ToRgb888 rejects lengths that are not a multiple of four", "[codec]") {
  const std::vector<std::uint8_t> yuyv = {16U, 128U, 235U, 128U, 16U};
  std::vector<std::uint8_t> rgb = {1U, 2U, 3U};
  CameraError error;
  REQUIRE_FALSE(camkit::codec::Yuyv422ToRgb888(yuyv, rgb, error));
  REQUIRE(error.kind == CameraErrorKind::kProcessFrame);
  REQUIRE(error.src_format == FrameFormat::kYuyv);
  REQUIRE(error.destination == "RGB888");
  REQUIRE(rgb == std::vector<std::uint8_t>{1U, 2U, 3U});
}

TEST_CASE("RgbaToRgb888 drops the alpha channel", "[codec]") {
  const std::vector<std::uint8_t> rgba = {1U, 2U, 3U, 255U, 4U, 5U, 6U, 0U};
  std::vector<std::uint8_t> rgb;
  CameraError error;
  REQUIRE(camkit::codec::RgbaToRgb888(rgba, rgb, error));
  REQUIRE(rgb == std::vector<std::uint8_t>{1U, 2U, 3U, 4U, 5U, 6U});

  REQUIRE_FALSE(camkit::codec::RgbaToRgb888(std::vector<std::uint8_t>{1U, 2U, 3U}, rgb, error));
  REQUIRE(error.kind == CameraErrorKind::kProcessFrame);
}

TEST_CASE("MjpegToRgb888 rejects empty and corrupt input", "[codec]") {
  std::vector<std::uint8_t> rgb;
  Resolution resolution;
  CameraError error;
  REQUIRE_FALSE(
      camkit::codec::MjpegToRgb888(std::vector<std::uint8_t>{}, rgb, resolution, error));
  REQUIRE(error.kind == CameraErrorKind::kProcessFrame);
  REQUIRE(error.src_format == FrameFormat::kMjpeg);

  const std::vector<std::uint8_t> garbage = {0x00U, 0x11U, 0x22U, 0x33U, 0x44U, 0x55U};
  REQUIRE_FALSE(camkit::codec::MjpegToRgb888(garbage, rgb, resolution, error));
  REQUIRE(error.kind == CameraErrorKind::kProcessFrame);
  REQUIRE(rgb.empty());
}

TEST_CASE("DecodeToRgb888 checks the byte count against the geometry", "[codec]") {
  // 2x1 YUYV is exactly one 4-byte group.
  const std::vector<std::uint8_t> yuyv = {16U, 128U, 235U, 128U};
  ImageBuffer image;
  CameraError error;
  REQUIRE(camkit::codec::DecodeToRgb888(FrameFormat::kYuyv, Resolution{2U, 1U}, yuyv, image,
                                        error));
  REQUIRE(image.layout == PixelLayout::kRgb888);
  REQUIRE(image.resolution == Resolution{2U, 1U});
  REQUIRE(image.pixels.size() == 6U);

  ImageBuffer untouched;
  REQUIRE_FALSE(camkit::codec::DecodeToRgb888(FrameFormat::kYuyv, Resolution{4U, 1U}, yuyv,
                                              untouched, error));
  REQUIRE(error.kind == CameraErrorKind::kReadFrame);
  REQUIRE(untouched.pixels.empty());
}

TEST_CASE("MakeImageBuffer rejects mismatched sizes", "[codec]") {
  ImageBuffer image;
  CameraError error;
  REQUIRE(camkit::codec::ExpectedByteCount(Resolution{2U, 2U}, PixelLayout::kRgba8888) == 16U);
  REQUIRE_FALSE(camkit::codec::MakeImageBuffer(Resolution{2U, 2U}, PixelLayout::kRgba8888,
                                               std::vector<std::uint8_t>(12U), image, error));
  REQUIRE(error.kind == CameraErrorKind::kReadFrame);
  REQUIRE(error.detail == "RGBA8888 buffer for 2x2 needs 16 bytes, got 12");
  REQUIRE(camkit::codec::MakeImageBuffer(Resolution{2U, 2U}, PixelLayout::kRgb888,
                                         std::vector<std::uint8_t>(12U), image, error));
}

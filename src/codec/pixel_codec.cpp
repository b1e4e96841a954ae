#include "codec/pixel_codec.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>

#if CAMKIT_ENABLE_OPENCV
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#endif

namespace camkit::codec {

namespace {

constexpr const char* kRgb888 = "RGB888";

std::uint8_t ClampToByte(const std::int32_t value) {
  return static_cast<std::uint8_t>(std::clamp(value, 0, 255));
}

} // namespace

std::array<std::uint8_t, 3> Yuyv444ToRgb888(const std::int32_t y, const std::int32_t u,
                                             const std::int32_t v) {
  const std::int32_t c298 = (y - 16) * 298;
  const std::int32_t d = u - 128;
  const std::int32_t e = v - 128;
  // Right shift of a negative int is arithmetic since C++20.
  return {
      ClampToByte((c298 + 409 * e + 128) >> 8),
      ClampToByte((c298 - 100 * d - 208 * e + 128) >> 8),
      ClampToByte((c298 + 516 * d + 128) >> 8),
  };
}

bool Yuyv422ToRgb888(std::span<const std::uint8_t> yuyv, std::vector<std::uint8_t>& rgb,
                     core::errors::CameraError& error) {
  if (yuyv.size() % 4U != 0U) {
    error = core::errors::ProcessFrameError(
        format::FrameFormat::kYuyv, kRgb888,
        "input is not packed 4:2:2 (length " + std::to_string(yuyv.size()) +
            " is not a multiple of 4)");
    return false;
  }

  std::vector<std::uint8_t> out(yuyv.size() / 4U * 6U);
  std::size_t write = 0U;
  for (std::size_t read = 0U; read < yuyv.size(); read += 4U) {
    const std::int32_t y1 = yuyv[read];
    const std::int32_t u = yuyv[read + 1U];
    const std::int32_t y2 = yuyv[read + 2U];
    const std::int32_t v = yuyv[read + 3U];

    const auto first = Yuyv444ToRgb888(y1, u, v);
    const auto second = Yuyv444ToRgb888(y2, u, v);
    std::copy(first.begin(), first.end(), out.begin() + static_cast<std::ptrdiff_t>(write));
    std::copy(second.begin(), second.end(),
              out.begin() + static_cast<std::ptrdiff_t>(write + 3U));
    write += 6U;
  }

  rgb = std::move(out);
  error.Clear();
  return true;
}

bool MjpegToRgb888(std::span<const std::uint8_t> jpeg, std::vector<std::uint8_t>& rgb,
                   format::Resolution& resolution, core::errors::CameraError& error) {
  if (jpeg.empty()) {
    error = core::errors::ProcessFrameError(format::FrameFormat::kMjpeg, kRgb888,
                                            "empty JPEG buffer");
    return false;
  }

#if CAMKIT_ENABLE_OPENCV
  cv::Mat decoded;
  try {
    const cv::Mat encoded(1, static_cast<int>(jpeg.size()), CV_8UC1,
                          const_cast<std::uint8_t*>(jpeg.data()));
    decoded = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    error = core::errors::ProcessFrameError(format::FrameFormat::kMjpeg, kRgb888,
                                            std::string("decoder failed: ") + ex.what());
    return false;
  }

  if (decoded.empty() || decoded.type() != CV_8UC3) {
    error = core::errors::ProcessFrameError(format::FrameFormat::kMjpeg, kRgb888,
                                            "failed to read scanlines into RGB888 pixels");
    return false;
  }

  const auto width = static_cast<std::size_t>(decoded.cols);
  const auto height = static_cast<std::size_t>(decoded.rows);
  std::vector<std::uint8_t> out(width * height * 3U);

  // OpenCV rows may be padded; copy scanline by scanline and swap BGR -> RGB.
  std::size_t write = 0U;
  for (int row = 0; row < decoded.rows; ++row) {
    const std::uint8_t* scanline = decoded.ptr<std::uint8_t>(row);
    for (std::size_t col = 0U; col < width; ++col) {
      const std::uint8_t* bgr = scanline + col * 3U;
      out[write] = bgr[2];
      out[write + 1U] = bgr[1];
      out[write + 2U] = bgr[0];
      write += 3U;
    }
  }

  resolution = format::Resolution{static_cast<std::uint32_t>(width),
                                  static_cast<std::uint32_t>(height)};
  rgb = std::move(out);
  error.Clear();
  return true;
#else
  (void)rgb;
  (void)resolution;
  error = core::errors::ProcessFrameError(
      format::FrameFormat::kMjpeg, kRgb888,
      "BACKEND_NOT_AVAILABLE: JPEG decoder (OpenCV) is not compiled in this build");
  return false;
#endif
}

bool RgbaToRgb888(std::span<const std::uint8_t> rgba, std::vector<std::uint8_t>& rgb,
                  core::errors::CameraError& error) {
  if (rgba.size() % 4U != 0U) {
    error.Clear();
    error.kind = core::errors::CameraErrorKind::kProcessFrame;
    error.destination = kRgb888;
    error.detail = "RGBA input length " + std::to_string(rgba.size()) +
                   " is not a multiple of 4";
    return false;
  }

  std::vector<std::uint8_t> out(rgba.size() / 4U * 3U);
  std::size_t write = 0U;
  for (std::size_t read = 0U; read < rgba.size(); read += 4U) {
    out[write] = rgba[read];
    out[write + 1U] = rgba[read + 1U];
    out[write + 2U] = rgba[read + 2U];
    write += 3U;
  }

  rgb = std::move(out);
  error.Clear();
  return true;
}

bool DecodeToRgb888(const format::FrameFormat frame_format, const format::Resolution resolution,
                    std::span<const std::uint8_t> bytes, ImageBuffer& image,
                    core::errors::CameraError& error) {
  std::vector<std::uint8_t> rgb;
  switch (frame_format) {
  case format::FrameFormat::kYuyv:
    if (!Yuyv422ToRgb888(bytes, rgb, error)) {
      return false;
    }
    break;
  case format::FrameFormat::kMjpeg: {
    format::Resolution decoded_resolution;
    if (!MjpegToRgb888(bytes, rgb, decoded_resolution, error)) {
      return false;
    }
    if (decoded_resolution != resolution) {
      error = core::errors::ReadFrameError("decoded JPEG is " +
                                           format::ToString(decoded_resolution) +
                                           " but the frame reported " +
                                           format::ToString(resolution));
      return false;
    }
    break;
  }
  }

  return MakeImageBuffer(resolution, PixelLayout::kRgb888, std::move(rgb), image, error);
}

} // namespace camkit::codec

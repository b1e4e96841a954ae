#pragma once

#include "codec/image_buffer.hpp"
#include "core/errors/camera_error.hpp"
#include "format/frame_format.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace camkit::codec {

// Converts one Y'CbCr sample to RGB using the integer BT.601 studio-swing
// constants:
//   c = (Y - 16) * 298
//   R = clamp((c + 409 * (V - 128) + 128) >> 8)
//   G = clamp((c - 100 * (U - 128) - 208 * (V - 128) + 128) >> 8)
//   B = clamp((c + 516 * (U - 128) + 128) >> 8)
// Results must match this arithmetic bit for bit; it is not an approximation
// of a float formula.
std::array<std::uint8_t, 3> Yuyv444ToRgb888(std::int32_t y, std::int32_t u, std::int32_t v);

// Packed YUYV 4:2:2 (Y1 U Y2 V per two pixels) to packed RGB888. Each 4-byte
// group yields two pixels sharing U and V. Fails with kProcessFrame when the
// input length is not a multiple of 4.
bool Yuyv422ToRgb888(std::span<const std::uint8_t> yuyv, std::vector<std::uint8_t>& rgb,
                     core::errors::CameraError& error);

// Baseline JPEG to packed RGB888 through OpenCV's decoder. The decoder is
// trusted for width and height; `resolution` receives them and `rgb` holds
// exactly width * height * 3 bytes. Fails with kProcessFrame when decoding
// fails or when the library was built without OpenCV.
bool MjpegToRgb888(std::span<const std::uint8_t> jpeg, std::vector<std::uint8_t>& rgb,
                   format::Resolution& resolution, core::errors::CameraError& error);

// Drops the alpha channel. Fails with kProcessFrame on a length that is not a
// multiple of 4.
bool RgbaToRgb888(std::span<const std::uint8_t> rgba, std::vector<std::uint8_t>& rgb,
                  core::errors::CameraError& error);

// Decodes any supported FrameFormat into an RGB888 ImageBuffer of
// `resolution`. The decoded byte count is checked against the geometry and a
// mismatch fails with kReadFrame. For MJPEG the decoder's own geometry must
// agree with `resolution`.
bool DecodeToRgb888(format::FrameFormat frame_format, format::Resolution resolution,
                    std::span<const std::uint8_t> bytes, ImageBuffer& image,
                    core::errors::CameraError& error);

} // namespace camkit::codec

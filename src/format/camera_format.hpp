#pragma once

#include "format/frame_format.hpp"
#include "format/resolution.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace camkit::format {

// Geometry, encoding and rate of one stream. Fields are independent; setters
// replace a whole field and nothing is cross-validated.
class CameraFormat {
public:
  CameraFormat() = default;
  CameraFormat(Resolution resolution, FrameFormat format, std::uint32_t frame_rate);
  CameraFormat(std::uint32_t width, std::uint32_t height, FrameFormat format,
               std::uint32_t frame_rate);

  Resolution resolution() const {
    return resolution_;
  }
  std::uint32_t width() const {
    return resolution_.width;
  }
  std::uint32_t height() const {
    return resolution_.height;
  }
  FrameFormat format() const {
    return format_;
  }
  std::uint32_t frame_rate() const {
    return frame_rate_;
  }

  void set_resolution(Resolution resolution) {
    resolution_ = resolution;
  }
  void set_format(FrameFormat format) {
    format_ = format;
  }
  void set_frame_rate(std::uint32_t frame_rate) {
    frame_rate_ = frame_rate;
  }

  bool operator==(const CameraFormat& other) const = default;

private:
  Resolution resolution_{640U, 480U};
  FrameFormat format_ = FrameFormat::kMjpeg;
  std::uint32_t frame_rate_ = 15U;
};

// `640x480@15FPS, MJPEG Format`.
std::string ToString(const CameraFormat& format);

// Identity of one enumerated camera. `misc` carries backend-specific detail
// (bus path, `group:device` ids) and `index` is what the backend opens.
struct CameraInfo {
  std::string human_name;
  std::string description;
  std::string misc;
  std::size_t index = 0U;

  bool operator==(const CameraInfo& other) const = default;
  bool operator<(const CameraInfo& other) const {
    return index < other.index;
  }
};

std::string ToString(const CameraInfo& info);

} // namespace camkit::format

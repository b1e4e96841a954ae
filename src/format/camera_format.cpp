#include "format/camera_format.hpp"

#include <sstream>

namespace camkit::format {

CameraFormat::CameraFormat(const Resolution resolution, const FrameFormat format,
                           const std::uint32_t frame_rate)
    : resolution_(resolution), format_(format), frame_rate_(frame_rate) {}

CameraFormat::CameraFormat(const std::uint32_t width, const std::uint32_t height,
                           const FrameFormat format, const std::uint32_t frame_rate)
    : resolution_{width, height}, format_(format), frame_rate_(frame_rate) {}

std::string ToString(const CameraFormat& format) {
  std::ostringstream out;
  out << ToString(format.resolution()) << '@' << format.frame_rate() << "FPS, "
      << ToString(format.format()) << " Format";
  return out.str();
}

std::string ToString(const CameraInfo& info) {
  std::ostringstream out;
  out << "Name: " << info.human_name << ", Description: " << info.description
      << ", Extra: " << info.misc << ", Index: " << info.index;
  return out.str();
}

} // namespace camkit::format

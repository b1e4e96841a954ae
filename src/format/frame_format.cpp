#include "format/frame_format.hpp"

#include <algorithm>
#include <cctype>

namespace camkit::format {

const char* ToString(const FrameFormat format) {
  switch (format) {
  case FrameFormat::kMjpeg:
    return "MJPEG";
  case FrameFormat::kYuyv:
    return "YUYV";
  }
  return "MJPEG";
}

const char* ToString(const CaptureApiBackend backend) {
  switch (backend) {
  case CaptureApiBackend::kAuto:
    return "Auto";
  case CaptureApiBackend::kAvFoundation:
    return "AVFoundation";
  case CaptureApiBackend::kVideo4Linux:
    return "Video4Linux";
  case CaptureApiBackend::kUniversalVideoClass:
    return "UniversalVideoClass";
  case CaptureApiBackend::kMediaFoundation:
    return "MediaFoundation";
  case CaptureApiBackend::kOpenCv:
    return "OpenCv";
  case CaptureApiBackend::kGStreamer:
    return "GStreamer";
  case CaptureApiBackend::kBrowser:
    return "Browser";
  }
  return "Auto";
}

bool ParseFrameFormat(std::string_view raw, FrameFormat& format, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (normalized == "MJPEG" || normalized == "MJPG") {
    format = FrameFormat::kMjpeg;
    error.clear();
    return true;
  }
  if (normalized == "YUYV" || normalized == "YUY2") {
    format = FrameFormat::kYuyv;
    error.clear();
    return true;
  }

  error = "unknown frame format '" + std::string(raw) + "' (expected MJPEG|YUYV)";
  return false;
}

} // namespace camkit::format

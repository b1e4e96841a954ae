#include "format/native_format_table.hpp"

namespace camkit::format {

const std::vector<NativeFormatTag>& NativeFormatTags() {
  static const std::vector<NativeFormatTag> kTags = {
      {CaptureApiBackend::kVideo4Linux, FrameFormat::kMjpeg, "MJPG"},
      {CaptureApiBackend::kVideo4Linux, FrameFormat::kYuyv, "YUYV"},
      {CaptureApiBackend::kUniversalVideoClass, FrameFormat::kMjpeg, "MJPEG"},
      {CaptureApiBackend::kUniversalVideoClass, FrameFormat::kYuyv, "YUYV"},
      {CaptureApiBackend::kMediaFoundation, FrameFormat::kMjpeg, "MJPG"},
      {CaptureApiBackend::kMediaFoundation, FrameFormat::kYuyv, "YUY2"},
      {CaptureApiBackend::kOpenCv, FrameFormat::kMjpeg, "MJPG"},
      {CaptureApiBackend::kOpenCv, FrameFormat::kYuyv, "YUYV"},
      {CaptureApiBackend::kGStreamer, FrameFormat::kMjpeg, "image/jpeg"},
      {CaptureApiBackend::kGStreamer, FrameFormat::kYuyv, "YUY2"},
  };
  return kTags;
}

bool CarriesRawFrames(const CaptureApiBackend backend) {
  switch (backend) {
  case CaptureApiBackend::kVideo4Linux:
  case CaptureApiBackend::kUniversalVideoClass:
  case CaptureApiBackend::kMediaFoundation:
  case CaptureApiBackend::kOpenCv:
  case CaptureApiBackend::kGStreamer:
    return true;
  case CaptureApiBackend::kAuto:
  case CaptureApiBackend::kAvFoundation:
  case CaptureApiBackend::kBrowser:
    return false;
  }
  return false;
}

bool ToNativeTag(const CaptureApiBackend backend, const FrameFormat format, std::string& tag,
                 core::errors::CameraError& error) {
  for (const auto& row : NativeFormatTags()) {
    if (row.backend == backend && row.format == format) {
      tag = std::string(row.tag);
      error.Clear();
      return true;
    }
  }
  error = core::errors::NotImplementedError(std::string("no native tag for ") +
                                            ToString(format) + " on backend " +
                                            ToString(backend));
  return false;
}

bool FromNativeTag(const CaptureApiBackend backend, std::string_view tag, FrameFormat& format,
                   core::errors::CameraError& error) {
  for (const auto& row : NativeFormatTags()) {
    if (row.backend == backend && row.tag == tag) {
      format = row.format;
      error.Clear();
      return true;
    }
  }
  error = core::errors::NotImplementedError("native tag '" + std::string(tag) +
                                            "' has no frame format on backend " +
                                            ToString(backend));
  return false;
}

} // namespace camkit::format

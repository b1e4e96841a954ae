#pragma once

#include <string>
#include <string_view>

namespace camkit::format {

// Encoding of one raw camera frame as delivered by a backend.
enum class FrameFormat {
  kMjpeg = 0,
  kYuyv,
};

// Capture APIs a frame source can sit on. Closed on purpose: adding a backend
// means adding a variant here and a row to the native tag table.
enum class CaptureApiBackend {
  kAuto = 0,
  kAvFoundation,
  kVideo4Linux,
  kUniversalVideoClass,
  kMediaFoundation,
  kOpenCv,
  kGStreamer,
  kBrowser,
};

// `MJPEG` / `YUYV`.
const char* ToString(FrameFormat format);
const char* ToString(CaptureApiBackend backend);

// Case-insensitive. `MJPG` and `YUY2` are accepted as aliases because they are
// the spellings most drivers print.
bool ParseFrameFormat(std::string_view raw, FrameFormat& format, std::string& error);

} // namespace camkit::format

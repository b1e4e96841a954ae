#pragma once

#include "core/errors/camera_error.hpp"
#include "format/frame_format.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace camkit::format {

// One row of the FrameFormat <-> native encoding tag table.
struct NativeFormatTag {
  CaptureApiBackend backend = CaptureApiBackend::kAuto;
  FrameFormat format = FrameFormat::kMjpeg;
  std::string_view tag;
};

// Every row known to the library. This table is the only place backend tags
// are spelled; both conversion directions below read it.
const std::vector<NativeFormatTag>& NativeFormatTags();

// Backends that deliver raw encoded frames and therefore have rows for every
// FrameFormat. Auto, AVFoundation and Browser have none.
bool CarriesRawFrames(CaptureApiBackend backend);

// Fails with kNotImplemented when the backend has no row for `format`.
bool ToNativeTag(CaptureApiBackend backend, FrameFormat format, std::string& tag,
                 core::errors::CameraError& error);

// Exact, case-sensitive tag match. Unknown tags fail with kNotImplemented.
bool FromNativeTag(CaptureApiBackend backend, std::string_view tag, FrameFormat& format,
                   core::errors::CameraError& error);

} // namespace camkit::format

#pragma once

#include "controls/camera_control.hpp"
#include "core/errors/camera_error.hpp"
#include "format/camera_format.hpp"
#include "format/frame_format.hpp"
#include "format/resolution.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace camkit::backends {

// One encoded frame exactly as the driver delivered it.
struct RawFrame {
  format::FrameFormat format = format::FrameFormat::kMjpeg;
  format::Resolution resolution;
  std::vector<std::uint8_t> bytes;
};

// Driver-side capability behind a native camera. Implementations own their
// device handle; Close must be idempotent.
class IFrameSource {
public:
  virtual ~IFrameSource() = default;

  virtual format::CaptureApiBackend backend() const = 0;

  virtual bool Enumerate(std::vector<format::CameraInfo>& cameras,
                         core::errors::CameraError& error) = 0;

  // `negotiated` is what the driver settled on, which may differ from
  // `requested`.
  virtual bool Open(std::size_t index, const format::CameraFormat& requested,
                    format::CameraFormat& negotiated, core::errors::CameraError& error) = 0;

  virtual bool ReadFrame(RawFrame& frame, core::errors::CameraError& error) = 0;

  virtual bool Controls(std::vector<controls::CameraControl>& controls,
                        core::errors::CameraError& error) = 0;

  virtual bool Close(core::errors::CameraError& error) = 0;

  virtual bool IsOpen() const = 0;
};

} // namespace camkit::backends

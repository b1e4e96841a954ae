#pragma once

#include "backends/frame_source.hpp"
#include "codec/image_buffer.hpp"
#include "controls/camera_control.hpp"
#include "core/errors/camera_error.hpp"
#include "core/logging/logger.hpp"
#include "format/camera_format.hpp"

#include <cstddef>
#include <vector>

namespace camkit::capture {

// Cameras the source can see, sorted by index.
bool QueryCameras(backends::IFrameSource& source, std::vector<format::CameraInfo>& cameras,
                  core::errors::CameraError& error);

// Native capture path: pulls encoded frames from an IFrameSource and decodes
// them to RGB888.
//
// The source and logger are borrowed and must outlive the camera. The
// destructor closes the source if it is still open.
class Camera {
public:
  explicit Camera(backends::IFrameSource& source, core::logging::Logger* logger = nullptr);
  ~Camera();

  Camera(const Camera&) = delete;
  Camera& operator=(const Camera&) = delete;
  Camera(Camera&&) = delete;
  Camera& operator=(Camera&&) = delete;

  // Re-opening closes the previous device first.
  bool Open(std::size_t index, const format::CameraFormat& requested,
            core::errors::CameraError& error);

  bool NextRawFrame(backends::RawFrame& frame, core::errors::CameraError& error);

  // Decoded frame. The decoded byte count must match the reported resolution.
  bool NextFrame(codec::ImageBuffer& rgb, core::errors::CameraError& error);

  // Sorted by control.
  bool Controls(std::vector<controls::CameraControl>& controls,
                core::errors::CameraError& error);

  // Idempotent.
  bool Close(core::errors::CameraError& error);

  bool is_open() const {
    return open_;
  }
  std::size_t index() const {
    return index_;
  }
  // What the source negotiated on the last successful Open.
  const format::CameraFormat& camera_format() const {
    return negotiated_;
  }

private:
  bool EnsureOpen(core::errors::CameraError& error) const;

  backends::IFrameSource& source_;
  core::logging::Logger* logger_ = nullptr;
  format::CameraFormat negotiated_;
  std::size_t index_ = 0U;
  bool open_ = false;
};

} // namespace camkit::capture

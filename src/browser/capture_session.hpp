#pragma once

#include "browser/constraints.hpp"
#include "browser/media_host.hpp"
#include "codec/image_buffer.hpp"
#include "core/errors/camera_error.hpp"
#include "core/logging/logger.hpp"
#include "format/camera_format.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace camkit::browser {

// Asks the host for camera permission without keeping a stream.
bool RequestPermission(IMediaDevices& devices, core::errors::CameraError& error);

// Video inputs only. `index` is the position in the host's full device list and
// `misc` is `<group_id>:<device_id>`.
bool QueryCameras(IMediaDevices& devices, std::vector<format::CameraInfo>& cameras,
                  core::errors::CameraError& error);

// Names the host reports that this library does not know are skipped.
bool QuerySupportedConstraints(IMediaDevices& devices,
                               std::vector<SupportedConstraint>& constraints,
                               core::errors::CameraError& error);

// Owner of one negotiated media stream and its optional <video> attachment.
//
// States:
//   Open{attached:false} <-> Open{attached:true} -> Disposed
//
// Not thread-safe; one caller drives a session at a time. Frames are never
// buffered: every FrameRaw call draws fresh from the stream at the current
// preferred resolution.
class CaptureSession {
  // Only `Open` can name this, so only `Open` can construct a session.
  struct OpenKey {
    explicit OpenKey() = default;
  };

public:
  // Negotiates a stream for `constraints`. Blocks until the host resolves the
  // request; denial or unsatisfiable constraints fail with
  // StructureError{"MediaDevicesGetUserMedia", ...}. No retry.
  //
  // `devices`, `surface` and `logger` must outlive the session.
  static bool Open(IMediaDevices& devices, IRenderSurface& surface,
                   const Constraints& constraints, std::unique_ptr<CaptureSession>& session,
                   core::errors::CameraError& error, core::logging::Logger* logger = nullptr);

  CaptureSession(OpenKey key, IMediaDevices& devices, IRenderSurface& surface,
                 Constraints constraints, MediaStreamHandle stream,
                 core::logging::Logger* logger);

  // Disposes if the caller did not. Failures are logged, never thrown.
  ~CaptureSession();

  CaptureSession(const CaptureSession&) = delete;
  CaptureSession& operator=(const CaptureSession&) = delete;
  CaptureSession(CaptureSession&&) = delete;
  CaptureSession& operator=(CaptureSession&&) = delete;

  // Binds the stream to a <video> element.
  // - create_new: a new <video> is created and appended under `target_id`.
  // - otherwise `target_id` must itself be a <video> element.
  // Re-attaching replaces the recorded node; the previous node keeps its
  // source and only the session's reference to it is dropped.
  bool Attach(std::string_view target_id, bool create_new, core::errors::CameraError& error);

  // Success without side effects when nothing is attached.
  bool DeAttach(core::errors::CameraError& error);

  // One RGBA snapshot of `preferred_resolution()` size.
  bool FrameRaw(std::vector<std::uint8_t>& rgba, core::errors::CameraError& error);
  bool Frame(codec::ImageBuffer& image, core::errors::CameraError& error);
  bool RgbaFrame(codec::ImageBuffer& image, core::errors::CameraError& error);

  // width * height * (use_rgba ? 4 : 3).
  std::size_t MinBufferSize(bool use_rgba) const;

  // Captures one frame into `buffer` as RGBA (`convert_rgba`) or RGB. A buffer
  // smaller than MinBufferSize fails with kReadFrame before anything is drawn
  // or written.
  bool WriteFrameToBuffer(std::span<std::uint8_t> buffer, bool convert_rgba,
                          std::size_t& written, core::errors::CameraError& error);

  // Rebuilds the constraint snapshot from `builder` and swaps it in. On
  // failure the current snapshot stays. The live stream is not renegotiated;
  // later frames use the new preferred resolution.
  bool ApplyConstraints(const ConstraintsBuilder& builder, core::errors::CameraError& error);

  // Detaches if needed, then stops every track of the stream. Idempotent: the
  // tracks are stopped exactly once. The session is Disposed afterwards even
  // when a step failed; the failure is still reported.
  bool Dispose(core::errors::CameraError& error);

  const Constraints& constraints() const {
    return constraints_;
  }
  format::Resolution preferred_resolution() const {
    return constraints_.resolution();
  }
  MediaStreamHandle stream() const {
    return stream_;
  }
  bool attached() const {
    return attached_;
  }
  std::optional<ElementHandle> attached_node() const {
    return attached_node_;
  }
  bool disposed() const {
    return disposed_;
  }

private:
  bool EnsureOpen(core::errors::CameraError& error) const;
  bool SetAutoplayInline(ElementHandle element, core::errors::CameraError& error);
  bool SetDimensions(ElementHandle element, core::errors::CameraError& error);
  // Autoplay/inline, <video> check, dimensions, stream binding.
  bool PrepareVideoElement(ElementHandle element, core::errors::CameraError& error);
  bool DrawFrom(CanvasHandle canvas, ElementHandle video, core::errors::CameraError& error);

  IMediaDevices& devices_;
  IRenderSurface& surface_;
  core::logging::Logger* logger_ = nullptr;

  Constraints constraints_;
  MediaStreamHandle stream_;
  bool attached_ = false;
  std::optional<ElementHandle> attached_node_;
  bool disposed_ = false;
};

} // namespace camkit::browser

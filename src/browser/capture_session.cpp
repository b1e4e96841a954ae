#include "browser/capture_session.hpp"

#include "codec/pixel_codec.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace camkit::browser {

namespace {

using core::errors::CameraError;

constexpr const char* kVideoElementStructure = "HtmlVideoElement";
constexpr const char* kNotAVideoElement = "Cannot Cast - No Subtype";

// Releases a canvas on every exit path of a frame read.
class ScopedCanvas {
public:
  ScopedCanvas(IRenderSurface& surface, CanvasHandle canvas)
      : surface_(surface), canvas_(canvas) {}
  ~ScopedCanvas() {
    surface_.ReleaseCanvas(canvas_);
  }

  ScopedCanvas(const ScopedCanvas&) = delete;
  ScopedCanvas& operator=(const ScopedCanvas&) = delete;

private:
  IRenderSurface& surface_;
  CanvasHandle canvas_;
};

class ScopedElement {
public:
  ScopedElement(IRenderSurface& surface, ElementHandle element)
      : surface_(surface), element_(element) {}
  ~ScopedElement() {
    if (armed_) {
      surface_.ReleaseElement(element_);
    }
  }

  ScopedElement(const ScopedElement&) = delete;
  ScopedElement& operator=(const ScopedElement&) = delete;

  void Dismiss() {
    armed_ = false;
  }

private:
  IRenderSurface& surface_;
  ElementHandle element_;
  bool armed_ = true;
};

} // namespace

bool RequestPermission(IMediaDevices& devices, CameraError& error) {
  std::string host_error;
  if (!devices.RequestPermission(host_error)) {
    error = core::errors::StructureError("UserMediaPermission", host_error);
    return false;
  }
  error.Clear();
  return true;
}

bool QueryCameras(IMediaDevices& devices, std::vector<format::CameraInfo>& cameras,
                  CameraError& error) {
  std::vector<MediaDeviceInfo> listed;
  std::string host_error;
  if (!devices.EnumerateDevices(listed, host_error)) {
    error = core::errors::StructureError("EnumerateDevices", host_error);
    return false;
  }

  cameras.clear();
  for (std::size_t i = 0; i < listed.size(); ++i) {
    const MediaDeviceInfo& device = listed[i];
    if (device.kind != kVideoInputKind) {
      continue;
    }
    cameras.push_back(format::CameraInfo{
        .human_name = device.label,
        .description = "Videoinput",
        .misc = device.group_id + ":" + device.device_id,
        .index = i,
    });
  }
  error.Clear();
  return true;
}

bool QuerySupportedConstraints(IMediaDevices& devices,
                               std::vector<SupportedConstraint>& constraints,
                               CameraError& error) {
  std::vector<std::string> names;
  std::string host_error;
  if (!devices.SupportedConstraints(names, host_error)) {
    error = core::errors::StructureError("SupportedConstraints", host_error);
    return false;
  }

  constraints.clear();
  for (const std::string& name : names) {
    SupportedConstraint parsed = SupportedConstraint::kDeviceId;
    if (ParseSupportedConstraint(name, parsed)) {
      constraints.push_back(parsed);
    }
  }
  error.Clear();
  return true;
}

bool CaptureSession::Open(IMediaDevices& devices, IRenderSurface& surface,
                          const Constraints& constraints,
                          std::unique_ptr<CaptureSession>& session, CameraError& error,
                          core::logging::Logger* logger) {
  session.reset();

  MediaStreamHandle stream;
  std::string host_error;
  if (!devices.GetUserMedia(constraints.request(), stream, host_error)) {
    error = core::errors::StructureError("MediaDevicesGetUserMedia", host_error);
    if (logger != nullptr) {
      logger->Warn("media stream negotiation failed",
                   {{"request", constraints.request_text()}, {"error", host_error}});
    }
    return false;
  }

  session = std::make_unique<CaptureSession>(OpenKey{}, devices, surface, constraints, stream,
                                             logger);
  if (logger != nullptr) {
    logger->Info("capture session opened",
                 {{"stream", std::to_string(stream.id)},
                  {"resolution", format::ToString(constraints.resolution())}});
  }
  error.Clear();
  return true;
}

CaptureSession::CaptureSession(OpenKey /*key*/, IMediaDevices& devices,
                               IRenderSurface& surface, Constraints constraints,
                               const MediaStreamHandle stream, core::logging::Logger* logger)
    : devices_(devices),
      surface_(surface),
      logger_(logger),
      constraints_(std::move(constraints)),
      stream_(stream) {}

CaptureSession::~CaptureSession() {
  CameraError dispose_error;
  if (!Dispose(dispose_error) && logger_ != nullptr) {
    logger_->Warn("capture session teardown failed",
                  {{"error", core::errors::ToString(dispose_error)}});
  }
}

bool CaptureSession::EnsureOpen(CameraError& error) const {
  if (disposed_) {
    error = core::errors::StructureError("CaptureSession", "session is disposed");
    return false;
  }
  return true;
}

bool CaptureSession::SetAutoplayInline(const ElementHandle element, CameraError& error) {
  std::string host_error;
  if (!surface_.SetAttribute(element, "autoplay", "autoplay", host_error)) {
    error = core::errors::SetPropertyError("Video-autoplay", "autoplay", host_error);
    return false;
  }
  if (!surface_.SetAttribute(element, "playsinline", "playsinline", host_error)) {
    error = core::errors::SetPropertyError("Video-playsinline", "playsinline", host_error);
    return false;
  }
  return true;
}

bool CaptureSession::SetDimensions(const ElementHandle element, CameraError& error) {
  const format::Resolution resolution = preferred_resolution();
  std::string host_error;
  if (!surface_.SetWidth(element, resolution.width, host_error)) {
    error = core::errors::SetPropertyError("Video-width", std::to_string(resolution.width),
                                           host_error);
    return false;
  }
  if (!surface_.SetHeight(element, resolution.height, host_error)) {
    error = core::errors::SetPropertyError("Video-height", std::to_string(resolution.height),
                                           host_error);
    return false;
  }
  return true;
}

bool CaptureSession::PrepareVideoElement(const ElementHandle element, CameraError& error) {
  if (!SetAutoplayInline(element, error)) {
    return false;
  }
  if (!surface_.IsVideoElement(element)) {
    error = core::errors::StructureError(kVideoElementStructure, kNotAVideoElement);
    return false;
  }
  if (!SetDimensions(element, error)) {
    return false;
  }
  std::string host_error;
  if (!surface_.SetSourceObject(element, stream_, host_error)) {
    error = core::errors::StructureError(kVideoElementStructure,
                                         "failed to bind stream: " + host_error);
    return false;
  }
  return true;
}

bool CaptureSession::Attach(std::string_view target_id, const bool create_new,
                            CameraError& error) {
  if (!EnsureOpen(error)) {
    return false;
  }

  ElementHandle target;
  std::string host_error;
  if (!surface_.GetElementById(target_id, target, host_error)) {
    error = core::errors::StructureError("Document " + std::string(target_id), host_error);
    return false;
  }
  ScopedElement target_guard(surface_, target);

  ElementHandle node = target;
  if (create_new) {
    ElementHandle video;
    if (!surface_.CreateElement("video", video, host_error)) {
      error = core::errors::StructureError("Document Video Element", host_error);
      return false;
    }
    ScopedElement video_guard(surface_, video);

    if (!PrepareVideoElement(video, error)) {
      return false;
    }
    if (!surface_.AppendChild(target, video, node, host_error)) {
      error = core::errors::StructureError("Attach Error", host_error);
      return false;
    }
    if (node == video) {
      video_guard.Dismiss();
    }
  } else {
    if (!PrepareVideoElement(target, error)) {
      return false;
    }
    target_guard.Dismiss();
  }

  if (attached_node_.has_value() && !(attached_node_.value() == node)) {
    surface_.ReleaseElement(attached_node_.value());
  }
  attached_node_ = node;
  attached_ = true;

  if (logger_ != nullptr) {
    logger_->Info("capture session attached",
                  {{"target", target_id},
                   {"create_new", create_new ? "true" : "false"},
                   {"node", std::to_string(node.id)}});
  }
  error.Clear();
  return true;
}

bool CaptureSession::DeAttach(CameraError& error) {
  if (!EnsureOpen(error)) {
    return false;
  }
  if (!attached_ || !attached_node_.has_value()) {
    attached_ = false;
    error.Clear();
    return true;
  }

  const ElementHandle node = attached_node_.value();
  if (!surface_.IsVideoElement(node)) {
    error = core::errors::StructureError(kVideoElementStructure, kNotAVideoElement);
    return false;
  }
  std::string host_error;
  if (!surface_.SetSourceObject(node, std::nullopt, host_error)) {
    error = core::errors::StructureError(kVideoElementStructure,
                                         "failed to clear source: " + host_error);
    return false;
  }

  surface_.ReleaseElement(node);
  attached_node_.reset();
  attached_ = false;

  if (logger_ != nullptr) {
    logger_->Debug("capture session detached", {{"node", std::to_string(node.id)}});
  }
  error.Clear();
  return true;
}

bool CaptureSession::DrawFrom(const CanvasHandle canvas, const ElementHandle video,
                              CameraError& error) {
  std::string host_error;
  if (!surface_.DrawVideo(canvas, video, preferred_resolution(), host_error)) {
    error = core::errors::ReadFrameError("drawing video into canvas failed: " + host_error);
    return false;
  }
  return true;
}

bool CaptureSession::FrameRaw(std::vector<std::uint8_t>& rgba, CameraError& error) {
  if (!EnsureOpen(error)) {
    return false;
  }

  const format::Resolution resolution = preferred_resolution();
  if (resolution.IsEmpty()) {
    error = core::errors::ReadFrameError("preferred resolution " + format::ToString(resolution) +
                                         " has zero area");
    return false;
  }

  CanvasHandle canvas;
  std::string host_error;
  if (!surface_.CreateCanvas(resolution, canvas, host_error)) {
    error = core::errors::StructureError("HtmlCanvasElement Context 2D", host_error);
    return false;
  }
  ScopedCanvas canvas_guard(surface_, canvas);

  if (attached_ && attached_node_.has_value()) {
    const ElementHandle video = attached_node_.value();
    if (!surface_.IsVideoElement(video)) {
      error = core::errors::StructureError(kVideoElementStructure, kNotAVideoElement);
      return false;
    }
    // Constraints may have changed since Attach.
    if (!SetDimensions(video, error)) {
      return false;
    }
    if (!DrawFrom(canvas, video, error)) {
      return false;
    }
  } else {
    ElementHandle video;
    if (!surface_.CreateElement("video", video, host_error)) {
      error = core::errors::StructureError("Document Video Element", host_error);
      return false;
    }
    ScopedElement video_guard(surface_, video);
    if (!PrepareVideoElement(video, error)) {
      return false;
    }
    if (!DrawFrom(canvas, video, error)) {
      return false;
    }
  }

  std::vector<std::uint8_t> pixels;
  if (!surface_.ReadPixels(canvas, resolution, pixels, host_error)) {
    error = core::errors::ReadFrameError("reading canvas pixels failed: " + host_error);
    return false;
  }

  rgba = std::move(pixels);
  error.Clear();
  return true;
}

bool CaptureSession::RgbaFrame(codec::ImageBuffer& image, CameraError& error) {
  std::vector<std::uint8_t> rgba;
  if (!FrameRaw(rgba, error)) {
    return false;
  }
  return codec::MakeImageBuffer(preferred_resolution(), codec::PixelLayout::kRgba8888,
                                std::move(rgba), image, error);
}

bool CaptureSession::Frame(codec::ImageBuffer& image, CameraError& error) {
  codec::ImageBuffer rgba_image;
  if (!RgbaFrame(rgba_image, error)) {
    return false;
  }
  std::vector<std::uint8_t> rgb;
  if (!codec::RgbaToRgb888(rgba_image.pixels, rgb, error)) {
    return false;
  }
  return codec::MakeImageBuffer(rgba_image.resolution, codec::PixelLayout::kRgb888,
                                std::move(rgb), image, error);
}

std::size_t CaptureSession::MinBufferSize(const bool use_rgba) const {
  return codec::ExpectedByteCount(preferred_resolution(), use_rgba
                                                              ? codec::PixelLayout::kRgba8888
                                                              : codec::PixelLayout::kRgb888);
}

bool CaptureSession::WriteFrameToBuffer(std::span<std::uint8_t> buffer, const bool convert_rgba,
                                        std::size_t& written, CameraError& error) {
  written = 0U;
  if (!EnsureOpen(error)) {
    return false;
  }

  const std::size_t required = MinBufferSize(convert_rgba);
  if (buffer.size() < required) {
    error = core::errors::ReadFrameError("destination buffer holds " +
                                         std::to_string(buffer.size()) + " bytes, frame needs " +
                                         std::to_string(required));
    return false;
  }

  codec::ImageBuffer image;
  if (!(convert_rgba ? RgbaFrame(image, error) : Frame(image, error))) {
    return false;
  }
  // MakeImageBuffer pinned the frame to exactly `required` bytes.
  std::copy(image.pixels.begin(), image.pixels.end(), buffer.begin());
  written = image.pixels.size();
  error.Clear();
  return true;
}

bool CaptureSession::ApplyConstraints(const ConstraintsBuilder& builder, CameraError& error) {
  if (!EnsureOpen(error)) {
    return false;
  }

  Constraints rebuilt;
  if (!builder.Build(rebuilt, error)) {
    if (logger_ != nullptr) {
      logger_->Warn("constraints rejected", {{"error", core::errors::ToString(error)}});
    }
    return false;
  }

  constraints_ = std::move(rebuilt);
  if (logger_ != nullptr) {
    logger_->Debug("constraints applied", {{"request", constraints_.request_text()}});
  }
  return true;
}

bool CaptureSession::Dispose(CameraError& error) {
  if (disposed_) {
    error.Clear();
    return true;
  }

  CameraError first_error;
  if (attached_) {
    CameraError detach_error;
    if (!DeAttach(detach_error)) {
      first_error = detach_error;
      // The node cannot be detached cleanly; still give up our reference.
      if (attached_node_.has_value()) {
        surface_.ReleaseElement(attached_node_.value());
      }
      attached_node_.reset();
      attached_ = false;
    }
  }

  std::string host_error;
  if (!devices_.StopTracks(stream_, host_error) && first_error.ok()) {
    first_error = core::errors::StructureError("MediaStreamTrack", "stop failed: " + host_error);
  }
  disposed_ = true;

  if (logger_ != nullptr) {
    logger_->Info("capture session disposed", {{"stream", std::to_string(stream_.id)}});
  }

  if (!first_error.ok()) {
    error = first_error;
    return false;
  }
  error.Clear();
  return true;
}

} // namespace camkit::browser

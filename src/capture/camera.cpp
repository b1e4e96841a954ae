#include "capture/camera.hpp"

#include "codec/pixel_codec.hpp"

#include <algorithm>
#include <string>

namespace camkit::capture {

bool QueryCameras(backends::IFrameSource& source, std::vector<format::CameraInfo>& cameras,
                  core::errors::CameraError& error) {
  if (!source.Enumerate(cameras, error)) {
    return false;
  }
  std::sort(cameras.begin(), cameras.end());
  return true;
}

Camera::Camera(backends::IFrameSource& source, core::logging::Logger* logger)
    : source_(source), logger_(logger) {}

Camera::~Camera() {
  core::errors::CameraError close_error;
  if (!Close(close_error) && logger_ != nullptr) {
    logger_->Warn("camera close failed", {{"error", core::errors::ToString(close_error)}});
  }
}

bool Camera::EnsureOpen(core::errors::CameraError& error) const {
  if (!open_) {
    error = core::errors::StructureError("Camera", "camera is not open");
    return false;
  }
  return true;
}

bool Camera::Open(const std::size_t index, const format::CameraFormat& requested,
                  core::errors::CameraError& error) {
  if (open_ && !Close(error)) {
    return false;
  }

  format::CameraFormat negotiated;
  if (!source_.Open(index, requested, negotiated, error)) {
    if (logger_ != nullptr) {
      logger_->Error("camera open failed", {{"index", std::to_string(index)},
                                            {"requested", format::ToString(requested)},
                                            {"error", core::errors::ToString(error)}});
    }
    return false;
  }

  negotiated_ = negotiated;
  index_ = index;
  open_ = true;
  if (logger_ != nullptr) {
    logger_->Info("camera opened", {{"index", std::to_string(index)},
                                    {"backend", format::ToString(source_.backend())},
                                    {"format", format::ToString(negotiated_)}});
    if (!(negotiated_ == requested)) {
      logger_->Debug("driver adjusted requested format",
                     {{"requested", format::ToString(requested)}});
    }
  }
  error.Clear();
  return true;
}

bool Camera::NextRawFrame(backends::RawFrame& frame, core::errors::CameraError& error) {
  if (!EnsureOpen(error)) {
    return false;
  }
  return source_.ReadFrame(frame, error);
}

bool Camera::NextFrame(codec::ImageBuffer& rgb, core::errors::CameraError& error) {
  backends::RawFrame frame;
  if (!NextRawFrame(frame, error)) {
    return false;
  }
  if (!codec::DecodeToRgb888(frame.format, frame.resolution, frame.bytes, rgb, error)) {
    if (logger_ != nullptr) {
      logger_->Warn("frame decode failed", {{"format", format::ToString(frame.format)},
                                            {"bytes", std::to_string(frame.bytes.size())},
                                            {"error", core::errors::ToString(error)}});
    }
    return false;
  }
  return true;
}

bool Camera::Controls(std::vector<controls::CameraControl>& controls,
                      core::errors::CameraError& error) {
  if (!EnsureOpen(error)) {
    return false;
  }
  if (!source_.Controls(controls, error)) {
    return false;
  }
  std::sort(controls.begin(), controls.end());
  return true;
}

bool Camera::Close(core::errors::CameraError& error) {
  if (!open_) {
    error.Clear();
    return true;
  }
  if (!source_.Close(error)) {
    return false;
  }
  open_ = false;
  if (logger_ != nullptr) {
    logger_->Debug("camera closed", {{"index", std::to_string(index_)}});
  }
  return true;
}

} // namespace camkit::capture

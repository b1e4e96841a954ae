#pragma once

#include "backends/frame_source.hpp"

#include <cstddef>
#include <memory>

namespace camkit::backends::opencv {

// IFrameSource over cv::VideoCapture.
//
// RGB conversion is switched off after open so reads return the encoded
// payload (MJPEG or YUYV) the camera sent. OpenCV reports no control ranges,
// so Controls always fails with kNotImplemented.
//
// Built without OpenCV, every device call fails with a
// `BACKEND_NOT_AVAILABLE` detail.
class OpenCvFrameSource final : public IFrameSource {
public:
  // Enumerate probes indices 0..max_probe_index.
  explicit OpenCvFrameSource(std::size_t max_probe_index = 8U);
  ~OpenCvFrameSource() override;

  OpenCvFrameSource(const OpenCvFrameSource&) = delete;
  OpenCvFrameSource& operator=(const OpenCvFrameSource&) = delete;

  format::CaptureApiBackend backend() const override;

  bool Enumerate(std::vector<format::CameraInfo>& cameras,
                 core::errors::CameraError& error) override;
  bool Open(std::size_t index, const format::CameraFormat& requested,
            format::CameraFormat& negotiated, core::errors::CameraError& error) override;
  bool ReadFrame(RawFrame& frame, core::errors::CameraError& error) override;
  bool Controls(std::vector<controls::CameraControl>& controls,
                core::errors::CameraError& error) override;
  bool Close(core::errors::CameraError& error) override;
  bool IsOpen() const override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::size_t max_probe_index_ = 8U;
};

} // namespace camkit::backends::opencv

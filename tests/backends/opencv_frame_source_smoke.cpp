#include "backends/opencv/opencv_bootstrap.hpp"
#include "backends/opencv/opencv_frame_source.hpp"
#include "capture/camera.hpp"

#include "common/assertions.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  using camkit::backends::RawFrame;
  using camkit::backends::opencv::OpenCvFrameSource;
  using camkit::core::errors::CameraError;
  using camkit::core::errors::CameraErrorKind;
  using camkit::tests::common::AssertContains;
  using camkit::tests::common::Fail;

  OpenCvFrameSource source(0U);
  if (source.backend() != camkit::format::CaptureApiBackend::kOpenCv) {
    Fail("opencv frame source should report the OpenCv backend");
  }
  if (source.IsOpen()) {
    Fail("new frame source should not be open");
  }

  CameraError error;
  std::vector<camkit::format::CameraInfo> cameras;
  const bool enumerated = source.Enumerate(cameras, error);

  // No camera exists at this index on build machines.
  const camkit::format::CameraFormat requested;
  camkit::format::CameraFormat negotiated;
  if (source.Open(63U, requested, negotiated, error)) {
    Fail("opening a missing camera index should fail");
  }

  if (camkit::backends::opencv::IsOpenCvEnabled()) {
    if (!enumerated) {
      Fail("enumerate should succeed with OpenCV: " + camkit::core::errors::ToString(error));
    }
    if (error.kind != CameraErrorKind::kStructure || error.structure != "VideoCapture") {
      Fail("missing camera should fail with a VideoCapture structure error");
    }
    AssertContains(camkit::backends::opencv::OpenCvDetail(), "OpenCV");
  } else {
    if (enumerated || !cameras.empty()) {
      Fail("enumerate should fail without OpenCV");
    }
    if (error.kind != CameraErrorKind::kNotImplemented) {
      Fail("missing OpenCV should report not-implemented");
    }
    AssertContains(error.detail, "BACKEND_NOT_AVAILABLE");
    if (camkit::backends::opencv::OpenCvStatusText() != std::string("disabled")) {
      Fail("status text should be disabled without OpenCV");
    }
  }

  RawFrame frame;
  if (source.ReadFrame(frame, error)) {
    Fail("reading from an unopened source should fail");
  }

  std::vector<camkit::controls::CameraControl> controls;
  if (source.Controls(controls, error) || error.kind != CameraErrorKind::kNotImplemented) {
    Fail("controls should be not-implemented for OpenCV");
  }

  if (!source.Close(error) || !source.Close(error)) {
    Fail("close should be idempotent");
  }

  camkit::capture::Camera camera(source);
  if (camera.Open(63U, requested, error) || camera.is_open()) {
    Fail("camera open should propagate the source failure");
  }

  std::cout << "opencv_frame_source_smoke: ok\n";
  return 0;
}

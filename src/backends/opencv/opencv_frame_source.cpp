#include "backends/opencv/opencv_frame_source.hpp"

#include "format/native_format_table.hpp"

#include <climits>
#include <cmath>
#include <string>
#include <utility>

#if CAMKIT_ENABLE_OPENCV
#include <opencv2/core/mat.hpp>
#include <opencv2/videoio.hpp>
#endif

namespace camkit::backends::opencv {

namespace {

using core::errors::CameraError;

constexpr const char* kCaptureStructure = "VideoCapture";

#if CAMKIT_ENABLE_OPENCV
int ToOpenCvFourcc(std::string_view code) {
  return cv::VideoWriter::fourcc(code[0], code[1], code[2], code[3]);
}

std::string DecodeOpenCvFourcc(const int value) {
  std::string decoded(4, ' ');
  decoded[0] = static_cast<char>(value & 0xFF);
  decoded[1] = static_cast<char>((value >> 8) & 0xFF);
  decoded[2] = static_cast<char>((value >> 16) & 0xFF);
  decoded[3] = static_cast<char>((value >> 24) & 0xFF);
  return decoded;
}

// 0 when OpenCV cannot report the property.
std::uint32_t ReadPositiveProperty(cv::VideoCapture& capture, const int property) {
  const double value = capture.get(property);
  if (!std::isfinite(value) || value <= 0.0) {
    return 0U;
  }
  return static_cast<std::uint32_t>(std::lround(value));
}
#else
CameraError NotCompiled() {
  return core::errors::NotImplementedError(
      "BACKEND_NOT_AVAILABLE: OpenCV frame source is not compiled in this build");
}
#endif

} // namespace

struct OpenCvFrameSource::Impl {
  format::CameraFormat negotiated;
#if CAMKIT_ENABLE_OPENCV
  cv::VideoCapture capture;
#endif
};

OpenCvFrameSource::OpenCvFrameSource(const std::size_t max_probe_index)
    : impl_(std::make_unique<Impl>()), max_probe_index_(max_probe_index) {}

OpenCvFrameSource::~OpenCvFrameSource() {
  CameraError close_error;
  (void)Close(close_error);
}

format::CaptureApiBackend OpenCvFrameSource::backend() const {
  return format::CaptureApiBackend::kOpenCv;
}

bool OpenCvFrameSource::Enumerate(std::vector<format::CameraInfo>& cameras, CameraError& error) {
  cameras.clear();
#if CAMKIT_ENABLE_OPENCV
  for (std::size_t index = 0; index <= max_probe_index_ && index <= INT_MAX; ++index) {
    cv::VideoCapture probe;
    if (!probe.open(static_cast<int>(index), cv::CAP_ANY)) {
      continue;
    }
    cameras.push_back(format::CameraInfo{
        .human_name = "OpenCV camera " + std::to_string(index),
        .description = probe.getBackendName(),
        .misc = "index=" + std::to_string(index),
        .index = index,
    });
    probe.release();
  }
  error.Clear();
  return true;
#else
  error = NotCompiled();
  return false;
#endif
}

bool OpenCvFrameSource::Open(const std::size_t index, const format::CameraFormat& requested,
                             format::CameraFormat& negotiated, CameraError& error) {
#if CAMKIT_ENABLE_OPENCV
  if (index > static_cast<std::size_t>(INT_MAX)) {
    error = core::errors::StructureError(kCaptureStructure,
                                         "camera index is out of range for OpenCV");
    return false;
  }

  std::string fourcc;
  if (!format::ToNativeTag(backend(), requested.format(), fourcc, error)) {
    return false;
  }

  cv::VideoCapture capture;
  if (!capture.open(static_cast<int>(index), cv::CAP_ANY)) {
    error = core::errors::StructureError(kCaptureStructure, "could not open camera index " +
                                                                std::to_string(index));
    return false;
  }

  // Drivers may ignore any of these; the readback below is authoritative.
  capture.set(cv::CAP_PROP_FOURCC, static_cast<double>(ToOpenCvFourcc(fourcc)));
  capture.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(requested.width()));
  capture.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(requested.height()));
  capture.set(cv::CAP_PROP_FPS, static_cast<double>(requested.frame_rate()));
  if (!capture.set(cv::CAP_PROP_CONVERT_RGB, 0.0)) {
    error = core::errors::StructureError(kCaptureStructure,
                                         "backend cannot deliver raw encoded frames");
    return false;
  }

  const double raw_fourcc = capture.get(cv::CAP_PROP_FOURCC);
  if (!std::isfinite(raw_fourcc) || raw_fourcc <= 0.0) {
    error = core::errors::StructureError(kCaptureStructure, "could not read back pixel format");
    return false;
  }
  format::FrameFormat frame_format = requested.format();
  if (!format::FromNativeTag(backend(), DecodeOpenCvFourcc(static_cast<int>(raw_fourcc)),
                             frame_format, error)) {
    return false;
  }

  const std::uint32_t width = ReadPositiveProperty(capture, cv::CAP_PROP_FRAME_WIDTH);
  const std::uint32_t height = ReadPositiveProperty(capture, cv::CAP_PROP_FRAME_HEIGHT);
  const std::uint32_t fps = ReadPositiveProperty(capture, cv::CAP_PROP_FPS);
  impl_->negotiated = format::CameraFormat(width == 0U ? requested.width() : width,
                                           height == 0U ? requested.height() : height,
                                           frame_format,
                                           fps == 0U ? requested.frame_rate() : fps);

  impl_->capture.release();
  impl_->capture = std::move(capture);
  negotiated = impl_->negotiated;
  error.Clear();
  return true;
#else
  (void)index;
  (void)requested;
  (void)negotiated;
  error = NotCompiled();
  return false;
#endif
}

bool OpenCvFrameSource::ReadFrame(RawFrame& frame, CameraError& error) {
#if CAMKIT_ENABLE_OPENCV
  if (!impl_->capture.isOpened()) {
    error = core::errors::StructureError(kCaptureStructure, "camera must be open before reading");
    return false;
  }

  cv::Mat encoded;
  if (!impl_->capture.read(encoded)) {
    error = core::errors::ReadFrameError("OpenCV read returned no frame");
    return false;
  }
  if (encoded.empty()) {
    error = core::errors::ReadFrameError("OpenCV returned an empty frame");
    return false;
  }

  const std::size_t row_bytes = encoded.cols * encoded.elemSize();
  std::vector<std::uint8_t> bytes;
  bytes.reserve(row_bytes * static_cast<std::size_t>(encoded.rows));
  for (int row = 0; row < encoded.rows; ++row) {
    const std::uint8_t* begin = encoded.ptr<std::uint8_t>(row);
    bytes.insert(bytes.end(), begin, begin + row_bytes);
  }

  frame.format = impl_->negotiated.format();
  frame.resolution = impl_->negotiated.resolution();
  frame.bytes = std::move(bytes);
  error.Clear();
  return true;
#else
  (void)frame;
  error = NotCompiled();
  return false;
#endif
}

bool OpenCvFrameSource::Controls(std::vector<controls::CameraControl>& controls,
                                 CameraError& error) {
  controls.clear();
  error = core::errors::NotImplementedError("OpenCV does not report camera control ranges");
  return false;
}

bool OpenCvFrameSource::Close(CameraError& error) {
  error.Clear();
#if CAMKIT_ENABLE_OPENCV
  if (impl_->capture.isOpened()) {
    impl_->capture.release();
  }
#endif
  return true;
}

bool OpenCvFrameSource::IsOpen() const {
#if CAMKIT_ENABLE_OPENCV
  return impl_->capture.isOpened();
#else
  return false;
#endif
}

} // namespace camkit::backends::opencv

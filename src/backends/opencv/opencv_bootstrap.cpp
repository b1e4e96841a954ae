#include "backends/opencv/opencv_bootstrap.hpp"

#if CAMKIT_ENABLE_OPENCV
#include <opencv2/core/version.hpp>
#endif

namespace camkit::backends::opencv {

bool IsOpenCvEnabled() {
#if CAMKIT_ENABLE_OPENCV
  return true;
#else
  return false;
#endif
}

const char* OpenCvStatusText() {
  return IsOpenCvEnabled() ? "enabled" : "disabled";
}

std::string OpenCvDetail() {
#if CAMKIT_ENABLE_OPENCV
  return std::string("OpenCV ") + CV_VERSION;
#else
  return "OpenCV not compiled; MJPEG decode and native capture unavailable";
#endif
}

} // namespace camkit::backends::opencv

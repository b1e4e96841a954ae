#pragma once

#include <string>

namespace camkit::backends::opencv {

// Whether OpenCV (capture and JPEG decode) was compiled into this binary.
bool IsOpenCvEnabled();

// `enabled` or `disabled`.
const char* OpenCvStatusText();

// `OpenCV 4.6.0` style detail for `camkit version`.
std::string OpenCvDetail();

} // namespace camkit::backends::opencv

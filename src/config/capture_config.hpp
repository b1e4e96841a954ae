#pragma once

#include "browser/constraints.hpp"
#include "core/logging/logger.hpp"
#include "format/camera_format.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace camkit::config {

// Everything a capture run needs. Every section of the JSON file is optional
// and missing fields keep the defaults below.
//
//   {
//     "log_level": "info",
//     "device": {"index": 0},
//     "format": {"width": 1280, "height": 720, "frame_format": "MJPEG", "fps": 30},
//     "constraints": {"width": 640, "height": 480, "resolution_exact": false, ...}
//   }
struct CaptureConfig {
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
  std::size_t device_index = 0U;
  format::CameraFormat format;
  browser::ConstraintDirectives constraints;
};

// Strict: wrong types, out-of-range numbers, unknown keys and unknown enum
// names fail with the offending JSON path in `error`.
bool ParseCaptureConfigText(std::string_view json_text, CaptureConfig& config,
                            std::string& error);

bool LoadCaptureConfigFile(const std::filesystem::path& path, CaptureConfig& config,
                           std::string& error);

} // namespace camkit::config

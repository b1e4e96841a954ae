#pragma once

namespace camkit::core::errors {

// Exit status of the `camkit` CLI. Each failing stage has its own code:
// config load (10), device open (20) and frame decode (30). 1 covers I/O on
// input and output files, 2 a malformed command line.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kDeviceOpenFailed = 20,
  kFrameDecodeFailed = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camkit::core::errors

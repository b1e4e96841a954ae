#pragma once

#include "backends/frame_source.hpp"
#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>

namespace camkit::cli {

// Inputs of `camkit capture`, shared with in-process callers that bring their
// own frame source.
struct CaptureOptions {
  std::filesystem::path config_path;
  std::filesystem::path output_path;
  // Overrides the config file's `log_level` when set.
  std::optional<core::logging::LogLevel> log_level;
};

// Loads the config, opens the configured device on `source`, decodes one frame
// and writes it as PPM. Returns a process exit code (see Dispatch).
int ExecuteCapture(const CaptureOptions& options, backends::IFrameSource& source);

// Routes `camkit` subcommands. Exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => capture config invalid
//   20 => camera could not be opened
//   30 => frame could not be read or decoded
int Dispatch(int argc, char** argv);

} // namespace camkit::cli

#include "backends/testing/scripted_frame_source.hpp"
#include "camkit/cli/router.hpp"

#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

int main() {
  using camkit::backends::RawFrame;
  using camkit::backends::testing::ScriptedFrameSource;
  using camkit::cli::CaptureOptions;
  using camkit::format::FrameFormat;
  using camkit::format::Resolution;
  using camkit::tests::common::AssertContains;
  using camkit::tests::common::DispatchArgs;
  using camkit::tests::common::Fail;
  using camkit::tests::common::ReadFileToString;
  using camkit::tests::common::WriteFileOrFail;

  const camkit::tests::common::ScopedTempDir temp("camkit-cli-capture-smoke");
  const std::filesystem::path config_path = temp.path() / "capture.json";
  WriteFileOrFail(config_path, R"({
    "log_level": "error",
    "device": {"index": 0},
    "format": {"width": 2, "height": 1, "frame_format": "YUYV", "fps": 30}
  })");

  const RawFrame good{
      .format = FrameFormat::kYuyv,
      .resolution = Resolution{2U, 1U},
      .bytes = {235U, 128U, 16U, 128U},
  };
  const RawFrame truncated{
      .format = FrameFormat::kYuyv,
      .resolution = Resolution{2U, 1U},
      .bytes = {235U, 128U},
  };

  CaptureOptions options;
  options.config_path = config_path;
  options.output_path = temp.path() / "frames" / "frame.ppm";

  ScriptedFrameSource source(std::vector<RawFrame>{good});
  int exit_code = camkit::cli::ExecuteCapture(options, source);
  if (exit_code != 0) {
    Fail("capture should succeed (exit_code=" + std::to_string(exit_code) + ")");
  }
  const std::string ppm = ReadFileToString(options.output_path);
  if (ppm != std::string("P6\n2 1\n255\n\xFF\xFF\xFF\x00\x00\x00", 17U)) {
    Fail("captured ppm should hold one white and one black pixel");
  }
  if (source.IsOpen() || source.close_calls() != 1U) {
    Fail("capture should close the source");
  }

  ScriptedFrameSource busy(std::vector<RawFrame>{good});
  busy.FailNextOpen(camkit::core::errors::StructureError("VideoCapture", "device busy"));
  if (camkit::cli::ExecuteCapture(options, busy) != 20) {
    Fail("open failure should exit 20");
  }

  ScriptedFrameSource broken(std::vector<RawFrame>{truncated});
  if (camkit::cli::ExecuteCapture(options, broken) != 30) {
    Fail("decode failure should exit 30");
  }

  ScriptedFrameSource empty(std::vector<RawFrame>{});
  if (camkit::cli::ExecuteCapture(options, empty) != 30) {
    Fail("missing frame should exit 30");
  }

  CaptureOptions bad_config = options;
  bad_config.config_path = temp.path() / "missing.json";
  ScriptedFrameSource unused(std::vector<RawFrame>{good});
  if (camkit::cli::ExecuteCapture(bad_config, unused) != 10 || unused.open_calls() != 0U) {
    Fail("missing config should exit 10 before opening the device");
  }

  CaptureOptions blocked = options;
  WriteFileOrFail(temp.path() / "occupied", "file");
  blocked.output_path = temp.path() / "occupied" / "frame.ppm";
  ScriptedFrameSource blocked_source(std::vector<RawFrame>{good});
  if (camkit::cli::ExecuteCapture(blocked, blocked_source) != 1) {
    Fail("unwritable output should exit 1");
  }

  if (DispatchArgs({"camkit", "capture", config_path.string()}) != 2) {
    Fail("capture without --out should be a usage error");
  }
  if (DispatchArgs({"camkit", "capture", config_path.string(), "--out",
                    options.output_path.string(), "--log-level", "loud"}) != 2) {
    Fail("invalid log level should be a usage error");
  }
  if (DispatchArgs({"camkit", "capture", "a.json", "b.json", "--out", "x.ppm"}) != 2) {
    Fail("two config paths should be a usage error");
  }

  AssertContains(ReadFileToString(config_path), "YUYV");
  std::cout << "cli_capture_smoke: ok\n";
  return 0;
}

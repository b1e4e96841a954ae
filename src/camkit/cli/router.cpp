#include "camkit/cli/router.hpp"

#include "backends/opencv/opencv_bootstrap.hpp"
#include "backends/opencv/opencv_frame_source.hpp"
#include "browser/constraints.hpp"
#include "capture/camera.hpp"
#include "codec/pixel_codec.hpp"
#include "codec/ppm_writer.hpp"
#include "config/capture_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "format/frame_format.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace camkit::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitDeviceOpenFailed =
    core::errors::ToInt(core::errors::ExitCode::kDeviceOpenFailed);
constexpr int kExitFrameDecodeFailed =
    core::errors::ToInt(core::errors::ExitCode::kFrameDecodeFailed);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camkit list-devices [--max-index <n>]\n"
      << "  camkit constraints <config.json>\n"
      << "  camkit convert --format <yuyv|mjpeg> --width <w> --height <h> --in <raw> "
         "--out <image.ppm>\n"
      << "  camkit capture <config.json> --out <image.ppm> "
         "[--log-level <debug|info|warn|error>]\n"
      << "  camkit version\n";
}

bool ParseUnsignedArg(std::string_view flag, std::string_view raw, const std::uint64_t max,
                      std::uint64_t& out, std::string& error) {
  std::uint64_t parsed = 0U;
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (raw.empty() || ec != std::errc{} || end != raw.data() + raw.size() || parsed > max) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) + "'";
    return false;
  }
  out = parsed;
  return true;
}

bool ReadBinaryFile(const fs::path& path, std::vector<std::uint8_t>& bytes, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to read input file: " + path.string();
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "camkit 0.1.0\n"
            << "opencv: " << backends::opencv::OpenCvStatusText() << " ("
            << backends::opencv::OpenCvDetail() << ")\n";
  return kExitSuccess;
}

int CommandListDevices(const std::vector<std::string_view>& args) {
  std::uint64_t max_index = 8U;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--max-index") {
      if (i + 1 >= args.size()) {
        std::cerr << "error: missing value for --max-index\n";
        return kExitUsage;
      }
      if (!ParseUnsignedArg("--max-index", args[i + 1], 64U, max_index, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      ++i;
      continue;
    }
    std::cerr << "error: unknown option: " << args[i] << '\n';
    return kExitUsage;
  }

  backends::opencv::OpenCvFrameSource source(static_cast<std::size_t>(max_index));
  std::vector<format::CameraInfo> cameras;
  core::errors::CameraError camera_error;
  if (!capture::QueryCameras(source, cameras, camera_error)) {
    std::cerr << "error: " << core::errors::ToString(camera_error) << '\n';
    return kExitDeviceOpenFailed;
  }

  std::cout << "devices: " << cameras.size() << '\n';
  for (const auto& camera : cameras) {
    std::cout << "  - " << format::ToString(camera) << '\n';
  }
  return kExitSuccess;
}

int CommandConstraints(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: constraints requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  config::CaptureConfig capture_config;
  std::string error;
  if (!config::LoadCaptureConfigFile(fs::path(args.front()), capture_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  browser::Constraints constraints;
  core::errors::CameraError build_error;
  if (!browser::ConstraintsBuilder(capture_config.constraints).Build(constraints, build_error)) {
    std::cerr << "error: " << core::errors::ToString(build_error) << '\n';
    return kExitConfigInvalid;
  }

  std::cout << constraints.request_text() << '\n';
  return kExitSuccess;
}

struct ConvertOptions {
  format::FrameFormat frame_format = format::FrameFormat::kYuyv;
  bool has_format = false;
  format::Resolution resolution;
  fs::path input_path;
  fs::path output_path;
};

bool ParseConvertOptions(const std::vector<std::string_view>& args, ConvertOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token != "--format" && token != "--width" && token != "--height" && token != "--in" &&
        token != "--out") {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[++i];

    if (token == "--format") {
      if (!format::ParseFrameFormat(value, options.frame_format, error)) {
        return false;
      }
      options.has_format = true;
    } else if (token == "--in") {
      options.input_path = fs::path(value);
    } else if (token == "--out") {
      options.output_path = fs::path(value);
    } else {
      std::uint64_t parsed = 0U;
      if (!ParseUnsignedArg(token, value, std::numeric_limits<std::uint32_t>::max(), parsed,
                            error)) {
        return false;
      }
      (token == "--width" ? options.resolution.width : options.resolution.height) =
          static_cast<std::uint32_t>(parsed);
    }
  }

  if (!options.has_format || options.input_path.empty() || options.output_path.empty()) {
    error = "convert requires --format, --in and --out";
    return false;
  }
  if (options.resolution.IsEmpty()) {
    error = "convert requires a non-zero --width and --height";
    return false;
  }
  return true;
}

int CommandConvert(const std::vector<std::string_view>& args) {
  ConvertOptions options;
  std::string error;
  if (!ParseConvertOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  std::vector<std::uint8_t> bytes;
  if (!ReadBinaryFile(options.input_path, bytes, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  codec::ImageBuffer image;
  core::errors::CameraError decode_error;
  if (!codec::DecodeToRgb888(options.frame_format, options.resolution, bytes, image,
                             decode_error)) {
    std::cerr << "error: " << core::errors::ToString(decode_error) << '\n';
    return kExitFrameDecodeFailed;
  }

  if (!codec::WritePpm(options.output_path, image, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "wrote: " << options.output_path.string() << '\n';
  return kExitSuccess;
}

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for --out";
        return false;
      }
      options.output_path = fs::path(args[++i]);
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[++i], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "capture accepts exactly 1 config path";
      return false;
    }
    options.config_path = fs::path(token);
  }

  if (options.config_path.empty()) {
    error = "capture requires exactly 1 argument: <config.json>";
    return false;
  }
  if (options.output_path.empty()) {
    error = "capture requires --out <image.ppm>";
    return false;
  }
  return true;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CaptureOptions options;
  std::string error;
  if (!ParseCaptureOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  backends::opencv::OpenCvFrameSource source;
  return ExecuteCapture(options, source);
}

} // namespace

int ExecuteCapture(const CaptureOptions& options, backends::IFrameSource& source) {
  config::CaptureConfig capture_config;
  std::string error;
  if (!config::LoadCaptureConfigFile(options.config_path, capture_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(options.log_level.value_or(capture_config.log_level));
  logger.SetComponent("capture");
  logger.Info("capture requested", {{"config", options.config_path.string()},
                                    {"format", format::ToString(capture_config.format)}});

  capture::Camera camera(source, &logger);
  core::errors::CameraError camera_error;
  if (!camera.Open(capture_config.device_index, capture_config.format, camera_error)) {
    std::cerr << "error: " << core::errors::ToString(camera_error) << '\n';
    return kExitDeviceOpenFailed;
  }

  codec::ImageBuffer image;
  if (!camera.NextFrame(image, camera_error)) {
    std::cerr << "error: " << core::errors::ToString(camera_error) << '\n';
    return kExitFrameDecodeFailed;
  }

  if (!codec::WritePpm(options.output_path, image, error)) {
    logger.Error("failed to write image", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!camera.Close(camera_error)) {
    logger.Warn("camera close failed", {{"error", core::errors::ToString(camera_error)}});
  }
  logger.Info("frame written", {{"path", options.output_path.string()},
                                {"resolution", format::ToString(image.resolution)}});
  std::cout << "wrote: " << options.output_path.string() << '\n';
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "list-devices") {
    return CommandListDevices(args);
  }
  if (command == "constraints") {
    return CommandConstraints(args);
  }
  if (command == "convert") {
    return CommandConvert(args);
  }
  if (command == "capture") {
    return CommandCapture(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camkit::cli

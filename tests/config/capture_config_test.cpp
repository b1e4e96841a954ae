#include "config/capture_config.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using camkit::browser::FacingMode;
using camkit::config::CaptureConfig;
using camkit::core::logging::LogLevel;
using camkit::format::FrameFormat;
using camkit::format::Resolution;

TEST_CASE("Empty config object keeps every default", "[config]") {
  CaptureConfig config;
  std::string error;
  REQUIRE(camkit::config::ParseCaptureConfigText("{}", config, error));
  REQUIRE(error.empty());
  REQUIRE(config.log_level == LogLevel::kInfo);
  REQUIRE(config.device_index == 0U);
  REQUIRE(config.format == camkit::format::CameraFormat{});
  REQUIRE(config.constraints == camkit::browser::ConstraintDirectives{});
}

TEST_CASE("Full config populates format and constraints", "[config]") {
  CaptureConfig config;
  std::string error;
  REQUIRE(camkit::config::ParseCaptureConfigText(R"({
    "log_level": "debug",
    "device": {"index": 2},
    "format": {"width": 1280, "height": 720, "frame_format": "yuyv", "fps": 30},
    "constraints": {
      "width": 640, "height": 480, "resolution_exact": true,
      "aspect_ratio": 1.5, "facing_mode": "user", "facing_mode_exact": true,
      "frame_rate": 24, "resize_mode": "none",
      "device_id": "cam-1", "group_id": "grp", "group_id_exact": true
    }
  })",
                                                 config, error));
  REQUIRE(config.log_level == LogLevel::kDebug);
  REQUIRE(config.device_index == 2U);
  REQUIRE(config.format.resolution() == Resolution{1280U, 720U});
  REQUIRE(config.format.format() == FrameFormat::kYuyv);
  REQUIRE(config.format.frame_rate() == 30U);

  const auto& c = config.constraints;
  REQUIRE(c.resolution == Resolution{640U, 480U});
  REQUIRE(c.resolution_exact);
  REQUIRE(c.aspect_ratio == 1.5);
  REQUIRE(c.facing_mode == FacingMode::kUser);
  REQUIRE(c.facing_mode_exact);
  REQUIRE(c.frame_rate == 24U);
  REQUIRE(c.resize_mode == camkit::browser::ResizeMode::kNone);
  REQUIRE(c.device_id == "cam-1");
  REQUIRE_FALSE(c.device_id_exact);
  REQUIRE(c.group_id_exact);
}

TEST_CASE("Config errors name the offending field", "[config]") {
  CaptureConfig config;
  std::string error;

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText(R"({"format":{"widht":1}})", config,
                                                       error));
  REQUIRE(error == "unknown config field 'format.widht'");

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText(R"({"format":{"width":"640"}})", config,
                                                       error));
  REQUIRE(error.find("config field 'format.width' must be a non-negative integer") == 0U);

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText(R"({"format":{"fps":-1}})", config,
                                                       error));
  REQUIRE(error.find("format.fps") != std::string::npos);

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText(R"({"constraints":{"width":4294967296}})",
                                                       config, error));
  REQUIRE(error.find("constraints.width") != std::string::npos);

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText(
      R"({"constraints":{"facing_mode":"front"}})", config, error));
  REQUIRE(error.rfind("config field 'constraints.facing_mode': ", 0) == 0U);

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText(R"({"log_level":"loud"})", config,
                                                       error));
  REQUIRE(error.rfind("config field 'log_level': ", 0) == 0U);

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText("[1]", config, error));
  REQUIRE(error.rfind("config field '<root>' must be an object", 0) == 0U);

  REQUIRE_FALSE(camkit::config::ParseCaptureConfigText("{", config, error));
  REQUIRE(error.rfind("invalid capture config JSON: ", 0) == 0U);
}

TEST_CASE("Config file loader reads from disk", "[config]") {
  camkit::tests::common::ScopedTempDir dir("camkit-config-test");
  const auto path = dir.path() / "capture.json";
  camkit::tests::common::WriteFileOrFail(path, R"({"device":{"index":1}})");

  CaptureConfig config;
  std::string error;
  REQUIRE(camkit::config::LoadCaptureConfigFile(path, config, error));
  REQUIRE(config.device_index == 1U);

  REQUIRE_FALSE(camkit::config::LoadCaptureConfigFile(dir.path() / "missing.json", config, error));
  REQUIRE(error.rfind("unable to read capture config file: ", 0) == 0U);
}

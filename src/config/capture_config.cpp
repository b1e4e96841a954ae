#include "config/capture_config.hpp"

#include "core/json_dom.hpp"
#include "format/frame_format.hpp"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <limits>

namespace fs = std::filesystem;

namespace camkit::config {

namespace {

using JsonValue = core::json::Value;

std::string JoinPath(std::string_view parent, std::string_view key) {
  if (parent.empty()) {
    return std::string(key);
  }
  return std::string(parent) + "." + std::string(key);
}

std::string TypeMismatch(std::string_view path, std::string_view expected,
                         const JsonValue& value) {
  return "config field '" + std::string(path) + "' must be " + std::string(expected) +
         ", got " + core::json::ToString(value.type);
}

bool RequireObject(const JsonValue& value, std::string_view path, std::string& error) {
  if (value.type != JsonValue::Type::kObject) {
    error = TypeMismatch(path.empty() ? "<root>" : path, "an object", value);
    return false;
  }
  return true;
}

bool RejectUnknownKeys(const JsonValue& object, std::string_view path,
                       std::initializer_list<std::string_view> allowed, std::string& error) {
  for (const auto& [key, member] : object.object_value) {
    bool known = false;
    for (const std::string_view candidate : allowed) {
      if (key == candidate) {
        known = true;
        break;
      }
    }
    if (!known) {
      error = "unknown config field '" + JoinPath(path, key) + "'";
      return false;
    }
  }
  return true;
}

bool ReadUnsigned(const JsonValue& value, std::string_view path, const std::uint64_t max,
                  std::uint64_t& out, std::string& error) {
  if (value.type != JsonValue::Type::kNumber) {
    error = TypeMismatch(path, "a non-negative integer", value);
    return false;
  }
  const double number = value.number_value;
  if (!std::isfinite(number) || number < 0.0 || std::floor(number) != number ||
      number > static_cast<double>(max)) {
    error = "config field '" + std::string(path) + "' must be an integer in [0, " +
            std::to_string(max) + "]";
    return false;
  }
  out = static_cast<std::uint64_t>(number);
  return true;
}

bool ReadU32(const JsonValue& parent, std::string_view parent_path, std::string_view key,
             std::uint32_t& out, std::string& error) {
  const JsonValue* value = parent.Find(key);
  if (value == nullptr) {
    return true;
  }
  std::uint64_t parsed = 0U;
  if (!ReadUnsigned(*value, JoinPath(parent_path, key), std::numeric_limits<std::uint32_t>::max(),
                    parsed, error)) {
    return false;
  }
  out = static_cast<std::uint32_t>(parsed);
  return true;
}

bool ReadBool(const JsonValue& parent, std::string_view parent_path, std::string_view key,
              bool& out, std::string& error) {
  const JsonValue* value = parent.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kBool) {
    error = TypeMismatch(JoinPath(parent_path, key), "a bool", *value);
    return false;
  }
  out = value->bool_value;
  return true;
}

bool ReadString(const JsonValue& parent, std::string_view parent_path, std::string_view key,
                std::string& out, std::string& error) {
  const JsonValue* value = parent.Find(key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kString) {
    error = TypeMismatch(JoinPath(parent_path, key), "a string", *value);
    return false;
  }
  out = value->string_value;
  return true;
}

bool ParseDevice(const JsonValue& device, CaptureConfig& config, std::string& error) {
  if (!RequireObject(device, "device", error) ||
      !RejectUnknownKeys(device, "device", {"index"}, error)) {
    return false;
  }
  const JsonValue* index = device.Find("index");
  if (index == nullptr) {
    return true;
  }
  std::uint64_t parsed = 0U;
  if (!ReadUnsigned(*index, "device.index",
                    static_cast<std::uint64_t>(std::numeric_limits<int>::max()), parsed, error)) {
    return false;
  }
  config.device_index = static_cast<std::size_t>(parsed);
  return true;
}

bool ParseFormat(const JsonValue& section, CaptureConfig& config, std::string& error) {
  if (!RequireObject(section, "format", error) ||
      !RejectUnknownKeys(section, "format", {"width", "height", "frame_format", "fps"}, error)) {
    return false;
  }

  std::uint32_t width = config.format.width();
  std::uint32_t height = config.format.height();
  std::uint32_t fps = config.format.frame_rate();
  std::string frame_format_text;
  if (!ReadU32(section, "format", "width", width, error) ||
      !ReadU32(section, "format", "height", height, error) ||
      !ReadU32(section, "format", "fps", fps, error) ||
      !ReadString(section, "format", "frame_format", frame_format_text, error)) {
    return false;
  }

  format::FrameFormat frame_format = config.format.format();
  if (!frame_format_text.empty()) {
    std::string parse_error;
    if (!format::ParseFrameFormat(frame_format_text, frame_format, parse_error)) {
      error = "config field 'format.frame_format': " + parse_error;
      return false;
    }
  }

  config.format = format::CameraFormat(width, height, frame_format, fps);
  return true;
}

bool ParseConstraints(const JsonValue& section, CaptureConfig& config, std::string& error) {
  constexpr std::string_view kPath = "constraints";
  if (!RequireObject(section, kPath, error) ||
      !RejectUnknownKeys(section, kPath,
                         {"width", "height", "resolution_exact", "aspect_ratio",
                          "aspect_ratio_exact", "facing_mode", "facing_mode_exact", "frame_rate",
                          "frame_rate_exact", "resize_mode", "resize_mode_exact", "device_id",
                          "device_id_exact", "group_id", "group_id_exact"},
                         error)) {
    return false;
  }

  browser::ConstraintDirectives& d = config.constraints;
  if (!ReadU32(section, kPath, "width", d.resolution.width, error) ||
      !ReadU32(section, kPath, "height", d.resolution.height, error) ||
      !ReadBool(section, kPath, "resolution_exact", d.resolution_exact, error) ||
      !ReadBool(section, kPath, "aspect_ratio_exact", d.aspect_ratio_exact, error) ||
      !ReadBool(section, kPath, "facing_mode_exact", d.facing_mode_exact, error) ||
      !ReadU32(section, kPath, "frame_rate", d.frame_rate, error) ||
      !ReadBool(section, kPath, "frame_rate_exact", d.frame_rate_exact, error) ||
      !ReadBool(section, kPath, "resize_mode_exact", d.resize_mode_exact, error) ||
      !ReadString(section, kPath, "device_id", d.device_id, error) ||
      !ReadBool(section, kPath, "device_id_exact", d.device_id_exact, error) ||
      !ReadString(section, kPath, "group_id", d.group_id, error) ||
      !ReadBool(section, kPath, "group_id_exact", d.group_id_exact, error)) {
    return false;
  }

  if (const JsonValue* ratio = section.Find("aspect_ratio"); ratio != nullptr) {
    if (ratio->type != JsonValue::Type::kNumber || !std::isfinite(ratio->number_value) ||
        ratio->number_value < 0.0) {
      error = "config field 'constraints.aspect_ratio' must be a non-negative number";
      return false;
    }
    d.aspect_ratio = ratio->number_value;
  }

  std::string mode_text;
  std::string parse_error;
  if (!ReadString(section, kPath, "facing_mode", mode_text, error)) {
    return false;
  }
  if (!browser::ParseFacingMode(mode_text, d.facing_mode, parse_error)) {
    error = "config field 'constraints.facing_mode': " + parse_error;
    return false;
  }

  mode_text.clear();
  if (!ReadString(section, kPath, "resize_mode", mode_text, error)) {
    return false;
  }
  if (!browser::ParseResizeMode(mode_text, d.resize_mode, parse_error)) {
    error = "config field 'constraints.resize_mode': " + parse_error;
    return false;
  }
  return true;
}

} // namespace

bool ParseCaptureConfigText(std::string_view json_text, CaptureConfig& config,
                            std::string& error) {
  config = CaptureConfig{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid capture config JSON: " + parse_error;
    return false;
  }
  if (!RequireObject(root, "", error) ||
      !RejectUnknownKeys(root, "", {"log_level", "device", "format", "constraints"}, error)) {
    return false;
  }

  std::string level_text;
  if (!ReadString(root, "", "log_level", level_text, error)) {
    return false;
  }
  if (!level_text.empty() && !core::logging::ParseLogLevel(level_text, config.log_level,
                                                           parse_error)) {
    error = "config field 'log_level': " + parse_error;
    return false;
  }

  if (const JsonValue* device = root.Find("device");
      device != nullptr && !ParseDevice(*device, config, error)) {
    return false;
  }
  if (const JsonValue* section = root.Find("format");
      section != nullptr && !ParseFormat(*section, config, error)) {
    return false;
  }
  if (const JsonValue* section = root.Find("constraints");
      section != nullptr && !ParseConstraints(*section, config, error)) {
    return false;
  }
  return true;
}

bool LoadCaptureConfigFile(const fs::path& path, CaptureConfig& config, std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read capture config file: " + path.string();
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  return ParseCaptureConfigText(contents, config, error);
}

} // namespace camkit::config

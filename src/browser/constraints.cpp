#include "browser/constraints.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

namespace camkit::browser {

namespace {

constexpr const char* kRequestStructure = "MediaStreamConstraints";

std::string Fragment(std::string_view name, const bool exact, std::string_view rendered_value) {
  std::string fragment;
  fragment.reserve(name.size() + rendered_value.size() + 16U);
  fragment += '"';
  fragment += name;
  fragment += "\":{\"";
  fragment += exact ? "exact" : "ideal";
  fragment += "\":";
  fragment += rendered_value;
  fragment += '}';
  return fragment;
}

std::string QuotedRaw(std::string_view value) {
  return "\"" + std::string(value) + "\"";
}

// Shortest form that parses back to the same double.
std::string FormatRatio(const double ratio) {
  char text[32];
  const auto [end, ec] = std::to_chars(text, text + sizeof(text), ratio);
  return ec == std::errc{} ? std::string(text, end) : std::string();
}

} // namespace

const char* ToString(const FacingMode mode) {
  switch (mode) {
  case FacingMode::kAny:
    return "";
  case FacingMode::kEnvironment:
    return "environment";
  case FacingMode::kUser:
    return "user";
  case FacingMode::kLeft:
    return "left";
  case FacingMode::kRight:
    return "right";
  }
  return "";
}

const char* ToString(const ResizeMode mode) {
  switch (mode) {
  case ResizeMode::kAny:
    return "";
  case ResizeMode::kNone:
    return "none";
  case ResizeMode::kCropAndScale:
    return "crop-and-scale";
  }
  return "";
}

const char* ToString(const SupportedConstraint constraint) {
  switch (constraint) {
  case SupportedConstraint::kDeviceId:
    return "deviceId";
  case SupportedConstraint::kGroupId:
    return "groupId";
  case SupportedConstraint::kAspectRatio:
    return "aspectRatio";
  case SupportedConstraint::kFacingMode:
    return "facingMode";
  case SupportedConstraint::kFrameRate:
    return "frameRate";
  case SupportedConstraint::kHeight:
    return "height";
  case SupportedConstraint::kWidth:
    return "width";
  case SupportedConstraint::kResizeMode:
    return "resizeMode";
  }
  return "";
}

bool ParseFacingMode(std::string_view raw, FacingMode& mode, std::string& error) {
  error.clear();
  for (const FacingMode candidate : {FacingMode::kAny, FacingMode::kEnvironment,
                                     FacingMode::kUser, FacingMode::kLeft, FacingMode::kRight}) {
    if (raw == ToString(candidate)) {
      mode = candidate;
      return true;
    }
  }
  error = "invalid facing mode '" + std::string(raw) + "' (expected environment|user|left|right)";
  return false;
}

bool ParseResizeMode(std::string_view raw, ResizeMode& mode, std::string& error) {
  error.clear();
  for (const ResizeMode candidate :
       {ResizeMode::kAny, ResizeMode::kNone, ResizeMode::kCropAndScale}) {
    if (raw == ToString(candidate)) {
      mode = candidate;
      return true;
    }
  }
  error = "invalid resize mode '" + std::string(raw) + "' (expected none|crop-and-scale)";
  return false;
}

bool ParseSupportedConstraint(std::string_view raw, SupportedConstraint& constraint) {
  for (const SupportedConstraint candidate :
       {SupportedConstraint::kDeviceId, SupportedConstraint::kGroupId,
        SupportedConstraint::kAspectRatio, SupportedConstraint::kFacingMode,
        SupportedConstraint::kFrameRate, SupportedConstraint::kHeight,
        SupportedConstraint::kWidth, SupportedConstraint::kResizeMode}) {
    if (raw == ToString(candidate)) {
      constraint = candidate;
      return true;
    }
  }
  return false;
}

Constraints::Constraints() : request_text_(kUnconstrainedRequest) {
  core::json::Value audio;
  audio.type = core::json::Value::Type::kBool;
  audio.bool_value = false;
  core::json::Value video;
  video.type = core::json::Value::Type::kBool;
  video.bool_value = true;

  request_.type = core::json::Value::Type::kObject;
  request_.object_value.emplace("audio", std::move(audio));
  request_.object_value.emplace("video", std::move(video));
}

ConstraintsBuilder Constraints::ToBuilder() const {
  return ConstraintsBuilder(directives_);
}

ConstraintsBuilder::ConstraintsBuilder(ConstraintDirectives directives)
    : directives_(std::move(directives)) {}

ConstraintsBuilder& ConstraintsBuilder::WithResolution(const format::Resolution resolution,
                                                       const bool exact) {
  directives_.resolution = resolution;
  directives_.resolution_exact = exact;
  return *this;
}

ConstraintsBuilder& ConstraintsBuilder::WithAspectRatio(const double ratio, const bool exact) {
  directives_.aspect_ratio = ratio;
  directives_.aspect_ratio_exact = exact;
  return *this;
}

ConstraintsBuilder& ConstraintsBuilder::WithFacingMode(const FacingMode mode, const bool exact) {
  directives_.facing_mode = mode;
  directives_.facing_mode_exact = exact;
  return *this;
}

ConstraintsBuilder& ConstraintsBuilder::WithFrameRate(const std::uint32_t fps, const bool exact) {
  directives_.frame_rate = fps;
  directives_.frame_rate_exact = exact;
  return *this;
}

ConstraintsBuilder& ConstraintsBuilder::WithResizeMode(const ResizeMode mode, const bool exact) {
  directives_.resize_mode = mode;
  directives_.resize_mode_exact = exact;
  return *this;
}

ConstraintsBuilder& ConstraintsBuilder::WithDeviceId(std::string device_id, const bool exact) {
  directives_.device_id = std::move(device_id);
  directives_.device_id_exact = exact;
  return *this;
}

ConstraintsBuilder& ConstraintsBuilder::WithGroupId(std::string group_id, const bool exact) {
  directives_.group_id = std::move(group_id);
  directives_.group_id_exact = exact;
  return *this;
}

std::vector<std::string> ConstraintsBuilder::RenderFragments() const {
  const ConstraintDirectives& d = directives_;
  std::vector<std::string> fragments;

  if (d.resolution.width != 0U) {
    fragments.push_back(
        Fragment("width", d.resolution_exact, std::to_string(d.resolution.width)));
  }
  if (d.resolution.height != 0U) {
    fragments.push_back(
        Fragment("height", d.resolution_exact, std::to_string(d.resolution.height)));
  }
  // NaN and infinities have no JSON form and request nothing, like 0.
  if (d.aspect_ratio != 0.0 && std::isfinite(d.aspect_ratio)) {
    fragments.push_back(
        Fragment("aspectRatio", d.aspect_ratio_exact, FormatRatio(d.aspect_ratio)));
  }
  if (d.facing_mode != FacingMode::kAny) {
    fragments.push_back(
        Fragment("facingMode", d.facing_mode_exact, QuotedRaw(ToString(d.facing_mode))));
  }
  if (d.frame_rate != 0U) {
    fragments.push_back(Fragment("frameRate", d.frame_rate_exact, std::to_string(d.frame_rate)));
  }
  if (d.resize_mode != ResizeMode::kAny) {
    fragments.push_back(
        Fragment("resizeMode", d.resize_mode_exact, QuotedRaw(ToString(d.resize_mode))));
  }
  if (!d.device_id.empty()) {
    fragments.push_back(Fragment("deviceId", d.device_id_exact, QuotedRaw(d.device_id)));
  }
  if (!d.group_id.empty()) {
    fragments.push_back(Fragment("groupId", d.group_id_exact, QuotedRaw(d.group_id)));
  }

  std::sort(fragments.begin(), fragments.end());
  fragments.erase(std::unique(fragments.begin(), fragments.end()), fragments.end());
  return fragments;
}

std::string ConstraintsBuilder::RenderRequest() const {
  const std::vector<std::string> fragments = RenderFragments();
  if (fragments.empty()) {
    return std::string(kUnconstrainedRequest);
  }

  std::string request = R"({"audio":false,"video":{)";
  for (std::size_t i = 0; i < fragments.size(); ++i) {
    if (i != 0U) {
      request += ',';
    }
    request += fragments[i];
  }
  request += "}}";
  return request;
}

bool ConstraintsBuilder::Build(Constraints& constraints, core::errors::CameraError& error) const {
  std::string request_text = RenderRequest();

  core::json::Value request;
  std::string parse_error;
  if (!core::json::Parse(request_text, request, parse_error)) {
    error = core::errors::StructureError(kRequestStructure, parse_error);
    return false;
  }

  constraints.directives_ = directives_;
  constraints.request_text_ = std::move(request_text);
  constraints.request_ = std::move(request);
  error.Clear();
  return true;
}

} // namespace camkit::browser

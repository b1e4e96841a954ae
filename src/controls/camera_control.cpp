#include "controls/camera_control.hpp"

namespace camkit::controls {

namespace {

constexpr const char* kStructureName = "CameraControl";

} // namespace

const std::array<KnownCameraControl, kKnownCameraControlCount>& AllKnownCameraControls() {
  static const std::array<KnownCameraControl, kKnownCameraControlCount> kAll = {
      KnownCameraControl::kBrightness,    KnownCameraControl::kContrast,
      KnownCameraControl::kHue,           KnownCameraControl::kSaturation,
      KnownCameraControl::kSharpness,     KnownCameraControl::kGamma,
      KnownCameraControl::kColorEnable,   KnownCameraControl::kWhiteBalance,
      KnownCameraControl::kBacklightComp, KnownCameraControl::kGain,
      KnownCameraControl::kPan,           KnownCameraControl::kTilt,
      KnownCameraControl::kRoll,          KnownCameraControl::kZoom,
      KnownCameraControl::kExposure,      KnownCameraControl::kIris,
      KnownCameraControl::kFocus,
  };
  return kAll;
}

const char* ToString(const KnownCameraControl control) {
  switch (control) {
  case KnownCameraControl::kBrightness:
    return "Brightness";
  case KnownCameraControl::kContrast:
    return "Contrast";
  case KnownCameraControl::kHue:
    return "Hue";
  case KnownCameraControl::kSaturation:
    return "Saturation";
  case KnownCameraControl::kSharpness:
    return "Sharpness";
  case KnownCameraControl::kGamma:
    return "Gamma";
  case KnownCameraControl::kColorEnable:
    return "ColorEnable";
  case KnownCameraControl::kWhiteBalance:
    return "WhiteBalance";
  case KnownCameraControl::kBacklightComp:
    return "BacklightComp";
  case KnownCameraControl::kGain:
    return "Gain";
  case KnownCameraControl::kPan:
    return "Pan";
  case KnownCameraControl::kTilt:
    return "Tilt";
  case KnownCameraControl::kRoll:
    return "Roll";
  case KnownCameraControl::kZoom:
    return "Zoom";
  case KnownCameraControl::kExposure:
    return "Exposure";
  case KnownCameraControl::kIris:
    return "Iris";
  case KnownCameraControl::kFocus:
    return "Focus";
  }
  return "Unknown";
}

const char* ToString(const CameraControlFlag flag) {
  switch (flag) {
  case CameraControlFlag::kAutomatic:
    return "Automatic";
  case CameraControlFlag::kManual:
    return "Manual";
  }
  return "Manual";
}

CameraControl::CameraControl(const KnownCameraControl control, const std::int32_t minimum,
                             const std::int32_t maximum, const std::int32_t value,
                             const std::int32_t step, const std::int32_t default_value,
                             const CameraControlFlag flag, const bool active)
    : control_(control),
      min_(minimum),
      max_(maximum),
      value_(value),
      step_(step),
      default_(default_value),
      flag_(flag),
      active_(active) {}

bool CameraControl::ValidateValue(const std::int32_t minimum, const std::int32_t maximum,
                                  const std::int32_t value, const std::int32_t step,
                                  core::errors::CameraError& error) {
  if (value >= maximum) {
    error = core::errors::StructureError(kStructureName, "Value too large");
    return false;
  }
  if (value <= minimum) {
    error = core::errors::StructureError(kStructureName, "Value too low");
    return false;
  }
  // Checked before the modulo: a zero step would be undefined behavior.
  if (step <= 0) {
    error = core::errors::StructureError(kStructureName, "Step must be positive");
    return false;
  }
  if (value % step != 0) {
    error = core::errors::StructureError(kStructureName, "Not aligned with step");
    return false;
  }
  error.Clear();
  return true;
}

bool CameraControl::Create(const KnownCameraControl control, const std::int32_t minimum,
                           const std::int32_t maximum, const std::int32_t value,
                           const std::int32_t step, const std::int32_t default_value,
                           const CameraControlFlag flag, const bool active,
                           std::optional<CameraControl>& created,
                           core::errors::CameraError& error) {
  created.reset();
  if (!ValidateValue(minimum, maximum, value, step, error)) {
    return false;
  }
  created = CameraControl(control, minimum, maximum, value, step, default_value, flag, active);
  return true;
}

bool CameraControl::SetValue(const std::int32_t value, core::errors::CameraError& error) {
  if (!ValidateValue(min_, max_, value, step_, error)) {
    return false;
  }
  value_ = value;
  return true;
}

bool CameraControl::WithValue(const std::int32_t value, std::optional<CameraControl>& updated,
                              core::errors::CameraError& error) const {
  updated.reset();
  if (!ValidateValue(min_, max_, value, step_, error)) {
    return false;
  }
  CameraControl copy = *this;
  copy.value_ = value;
  updated = copy;
  return true;
}

std::vector<std::int32_t> CameraControl::ValidValues() const {
  std::vector<std::int32_t> values;
  // 64-bit cursor so `max_ + step_` near INT32_MAX cannot overflow.
  for (std::int64_t current = min_; current <= max_; current += step_) {
    values.push_back(static_cast<std::int32_t>(current));
  }
  return values;
}

} // namespace camkit::controls

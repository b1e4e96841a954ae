#pragma once

#include "core/errors/camera_error.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace camkit::controls {

// Adjustable camera parameters known across backends. Backends translate their
// own control ids into this enum; which native id maps to which entry is the
// backend's business.
enum class KnownCameraControl {
  kBrightness = 0,
  kContrast,
  kHue,
  kSaturation,
  kSharpness,
  kGamma,
  kColorEnable,
  kWhiteBalance,
  kBacklightComp,
  kGain,
  kPan,
  kTilt,
  kRoll,
  kZoom,
  kExposure,
  kIris,
  kFocus,
};

inline constexpr std::size_t kKnownCameraControlCount = 17U;

// All controls in declaration order.
const std::array<KnownCameraControl, kKnownCameraControlCount>& AllKnownCameraControls();

enum class CameraControlFlag {
  kAutomatic = 0,
  kManual,
};

// `Brightness`, `WhiteBalance`, ...
const char* ToString(KnownCameraControl control);
const char* ToString(CameraControlFlag flag);

// One adjustable camera parameter with its backend-reported range.
//
// Invariants, checked on creation and on every value change:
// - min < value < max (boundaries are rejected)
// - step > 0 and value % step == 0
//
// Instances only exist in a valid state: `Create` is the sole way in, and a
// failed `SetValue` leaves the previous value untouched.
class CameraControl {
public:
  static bool Create(KnownCameraControl control, std::int32_t minimum, std::int32_t maximum,
                     std::int32_t value, std::int32_t step, std::int32_t default_value,
                     CameraControlFlag flag, bool active,
                     std::optional<CameraControl>& created, core::errors::CameraError& error);

  KnownCameraControl control() const {
    return control_;
  }
  std::int32_t minimum_value() const {
    return min_;
  }
  std::int32_t maximum_value() const {
    return max_;
  }
  std::int32_t value() const {
    return value_;
  }
  std::int32_t step() const {
    return step_;
  }
  std::int32_t default_value() const {
    return default_;
  }
  CameraControlFlag flag() const {
    return flag_;
  }
  bool active() const {
    return active_;
  }

  bool SetValue(std::int32_t value, core::errors::CameraError& error);

  // Copy of this control holding `value`; `this` is never modified.
  bool WithValue(std::int32_t value, std::optional<CameraControl>& updated,
                 core::errors::CameraError& error) const;

  // Range steps min, min + step, ... while <= max. These are not the values
  // SetValue accepts: min and max are always listed, and when min is not a
  // multiple of step no listed value is aligned.
  std::vector<std::int32_t> ValidValues() const;

  bool operator==(const CameraControl& other) const = default;

  // Controls sort by which parameter they describe, not by value.
  bool operator<(const CameraControl& other) const {
    return control_ < other.control_;
  }

private:
  CameraControl(KnownCameraControl control, std::int32_t minimum, std::int32_t maximum,
                std::int32_t value, std::int32_t step, std::int32_t default_value,
                CameraControlFlag flag, bool active);

  static bool ValidateValue(std::int32_t minimum, std::int32_t maximum, std::int32_t value,
                            std::int32_t step, core::errors::CameraError& error);

  KnownCameraControl control_;
  std::int32_t min_;
  std::int32_t max_;
  std::int32_t value_;
  std::int32_t step_;
  std::int32_t default_;
  CameraControlFlag flag_;
  bool active_;
};

} // namespace camkit::controls

#pragma once

#include "core/errors/camera_error.hpp"
#include "core/json_dom.hpp"
#include "format/resolution.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace camkit::browser {

// Which way the camera points. `kAny` leaves the choice to the browser.
enum class FacingMode {
  kAny = 0,
  kEnvironment,
  kUser,
  kLeft,
  kRight,
};

// Whether the browser may crop and/or scale to reach the requested size.
enum class ResizeMode {
  kAny = 0,
  kNone,
  kCropAndScale,
};

// Constraint names a browser can report as supported.
enum class SupportedConstraint {
  kDeviceId = 0,
  kGroupId,
  kAspectRatio,
  kFacingMode,
  kFrameRate,
  kHeight,
  kWidth,
  kResizeMode,
};

// Wire names. `kAny` renders as "".
const char* ToString(FacingMode mode);
const char* ToString(ResizeMode mode);
const char* ToString(SupportedConstraint constraint);

// Accept the wire names above. An empty string parses as `kAny`.
bool ParseFacingMode(std::string_view raw, FacingMode& mode, std::string& error);
bool ParseResizeMode(std::string_view raw, ResizeMode& mode, std::string& error);
bool ParseSupportedConstraint(std::string_view raw, SupportedConstraint& constraint);

// The eight directives of a request and their exact/ideal flags. A zero, empty
// or kAny value means "no preference" and renders nothing.
struct ConstraintDirectives {
  format::Resolution resolution;
  // Covers both width and height.
  bool resolution_exact = false;
  double aspect_ratio = 0.0;
  bool aspect_ratio_exact = false;
  FacingMode facing_mode = FacingMode::kAny;
  bool facing_mode_exact = false;
  std::uint32_t frame_rate = 0U;
  bool frame_rate_exact = false;
  ResizeMode resize_mode = ResizeMode::kAny;
  bool resize_mode_exact = false;
  std::string device_id;
  bool device_id_exact = false;
  std::string group_id;
  bool group_id_exact = false;

  bool operator==(const ConstraintDirectives& other) const = default;
};

// Negotiation request used when no directive carries a value.
inline constexpr std::string_view kUnconstrainedRequest = R"({"audio":false,"video":true})";

class ConstraintsBuilder;

// Immutable snapshot of one negotiation request: the directives that produced
// it, the rendered request text and the parsed request. Changing constraints
// means building a new snapshot from `ToBuilder()`.
//
// A default-constructed snapshot is the unconstrained request.
class Constraints {
public:
  Constraints();

  const ConstraintDirectives& directives() const {
    return directives_;
  }
  const std::string& request_text() const {
    return request_text_;
  }
  const core::json::Value& request() const {
    return request_;
  }

  format::Resolution resolution() const {
    return directives_.resolution;
  }
  bool resolution_exact() const {
    return directives_.resolution_exact;
  }
  double aspect_ratio() const {
    return directives_.aspect_ratio;
  }
  bool aspect_ratio_exact() const {
    return directives_.aspect_ratio_exact;
  }
  FacingMode facing_mode() const {
    return directives_.facing_mode;
  }
  bool facing_mode_exact() const {
    return directives_.facing_mode_exact;
  }
  std::uint32_t frame_rate() const {
    return directives_.frame_rate;
  }
  bool frame_rate_exact() const {
    return directives_.frame_rate_exact;
  }
  ResizeMode resize_mode() const {
    return directives_.resize_mode;
  }
  bool resize_mode_exact() const {
    return directives_.resize_mode_exact;
  }
  const std::string& device_id() const {
    return directives_.device_id;
  }
  bool device_id_exact() const {
    return directives_.device_id_exact;
  }
  const std::string& group_id() const {
    return directives_.group_id;
  }
  bool group_id_exact() const {
    return directives_.group_id_exact;
  }

  ConstraintsBuilder ToBuilder() const;

private:
  friend class ConstraintsBuilder;

  ConstraintDirectives directives_;
  std::string request_text_;
  core::json::Value request_;
};

// Accumulates directives and renders them into a request of the shape
//   {"audio":false,"video":{"height":{"ideal":480},"width":{"ideal":640}}}
//
// Rendering rule, per directive: no value -> nothing; exact -> {"exact":v};
// otherwise {"ideal":v}. Fragments are sorted and deduplicated before joining.
// With no fragments the request is `kUnconstrainedRequest`.
//
// The builder never validates ranges. `Build` fails only when the rendered
// request does not parse.
//
// SECURITY: string directives (device id, group id, facing and resize mode) are
// spliced into the request between quotes without escaping. A quote or brace
// inside a device or group id breaks the request (Build fails) or, worse,
// rewrites other directives. These ids must come from the browser's own device
// enumeration, never from untrusted input; callers own any sanitizing.
//
// The aspect ratio renders in its shortest round-trip form. A NaN or infinite
// ratio renders nothing, the same as 0.
class ConstraintsBuilder {
public:
  ConstraintsBuilder() = default;
  explicit ConstraintsBuilder(ConstraintDirectives directives);

  ConstraintsBuilder& WithResolution(format::Resolution resolution, bool exact = false);
  ConstraintsBuilder& WithAspectRatio(double ratio, bool exact = false);
  ConstraintsBuilder& WithFacingMode(FacingMode mode, bool exact = false);
  ConstraintsBuilder& WithFrameRate(std::uint32_t fps, bool exact = false);
  ConstraintsBuilder& WithResizeMode(ResizeMode mode, bool exact = false);
  ConstraintsBuilder& WithDeviceId(std::string device_id, bool exact = false);
  ConstraintsBuilder& WithGroupId(std::string group_id, bool exact = false);

  const ConstraintDirectives& directives() const {
    return directives_;
  }

  // Sorted, deduplicated `"<name>":{"ideal"|"exact":<value>}` fragments.
  std::vector<std::string> RenderFragments() const;
  std::string RenderRequest() const;

  // On failure `constraints` is left untouched and the error is
  // StructureError{"MediaStreamConstraints", <parser diagnostic>}.
  bool Build(Constraints& constraints, core::errors::CameraError& error) const;

private:
  ConstraintDirectives directives_;
};

} // namespace camkit::browser

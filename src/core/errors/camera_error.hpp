#pragma once

#include "format/frame_format.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace camkit::core::errors {

// Flat classification of every library failure. There is no hierarchy: the
// kind tells the caller which of the payload fields below are populated.
enum class CameraErrorKind {
  kNone = 0,
  // An expected platform object or handle was missing or had the wrong type.
  kStructure,
  // A presentation attribute failed to apply.
  kSetProperty,
  // Pixel codec failure.
  kProcessFrame,
  // Draw/readback failure or buffer-size mismatch.
  kReadFrame,
  // A control or format variant has no mapping.
  kNotImplemented,
};

// Typed error value filled by every fallible call through a `CameraError&`
// out-parameter. Callers branch on `kind`; `ToString` is for humans and logs.
struct CameraError {
  CameraErrorKind kind = CameraErrorKind::kNone;
  // kStructure: name of the object that was missing or mis-typed.
  std::string structure;
  // kSetProperty
  std::string property;
  std::string value;
  // kProcessFrame
  std::optional<format::FrameFormat> src_format;
  std::string destination;

  std::string detail;

  bool ok() const {
    return kind == CameraErrorKind::kNone;
  }

  void Clear() {
    *this = CameraError{};
  }
};

CameraError StructureError(std::string structure, std::string detail);
CameraError SetPropertyError(std::string property, std::string value, std::string detail);
CameraError ProcessFrameError(format::FrameFormat src_format, std::string destination,
                              std::string detail);
CameraError ReadFrameError(std::string detail);
CameraError NotImplementedError(std::string detail);

// Grep-friendly code: STRUCTURE_ERROR, SET_PROPERTY_ERROR, PROCESS_FRAME_ERROR,
// READ_FRAME_ERROR, NOT_IMPLEMENTED, or OK.
std::string_view ToStableErrorCode(CameraErrorKind kind);

// Single line: "<STABLE_CODE>: <subject>: <detail>". The subject depends on
// the kind (structure name, `property=value`, `MJPEG->RGB888`) and is omitted
// when empty.
std::string ToString(const CameraError& error);

} // namespace camkit::core::errors

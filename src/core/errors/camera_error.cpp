#include "core/errors/camera_error.hpp"

#include <utility>

namespace camkit::core::errors {

CameraError StructureError(std::string structure, std::string detail) {
  CameraError error;
  error.kind = CameraErrorKind::kStructure;
  error.structure = std::move(structure);
  error.detail = std::move(detail);
  return error;
}

CameraError SetPropertyError(std::string property, std::string value, std::string detail) {
  CameraError error;
  error.kind = CameraErrorKind::kSetProperty;
  error.property = std::move(property);
  error.value = std::move(value);
  error.detail = std::move(detail);
  return error;
}

CameraError ProcessFrameError(const format::FrameFormat src_format, std::string destination,
                              std::string detail) {
  CameraError error;
  error.kind = CameraErrorKind::kProcessFrame;
  error.src_format = src_format;
  error.destination = std::move(destination);
  error.detail = std::move(detail);
  return error;
}

CameraError ReadFrameError(std::string detail) {
  CameraError error;
  error.kind = CameraErrorKind::kReadFrame;
  error.detail = std::move(detail);
  return error;
}

CameraError NotImplementedError(std::string detail) {
  CameraError error;
  error.kind = CameraErrorKind::kNotImplemented;
  error.detail = std::move(detail);
  return error;
}

std::string_view ToStableErrorCode(const CameraErrorKind kind) {
  switch (kind) {
  case CameraErrorKind::kNone:
    return "OK";
  case CameraErrorKind::kStructure:
    return "STRUCTURE_ERROR";
  case CameraErrorKind::kSetProperty:
    return "SET_PROPERTY_ERROR";
  case CameraErrorKind::kProcessFrame:
    return "PROCESS_FRAME_ERROR";
  case CameraErrorKind::kReadFrame:
    return "READ_FRAME_ERROR";
  case CameraErrorKind::kNotImplemented:
    return "NOT_IMPLEMENTED";
  }
  return "OK";
}

std::string ToString(const CameraError& error) {
  std::string subject;
  switch (error.kind) {
  case CameraErrorKind::kStructure:
    subject = error.structure;
    break;
  case CameraErrorKind::kSetProperty:
    subject = error.property + "=" + error.value;
    break;
  case CameraErrorKind::kProcessFrame:
    if (error.src_format.has_value()) {
      subject = std::string(format::ToString(error.src_format.value())) + "->" +
                error.destination;
    }
    break;
  case CameraErrorKind::kNone:
  case CameraErrorKind::kReadFrame:
  case CameraErrorKind::kNotImplemented:
    break;
  }

  std::string text(ToStableErrorCode(error.kind));
  if (!subject.empty()) {
    text += ": " + subject;
  }
  if (!error.detail.empty()) {
    text += ": " + error.detail;
  }
  return text;
}

} // namespace camkit::core::errors

#pragma once

#include "core/json_dom.hpp"
#include "format/resolution.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camkit::browser {

// Opaque host handles. Id 0 is never handed out by a host.
struct MediaStreamHandle {
  std::uint64_t id = 0U;
  bool operator==(const MediaStreamHandle& other) const = default;
};

struct ElementHandle {
  std::uint64_t id = 0U;
  bool operator==(const ElementHandle& other) const = default;
};

struct CanvasHandle {
  std::uint64_t id = 0U;
  bool operator==(const CanvasHandle& other) const = default;
};

// One entry of the host's device enumeration.
struct MediaDeviceInfo {
  std::string device_id;
  std::string group_id;
  std::string label;
  // `videoinput`, `audioinput`, `audiooutput`.
  std::string kind;
};

inline constexpr std::string_view kVideoInputKind = "videoinput";

// Capture subsystem of the host (navigator.mediaDevices in a browser).
//
// Calls that depend on a user prompt or on device negotiation block until the
// host resolves them. Cancellation surfaces as an ordinary failure.
class IMediaDevices {
public:
  virtual ~IMediaDevices() = default;

  virtual bool RequestPermission(std::string& error) = 0;

  // `request` is the parsed {"audio":...,"video":...} request object.
  virtual bool GetUserMedia(const core::json::Value& request, MediaStreamHandle& stream,
                            std::string& error) = 0;

  virtual bool EnumerateDevices(std::vector<MediaDeviceInfo>& devices, std::string& error) = 0;

  // Wire names the host accepts (`width`, `deviceId`, ...). May contain names
  // this library does not know.
  virtual bool SupportedConstraints(std::vector<std::string>& names, std::string& error) = 0;

  virtual bool StopTracks(MediaStreamHandle stream, std::string& error) = 0;
};

// Presentation side of the host (document, elements, 2D canvas).
class IRenderSurface {
public:
  virtual ~IRenderSurface() = default;

  virtual bool GetElementById(std::string_view id, ElementHandle& element,
                              std::string& error) = 0;
  virtual bool CreateElement(std::string_view tag, ElementHandle& element,
                             std::string& error) = 0;
  virtual bool SetAttribute(ElementHandle element, std::string_view name, std::string_view value,
                            std::string& error) = 0;
  virtual bool IsVideoElement(ElementHandle element) const = 0;
  virtual bool SetWidth(ElementHandle element, std::uint32_t width, std::string& error) = 0;
  virtual bool SetHeight(ElementHandle element, std::uint32_t height, std::string& error) = 0;

  // std::nullopt unbinds the current source.
  virtual bool SetSourceObject(ElementHandle element, std::optional<MediaStreamHandle> stream,
                               std::string& error) = 0;

  // `appended` is the node as it now lives in the tree under `parent`.
  virtual bool AppendChild(ElementHandle parent, ElementHandle child, ElementHandle& appended,
                           std::string& error) = 0;

  // Drops the caller's reference. Never fails.
  virtual void ReleaseElement(ElementHandle element) = 0;

  virtual bool CreateCanvas(format::Resolution resolution, CanvasHandle& canvas,
                            std::string& error) = 0;

  // Draws `video` at (0,0) scaled to `resolution`.
  virtual bool DrawVideo(CanvasHandle canvas, ElementHandle video, format::Resolution resolution,
                         std::string& error) = 0;

  // RGBA, row-major, `resolution` sized.
  virtual bool ReadPixels(CanvasHandle canvas, format::Resolution resolution,
                          std::vector<std::uint8_t>& rgba, std::string& error) = 0;

  virtual void ReleaseCanvas(CanvasHandle canvas) = 0;
};

} // namespace camkit::browser

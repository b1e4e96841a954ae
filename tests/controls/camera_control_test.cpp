#include "controls/camera_control.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

using camkit::controls::CameraControl;
using camkit::controls::CameraControlFlag;
using camkit::controls::KnownCameraControl;
using camkit::core::errors::CameraError;
using camkit::core::errors::CameraErrorKind;

namespace {

std::optional<CameraControl> MakeBrightness(const std::int32_t value, const std::int32_t step) {
  std::optional<CameraControl> created;
  CameraError error;
  (void)CameraControl::Create(KnownCameraControl::kBrightness, 0, 100, value, step, 50,
                              CameraControlFlag::kManual, true, created, error);
  return created;
}

} // namespace

TEST_CASE("CameraControl accepts a strictly interior aligned value", "[controls]") {
  std::optional<CameraControl> created;
  CameraError error;
  REQUIRE(CameraControl::Create(KnownCameraControl::kBrightness, 0, 100, 50, 5, 50,
                                CameraControlFlag::kManual, true, created, error));
  REQUIRE(created.has_value());
  REQUIRE(error.ok());
  REQUIRE(created->value() == 50);
  REQUIRE(created->default_value() == 50);
  REQUIRE(created->flag() == CameraControlFlag::kManual);
}

TEST_CASE("CameraControl rejects boundaries and misaligned values", "[controls]") {
  std::optional<CameraControl> created;
  CameraError error;

  REQUIRE_FALSE(CameraControl::Create(KnownCameraControl::kGain, 0, 100, 100, 1, 50,
                                      CameraControlFlag::kManual, true, created, error));
  REQUIRE(error.kind == CameraErrorKind::kStructure);
  REQUIRE(error.detail == "Value too large");
  REQUIRE_FALSE(created.has_value());

  REQUIRE_FALSE(CameraControl::Create(KnownCameraControl::kGain, 0, 100, 0, 1, 50,
                                      CameraControlFlag::kManual, true, created, error));
  REQUIRE(error.detail == "Value too low");

  REQUIRE_FALSE(CameraControl::Create(KnownCameraControl::kGain, 0, 100, 51, 5, 50,
                                      CameraControlFlag::kManual, true, created, error));
  REQUIRE(error.detail == "Not aligned with step");

  REQUIRE_FALSE(CameraControl::Create(KnownCameraControl::kGain, 0, 100, 50, 0, 50,
                                      CameraControlFlag::kManual, true, created, error));
  REQUIRE(error.detail == "Step must be positive");
  REQUIRE(error.structure == "CameraControl");
}

TEST_CASE("CameraControl SetValue keeps the old value on failure", "[controls]") {
  auto control = MakeBrightness(50, 10);
  REQUIRE(control.has_value());

  CameraError error;
  REQUIRE(control->SetValue(70, error));
  REQUIRE(control->value() == 70);

  REQUIRE_FALSE(control->SetValue(75, error));
  REQUIRE(error.kind == CameraErrorKind::kStructure);
  REQUIRE(control->value() == 70);

  std::optional<CameraControl> updated;
  REQUIRE(control->WithValue(20, updated, error));
  REQUIRE(updated->value() == 20);
  REQUIRE(control->value() == 70);
}

TEST_CASE("CameraControl enumerates valid values from min to max", "[controls]") {
  const auto control = MakeBrightness(50, 25);
  REQUIRE(control.has_value());
  REQUIRE(control->ValidValues() == std::vector<std::int32_t>{0, 25, 50, 75, 100});
}

TEST_CASE("CameraControl range steps include values SetValue rejects", "[controls]") {
  std::optional<CameraControl> control;
  CameraError error;
  REQUIRE(CameraControl::Create(KnownCameraControl::kGain, 1, 9, 4, 2, 4,
                                CameraControlFlag::kManual, true, control, error));
  REQUIRE(control->ValidValues() == std::vector<std::int32_t>{1, 3, 5, 7, 9});

  REQUIRE_FALSE(control->SetValue(1, error));
  REQUIRE(error.kind == CameraErrorKind::kStructure);
  REQUIRE_FALSE(control->SetValue(9, error));
  REQUIRE_FALSE(control->SetValue(3, error));
  REQUIRE(control->value() == 4);

  REQUIRE(control->SetValue(6, error));
  REQUIRE(control->value() == 6);
}

TEST_CASE("CameraControl sorts by control kind", "[controls]") {
  std::optional<CameraControl> focus;
  std::optional<CameraControl> contrast;
  CameraError error;
  REQUIRE(CameraControl::Create(KnownCameraControl::kFocus, 0, 10, 1, 1, 1,
                                CameraControlFlag::kAutomatic, true, focus, error));
  REQUIRE(CameraControl::Create(KnownCameraControl::kContrast, 0, 10, 9, 1, 1,
                                CameraControlFlag::kManual, false, contrast, error));
  REQUIRE(contrast.value() < focus.value());
  REQUIRE(camkit::controls::AllKnownCameraControls().size() == 17U);
  REQUIRE(std::string(camkit::controls::ToString(KnownCameraControl::kWhiteBalance)) ==
          "WhiteBalance");
}

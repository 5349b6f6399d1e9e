#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "lineplan/core/entities.hpp"
#include "lineplan/core/result.hpp"

namespace lineplan::core {

struct LaneOffsets {
  // Across-line z offset of each lane centre, metres.
  double a = -1.2;
  double b = -2.8;
  double c = 1.2;
  double d = 2.8;

  [[nodiscard]] double of(Lane lane) const {
    switch (lane) {
    case Lane::kA:
      return a;
    case Lane::kB:
      return b;
    case Lane::kC:
      return c;
    case Lane::kD:
      return d;
    }
    return a;
  }
};

struct FacingAngles {
  // Yaw in degrees about the height axis. 0 faces +z.
  double front_deg = -90.0;
  double back_deg = 90.0;
  double left_deg = 180.0;
  double right_deg = 0.0;

  [[nodiscard]] double of(Facing facing) const {
    switch (facing) {
    case Facing::kFront:
      return front_deg;
    case Facing::kBack:
      return back_deg;
    case Facing::kLeft:
      return left_deg;
    case Facing::kRight:
      return right_deg;
    }
    return front_deg;
  }
};

// Supermarket cabinet (AB) and table-and-chair (CD) between parts preparation and assembly.
struct PostPrepFixtureSettings {
  bool enabled = false;
  double depth_m = 2.0;
};

struct LayoutSettings {
  LaneOffsets lane_offsets{};
  FacingAngles facing{};
  double machine_pitch_m = 2.0;
  double section_gap_m = 2.0;
  double board_clearance_m = 1.5;
  double board_height_m = 2.5;
  double inspection_gap_m = 1.0;
  double trolley_along_offset_m = 3.5;
  double trolley_across_offset_m = 0.5;
  double fixture_clearance_m = 2.5;
  PostPrepFixtureSettings post_prep_fixtures{};
};

// Clamps negative spacings to zero. Fails for non-finite values or a non-positive machine pitch.
[[nodiscard]] PlanResult<LayoutSettings> NormalizeLayoutSettings(const LayoutSettings& settings);

[[nodiscard]] bool SameLayoutSettings(const LayoutSettings& a, const LayoutSettings& b);

struct SettingsLoadResult {
  bool ok = false;
  LayoutSettings settings{};
  std::string error{};
  ValidationResult warnings{};
};

// Scalar readers shared by every key=value file. Accept 1/0, true/false, True/False and whole-string
// numbers; return false and leave *out untouched otherwise.
[[nodiscard]] bool ParseBoolValue(std::string_view value, bool* out);
[[nodiscard]] bool ParseNumberValue(const std::string& value, double* out);

// key=value lines; '#' starts a comment line. Unknown keys and malformed values become warnings and
// leave the corresponding default untouched.
[[nodiscard]] SettingsLoadResult ParseLayoutSettings(std::istream& in);
[[nodiscard]] SettingsLoadResult LoadLayoutSettingsFile(const std::string& path);
void WriteLayoutSettings(std::ostream& out, const LayoutSettings& settings);
[[nodiscard]] PlanResult<bool> SaveLayoutSettingsFile(const std::string& path, const LayoutSettings& settings);

}  // namespace lineplan::core

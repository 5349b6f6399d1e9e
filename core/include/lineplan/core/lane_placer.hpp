#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lineplan/core/classification.hpp"
#include "lineplan/core/entities.hpp"
#include "lineplan/core/section_grouper.hpp"
#include "lineplan/core/settings.hpp"

namespace lineplan::core {

// Next free along-line offset per lane. Local to one generation call.
struct LaneCursors {
  std::array<double, kLaneCount> offsets{};

  [[nodiscard]] double at(Lane lane) const { return offsets[lane_index(lane)]; }
  void set(Lane lane, double x) { offsets[lane_index(lane)] = x; }

  [[nodiscard]] double max_of(LaneGroup group) const {
    return std::max(at(inner_lane(group)), at(outer_lane(group)));
  }
  [[nodiscard]] double max_all() const { return *std::max_element(offsets.begin(), offsets.end()); }

  void sync(LaneGroup group, double x) {
    set(inner_lane(group), x);
    set(outer_lane(group), x);
  }
  void sync_all(double x) { offsets.fill(x); }
};

inline constexpr std::string_view kPostPrepSectionLabel = "Post-prep";

struct SectionPlacementDebug {
  // Session diagnostics; not part of the entity contract.
  std::string label{};
  SectionKind kind = SectionKind::kPartsAB;
  std::string matched_keyword{};
  bool defaulted_kind = true;
  std::optional<LaneGroup> lane_group{};  // empty for assembly
  double start_x = 0.0;
  double end_x = 0.0;
  int machine_count = 0;
  int buttoning_machine_count = 0;
  int fixture_count = 0;
  bool post_prep_fixtures_before = false;
};

struct PlacementStep {
  LaneCursors cursors{};
  std::vector<PlacedEntity> entities{};  // ids unassigned
  SectionPlacementDebug debug{};
};

struct PlacementOutput {
  std::vector<PlacedEntity> entities{};
  std::vector<SectionPlacementDebug> section_debug{};
  LaneCursors final_cursors{};
};

class LanePlacer {
 public:
  explicit LanePlacer(const LayoutSettings& settings) : settings_(settings) {}

  // Folds PlaceSection over the buckets in order and assigns ids in emission order.
  [[nodiscard]] PlacementOutput Place(const std::vector<SectionBucket>& sections) const;

  [[nodiscard]] PlacementStep PlaceSection(const SectionBucket& section, const LaneCursors& cursors) const;

  [[nodiscard]] PlacementStep PlacePostPrepFixtures(const LaneCursors& cursors) const;

  [[nodiscard]] double machine_yaw_deg(Lane lane, const Operation& operation,
                                       std::optional<Facing> forced_facing = std::nullopt) const;

  [[nodiscard]] const LayoutSettings& settings() const { return settings_; }

 private:
  [[nodiscard]] PlacementStep place_parts_section(const SectionBucket& section,
                                                  const SectionClassification& classification,
                                                  const LaneCursors& cursors) const;
  [[nodiscard]] PlacementStep place_assembly_section(const SectionBucket& section,
                                                     const SectionClassification& classification,
                                                     const LaneCursors& cursors) const;
  [[nodiscard]] PlacedEntity make_machine(const Operation& operation, Lane lane, double x, int sequence_index,
                                          std::optional<Facing> forced_facing, const std::string& section) const;
  [[nodiscard]] PlacedEntity make_fixture(FixtureKind kind, const std::string& label, Lane lane, const Vec3d& position,
                                          Facing facing, const std::string& section) const;
  [[nodiscard]] static Lane board_lane_for_offset(double z);

  LayoutSettings settings_{};
};

}  // namespace lineplan::core

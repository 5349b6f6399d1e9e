#pragma once

#include <array>
#include <string>
#include <vector>

#include "lineplan/core/entities.hpp"
#include "lineplan/core/lane_placer.hpp"
#include "lineplan/core/result.hpp"
#include "lineplan/core/section_grouper.hpp"
#include "lineplan/core/settings.hpp"
#include "lineplan/core/types.hpp"

namespace lineplan::core {

struct SectionSummary {
  std::string label{};
  SectionKind kind = SectionKind::kPartsAB;
  int operation_count = 0;
  int machine_count = 0;
  double total_smv = 0.0;
  double start_x = 0.0;
  double end_x = 0.0;
};

struct LaneSummary {
  Lane lane = Lane::kA;
  int machine_count = 0;
  double min_x = 0.0;
  double max_x = 0.0;
};

struct LayoutSummary {
  double total_smv = 0.0;
  double takt_time_min = 0.0;
  int operation_count = 0;
  int machine_count = 0;
  int fixture_count = 0;
  // total_smv / (machine_count * takt); 0 when nothing was placed.
  double balance_efficiency = 0.0;
  std::vector<SectionSummary> sections{};
  std::array<LaneSummary, kLaneCount> lanes{};
  AABBd bounds{};
};

struct GeneratedLayout {
  std::vector<BalancedOperation> balanced{};
  std::vector<SectionBucket> sections{};
  std::vector<PlacedEntity> entities{};
  std::vector<SectionPlacementDebug> section_debug{};
  LayoutSummary summary{};
};

class LayoutGenerator {
 public:
  LayoutGenerator() = default;

  // Capacity planning, grouping and placement. Fails without a partial layout.
  [[nodiscard]] PlanResult<std::vector<PlacedEntity>> Generate(
      const std::vector<Operation>& operations,
      double target_output_per_day,
      double working_minutes_per_day) const;

  [[nodiscard]] PlanResult<GeneratedLayout> GenerateDetailed(
      const std::vector<Operation>& operations,
      double target_output_per_day,
      double working_minutes_per_day) const;

  // value reports whether the normalized settings differ from the current ones.
  PlanResult<bool> UpdateSettings(const LayoutSettings& settings);

  [[nodiscard]] const LayoutSettings& settings() const { return settings_; }

 private:
  LayoutSettings settings_{};
};

[[nodiscard]] ValidationResult ValidateLayout(const std::vector<PlacedEntity>& entities);

[[nodiscard]] LayoutSummary SummarizeLayout(
    const std::vector<BalancedOperation>& balanced,
    const std::vector<PlacedEntity>& entities,
    double target_output_per_day,
    double working_minutes_per_day);

// Representative shirt bulletin for the viewer and smoke tests.
std::vector<Operation> make_demo_operations();

}  // namespace lineplan::core

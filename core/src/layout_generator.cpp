#include "lineplan/core/layout_generator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lineplan/core/capacity_planner.hpp"
#include "lineplan/core/section_grouper.hpp"

namespace lineplan::core {

namespace {

// Along-line offsets are compared on a micrometre grid.
constexpr double kSlotQuantum = 1e-6;

bool is_finite(const Vec3d& v) { return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z); }

void expand(AABBd& box, const Vec3d& p, bool first) {
  if (first) {
    box.min = p;
    box.max = p;
    return;
  }
  box.min = {std::min(box.min.x, p.x), std::min(box.min.y, p.y), std::min(box.min.z, p.z)};
  box.max = {std::max(box.max.x, p.x), std::max(box.max.y, p.y), std::max(box.max.z, p.z)};
}

} // namespace

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

bool ValidationResult::has_code(const std::string& code) const {
  for (const ValidationIssue& issue : issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

PlanResult<std::vector<PlacedEntity>> LayoutGenerator::Generate(const std::vector<Operation>& operations,
                                                                double target_output_per_day,
                                                                double working_minutes_per_day) const {
  PlanResult<GeneratedLayout> detailed = GenerateDetailed(operations, target_output_per_day, working_minutes_per_day);
  if (!detailed.ok) {
    return make_plan_error<std::vector<PlacedEntity>>(detailed.code, detailed.error);
  }
  PlanResult<std::vector<PlacedEntity>> result;
  result.ok = true;
  result.value = std::move(detailed.value.entities);
  return result;
}

PlanResult<GeneratedLayout> LayoutGenerator::GenerateDetailed(const std::vector<Operation>& operations,
                                                              double target_output_per_day,
                                                              double working_minutes_per_day) const {
  PlanResult<std::vector<BalancedOperation>> balanced =
      PlanCapacity(operations, target_output_per_day, working_minutes_per_day);
  if (!balanced.ok) {
    return make_plan_error<GeneratedLayout>(balanced.code, balanced.error);
  }

  PlanResult<GeneratedLayout> result;
  GeneratedLayout& layout = result.value;
  layout.balanced = std::move(balanced.value);
  layout.sections = GroupSections(layout.balanced);

  const LanePlacer placer(settings_);
  PlacementOutput placed = placer.Place(layout.sections);
  layout.entities = std::move(placed.entities);
  layout.section_debug = std::move(placed.section_debug);
  layout.summary = SummarizeLayout(layout.balanced, layout.entities, target_output_per_day, working_minutes_per_day);
  result.ok = true;
  return result;
}

PlanResult<bool> LayoutGenerator::UpdateSettings(const LayoutSettings& settings) {
  const PlanResult<LayoutSettings> normalized = NormalizeLayoutSettings(settings);
  if (!normalized.ok) {
    return make_plan_error<bool>(normalized.code, normalized.error);
  }
  const bool changed = !SameLayoutSettings(normalized.value, settings_);
  settings_ = normalized.value;

  PlanResult<bool> result;
  result.ok = true;
  result.value = changed;
  return result;
}

ValidationResult ValidateLayout(const std::vector<PlacedEntity>& entities) {
  ValidationResult result;
  std::unordered_map<EntityId, std::size_t> seen_ids;
  std::unordered_map<std::string, std::size_t> seen_display_ids;
  std::set<std::pair<int, long long>> machine_slots;

  for (const PlacedEntity& entity : entities) {
    if (entity.id == kInvalidEntityId) {
      result.issues.push_back({ValidationSeverity::kError, "EntityIdMissing", "Entity has no id", entity.id});
    } else if (++seen_ids[entity.id] == 2) {
      result.issues.push_back({ValidationSeverity::kError, "DuplicateEntityId", "Entity id is not unique", entity.id});
    }
    if (!entity.display_id.empty() && ++seen_display_ids[entity.display_id] == 2) {
      result.issues.push_back({
          ValidationSeverity::kError,
          "DuplicateDisplayId",
          "Display id '" + entity.display_id + "' is not unique",
          entity.id,
      });
    }

    if (!is_finite(entity.transform.position) || !is_finite(entity.transform.rotation_euler_deg)) {
      result.issues.push_back(
          {ValidationSeverity::kError, "NonFiniteTransform", "Entity transform has non-finite value", entity.id});
      continue;
    }
    if (entity.transform.rotation_euler_deg.x != 0.0 || entity.transform.rotation_euler_deg.z != 0.0) {
      result.issues.push_back({ValidationSeverity::kError, "UnexpectedRotationAxis",
                               "Only yaw may be non-zero", entity.id});
    }

    if (entity.is_machine()) {
      if (entity.sequence_index < 0) {
        result.issues.push_back({ValidationSeverity::kError, "MachineSequenceMissing",
                                 "Machine has no sequence index", entity.id});
      }
      const long long slot = std::llround(entity.transform.position.x / kSlotQuantum);
      if (!machine_slots.insert({lane_index(entity.lane), slot}).second) {
        result.issues.push_back({
            ValidationSeverity::kError,
            "MachineSlotCollision",
            "Another machine already occupies this lane offset",
            entity.id,
        });
      }
    } else if (entity.sequence_index != kNoSequenceIndex) {
      result.issues.push_back(
          {ValidationSeverity::kWarning, "FixtureHasSequence", "Fixture carries a sequence index", entity.id});
    }
  }
  return result;
}

LayoutSummary SummarizeLayout(const std::vector<BalancedOperation>& balanced,
                              const std::vector<PlacedEntity>& entities,
                              double target_output_per_day,
                              double working_minutes_per_day) {
  LayoutSummary summary;
  summary.operation_count = static_cast<int>(balanced.size());
  for (const BalancedOperation& item : balanced) {
    summary.total_smv += item.operation.smv;
  }
  if (CheckDemand(target_output_per_day, working_minutes_per_day).ok) {
    summary.takt_time_min = TaktTimeMinutes(target_output_per_day, working_minutes_per_day);
  }

  for (int i = 0; i < kLaneCount; ++i) {
    summary.lanes[static_cast<std::size_t>(i)].lane = static_cast<Lane>(i);
  }

  std::map<std::string, std::size_t> section_index;
  for (const SectionBucket& bucket : GroupSections(balanced)) {
    SectionSummary section{};
    section.label = bucket.label;
    section.kind = ClassifySection(bucket.label).kind;
    section.operation_count = static_cast<int>(bucket.operations.size());
    for (const BalancedOperation& item : bucket.operations) {
      section.total_smv += item.operation.smv;
    }
    section_index.emplace(bucket.label, summary.sections.size());
    summary.sections.push_back(std::move(section));
  }

  std::vector<bool> section_touched(summary.sections.size(), false);
  std::vector<bool> lane_touched(kLaneCount, false);
  bool first_point = true;
  for (const PlacedEntity& entity : entities) {
    const Vec3d& p = entity.transform.position;
    expand(summary.bounds, p, first_point);
    first_point = false;

    if (auto it = section_index.find(entity.section); it != section_index.end()) {
      SectionSummary& section = summary.sections[it->second];
      if (!section_touched[it->second]) {
        section.start_x = p.x;
        section.end_x = p.x;
        section_touched[it->second] = true;
      }
      section.start_x = std::min(section.start_x, p.x);
      section.end_x = std::max(section.end_x, p.x);
      if (entity.is_machine()) {
        ++section.machine_count;
      }
    }

    if (!entity.is_machine()) {
      ++summary.fixture_count;
      continue;
    }
    ++summary.machine_count;
    const std::size_t lane = static_cast<std::size_t>(lane_index(entity.lane));
    LaneSummary& lane_summary = summary.lanes[lane];
    if (!lane_touched[lane]) {
      lane_summary.min_x = p.x;
      lane_summary.max_x = p.x;
      lane_touched[lane] = true;
    }
    lane_summary.min_x = std::min(lane_summary.min_x, p.x);
    lane_summary.max_x = std::max(lane_summary.max_x, p.x);
    ++lane_summary.machine_count;
  }

  if (summary.machine_count > 0 && summary.takt_time_min > 0.0) {
    summary.balance_efficiency = summary.total_smv / (static_cast<double>(summary.machine_count) * summary.takt_time_min);
  }
  return summary;
}

std::vector<Operation> make_demo_operations() {
  return {
      {"1", "Collar run stitch", "SNLS", 0.55, "Collar"},
      {"2", "Collar trim and turn", "Turning Machine", 0.30, "Collar"},
      {"3", "Collar press", "Iron Press", 0.35, "Collar"},
      {"4", "Collar top stitch", "SNLS", 0.60, "Collar"},
      {"5", "Collar band attach", "SNLS", 0.70, "Collar"},
      {"6", "Cuff run stitch", "SNLS", 0.45, "Cuff"},
      {"7", "Cuff turn and point", "Pointing Machine", 0.25, "Cuff"},
      {"8", "Cuff top stitch", "SNLS", 0.40, "Cuff"},
      {"9", "Sleeve placket attach", "SNLS", 0.65, "Sleeve"},
      {"10", "Sleeve placket box", "SNLS", 0.50, "Sleeve"},
      {"11", "Sleeve pleat tack", "Bartack", 0.20, "Sleeve"},
      {"12", "Front placket fold", "FOA", 0.40, "Front"},
      {"13", "Front pocket hem", "SNLS", 0.30, "Front"},
      {"14", "Front pocket attach", "SNLS", 0.75, "Front"},
      {"15", "Front button hole", "Button Hole", 0.35, "Front"},
      {"16", "Back yoke attach", "SNLS", 0.55, "Back"},
      {"17", "Back yoke top stitch", "SNLS", 0.45, "Back"},
      {"18", "Back label attach", "SNLS", 0.20, "Back"},
      {"19", "Shoulder join", "Overlock", 0.50, "Assembly"},
      {"20", "Sleeve attach", "Overlock", 0.80, "Assembly"},
      {"21", "Side seam", "Overlock", 0.85, "Assembly"},
      {"22", "Collar attach", "SNLS", 0.90, "Assembly"},
      {"23", "Cuff attach", "SNLS", 0.75, "Assembly"},
      {"24", "Bottom hem", "SNLS", 0.60, "Assembly"},
      {"25", "Button sew", "Button Stitch", 0.45, "Assembly"},
      {"26", "Button wrap", "Button Wrapping", 0.30, "Assembly"},
      {"27", "Final inspection", "Inspection Table", 0.40, "Assembly"},
  };
}

} // namespace lineplan::core

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <functional>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "lineplan/core/capacity_planner.hpp"
#include "lineplan/core/catalog.hpp"
#include "lineplan/core/classification.hpp"
#include "lineplan/core/lane_placer.hpp"
#include "lineplan/core/layout_generator.hpp"
#include "lineplan/core/section_grouper.hpp"
#include "lineplan/core/settings.hpp"

namespace {

using lineplan::core::BalancedOperation;
using lineplan::core::Facing;
using lineplan::core::FixtureKind;
using lineplan::core::GeneratedLayout;
using lineplan::core::Lane;
using lineplan::core::LaneCursors;
using lineplan::core::LaneGroup;
using lineplan::core::LanePlacer;
using lineplan::core::LayoutGenerator;
using lineplan::core::LayoutSettings;
using lineplan::core::MachineCategory;
using lineplan::core::Operation;
using lineplan::core::PlacedEntity;
using lineplan::core::PlanError;
using lineplan::core::SectionBucket;
using lineplan::core::SectionKind;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

Operation op(const std::string& op_no, double smv, const std::string& machine_type, const std::string& section,
             const std::string& op_name = "") {
  return {op_no, op_name.empty() ? "Op " + op_no : op_name, machine_type, smv, section};
}

std::vector<const PlacedEntity*> machines_of(const std::vector<PlacedEntity>& entities) {
  std::vector<const PlacedEntity*> out;
  for (const PlacedEntity& entity : entities) {
    if (entity.is_machine()) {
      out.push_back(&entity);
    }
  }
  return out;
}

std::vector<const PlacedEntity*> machines_in_lane(const std::vector<PlacedEntity>& entities, Lane lane) {
  std::vector<const PlacedEntity*> out;
  for (const PlacedEntity* entity : machines_of(entities)) {
    if (entity->lane == lane) {
      out.push_back(entity);
    }
  }
  return out;
}

const PlacedEntity* first_fixture(const std::vector<PlacedEntity>& entities, FixtureKind kind) {
  for (const PlacedEntity& entity : entities) {
    if (entity.is_fixture_kind(kind)) {
      return &entity;
    }
  }
  return nullptr;
}

int count_fixtures(const std::vector<PlacedEntity>& entities, FixtureKind kind) {
  return static_cast<int>(std::count_if(entities.begin(), entities.end(),
                                        [kind](const PlacedEntity& e) { return e.is_fixture_kind(kind); }));
}

std::vector<PlacedEntity> generate_or_empty(const std::vector<Operation>& operations, double target, double minutes,
                                            const LayoutSettings& settings = {}) {
  LayoutGenerator generator;
  if (!generator.UpdateSettings(settings).ok) {
    return {};
  }
  const auto result = generator.Generate(operations, target, minutes);
  return result.ok ? result.value : std::vector<PlacedEntity>{};
}

// Intent: RequiredMachineCount is ceil(smv * target / minutes) and never below one.
bool test_required_machine_count_ceil_and_floor() {
  using lineplan::core::RequiredMachineCount;
  if (RequiredMachineCount(1.0, 480.0, 480.0) != 1) {
    return false;
  }
  if (RequiredMachineCount(1.01, 480.0, 480.0) != 2) {
    return false;
  }
  if (RequiredMachineCount(0.55, 1200.0, 480.0) != 2) {  // 1.375
    return false;
  }
  if (RequiredMachineCount(0.8, 1200.0, 480.0) != 2) {  // exactly 2.0
    return false;
  }
  if (RequiredMachineCount(0.0, 1200.0, 480.0) != 1) {
    return false;
  }
  return RequiredMachineCount(0.01, 10.0, 480.0) == 1;
}

// Intent: Floating-point noise around an exact integer ratio must not add a machine.
bool test_required_machine_count_absorbs_rounding_noise() {
  // 0.1 * 3 * 1600 / 480 is 1.0000000000000002 in doubles.
  return lineplan::core::RequiredMachineCount(0.1 * 3.0, 1600.0, 480.0) == 1 &&
         lineplan::core::RequiredMachineCount(0.7, 480.0, 48.0) == 7;
}

// Intent: A real fraction just above an integer still rounds up; only rounding noise is absorbed.
bool test_required_machine_count_keeps_small_fractions() {
  using lineplan::core::RequiredMachineCount;
  return RequiredMachineCount(1.0000000005, 480.0, 480.0) == 2 && RequiredMachineCount(3.000001, 480.0, 480.0) == 4;
}

// Intent: A ratio beyond int range saturates instead of wrapping to a small count.
bool test_required_machine_count_saturates() {
  using lineplan::core::RequiredMachineCount;
  constexpr int kMax = std::numeric_limits<int>::max();
  return RequiredMachineCount(1e12, 1.0, 1.0) == kMax && RequiredMachineCount(1e300, 1e300, 1.0) == kMax;
}

// Intent: Takt time is working minutes divided by target output.
bool test_takt_time() {
  return almost_equal(lineplan::core::TaktTimeMinutes(1200.0, 480.0), 0.4);
}

// Intent: PlanCapacity keeps input order and pairs every operation with its count.
bool test_plan_capacity_keeps_order() {
  const std::vector<Operation> ops = {op("10", 2.0, "SNLS", "Cuff"), op("11", 1.0, "SNLS", "Cuff"),
                                      op("3", 0.0, "Helper Table", "Back")};
  const auto result = lineplan::core::PlanCapacity(ops, 480.0, 480.0);
  if (!result.ok || result.value.size() != 3) {
    return false;
  }
  return result.value[0].operation.op_no == "10" && result.value[0].required_machine_count == 2 &&
         result.value[1].operation.op_no == "11" && result.value[1].required_machine_count == 1 &&
         result.value[2].operation.op_no == "3" && result.value[2].required_machine_count == 1;
}

// Intent: Non-positive or non-finite demand is rejected before any operation is looked at.
bool test_invalid_demand_rejected() {
  const std::vector<Operation> ops = {op("1", 1.0, "SNLS", "Cuff")};
  const auto zero_target = lineplan::core::PlanCapacity(ops, 0.0, 480.0);
  const auto negative_minutes = lineplan::core::PlanCapacity(ops, 480.0, -1.0);
  const auto nan_target = lineplan::core::PlanCapacity(ops, std::nan(""), 480.0);
  return !zero_target.ok && zero_target.code == PlanError::kInvalidDemand && zero_target.value.empty() &&
         !negative_minutes.ok && negative_minutes.code == PlanError::kInvalidDemand && !nan_target.ok &&
         nan_target.code == PlanError::kInvalidDemand;
}

// Intent: Missing op_no / machine_type and negative smv are malformed operations.
bool test_malformed_operation_rejected() {
  const auto missing_op_no = lineplan::core::PlanCapacity({op("", 1.0, "SNLS", "Cuff")}, 480.0, 480.0);
  const auto missing_type = lineplan::core::PlanCapacity({op("1", 1.0, "", "Cuff")}, 480.0, 480.0);
  const auto negative_smv = lineplan::core::PlanCapacity({op("1", -0.5, "SNLS", "Cuff")}, 480.0, 480.0);
  const auto inf_smv = lineplan::core::PlanCapacity({op("1", INFINITY, "SNLS", "Cuff")}, 480.0, 480.0);
  for (const auto* result : {&missing_op_no, &missing_type, &negative_smv, &inf_smv}) {
    if (result->ok || result->code != PlanError::kMalformedOperation || result->error.empty()) {
      return false;
    }
  }
  return missing_type.error.find("machine_type") != std::string::npos;
}

// Intent: An operation needing more machines than an int holds fails the call and is named in the error.
bool test_machine_count_overflow_rejected() {
  const std::vector<Operation> ops = {op("1", 0.5, "SNLS", "Cuff"), op("7B", 5e9, "SNLS", "Cuff")};
  const auto huge = lineplan::core::PlanCapacity(ops, 1.0, 1.0);
  const auto infinite = lineplan::core::PlanCapacity({op("9", 1e300, "SNLS", "Cuff")}, 1e300, 1.0);
  const auto fits = lineplan::core::PlanCapacity({op("2", 1e6, "SNLS", "Cuff")}, 1000.0, 1.0);
  return !huge.ok && huge.code == PlanError::kMalformedOperation && huge.value.empty() &&
         huge.error.find("#1 (7B)") != std::string::npos && !infinite.ok &&
         infinite.code == PlanError::kMalformedOperation && fits.ok && fits.value.size() == 1 &&
         fits.value[0].required_machine_count == 1000000000;
}

// Intent: Section rules are ordered: assembly, then CD keywords, then AB keywords, else AB by default.
bool test_section_classification_rules() {
  using lineplan::core::ClassifySection;
  const auto assembly = ClassifySection("Final Assembly");
  const auto collar = ClassifySection("COLLAR");
  const auto front_back = ClassifySection("Front & Back");
  const auto sleeve = ClassifySection("sleeve prep");
  const auto other = ClassifySection("Pocket");
  return assembly.kind == SectionKind::kAssembly && !assembly.defaulted && collar.kind == SectionKind::kPartsCD &&
         collar.matched_keyword == "collar" && front_back.kind == SectionKind::kPartsCD &&
         front_back.matched_keyword == "front" && sleeve.kind == SectionKind::kPartsAB && !sleeve.defaulted &&
         other.kind == SectionKind::kPartsAB && other.defaulted && other.matched_keyword.empty() &&
         lineplan::core::lane_group_for(SectionKind::kPartsCD) == LaneGroup::kCD &&
         lineplan::core::lane_group_for(SectionKind::kPartsAB) == LaneGroup::kAB;
}

// Intent: Ironing, pressing and inspection stations are forced to face Front.
bool test_facing_override_rules() {
  using lineplan::core::ResolveFacingOverride;
  return ResolveFacingOverride("Iron Table") == Facing::kFront && ResolveFacingOverride("Fusing PRESS") == Facing::kFront &&
         ResolveFacingOverride("inspection table") == Facing::kFront && !ResolveFacingOverride("SNLS").has_value();
}

// Intent: Buttoning is detected from either the machine type or the operation name.
bool test_buttoning_detection() {
  using lineplan::core::IsButtoningOperation;
  return IsButtoningOperation(op("1", 0.3, "Button Stitch", "Assembly")) &&
         IsButtoningOperation(op("2", 0.3, "Special", "Assembly", "Sew BUTTONS")) &&
         !IsButtoningOperation(op("3", 0.3, "SNLS", "Assembly", "Side seam"));
}

// Intent: Machine categories come from the normalized type key; unknown types fall back to default.
bool test_machine_category_catalog() {
  using lineplan::core::ClassifyMachine;
  return ClassifyMachine("S.N.L.S") == MachineCategory::kSnls && ClassifyMachine("Single Needle") == MachineCategory::kSnls &&
         ClassifyMachine("Overlock 3T") == MachineCategory::kSnec && ClassifyMachine("Iron") == MachineCategory::kIron &&
         ClassifyMachine("B-Hole") == MachineCategory::kButton && ClassifyMachine("Bartack") == MachineCategory::kBartack &&
         ClassifyMachine("Turning Machine") == MachineCategory::kSpecial &&
         ClassifyMachine("Helper") == MachineCategory::kHelper && ClassifyMachine("Laser cutter") == MachineCategory::kDefault &&
         ClassifyMachine("") == MachineCategory::kDefault && lineplan::core::normalize_machine_key(" Button_Hole ") == "buttonhole";
}

// Intent: Footprints resolve button hole before button stitch and fall back to the default size.
bool test_machine_footprint_catalog() {
  using lineplan::core::kFeetToMetres;
  using lineplan::core::MachineFootprint;
  const auto snls = MachineFootprint("SNLS");
  const auto iron = MachineFootprint("Iron Press");
  const auto unknown = MachineFootprint("Laser cutter");
  const auto fallback = lineplan::core::default_machine_footprint();
  const auto& rules = lineplan::core::machine_footprint_rules();
  std::size_t hole_index = rules.size();
  std::size_t stitch_index = rules.size();
  for (std::size_t i = 0; i < rules.size(); ++i) {
    if (rules[i].model_name == "Button Hole") {
      hole_index = i;
    } else if (rules[i].model_name == "Button Stitch") {
      stitch_index = i;
    }
  }
  return almost_equal(snls.length_m, 4.0 * kFeetToMetres) && almost_equal(snls.width_m, 2.5 * kFeetToMetres) &&
         almost_equal(iron.length_m, 5.0 * kFeetToMetres) && almost_equal(unknown.length_m, fallback.length_m) &&
         almost_equal(unknown.width_m, fallback.width_m) && hole_index < stitch_index && stitch_index < rules.size();
}

// Intent: Section envelopes use the LINE 6 profile where it has an entry and the default otherwise.
bool test_section_envelopes() {
  using lineplan::core::kFeetToMetres;
  using lineplan::core::SectionEnvelope;
  const auto line6_cuff = SectionEnvelope("LINE 6", " Cuff ");
  const auto line6_back = SectionEnvelope("line 6", "Back");
  const auto default_cuff = SectionEnvelope("LINE 2", "cuff");
  const auto pocket = SectionEnvelope("LINE 2", "Pocket");
  return line6_cuff.has_value() && almost_equal(line6_cuff->length_m, 30.9498 * kFeetToMetres) &&
         line6_back.has_value() && almost_equal(line6_back->length_m, 43.6927 * kFeetToMetres) &&
         default_cuff.has_value() && almost_equal(default_cuff->length_m, 34.34 * kFeetToMetres) &&
         !pocket.has_value();
}

// Intent: Grouping is first-seen ordered, case-insensitive, trimmed, and defaults blank labels to Unknown.
bool test_group_sections() {
  const std::vector<BalancedOperation> balanced = {
      {op("1", 1.0, "SNLS", "Cuff"), 1},   {op("2", 1.0, "SNLS", " collar"), 1},
      {op("3", 1.0, "SNLS", "cuff "), 2},  {op("4", 1.0, "SNLS", ""), 1},
      {op("5", 1.0, "SNLS", "COLLAR"), 1}, {op("6", 1.0, "SNLS", "   "), 1},
  };
  const auto buckets = lineplan::core::GroupSections(balanced);
  if (buckets.size() != 3) {
    return false;
  }
  return buckets[0].label == "Cuff" && buckets[0].operations.size() == 2 &&
         buckets[0].operations[1].operation.op_no == "3" && buckets[0].operations[1].required_machine_count == 2 &&
         buckets[1].label == "collar" && buckets[1].operations.size() == 2 && buckets[2].label == "Unknown" &&
         buckets[2].operations.size() == 2;
}

// Intent: Example 1 places a single cuff machine in lane A at the section's first slot.
bool test_example_single_machine() {
  const auto entities = generate_or_empty({op("1", 1.0, "SNLS", "Cuff")}, 480.0, 480.0);
  const auto machines = machines_of(entities);
  const PlacedEntity* board = first_fixture(entities, FixtureKind::kSectionBoard);
  if (machines.size() != 1 || board == nullptr) {
    return false;
  }
  const LayoutSettings defaults{};
  const double first_slot = defaults.section_gap_m + defaults.board_clearance_m;
  const PlacedEntity& m = *machines[0];
  return m.lane == Lane::kA && almost_equal(m.transform.position.x, first_slot) &&
         almost_equal(m.transform.position.z, defaults.lane_offsets.a) && almost_equal(m.yaw_deg(), 180.0) &&
         m.sequence_index == 0 && m.section == "Cuff" && almost_equal(board->transform.position.x, defaults.section_gap_m) &&
         almost_equal(board->transform.position.y, defaults.board_height_m);
}

// Intent: Example 2 puts the first run in consecutive lane A slots and the second run in lane B.
bool test_example_alternating_runs() {
  const auto entities = generate_or_empty({op("1", 2.0, "SNLS", "Cuff"), op("2", 1.0, "SNLS", "Cuff")}, 480.0, 480.0);
  const auto lane_a = machines_in_lane(entities, Lane::kA);
  const auto lane_b = machines_in_lane(entities, Lane::kB);
  if (lane_a.size() != 2 || lane_b.size() != 1) {
    return false;
  }
  return almost_equal(lane_a[0]->transform.position.x, 3.5) && almost_equal(lane_a[1]->transform.position.x, 5.5) &&
         lane_a[0]->sequence_index == 0 && lane_a[1]->sequence_index == 1 &&
         lane_a[0]->operation()->op_no == "1" && lane_b[0]->operation()->op_no == "2" &&
         almost_equal(lane_b[0]->transform.position.x, 3.5) && lane_b[0]->sequence_index == 0 &&
         almost_equal(lane_b[0]->yaw_deg(), 0.0);
}

// Intent: Example 3 lays three 3-machine assembly operations as rows across A/B/C, all facing Front.
bool test_example_assembly_rows() {
  const auto entities = generate_or_empty(
      {op("1", 3.0, "SNLS", "Assembly"), op("2", 3.0, "Overlock", "Assembly"), op("3", 3.0, "SNLS", "Assembly")},
      480.0, 480.0);
  const auto machines = machines_of(entities);
  if (machines.size() != 9) {
    return false;
  }
  for (const Lane lane : {Lane::kA, Lane::kB, Lane::kC}) {
    if (machines_in_lane(entities, lane).size() != 3) {
      return false;
    }
  }
  for (const PlacedEntity* m : machines) {
    if (!almost_equal(m->yaw_deg(), -90.0)) {
      return false;
    }
    // One row per operation.
    const int row = std::stoi(m->operation()->op_no) - 1;
    if (!almost_equal(m->transform.position.x, 2.0 + 2.0 * row)) {
      return false;
    }
  }
  const PlacedEntity* board = first_fixture(entities, FixtureKind::kSectionBoard);
  return board != nullptr && almost_equal(board->transform.position.z, 0.0) && board->lane == Lane::kC &&
         machines_in_lane(entities, Lane::kD).empty();
}

// Intent: Example 4 returns an empty layout for an empty bulletin without failing.
bool test_example_empty_input() {
  LayoutGenerator generator;
  const auto result = generator.Generate({}, 1200.0, 480.0);
  return result.ok && result.value.empty() && result.code == PlanError::kNone;
}

// Intent: Example 5 fails with InvalidDemand and produces no entities for a zero target.
bool test_example_zero_target() {
  LayoutGenerator generator;
  const auto result = generator.Generate({op("1", 1.0, "SNLS", "Cuff")}, 0.0, 480.0);
  return !result.ok && result.code == PlanError::kInvalidDemand && result.value.empty();
}

// Intent: Generation is deterministic for identical inputs and settings.
bool test_generation_is_idempotent() {
  const auto ops = lineplan::core::make_demo_operations();
  const auto first = generate_or_empty(ops, 1200.0, 480.0);
  const auto second = generate_or_empty(ops, 1200.0, 480.0);
  if (first.empty() || first.size() != second.size()) {
    return false;
  }
  for (std::size_t i = 0; i < first.size(); ++i) {
    const PlacedEntity& a = first[i];
    const PlacedEntity& b = second[i];
    if (a.id != b.id || a.display_id != b.display_id || a.lane != b.lane ||
        !(a.transform.position == b.transform.position) ||
        !(a.transform.rotation_euler_deg == b.transform.rotation_euler_deg) || a.section != b.section ||
        a.sequence_index != b.sequence_index) {
      return false;
    }
  }
  return true;
}

// Intent: No two machines share a lane and along-line offset in the demo layout.
bool test_no_machine_slot_collisions() {
  const auto entities = generate_or_empty(lineplan::core::make_demo_operations(), 1500.0, 480.0);
  std::set<std::pair<int, long long>> slots;
  for (const PlacedEntity* m : machines_of(entities)) {
    if (!slots.insert({lineplan::core::lane_index(m->lane), std::llround(m->transform.position.x * 1e6)}).second) {
      return false;
    }
  }
  return !slots.empty() && lineplan::core::ValidateLayout(entities).ok();
}

// Intent: Non-forced machines face their lane default (A Left, B Right, C Right, D Left); irons face Front.
bool test_lane_facing_and_iron_override() {
  const auto entities = generate_or_empty({op("1", 1.0, "SNLS", "Cuff"), op("2", 1.0, "SNLS", "Cuff"),
                                           op("3", 1.0, "SNLS", "Collar"), op("4", 1.0, "SNLS", "Collar"),
                                           op("5", 1.0, "Iron Press", "Collar")},
                                          480.0, 480.0);
  const auto a = machines_in_lane(entities, Lane::kA);
  const auto b = machines_in_lane(entities, Lane::kB);
  const auto c = machines_in_lane(entities, Lane::kC);
  const auto d = machines_in_lane(entities, Lane::kD);
  if (a.size() != 1 || b.size() != 1 || c.size() != 2 || d.size() != 1) {
    return false;
  }
  return almost_equal(a[0]->yaw_deg(), 180.0) && almost_equal(b[0]->yaw_deg(), 0.0) &&
         almost_equal(c[0]->yaw_deg(), 0.0) && almost_equal(d[0]->yaw_deg(), 180.0) &&
         c[1]->operation()->op_no == "5" && almost_equal(c[1]->yaw_deg(), -90.0) &&
         c[1]->category == MachineCategory::kIron;
}

// Intent: Every parts section gets board, inspection and trolley with the trolley offset toward the partner lane.
bool test_parts_section_fixtures() {
  const auto entities = generate_or_empty({op("1", 2.0, "SNLS", "Cuff"), op("2", 1.0, "SNLS", "Cuff")}, 480.0, 480.0);
  const PlacedEntity* inspection = first_fixture(entities, FixtureKind::kInspectionTable);
  const PlacedEntity* trolley = first_fixture(entities, FixtureKind::kMaterialTrolley);
  if (inspection == nullptr || trolley == nullptr || entities.size() != 6) {
    return false;
  }
  // Lane A ends at 7.5 (two machines from 3.5); inspection sits one gap further.
  return almost_equal(inspection->transform.position.x, 8.5) && inspection->lane == Lane::kA &&
         almost_equal(inspection->yaw_deg(), -90.0) && almost_equal(trolley->transform.position.x, 12.0) &&
         almost_equal(trolley->transform.position.z, -1.7) && almost_equal(trolley->yaw_deg(), 0.0) &&
         !inspection->is_machine() && inspection->sequence_index == lineplan::core::kNoSequenceIndex &&
         inspection->section == "Cuff";
}

// Intent: PlaceSection threads cursors: the next section of the same pair starts past the trolley.
bool test_place_section_threads_cursors() {
  const LanePlacer placer(LayoutSettings{});
  SectionBucket cuff{"Cuff", {{op("1", 1.0, "SNLS", "Cuff"), 1}}};
  SectionBucket collar{"Collar", {{op("2", 1.0, "SNLS", "Collar"), 3}}};
  const auto first = placer.PlaceSection(cuff, LaneCursors{});
  // Board 2, machine 3.5 -> 5.5, inspection 6.5, trolley 10.0 -> cursors 10.0.
  if (!almost_equal(first.cursors.at(Lane::kA), 10.0) || !almost_equal(first.cursors.at(Lane::kB), 10.0) ||
      !almost_equal(first.cursors.at(Lane::kC), 0.0) || first.debug.lane_group != LaneGroup::kAB ||
      first.debug.machine_count != 1 || first.debug.fixture_count != 3) {
    return false;
  }
  const auto second = placer.PlaceSection(collar, first.cursors);
  // CD pair is untouched by the cuff section, so collar starts from zero.
  const auto collar_machines = machines_of(second.entities);
  if (collar_machines.size() != 3 || !almost_equal(collar_machines[0]->transform.position.x, 3.5) ||
      collar_machines[2]->sequence_index != 2 || collar_machines[0]->lane != Lane::kC) {
    return false;
  }
  SectionBucket sleeve{"Sleeve", {{op("3", 1.0, "SNLS", "Sleeve"), 1}}};
  const auto third = placer.PlaceSection(sleeve, second.cursors);
  const PlacedEntity* board = first_fixture(third.entities, FixtureKind::kSectionBoard);
  return board != nullptr && almost_equal(board->transform.position.x, 12.0) &&
         almost_equal(third.cursors.at(Lane::kC), second.cursors.at(Lane::kC));
}

// Intent: Buttoning assembly work goes to lane D sequentially while main work fills A/B/C rows.
bool test_assembly_buttoning_lane() {
  const auto entities = generate_or_empty({op("1", 1.0, "SNLS", "Cuff"), op("2", 4.0, "Overlock", "Assembly"),
                                           op("3", 2.0, "Button Stitch", "Assembly"),
                                           op("4", 1.0, "SNLS", "Assembly", "Button wrap by hand")},
                                          480.0, 480.0);
  const auto d = machines_in_lane(entities, Lane::kD);
  const auto a = machines_in_lane(entities, Lane::kA);
  if (d.size() != 3 || a.size() != 3) {  // cuff in A plus two rows of op 2
    return false;
  }
  const PlacedEntity* assembly_board = nullptr;
  for (const PlacedEntity& entity : entities) {
    if (entity.is_board() && entity.section == "Assembly") {
      assembly_board = &entity;
    }
  }
  if (assembly_board == nullptr) {
    return false;
  }
  // Cuff ends at 10.0, so assembly starts at 12.0 across every lane.
  const double start = assembly_board->transform.position.x;
  return almost_equal(start, 12.0) && almost_equal(d[0]->transform.position.x, start) &&
         almost_equal(d[1]->transform.position.x, start + 2.0) && almost_equal(d[2]->transform.position.x, start + 4.0) &&
         d[2]->operation()->op_no == "4" && almost_equal(a[2]->transform.position.x, start + 2.0) &&
         almost_equal(d[0]->yaw_deg(), -90.0);
}

// Intent: Ids and display ids are unique and follow emission order.
bool test_ids_and_display_ids() {
  const auto entities = generate_or_empty({op("7", 2.0, "SNLS", "Cuff"), op("7", 1.0, "SNLS", "Cuff")}, 480.0, 480.0);
  if (entities.size() != 6) {
    return false;
  }
  for (std::size_t i = 0; i < entities.size(); ++i) {
    if (entities[i].id != static_cast<lineplan::core::EntityId>(i + 1)) {
      return false;
    }
  }
  return entities[0].display_id == "BOARD-000001" && entities[1].display_id == "7-0-000002" &&
         entities[2].display_id == "7-1-000003" && entities[3].display_id == "7-0-000004" &&
         starts_with(entities[4].display_id, "INSP-") && starts_with(entities[5].display_id, "TROLLEY-") &&
         lineplan::core::ValidateLayout(entities).ok();
}

// Intent: Post-prep fixtures are absent by default and inserted before assembly once enabled.
bool test_post_prep_fixtures() {
  const std::vector<Operation> ops = {op("1", 1.0, "SNLS", "Cuff"), op("2", 1.0, "SNLS", "Collar"),
                                      op("3", 1.0, "SNLS", "Assembly")};
  const auto disabled = generate_or_empty(ops, 480.0, 480.0);
  if (count_fixtures(disabled, FixtureKind::kSupermarketCabinet) != 0 ||
      count_fixtures(disabled, FixtureKind::kTableAndChair) != 0) {
    return false;
  }

  LayoutSettings settings;
  settings.post_prep_fixtures.enabled = true;
  LayoutGenerator generator;
  if (!generator.UpdateSettings(settings).ok) {
    return false;
  }
  const auto detailed = generator.GenerateDetailed(ops, 480.0, 480.0);
  if (!detailed.ok) {
    return false;
  }
  const auto& entities = detailed.value.entities;
  const PlacedEntity* cabinet = first_fixture(entities, FixtureKind::kSupermarketCabinet);
  const PlacedEntity* table = first_fixture(entities, FixtureKind::kTableAndChair);
  if (cabinet == nullptr || table == nullptr || cabinet->lane != Lane::kA || table->lane != Lane::kC) {
    return false;
  }
  // Both parts sections end at 10.0; fixtures sit one gap further; assembly follows the 2.0 depth.
  const PlacedEntity* assembly_board = nullptr;
  for (const PlacedEntity& entity : entities) {
    if (entity.is_board() && entity.section == "Assembly") {
      assembly_board = &entity;
    }
  }
  const auto& debug = detailed.value.section_debug;
  return almost_equal(cabinet->transform.position.x, 11.0) && almost_equal(table->transform.position.x, 11.0) &&
         cabinet->section == lineplan::core::kPostPrepSectionLabel && assembly_board != nullptr &&
         almost_equal(assembly_board->transform.position.x, 15.0) && debug.size() == 3 &&
         debug[2].post_prep_fixtures_before && !debug[1].post_prep_fixtures_before &&
         lineplan::core::ValidateLayout(entities).ok();
}

// Intent: Post-prep fixtures need a preceding parts section.
bool test_post_prep_requires_parts_section() {
  LayoutSettings settings;
  settings.post_prep_fixtures.enabled = true;
  const auto entities = generate_or_empty({op("1", 1.0, "SNLS", "Assembly"), op("2", 1.0, "SNLS", "Cuff")}, 480.0,
                                          480.0, settings);
  return !entities.empty() && count_fixtures(entities, FixtureKind::kSupermarketCabinet) == 0;
}

// Intent: Section debug records name the matched rule, lane group and counts.
bool test_section_debug_records() {
  LayoutGenerator generator;
  const auto result = generator.GenerateDetailed({op("1", 2.0, "SNLS", "Pocket"), op("2", 1.0, "Button Stitch", "Assembly")},
                                                 480.0, 480.0);
  if (!result.ok || result.value.section_debug.size() != 2) {
    return false;
  }
  const auto& pocket = result.value.section_debug[0];
  const auto& assembly = result.value.section_debug[1];
  return pocket.defaulted_kind && pocket.kind == SectionKind::kPartsAB && pocket.lane_group == LaneGroup::kAB &&
         pocket.machine_count == 2 && pocket.fixture_count == 3 && almost_equal(pocket.start_x, 2.0) &&
         !assembly.defaulted_kind && assembly.matched_keyword == "assembly" && !assembly.lane_group.has_value() &&
         assembly.buttoning_machine_count == 1 && assembly.machine_count == 1 && assembly.fixture_count == 1;
}

// Intent: The summary reports takt, counts, efficiency and per-section / per-lane extents.
bool test_layout_summary() {
  LayoutGenerator generator;
  const auto result = generator.GenerateDetailed({op("1", 2.0, "SNLS", "Cuff"), op("2", 1.0, "SNLS", "Cuff")}, 480.0,
                                                 480.0);
  if (!result.ok) {
    return false;
  }
  const auto& summary = result.value.summary;
  if (summary.sections.size() != 1) {
    return false;
  }
  const auto& cuff = summary.sections[0];
  const auto& lane_a = summary.lanes[0];
  return almost_equal(summary.total_smv, 3.0) && almost_equal(summary.takt_time_min, 1.0) &&
         summary.operation_count == 2 && summary.machine_count == 3 && summary.fixture_count == 3 &&
         almost_equal(summary.balance_efficiency, 1.0) && cuff.label == "Cuff" && cuff.machine_count == 3 &&
         cuff.operation_count == 2 && almost_equal(cuff.start_x, 2.0) && almost_equal(cuff.end_x, 12.0) &&
         lane_a.lane == Lane::kA && lane_a.machine_count == 2 && almost_equal(lane_a.min_x, 3.5) &&
         almost_equal(lane_a.max_x, 5.5) && summary.lanes[2].machine_count == 0 &&
         almost_equal(summary.bounds.max.y, 2.5) && almost_equal(summary.bounds.min.z, -2.8);
}

// Intent: The demo bulletin generates a valid layout touching every section kind.
bool test_demo_layout_is_valid() {
  LayoutGenerator generator;
  const auto result = generator.GenerateDetailed(lineplan::core::make_demo_operations(), 1200.0, 480.0);
  if (!result.ok) {
    return false;
  }
  bool has_ab = false;
  bool has_cd = false;
  bool has_assembly = false;
  for (const auto& debug : result.value.section_debug) {
    has_ab = has_ab || debug.kind == SectionKind::kPartsAB;
    has_cd = has_cd || debug.kind == SectionKind::kPartsCD;
    has_assembly = has_assembly || debug.kind == SectionKind::kAssembly;
  }
  return has_ab && has_cd && has_assembly && result.value.sections.size() == 6 &&
         lineplan::core::ValidateLayout(result.value.entities).ok() &&
         !machines_in_lane(result.value.entities, Lane::kD).empty() && result.value.summary.balance_efficiency > 0.0 &&
         result.value.summary.balance_efficiency <= 1.0;
}

// Intent: Validation reports duplicate ids, slot collisions, bad transforms and sequence problems.
bool test_validation_detects_issues() {
  auto entities = generate_or_empty({op("1", 2.0, "SNLS", "Cuff")}, 480.0, 480.0);
  if (entities.size() != 5 || !lineplan::core::ValidateLayout(entities).ok()) {
    return false;
  }
  // entities: board, machine 0, machine 1, inspection, trolley
  entities[2].id = entities[1].id;
  entities[2].display_id = entities[1].display_id;
  entities[2].transform.position.x = entities[1].transform.position.x;
  entities[2].sequence_index = lineplan::core::kNoSequenceIndex;
  entities[3].transform.rotation_euler_deg.x = 5.0;
  entities[4].sequence_index = 0;
  entities[0].transform.position.y = std::nan("");
  const auto validation = lineplan::core::ValidateLayout(entities);
  bool warning_only_for_fixture_sequence = false;
  for (const auto& issue : validation.issues) {
    if (issue.code == "FixtureHasSequence") {
      warning_only_for_fixture_sequence = issue.severity == lineplan::core::ValidationSeverity::kWarning;
    }
  }
  return !validation.ok() && validation.has_code("DuplicateEntityId") && validation.has_code("DuplicateDisplayId") &&
         validation.has_code("MachineSlotCollision") && validation.has_code("MachineSequenceMissing") &&
         validation.has_code("UnexpectedRotationAxis") && validation.has_code("NonFiniteTransform") &&
         warning_only_for_fixture_sequence;
}

// Intent: Settings normalization clamps negative gaps and rejects non-finite values or non-positive pitch.
bool test_settings_normalization() {
  LayoutSettings settings;
  settings.section_gap_m = -3.0;
  settings.lane_offsets.a = -1.5;
  const auto normalized = lineplan::core::NormalizeLayoutSettings(settings);
  if (!normalized.ok || !almost_equal(normalized.value.section_gap_m, 0.0) ||
      !almost_equal(normalized.value.lane_offsets.a, -1.5)) {
    return false;
  }
  LayoutSettings zero_pitch;
  zero_pitch.machine_pitch_m = 0.0;
  LayoutSettings nan_offset;
  nan_offset.lane_offsets.d = std::nan("");
  const auto bad_pitch = lineplan::core::NormalizeLayoutSettings(zero_pitch);
  const auto bad_offset = lineplan::core::NormalizeLayoutSettings(nan_offset);
  return !bad_pitch.ok && bad_pitch.code == PlanError::kInvalidSettings && !bad_offset.ok &&
         bad_offset.code == PlanError::kInvalidSettings;
}

// Intent: UpdateSettings reports change only when the normalized value differs and keeps settings on failure.
bool test_update_settings_reports_change() {
  LayoutGenerator generator;
  const auto unchanged = generator.UpdateSettings(LayoutSettings{});
  LayoutSettings wider;
  wider.machine_pitch_m = 2.5;
  const auto changed = generator.UpdateSettings(wider);
  LayoutSettings invalid = wider;
  invalid.machine_pitch_m = -1.0;
  const auto rejected = generator.UpdateSettings(invalid);
  return unchanged.ok && !unchanged.value && changed.ok && changed.value && !rejected.ok &&
         rejected.code == PlanError::kInvalidSettings && almost_equal(generator.settings().machine_pitch_m, 2.5);
}

// Intent: Parsing applies known keys, warns on unknown keys and malformed values, and ignores comments.
bool test_settings_parse_with_warnings() {
  std::istringstream in(
      "# comment\n"
      "\n"
      "machine_pitch_m = 2.25\n"
      "section_gap_m=-1\n"
      "lane_offset_b=abc\n"
      "post_prep_enabled=true\n"
      "mystery=1\n"
      "no equals sign\n");
  const auto result = lineplan::core::ParseLayoutSettings(in);
  return result.ok && almost_equal(result.settings.machine_pitch_m, 2.25) &&
         almost_equal(result.settings.section_gap_m, 0.0) && almost_equal(result.settings.lane_offsets.b, -2.8) &&
         result.settings.post_prep_fixtures.enabled && result.warnings.issues.size() == 3 &&
         result.warnings.has_code("SettingsUnknownKey") && result.warnings.has_code("SettingsMalformedValue") &&
         result.warnings.has_code("SettingsMalformedLine") && result.warnings.ok();
}

// Intent: Shared scalar readers accept only whole booleans and numbers and leave the output alone otherwise.
bool test_scalar_value_readers() {
  bool flag = false;
  double number = 7.0;
  if (!lineplan::core::ParseBoolValue("True", &flag) || !flag || !lineplan::core::ParseBoolValue("0", &flag) || flag) {
    return false;
  }
  if (lineplan::core::ParseBoolValue("yes", &flag) || flag) {
    return false;
  }
  if (!lineplan::core::ParseNumberValue("-2.5", &number) || !almost_equal(number, -2.5)) {
    return false;
  }
  return !lineplan::core::ParseNumberValue("2.5m", &number) && !lineplan::core::ParseNumberValue("", &number) &&
         !lineplan::core::ParseNumberValue("1e999", &number) && almost_equal(number, -2.5);
}

// Intent: Written settings parse back to the same values.
bool test_settings_write_then_parse() {
  LayoutSettings settings;
  settings.lane_offsets.c = 1.35;
  settings.facing.front_deg = -88.5;
  settings.trolley_along_offset_m = 4.125;
  settings.post_prep_fixtures.enabled = true;
  settings.post_prep_fixtures.depth_m = 3.0;
  std::stringstream buffer;
  lineplan::core::WriteLayoutSettings(buffer, settings);
  const auto parsed = lineplan::core::ParseLayoutSettings(buffer);
  return parsed.ok && parsed.warnings.issues.empty() && lineplan::core::SameLayoutSettings(parsed.settings, settings);
}

// Intent: A missing settings file is an error; a saved file loads back.
bool test_settings_file_io() {
  const auto missing = lineplan::core::LoadLayoutSettingsFile("lineplan_settings_does_not_exist.ini");
  if (missing.ok || missing.error.empty()) {
    return false;
  }
  const std::string path = "lineplan_core_tests_settings.ini";
  LayoutSettings settings;
  settings.inspection_gap_m = 1.75;
  const auto saved = lineplan::core::SaveLayoutSettingsFile(path, settings);
  const auto loaded = lineplan::core::LoadLayoutSettingsFile(path);
  std::remove(path.c_str());
  return saved.ok && loaded.ok && almost_equal(loaded.settings.inspection_gap_m, 1.75);
}

// Intent: Custom lane offsets and pitch flow through to placed positions.
bool test_custom_settings_change_positions() {
  LayoutSettings settings;
  settings.lane_offsets.c = 1.5;
  settings.machine_pitch_m = 1.0;
  const auto entities = generate_or_empty({op("1", 3.0, "SNLS", "Collar")}, 480.0, 480.0, settings);
  const auto c = machines_in_lane(entities, Lane::kC);
  return c.size() == 3 && almost_equal(c[0]->transform.position.z, 1.5) &&
         almost_equal(c[1]->transform.position.x - c[0]->transform.position.x, 1.0);
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Capacity_RequiredCount_CeilAndFloor", "Required count is ceil and at least one", test_required_machine_count_ceil_and_floor},
      {"Capacity_RequiredCount_RoundingNoise", "Exact ratios do not gain a machine", test_required_machine_count_absorbs_rounding_noise},
      {"Capacity_RequiredCount_SmallFraction", "Fractions above an integer round up", test_required_machine_count_keeps_small_fractions},
      {"Capacity_RequiredCount_Saturates", "Huge ratios saturate at int max", test_required_machine_count_saturates},
      {"Capacity_TaktTime", "Takt is minutes over target", test_takt_time},
      {"Capacity_PlanKeepsOrder", "Balanced list keeps input order", test_plan_capacity_keeps_order},
      {"Capacity_InvalidDemand", "Zero or non-finite demand fails", test_invalid_demand_rejected},
      {"Capacity_MalformedOperation", "Malformed rows fail the call", test_malformed_operation_rejected},
      {"Capacity_MachineCountOverflow", "Counts beyond int range fail the call", test_machine_count_overflow_rejected},
      {"Rules_SectionClassification", "Ordered section keyword rules", test_section_classification_rules},
      {"Rules_FacingOverride", "Iron/press/inspection face Front", test_facing_override_rules},
      {"Rules_Buttoning", "Buttoning from type or name", test_buttoning_detection},
      {"Catalog_MachineCategory", "Normalized machine categories", test_machine_category_catalog},
      {"Catalog_MachineFootprint", "Footprint lookup and fallback", test_machine_footprint_catalog},
      {"Catalog_SectionEnvelope", "Line profile envelopes", test_section_envelopes},
      {"Grouper_FirstSeenCaseInsensitive", "Grouping order and Unknown bucket", test_group_sections},
      {"Layout_Example_SingleMachine", "Single cuff machine in lane A", test_example_single_machine},
      {"Layout_Example_AlternatingRuns", "Runs alternate between paired lanes", test_example_alternating_runs},
      {"Layout_Example_AssemblyRows", "Assembly rows across A/B/C", test_example_assembly_rows},
      {"Layout_Example_EmptyInput", "Empty bulletin gives empty layout", test_example_empty_input},
      {"Layout_Example_ZeroTarget", "Zero target fails with InvalidDemand", test_example_zero_target},
      {"Layout_Idempotent", "Identical inputs give identical layouts", test_generation_is_idempotent},
      {"Layout_NoSlotCollisions", "Machines never share lane and offset", test_no_machine_slot_collisions},
      {"Layout_LaneFacing", "Lane default facing and iron override", test_lane_facing_and_iron_override},
      {"Layout_PartsFixtures", "Board, inspection and trolley per parts section", test_parts_section_fixtures},
      {"Layout_PlaceSection_Threading", "Cursor state threads between sections", test_place_section_threads_cursors},
      {"Layout_Assembly_ButtoningLaneD", "Buttoning work runs in lane D", test_assembly_buttoning_lane},
      {"Layout_Ids_EmissionOrder", "Ids and display ids follow emission order", test_ids_and_display_ids},
      {"Layout_PostPrep_Fixtures", "Post-prep fixtures only when enabled", test_post_prep_fixtures},
      {"Layout_PostPrep_NeedsParts", "Post-prep skipped without parts section", test_post_prep_requires_parts_section},
      {"Layout_SectionDebug", "Debug records carry rule and counts", test_section_debug_records},
      {"Layout_Summary", "Summary math and extents", test_layout_summary},
      {"Layout_DemoValid", "Demo bulletin yields a valid layout", test_demo_layout_is_valid},
      {"Validation_DetectsIssues", "Validation flags broken layouts", test_validation_detects_issues},
      {"Settings_Normalize", "Clamp and reject settings", test_settings_normalization},
      {"Settings_UpdateReportsChange", "UpdateSettings change detection", test_update_settings_reports_change},
      {"Settings_ParseWarnings", "Parser warnings and defaults", test_settings_parse_with_warnings},
      {"Settings_ScalarReaders", "Bool and number readers reject partial input", test_scalar_value_readers},
      {"Settings_WriteThenParse", "Written settings parse back", test_settings_write_then_parse},
      {"Settings_FileIo", "Missing file errors and save/load works", test_settings_file_io},
      {"Settings_CustomPositions", "Custom offsets and pitch move machines", test_custom_settings_change_positions},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}

#include "lineplan/core/lane_placer.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "lineplan/core/catalog.hpp"
#include "lineplan/core/id.hpp"

namespace lineplan::core {

namespace {

// Three parallel assembly sub-lines, each building complete garments.
constexpr std::array<Lane, 3> kAssemblyLanes = {Lane::kA, Lane::kB, Lane::kC};

const char* fixture_display_prefix(FixtureKind kind) {
  switch (kind) {
  case FixtureKind::kSectionBoard:
    return "BOARD";
  case FixtureKind::kInspectionTable:
    return "INSP";
  case FixtureKind::kMaterialTrolley:
    return "TROLLEY";
  case FixtureKind::kSupermarketCabinet:
    return "SMKT";
  case FixtureKind::kTableAndChair:
    return "TABLE";
  }
  return "FIX";
}

void append_step(PlacementOutput& out, PlacementStep& step) {
  out.entities.insert(out.entities.end(), std::make_move_iterator(step.entities.begin()),
                      std::make_move_iterator(step.entities.end()));
  step.entities.clear();
}

} // namespace

PlacementOutput LanePlacer::Place(const std::vector<SectionBucket>& sections) const {
  PlacementOutput out;
  LaneCursors cursors{};
  bool parts_seen = false;
  bool post_prep_done = false;

  for (const SectionBucket& section : sections) {
    const SectionKind kind = ClassifySection(section.label).kind;
    bool post_prep_inserted = false;
    if (kind == SectionKind::kAssembly && settings_.post_prep_fixtures.enabled && parts_seen && !post_prep_done) {
      PlacementStep fixtures = PlacePostPrepFixtures(cursors);
      cursors = fixtures.cursors;
      append_step(out, fixtures);
      post_prep_done = true;
      post_prep_inserted = true;
    }

    PlacementStep step = PlaceSection(section, cursors);
    step.debug.post_prep_fixtures_before = post_prep_inserted;
    cursors = step.cursors;
    append_step(out, step);
    out.section_debug.push_back(std::move(step.debug));
    if (kind != SectionKind::kAssembly) {
      parts_seen = true;
    }
  }

  EntityIdGenerator ids;
  for (PlacedEntity& entity : out.entities) {
    entity.id = ids.next();
    if (const Operation* operation = entity.operation(); operation != nullptr) {
      entity.display_id = make_machine_display_id(operation->op_no, entity.sequence_index, entity.id);
    } else if (const Fixture* fixture = entity.fixture(); fixture != nullptr) {
      entity.display_id = make_display_id(fixture_display_prefix(fixture->kind), entity.id);
    }
  }
  out.final_cursors = cursors;
  return out;
}

PlacementStep LanePlacer::PlaceSection(const SectionBucket& section, const LaneCursors& cursors) const {
  const SectionClassification classification = ClassifySection(section.label);
  if (classification.kind == SectionKind::kAssembly) {
    return place_assembly_section(section, classification, cursors);
  }
  return place_parts_section(section, classification, cursors);
}

PlacementStep LanePlacer::place_parts_section(const SectionBucket& section,
                                              const SectionClassification& classification,
                                              const LaneCursors& cursors) const {
  PlacementStep step;
  step.cursors = cursors;

  const LaneGroup group = lane_group_for(classification.kind);
  const Lane first_lane = inner_lane(group);
  const Lane second_lane = outer_lane(group);
  const double inner_z = settings_.lane_offsets.of(first_lane);
  const double outer_z = settings_.lane_offsets.of(second_lane);

  // Both lanes of the pair start flush.
  const double start_x = cursors.max_of(group) + settings_.section_gap_m;
  step.cursors.sync(group, start_x);
  step.entities.push_back(make_fixture(FixtureKind::kSectionBoard, section.label, first_lane,
                                       {start_x, settings_.board_height_m, inner_z}, Facing::kFront, section.label));
  step.cursors.sync(group, start_x + settings_.board_clearance_m);

  // Alternate lanes per operation; a whole run stays in one lane.
  int machine_count = 0;
  bool use_first_lane = true;
  for (const BalancedOperation& item : section.operations) {
    const Lane lane = use_first_lane ? first_lane : second_lane;
    double x = step.cursors.at(lane);
    for (int k = 0; k < item.required_machine_count; ++k) {
      step.entities.push_back(make_machine(item.operation, lane, x, k, std::nullopt, section.label));
      x += settings_.machine_pitch_m;
    }
    step.cursors.set(lane, x);
    machine_count += item.required_machine_count;
    use_first_lane = !use_first_lane;
  }

  const double inspection_x = step.cursors.max_of(group) + settings_.inspection_gap_m;
  step.entities.push_back(make_fixture(FixtureKind::kInspectionTable, "Inspection", first_lane,
                                       {inspection_x, 0.0, inner_z}, Facing::kFront, section.label));

  const double toward_partner = (outer_z >= inner_z) ? 1.0 : -1.0;
  const double trolley_x = inspection_x + settings_.trolley_along_offset_m;
  step.entities.push_back(make_fixture(FixtureKind::kMaterialTrolley, "Trolley", first_lane,
                                       {trolley_x, 0.0, inner_z + toward_partner * settings_.trolley_across_offset_m},
                                       Facing::kRight, section.label));
  step.cursors.sync(group, std::max(inspection_x + settings_.fixture_clearance_m, trolley_x));

  step.debug.label = section.label;
  step.debug.kind = classification.kind;
  step.debug.matched_keyword = classification.matched_keyword;
  step.debug.defaulted_kind = classification.defaulted;
  step.debug.lane_group = group;
  step.debug.start_x = start_x;
  step.debug.end_x = step.cursors.max_of(group);
  step.debug.machine_count = machine_count;
  step.debug.fixture_count = 3;
  return step;
}

PlacementStep LanePlacer::place_assembly_section(const SectionBucket& section,
                                                 const SectionClassification& classification,
                                                 const LaneCursors& cursors) const {
  PlacementStep step;
  step.cursors = cursors;

  const double start_x = cursors.max_all() + settings_.section_gap_m;
  step.cursors.sync_all(start_x);
  step.entities.push_back(make_fixture(FixtureKind::kSectionBoard, section.label, board_lane_for_offset(0.0),
                                       {start_x, settings_.board_height_m, 0.0}, Facing::kFront, section.label));

  std::vector<const BalancedOperation*> main_ops;
  std::vector<const BalancedOperation*> buttoning_ops;
  for (const BalancedOperation& item : section.operations) {
    if (IsButtoningOperation(item.operation)) {
      buttoning_ops.push_back(&item);
    } else {
      main_ops.push_back(&item);
    }
  }

  // Rows of three across A/B/C; the next operation starts on a fresh row.
  const int sub_lines = static_cast<int>(kAssemblyLanes.size());
  int machine_count = 0;
  double main_cursor = start_x;
  for (const BalancedOperation* item : main_ops) {
    const int count = item->required_machine_count;
    for (int k = 0; k < count; ++k) {
      const Lane lane = kAssemblyLanes[static_cast<std::size_t>(k % sub_lines)];
      const double x = main_cursor + static_cast<double>(k / sub_lines) * settings_.machine_pitch_m;
      step.entities.push_back(make_machine(item->operation, lane, x, k, Facing::kFront, section.label));
    }
    const int rows = (count + sub_lines - 1) / sub_lines;
    main_cursor += static_cast<double>(rows) * settings_.machine_pitch_m;
    machine_count += count;
  }

  int buttoning_count = 0;
  double buttoning_cursor = start_x;
  for (const BalancedOperation* item : buttoning_ops) {
    for (int k = 0; k < item->required_machine_count; ++k) {
      step.entities.push_back(
          make_machine(item->operation, Lane::kD, buttoning_cursor, k, Facing::kFront, section.label));
      buttoning_cursor += settings_.machine_pitch_m;
    }
    buttoning_count += item->required_machine_count;
  }

  const double end_x = std::max(main_cursor, buttoning_cursor);
  step.cursors.sync_all(end_x);

  step.debug.label = section.label;
  step.debug.kind = classification.kind;
  step.debug.matched_keyword = classification.matched_keyword;
  step.debug.defaulted_kind = classification.defaulted;
  step.debug.start_x = start_x;
  step.debug.end_x = end_x;
  step.debug.machine_count = machine_count + buttoning_count;
  step.debug.buttoning_machine_count = buttoning_count;
  step.debug.fixture_count = 1;
  return step;
}

PlacementStep LanePlacer::PlacePostPrepFixtures(const LaneCursors& cursors) const {
  PlacementStep step;
  step.cursors = cursors;
  const std::string section(kPostPrepSectionLabel);

  const double start_x = std::min(cursors.max_of(LaneGroup::kAB), cursors.max_of(LaneGroup::kCD));
  for (const LaneGroup group : {LaneGroup::kAB, LaneGroup::kCD}) {
    const Lane lane = inner_lane(group);
    const double x = cursors.max_of(group) + settings_.inspection_gap_m;
    const bool is_ab = (group == LaneGroup::kAB);
    step.entities.push_back(make_fixture(is_ab ? FixtureKind::kSupermarketCabinet : FixtureKind::kTableAndChair,
                                         is_ab ? "Supermarket cabinet" : "Table and chair", lane,
                                         {x, 0.0, settings_.lane_offsets.of(lane)}, Facing::kFront, section));
    step.cursors.sync(group, x + settings_.post_prep_fixtures.depth_m);
  }

  step.debug.label = section;
  step.debug.kind = SectionKind::kPartsAB;
  step.debug.start_x = start_x;
  step.debug.end_x = step.cursors.max_all();
  step.debug.fixture_count = 2;
  return step;
}

double LanePlacer::machine_yaw_deg(Lane lane, const Operation& operation, std::optional<Facing> forced_facing) const {
  if (forced_facing.has_value()) {
    return settings_.facing.of(*forced_facing);
  }
  if (const std::optional<Facing> override_facing = ResolveFacingOverride(operation.machine_type);
      override_facing.has_value()) {
    return settings_.facing.of(*override_facing);
  }
  return settings_.facing.of(default_lane_facing(lane));
}

PlacedEntity LanePlacer::make_machine(const Operation& operation, Lane lane, double x, int sequence_index,
                                      std::optional<Facing> forced_facing, const std::string& section) const {
  PlacedEntity entity{};
  entity.source = operation;
  entity.lane = lane;
  entity.transform.position = {x, 0.0, settings_.lane_offsets.of(lane)};
  entity.transform.rotation_euler_deg.y = machine_yaw_deg(lane, operation, forced_facing);
  entity.section = section;
  entity.sequence_index = sequence_index;
  entity.category = ClassifyMachine(operation.machine_type);
  entity.footprint = MachineFootprint(operation.machine_type);
  return entity;
}

PlacedEntity LanePlacer::make_fixture(FixtureKind kind, const std::string& label, Lane lane, const Vec3d& position,
                                      Facing facing, const std::string& section) const {
  PlacedEntity entity{};
  entity.source = Fixture{kind, label};
  entity.lane = lane;
  entity.transform.position = position;
  entity.transform.rotation_euler_deg.y = settings_.facing.of(facing);
  entity.section = section;
  entity.sequence_index = kNoSequenceIndex;
  entity.footprint = FixtureFootprint(kind);
  return entity;
}

Lane LanePlacer::board_lane_for_offset(double z) { return z < 0.0 ? Lane::kA : Lane::kC; }

} // namespace lineplan::core

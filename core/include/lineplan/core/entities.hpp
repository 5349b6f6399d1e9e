#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "lineplan/core/id.hpp"
#include "lineplan/core/types.hpp"

namespace lineplan::core {

enum class Lane : std::uint8_t {
  kA = 0,
  kB = 1,
  kC = 2,
  kD = 3,
};

constexpr int kLaneCount = 4;

enum class LaneGroup : std::uint8_t {
  kAB = 0,
  kCD = 1,
};

enum class SectionKind : std::uint8_t {
  kPartsAB = 0,
  kPartsCD = 1,
  kAssembly = 2,
};

enum class Facing : std::uint8_t {
  kFront = 0,
  kBack = 1,
  kLeft = 2,
  kRight = 3,
};

enum class MachineCategory : std::uint8_t {
  kDefault = 0,
  kSnls = 1,
  kSnec = 2,
  kIron = 3,
  kButton = 4,
  kBartack = 5,
  kSpecial = 6,
  kHelper = 7,
};

enum class FixtureKind : std::uint8_t {
  kSectionBoard = 0,
  kInspectionTable = 1,
  kMaterialTrolley = 2,
  kSupermarketCabinet = 3,
  kTableAndChair = 4,
};

constexpr int kNoSequenceIndex = -1;

// Normalized operation-bulletin row handed over by the ingestion collaborator.
struct Operation {
  std::string op_no{};
  std::string op_name{};
  std::string machine_type{};
  double smv = 0.0;  // standard minutes per unit
  std::string section{};
};

struct BalancedOperation {
  Operation operation{};
  int required_machine_count = 1;
};

// Policy-inserted floor item. Never a timed production station.
struct Fixture {
  FixtureKind kind = FixtureKind::kSectionBoard;
  std::string label{};
};

using EntitySource = std::variant<Operation, Fixture>;

struct PlacedEntity {
  EntityId id = kInvalidEntityId;
  std::string display_id{};
  EntitySource source{};
  Lane lane = Lane::kA;
  Transformd transform{};
  std::string section{};
  int sequence_index = kNoSequenceIndex;
  MachineCategory category = MachineCategory::kDefault;
  Footprint footprint{};

  [[nodiscard]] bool is_machine() const { return std::holds_alternative<Operation>(source); }
  [[nodiscard]] const Operation* operation() const { return std::get_if<Operation>(&source); }
  [[nodiscard]] const Fixture* fixture() const { return std::get_if<Fixture>(&source); }

  [[nodiscard]] bool is_fixture_kind(FixtureKind kind) const {
    const Fixture* f = fixture();
    return f != nullptr && f->kind == kind;
  }
  [[nodiscard]] bool is_board() const { return is_fixture_kind(FixtureKind::kSectionBoard); }
  [[nodiscard]] bool is_inspection() const { return is_fixture_kind(FixtureKind::kInspectionTable); }
  [[nodiscard]] bool is_trolley() const { return is_fixture_kind(FixtureKind::kMaterialTrolley); }

  [[nodiscard]] double yaw_deg() const { return transform.rotation_euler_deg.y; }
};

inline LaneGroup lane_group_of(Lane lane) {
  return (lane == Lane::kA || lane == Lane::kB) ? LaneGroup::kAB : LaneGroup::kCD;
}

inline Lane inner_lane(LaneGroup group) { return group == LaneGroup::kAB ? Lane::kA : Lane::kC; }

inline Lane outer_lane(LaneGroup group) { return group == LaneGroup::kAB ? Lane::kB : Lane::kD; }

inline int lane_index(Lane lane) { return static_cast<int>(lane); }

}  // namespace lineplan::core

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lineplan/core/entities.hpp"
#include "lineplan/core/types.hpp"

namespace lineplan::core {

struct MachineCategoryRule {
  std::vector<std::string> keywords{};
  MachineCategory category = MachineCategory::kDefault;
};

struct MachineFootprintRule {
  std::string model_name{};
  std::vector<std::string> keywords{};
  Footprint footprint{};
};

constexpr double kFeetToMetres = 0.3048;

// Category matching runs on the normalized key: lower case, spaces/underscores/hyphens/dots/slashes removed.
[[nodiscard]] std::string normalize_machine_key(std::string_view machine_type);

[[nodiscard]] const std::vector<MachineCategoryRule>& machine_category_rules();
[[nodiscard]] MachineCategory ClassifyMachine(std::string_view machine_type);

// Footprint matching runs on the lower-cased type with spacing kept ("button hole").
[[nodiscard]] const std::vector<MachineFootprintRule>& machine_footprint_rules();
[[nodiscard]] Footprint MachineFootprint(std::string_view machine_type);
[[nodiscard]] Footprint default_machine_footprint();
[[nodiscard]] Footprint FixtureFootprint(FixtureKind kind);

// Reference floor envelope of a section for a line profile ("LINE 6" or the default profile).
[[nodiscard]] std::optional<Footprint> SectionEnvelope(std::string_view line_no, std::string_view section_label);

}  // namespace lineplan::core

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lineplan/core/entities.hpp"

namespace lineplan::core {

// Ordered keyword rules. The first rule with a keyword contained in the (lower-cased) text wins.
struct SectionRule {
  std::vector<std::string> keywords{};
  SectionKind kind = SectionKind::kPartsAB;
};

struct SectionClassification {
  SectionKind kind = SectionKind::kPartsAB;
  std::string matched_keyword{};  // empty when the default applied
  bool defaulted = true;
};

struct FacingRule {
  std::vector<std::string> keywords{};
  Facing facing = Facing::kFront;
};

[[nodiscard]] const std::vector<SectionRule>& section_rules();
[[nodiscard]] SectionClassification ClassifySection(std::string_view section_label);

[[nodiscard]] LaneGroup lane_group_for(SectionKind kind);

// Stations read from one side only (ironing, pressing, inspection).
[[nodiscard]] const std::vector<FacingRule>& facing_override_rules();
[[nodiscard]] std::optional<Facing> ResolveFacingOverride(std::string_view machine_type);

// Paired lanes face each other across their aisle.
[[nodiscard]] Facing default_lane_facing(Lane lane);

[[nodiscard]] bool IsButtoningOperation(const Operation& operation);

[[nodiscard]] std::string to_lower_ascii(std::string_view text);
[[nodiscard]] std::string trim_copy(std::string_view text);
[[nodiscard]] bool contains_ci(std::string_view haystack, std::string_view needle);

}  // namespace lineplan::core

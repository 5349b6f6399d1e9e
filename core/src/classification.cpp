#include "lineplan/core/classification.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace lineplan::core {

namespace {

const std::string* first_contained_keyword(std::string_view lowered, const std::vector<std::string>& keywords) {
  for (const std::string& keyword : keywords) {
    if (lowered.find(keyword) != std::string_view::npos) {
      return &keyword;
    }
  }
  return nullptr;
}

} // namespace

std::string to_lower_ascii(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string trim_copy(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
  return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

const std::vector<SectionRule>& section_rules() {
  // Assembly first; CD wins over AB when a label names both ("Front & Back").
  static const std::vector<SectionRule> rules = {
      {{"assembly"}, SectionKind::kAssembly},
      {{"collar", "front"}, SectionKind::kPartsCD},
      {{"cuff", "sleeve", "back"}, SectionKind::kPartsAB},
  };
  return rules;
}

SectionClassification ClassifySection(std::string_view section_label) {
  const std::string lowered = to_lower_ascii(section_label);
  for (const SectionRule& rule : section_rules()) {
    if (const std::string* keyword = first_contained_keyword(lowered, rule.keywords); keyword != nullptr) {
      return {rule.kind, *keyword, false};
    }
  }
  return {SectionKind::kPartsAB, {}, true};
}

LaneGroup lane_group_for(SectionKind kind) {
  return kind == SectionKind::kPartsCD ? LaneGroup::kCD : LaneGroup::kAB;
}

const std::vector<FacingRule>& facing_override_rules() {
  static const std::vector<FacingRule> rules = {
      {{"iron", "press", "inspection"}, Facing::kFront},
  };
  return rules;
}

std::optional<Facing> ResolveFacingOverride(std::string_view machine_type) {
  const std::string lowered = to_lower_ascii(machine_type);
  for (const FacingRule& rule : facing_override_rules()) {
    if (first_contained_keyword(lowered, rule.keywords) != nullptr) {
      return rule.facing;
    }
  }
  return std::nullopt;
}

Facing default_lane_facing(Lane lane) {
  switch (lane) {
  case Lane::kA:
    return Facing::kLeft;
  case Lane::kB:
    return Facing::kRight;
  case Lane::kC:
    return Facing::kRight;
  case Lane::kD:
    return Facing::kLeft;
  }
  return Facing::kFront;
}

bool IsButtoningOperation(const Operation& operation) {
  return contains_ci(operation.machine_type, "button") || contains_ci(operation.op_name, "button");
}

} // namespace lineplan::core

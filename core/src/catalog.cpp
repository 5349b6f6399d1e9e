#include "lineplan/core/catalog.hpp"

#include <string>
#include <vector>

#include "lineplan/core/classification.hpp"

namespace lineplan::core {

namespace {

Footprint feet(double length_ft, double width_ft) {
  return {length_ft * kFeetToMetres, width_ft * kFeetToMetres};
}

bool contains_any(const std::string& text, const std::vector<std::string>& keywords) {
  for (const std::string& keyword : keywords) {
    if (text.find(keyword) != std::string::npos) {
      return true;
    }
  }
  return false;
}

struct SectionEnvelopeEntry {
  const char* section;
  Footprint envelope;
};

// Measured section envelopes: length along the flow, width across the floor.
const std::vector<SectionEnvelopeEntry>& default_line_envelopes() {
  static const std::vector<SectionEnvelopeEntry> entries = {
      {"cuff", {34.34 * kFeetToMetres, 9.3009 * kFeetToMetres}},
      {"sleeve", {25.0 * kFeetToMetres, 9.3009 * kFeetToMetres}},
      {"back", {43.6927 * kFeetToMetres, 9.3009 * kFeetToMetres}},
      {"collar", {62.0 * kFeetToMetres, 10.2098 * kFeetToMetres}},
      {"front", {43.8055 * kFeetToMetres, 10.2098 * kFeetToMetres}},
      {"assembly", {56.03 * kFeetToMetres, 10.2098 * kFeetToMetres}},
  };
  return entries;
}

const std::vector<SectionEnvelopeEntry>& line6_envelopes() {
  static const std::vector<SectionEnvelopeEntry> entries = {
      {"cuff", {30.9498 * kFeetToMetres, 9.025 * kFeetToMetres}},
      {"sleeve", {24.5510 * kFeetToMetres, 9.025 * kFeetToMetres}},
      {"collar", {56.7096 * kFeetToMetres, 9.0 * kFeetToMetres}},
  };
  return entries;
}

std::optional<Footprint> find_envelope(const std::vector<SectionEnvelopeEntry>& entries, const std::string& key) {
  for (const SectionEnvelopeEntry& entry : entries) {
    if (key == entry.section) {
      return entry.envelope;
    }
  }
  return std::nullopt;
}

} // namespace

std::string normalize_machine_key(std::string_view machine_type) {
  std::string out;
  out.reserve(machine_type.size());
  for (const char c : to_lower_ascii(machine_type)) {
    if (c == ' ' || c == '\t' || c == '_' || c == '-' || c == '.' || c == '/') {
      continue;
    }
    out.push_back(c);
  }
  return out;
}

const std::vector<MachineCategoryRule>& machine_category_rules() {
  static const std::vector<MachineCategoryRule> rules = {
      {{"snls", "singleneedle", "lockstitch"}, MachineCategory::kSnls},
      {{"snec", "overlock", "edge"}, MachineCategory::kSnec},
      {{"iron", "press", "fusing"}, MachineCategory::kIron},
      {{"button", "bhole"}, MachineCategory::kButton},
      {{"bartack"}, MachineCategory::kBartack},
      {{"helper", "table"}, MachineCategory::kHelper},
      {{"special", "contour", "turning", "pointing", "notch", "wrapping"}, MachineCategory::kSpecial},
  };
  return rules;
}

MachineCategory ClassifyMachine(std::string_view machine_type) {
  const std::string key = normalize_machine_key(machine_type);
  if (key.empty()) {
    return MachineCategory::kDefault;
  }
  for (const MachineCategoryRule& rule : machine_category_rules()) {
    if (contains_any(key, rule.keywords)) {
      return rule.category;
    }
  }
  return MachineCategory::kDefault;
}

const std::vector<MachineFootprintRule>& machine_footprint_rules() {
  // "button hole" must precede "button".
  static const std::vector<MachineFootprintRule> rules = {
      {"SNLS", {"snls"}, feet(4.0, 2.5)},
      {"DNLS", {"dnls"}, feet(4.0, 2.5)},
      {"Overlock", {"overlock"}, feet(4.0, 2.5)},
      {"SNEC", {"snec"}, feet(4.0, 2.5)},
      {"Bartack", {"bartack"}, feet(4.0, 2.5)},
      {"Button Hole", {"button hole"}, feet(4.0, 2.5)},
      {"Button Stitch", {"button"}, feet(4.0, 2.5)},
      {"Notch mc", {"notch"}, feet(4.0, 2.5)},
      {"FOA", {"foa", "feed off"}, feet(4.5, 2.5)},
      {"Turning Machine", {"turning"}, feet(4.0, 3.0)},
      {"Pointing Machine", {"pointing"}, feet(4.0, 3.0)},
      {"Contour Machine", {"contour"}, feet(4.5, 3.0)},
      {"Iron Press Table", {"iron", "press"}, feet(5.0, 3.5)},
      {"Inspection Table", {"inspection"}, feet(6.0, 4.0)},
  };
  return rules;
}

Footprint default_machine_footprint() { return {1.2, 0.8}; }

Footprint MachineFootprint(std::string_view machine_type) {
  const std::string lowered = to_lower_ascii(machine_type);
  for (const MachineFootprintRule& rule : machine_footprint_rules()) {
    if (contains_any(lowered, rule.keywords)) {
      return rule.footprint;
    }
  }
  return default_machine_footprint();
}

Footprint FixtureFootprint(FixtureKind kind) {
  switch (kind) {
  case FixtureKind::kSectionBoard:
    return {1.2, 0.1};
  case FixtureKind::kInspectionTable:
    return feet(6.0, 4.0);
  case FixtureKind::kMaterialTrolley:
    return {1.0, 0.6};
  case FixtureKind::kSupermarketCabinet:
    return {1.8, 0.6};
  case FixtureKind::kTableAndChair:
    return {1.5, 1.2};
  }
  return default_machine_footprint();
}

std::optional<Footprint> SectionEnvelope(std::string_view line_no, std::string_view section_label) {
  const std::string key = to_lower_ascii(trim_copy(section_label));
  if (contains_ci(line_no, "line 6")) {
    if (std::optional<Footprint> envelope = find_envelope(line6_envelopes(), key); envelope.has_value()) {
      return envelope;
    }
  }
  return find_envelope(default_line_envelopes(), key);
}

} // namespace lineplan::core

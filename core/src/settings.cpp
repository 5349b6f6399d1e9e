#include "lineplan/core/settings.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lineplan/core/classification.hpp"

namespace lineplan::core {

namespace {

constexpr double kSettingsEps = 1e-12;

struct SettingField {
  const char* key;
  double& (*ref)(LayoutSettings&);
  bool clamp_non_negative;
};

const std::vector<SettingField>& setting_fields() {
  static const std::vector<SettingField> fields = {
      {"lane_offset_a", [](LayoutSettings& s) -> double& { return s.lane_offsets.a; }, false},
      {"lane_offset_b", [](LayoutSettings& s) -> double& { return s.lane_offsets.b; }, false},
      {"lane_offset_c", [](LayoutSettings& s) -> double& { return s.lane_offsets.c; }, false},
      {"lane_offset_d", [](LayoutSettings& s) -> double& { return s.lane_offsets.d; }, false},
      {"facing_front_deg", [](LayoutSettings& s) -> double& { return s.facing.front_deg; }, false},
      {"facing_back_deg", [](LayoutSettings& s) -> double& { return s.facing.back_deg; }, false},
      {"facing_left_deg", [](LayoutSettings& s) -> double& { return s.facing.left_deg; }, false},
      {"facing_right_deg", [](LayoutSettings& s) -> double& { return s.facing.right_deg; }, false},
      {"machine_pitch_m", [](LayoutSettings& s) -> double& { return s.machine_pitch_m; }, false},
      {"section_gap_m", [](LayoutSettings& s) -> double& { return s.section_gap_m; }, true},
      {"board_clearance_m", [](LayoutSettings& s) -> double& { return s.board_clearance_m; }, true},
      {"board_height_m", [](LayoutSettings& s) -> double& { return s.board_height_m; }, true},
      {"inspection_gap_m", [](LayoutSettings& s) -> double& { return s.inspection_gap_m; }, true},
      {"trolley_along_offset_m", [](LayoutSettings& s) -> double& { return s.trolley_along_offset_m; }, true},
      {"trolley_across_offset_m", [](LayoutSettings& s) -> double& { return s.trolley_across_offset_m; }, true},
      {"fixture_clearance_m", [](LayoutSettings& s) -> double& { return s.fixture_clearance_m; }, true},
      {"post_prep_depth_m", [](LayoutSettings& s) -> double& { return s.post_prep_fixtures.depth_m; }, true},
  };
  return fields;
}

constexpr const char* kPostPrepEnabledKey = "post_prep_enabled";

void add_warning(ValidationResult& warnings, const char* code, std::string message) {
  warnings.issues.push_back({ValidationSeverity::kWarning, code, std::move(message), kInvalidEntityId});
}

} // namespace

bool ParseBoolValue(std::string_view value, bool* out) {
  if (value == "1" || value == "true" || value == "True") {
    *out = true;
    return true;
  }
  if (value == "0" || value == "false" || value == "False") {
    *out = false;
    return true;
  }
  return false;
}

bool ParseNumberValue(const std::string& value, double* out) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
      return false;
    }
    *out = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

PlanResult<LayoutSettings> NormalizeLayoutSettings(const LayoutSettings& settings) {
  LayoutSettings normalized = settings;
  for (const SettingField& field : setting_fields()) {
    double& value = field.ref(normalized);
    if (!std::isfinite(value)) {
      return make_plan_error<LayoutSettings>(PlanError::kInvalidSettings,
                                             std::string(field.key) + " must be finite");
    }
    if (field.clamp_non_negative) {
      value = std::max(0.0, value);
    }
  }
  if (normalized.machine_pitch_m <= 0.0) {
    return make_plan_error<LayoutSettings>(PlanError::kInvalidSettings, "machine_pitch_m must be > 0");
  }

  PlanResult<LayoutSettings> result;
  result.ok = true;
  result.value = normalized;
  return result;
}

bool SameLayoutSettings(const LayoutSettings& a, const LayoutSettings& b) {
  LayoutSettings lhs = a;
  LayoutSettings rhs = b;
  for (const SettingField& field : setting_fields()) {
    if (std::abs(field.ref(lhs) - field.ref(rhs)) > kSettingsEps) {
      return false;
    }
  }
  return a.post_prep_fixtures.enabled == b.post_prep_fixtures.enabled;
}

SettingsLoadResult ParseLayoutSettings(std::istream& in) {
  SettingsLoadResult result;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const std::size_t eq = trimmed.find('=');
    if (eq == std::string::npos || eq == 0) {
      add_warning(result.warnings, "SettingsMalformedLine", "line " + std::to_string(line_no) + ": expected key=value");
      continue;
    }
    const std::string key = trim_copy(std::string_view(trimmed).substr(0, eq));
    const std::string value = trim_copy(std::string_view(trimmed).substr(eq + 1));

    if (key == kPostPrepEnabledKey) {
      bool enabled = false;
      if (!ParseBoolValue(value, &enabled)) {
        add_warning(result.warnings, "SettingsMalformedValue", key + ": expected a boolean, got '" + value + "'");
        continue;
      }
      result.settings.post_prep_fixtures.enabled = enabled;
      continue;
    }

    const auto& fields = setting_fields();
    const auto field = std::find_if(fields.begin(), fields.end(),
                                    [&key](const SettingField& candidate) { return key == candidate.key; });
    if (field == fields.end()) {
      add_warning(result.warnings, "SettingsUnknownKey", "unknown key '" + key + "'");
      continue;
    }
    double parsed = 0.0;
    if (!ParseNumberValue(value, &parsed)) {
      add_warning(result.warnings, "SettingsMalformedValue", key + ": expected a number, got '" + value + "'");
      continue;
    }
    field->ref(result.settings) = parsed;
  }

  const PlanResult<LayoutSettings> normalized = NormalizeLayoutSettings(result.settings);
  if (!normalized.ok) {
    result.error = normalized.error;
    return result;
  }
  result.settings = normalized.value;
  result.ok = true;
  return result;
}

SettingsLoadResult LoadLayoutSettingsFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    SettingsLoadResult result;
    result.error = "cannot open settings file: " + path;
    return result;
  }
  return ParseLayoutSettings(ifs);
}

void WriteLayoutSettings(std::ostream& out, const LayoutSettings& settings) {
  LayoutSettings copy = settings;
  out << "# lineplan layout settings\n" << std::setprecision(12);
  for (const SettingField& field : setting_fields()) {
    out << field.key << "=" << field.ref(copy) << "\n";
  }
  out << kPostPrepEnabledKey << "=" << (settings.post_prep_fixtures.enabled ? 1 : 0) << "\n";
}

PlanResult<bool> SaveLayoutSettingsFile(const std::string& path, const LayoutSettings& settings) {
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs.is_open()) {
    return make_plan_error<bool>(PlanError::kIo, "cannot write settings file: " + path);
  }
  WriteLayoutSettings(ofs, settings);
  if (!ofs.good()) {
    return make_plan_error<bool>(PlanError::kIo, "failed while writing settings file: " + path);
  }
  PlanResult<bool> result;
  result.ok = true;
  result.value = true;
  return result;
}

} // namespace lineplan::core

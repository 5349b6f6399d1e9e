#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "raymath.h"
#include "rlImGui.h"
#include "rlgl.h"
#include "lineplan/core/catalog.hpp"
#include "lineplan/core/classification.hpp"
#include "lineplan/core/layout_generator.hpp"
#include "lineplan/core/settings.hpp"

namespace {

using lineplan::core::EntityId;
using lineplan::core::GeneratedLayout;
using lineplan::core::LayoutGenerator;
using lineplan::core::LayoutSettings;
using lineplan::core::Operation;
using lineplan::core::PlacedEntity;

constexpr float kAxisLength = 2.0f;
constexpr float kMachineHeight = 1.0f;
constexpr std::size_t kMaxLogLines = 12;
constexpr const char* kLayoutSettingsFile = "lineplan_settings.ini";
constexpr const char* kViewerStateFile = "viewer_state.ini";

enum class CameraView : std::uint8_t {
  kPerspective = 0,
  kTop = 1,
  kSide = 2,
};

struct ViewerUiState {
  EntityId selected_id = lineplan::core::kInvalidEntityId;

  double target_output_per_day = 1200.0;
  double working_minutes_per_day = 480.0;
  bool auto_generate = true;

  // Edited copy; pushed to the generator on Apply.
  LayoutSettings settings_edit{};
  bool settings_edit_loaded = false;

  bool show_labels = false;
  bool show_fixtures = true;
  bool show_facing = true;
  bool show_bounds = false;
  bool auto_orbit = false;
  CameraView camera_view = CameraView::kPerspective;
  int selected_section_debug_index = 0;

  std::string last_error;
  std::vector<std::string> logs;
};

struct PlannerSession {
  LayoutGenerator generator{};
  std::vector<Operation> operations{};
  GeneratedLayout layout{};
  lineplan::core::ValidationResult validation{};
  bool has_layout = false;
};

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > kMaxLogLines) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

// Demand and view toggles survive a restart. Layout settings live in their own file.
struct ViewerStateField {
  const char* key;
  double* number;
  bool* flag;
};

std::array<ViewerStateField, 7> ViewerStateFields(ViewerUiState& ui_state) {
  return {{
      {"target_output_per_day", &ui_state.target_output_per_day, nullptr},
      {"working_minutes_per_day", &ui_state.working_minutes_per_day, nullptr},
      {"auto_generate", nullptr, &ui_state.auto_generate},
      {"show_labels", nullptr, &ui_state.show_labels},
      {"show_fixtures", nullptr, &ui_state.show_fixtures},
      {"show_facing", nullptr, &ui_state.show_facing},
      {"auto_orbit", nullptr, &ui_state.auto_orbit},
  }};
}

void LoadViewerState(ViewerUiState& ui_state) {
  std::ifstream in(kViewerStateFile);
  if (!in.is_open()) {
    return;
  }
  const auto fields = ViewerStateFields(ui_state);
  std::string line;
  while (std::getline(in, line)) {
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = lineplan::core::trim_copy(line.substr(0, eq));
    const std::string value = lineplan::core::trim_copy(line.substr(eq + 1));
    const auto field = std::find_if(fields.begin(), fields.end(),
                                    [&key](const ViewerStateField& f) { return key == f.key; });
    if (field == fields.end()) {
      PushLog(ui_state, "[warn] " + std::string(kViewerStateFile) + ": unknown key '" + key + "'");
      continue;
    }
    double number = 0.0;
    bool flag = false;
    if (field->number != nullptr && lineplan::core::ParseNumberValue(value, &number) && number > 0.0) {
      *field->number = number;
    } else if (field->flag != nullptr && lineplan::core::ParseBoolValue(value, &flag)) {
      *field->flag = flag;
    } else {
      PushLog(ui_state, "[warn] " + std::string(kViewerStateFile) + ": bad value for '" + key + "'");
    }
  }
}

void SaveViewerState(ViewerUiState& ui_state) {
  std::ofstream out(kViewerStateFile, std::ios::trunc);
  if (!out.is_open()) {
    TraceLog(LOG_WARNING, "lineplan: cannot write %s", kViewerStateFile);
    return;
  }
  for (const ViewerStateField& field : ViewerStateFields(ui_state)) {
    if (field.number != nullptr) {
      out << field.key << "=" << *field.number << "\n";
    } else {
      out << field.key << "=" << (*field.flag ? "true" : "false") << "\n";
    }
  }
}

const char* LaneLabel(lineplan::core::Lane lane) {
  switch (lane) {
  case lineplan::core::Lane::kA:
    return "A";
  case lineplan::core::Lane::kB:
    return "B";
  case lineplan::core::Lane::kC:
    return "C";
  case lineplan::core::Lane::kD:
    return "D";
  }
  return "?";
}

const char* SectionKindLabel(lineplan::core::SectionKind kind) {
  switch (kind) {
  case lineplan::core::SectionKind::kPartsAB:
    return "Parts(AB)";
  case lineplan::core::SectionKind::kPartsCD:
    return "Parts(CD)";
  case lineplan::core::SectionKind::kAssembly:
    return "Assembly";
  }
  return "Unknown";
}

const char* CategoryLabel(lineplan::core::MachineCategory category) {
  switch (category) {
  case lineplan::core::MachineCategory::kDefault:
    return "Default";
  case lineplan::core::MachineCategory::kSnls:
    return "SNLS";
  case lineplan::core::MachineCategory::kSnec:
    return "SNEC";
  case lineplan::core::MachineCategory::kIron:
    return "Iron";
  case lineplan::core::MachineCategory::kButton:
    return "Button";
  case lineplan::core::MachineCategory::kBartack:
    return "Bartack";
  case lineplan::core::MachineCategory::kSpecial:
    return "Special";
  case lineplan::core::MachineCategory::kHelper:
    return "Helper";
  }
  return "Unknown";
}

const char* FixtureKindLabel(lineplan::core::FixtureKind kind) {
  switch (kind) {
  case lineplan::core::FixtureKind::kSectionBoard:
    return "Section board";
  case lineplan::core::FixtureKind::kInspectionTable:
    return "Inspection table";
  case lineplan::core::FixtureKind::kMaterialTrolley:
    return "Material trolley";
  case lineplan::core::FixtureKind::kSupermarketCabinet:
    return "Supermarket cabinet";
  case lineplan::core::FixtureKind::kTableAndChair:
    return "Table and chair";
  }
  return "Fixture";
}

Color CategoryColor(lineplan::core::MachineCategory category) {
  switch (category) {
  case lineplan::core::MachineCategory::kSnls:
    return SKYBLUE;
  case lineplan::core::MachineCategory::kSnec:
    return Color{90, 170, 120, 255};
  case lineplan::core::MachineCategory::kIron:
    return ORANGE;
  case lineplan::core::MachineCategory::kButton:
    return PINK;
  case lineplan::core::MachineCategory::kBartack:
    return VIOLET;
  case lineplan::core::MachineCategory::kSpecial:
    return Color{200, 200, 90, 255};
  case lineplan::core::MachineCategory::kHelper:
    return BEIGE;
  case lineplan::core::MachineCategory::kDefault:
    break;
  }
  return LIGHTGRAY;
}

Color FixtureColor(lineplan::core::FixtureKind kind) {
  switch (kind) {
  case lineplan::core::FixtureKind::kSectionBoard:
    return Color{240, 240, 240, 255};
  case lineplan::core::FixtureKind::kInspectionTable:
    return Color{150, 110, 80, 255};
  case lineplan::core::FixtureKind::kMaterialTrolley:
    return DARKGRAY;
  case lineplan::core::FixtureKind::kSupermarketCabinet:
    return Color{70, 110, 160, 255};
  case lineplan::core::FixtureKind::kTableAndChair:
    return Color{120, 90, 60, 255};
  }
  return GRAY;
}

// Floor frame and raylib share the y-up convention.
Vector3 ToRaylib(const lineplan::core::Vec3d& floor_xyz) {
  return Vector3{
      static_cast<float>(floor_xyz.x),
      static_cast<float>(floor_xyz.y),
      static_cast<float>(floor_xyz.z),
  };
}

BoundingBox ToRaylibBounds(const lineplan::core::AABBd& box) {
  return BoundingBox{ToRaylib(box.min), ToRaylib(box.max)};
}

Vector3 FacingDirection(double yaw_deg) {
  const double yaw = yaw_deg * DEG2RAD;
  return Vector3{static_cast<float>(std::sin(yaw)), 0.0f, static_cast<float>(std::cos(yaw))};
}

float EntityHeight(const PlacedEntity& entity) {
  if (entity.is_board()) {
    return 0.6f;
  }
  if (entity.is_fixture_kind(lineplan::core::FixtureKind::kSupermarketCabinet)) {
    return 1.6f;
  }
  if (entity.is_trolley()) {
    return 1.1f;
  }
  if (entity.is_inspection()) {
    return 0.85f;
  }
  return entity.is_machine() ? kMachineHeight : 0.8f;
}

// Yaw-agnostic pick volume.
BoundingBox EntityPickBounds(const PlacedEntity& entity) {
  const Vector3 p = ToRaylib(entity.transform.position);
  const float half = 0.5f * static_cast<float>(std::max(entity.footprint.length_m, entity.footprint.width_m));
  const float h = EntityHeight(entity);
  return BoundingBox{{p.x - half, p.y, p.z - half}, {p.x + half, p.y + h, p.z + half}};
}

const PlacedEntity* FindEntity(const PlannerSession& session, EntityId id) {
  for (const PlacedEntity& entity : session.layout.entities) {
    if (entity.id == id) {
      return &entity;
    }
  }
  return nullptr;
}

std::string EntityLabel(const PlacedEntity& entity) {
  if (const Operation* operation = entity.operation(); operation != nullptr) {
    return entity.display_id + " " + operation->op_name;
  }
  if (const lineplan::core::Fixture* fixture = entity.fixture(); fixture != nullptr) {
    return entity.display_id + " " + fixture->label;
  }
  return entity.display_id;
}

void RunGenerate(PlannerSession& session, ViewerUiState& ui_state) {
  const auto result = session.generator.GenerateDetailed(session.operations, ui_state.target_output_per_day,
                                                         ui_state.working_minutes_per_day);
  if (!result.ok) {
    ui_state.last_error = result.error;
    PushLog(ui_state, "[error] Generate failed: " + result.error);
    return;
  }
  session.layout = result.value;
  session.validation = lineplan::core::ValidateLayout(session.layout.entities);
  session.has_layout = true;
  ui_state.last_error.clear();
  if (FindEntity(session, ui_state.selected_id) == nullptr) {
    ui_state.selected_id = lineplan::core::kInvalidEntityId;
  }
  const auto& summary = session.layout.summary;
  char line[160];
  std::snprintf(line, sizeof(line), "[gen] ops=%d machines=%d fixtures=%d takt=%.3f eff=%.1f%%",
                summary.operation_count, summary.machine_count, summary.fixture_count, summary.takt_time_min,
                summary.balance_efficiency * 100.0);
  PushLog(ui_state, line);
  if (!session.validation.ok()) {
    PushLog(ui_state, "[warn] validation reported " + std::to_string(session.validation.issues.size()) + " issue(s)");
  }
}

void ApplySettings(PlannerSession& session, ViewerUiState& ui_state, const LayoutSettings& settings) {
  const auto result = session.generator.UpdateSettings(settings);
  if (!result.ok) {
    ui_state.last_error = result.error;
    PushLog(ui_state, "[error] UpdateSettings failed");
    return;
  }
  ui_state.last_error.clear();
  ui_state.settings_edit = session.generator.settings();
  if (!result.value) {
    PushLog(ui_state, "[info] settings unchanged");
    return;
  }
  PushLog(ui_state, "[info] settings updated");
  if (ui_state.auto_generate) {
    RunGenerate(session, ui_state);
  }
}

void LoadSettingsFromFile(PlannerSession& session, ViewerUiState& ui_state, bool quiet_when_missing) {
  const auto loaded = lineplan::core::LoadLayoutSettingsFile(kLayoutSettingsFile);
  if (!loaded.ok) {
    if (!quiet_when_missing) {
      ui_state.last_error = loaded.error;
      PushLog(ui_state, "[error] " + loaded.error);
    }
    return;
  }
  for (const auto& warning : loaded.warnings.issues) {
    PushLog(ui_state, "[warn] " + warning.code + ": " + warning.message);
  }
  PushLog(ui_state, std::string("[info] loaded ") + kLayoutSettingsFile);
  ApplySettings(session, ui_state, loaded.settings);
}

void SaveSettingsToFile(const PlannerSession& session, ViewerUiState& ui_state) {
  const auto saved = lineplan::core::SaveLayoutSettingsFile(kLayoutSettingsFile, session.generator.settings());
  if (!saved.ok) {
    ui_state.last_error = saved.error;
    PushLog(ui_state, "[error] " + saved.error);
    return;
  }
  PushLog(ui_state, std::string("[info] saved ") + kLayoutSettingsFile);
}

// Looks at the layout centre from a preset direction, far enough to keep its extent in view.
void PlaceCamera(Camera3D* camera, const PlannerSession& session, CameraView view) {
  Vector3 center{20.0f, 0.0f, 0.0f};
  float extent = 40.0f;
  if (session.has_layout && !session.layout.entities.empty()) {
    const auto& bounds = session.layout.summary.bounds;
    center = Vector3Scale(Vector3Add(ToRaylib(bounds.min), ToRaylib(bounds.max)), 0.5f);
    extent = static_cast<float>(std::max(bounds.max.x - bounds.min.x, bounds.max.z - bounds.min.z)) + 6.0f;
  }
  Vector3 direction{-0.25f, 0.55f, 0.8f};
  if (view == CameraView::kTop) {
    // Slight z tilt keeps the view direction off the up vector.
    direction = Vector3{0.0f, 1.0f, 0.01f};
  } else if (view == CameraView::kSide) {
    direction = Vector3{0.0f, 0.15f, 1.0f};
  }
  const float distance = 0.5f * extent / std::tan(0.5f * camera->fovy * DEG2RAD) + 2.0f;
  camera->target = center;
  camera->position = Vector3Add(center, Vector3Scale(Vector3Normalize(direction), distance));
  camera->up = Vector3{0.0f, 1.0f, 0.0f};
}

void UpdateViewCamera(Camera3D* camera, const PlannerSession& session, ViewerUiState& ui_state) {
  if (!ImGui::GetIO().WantCaptureKeyboard) {
    if (IsKeyPressed(KEY_ONE)) {
      ui_state.camera_view = CameraView::kPerspective;
      PlaceCamera(camera, session, ui_state.camera_view);
    } else if (IsKeyPressed(KEY_TWO)) {
      ui_state.camera_view = CameraView::kTop;
      PlaceCamera(camera, session, ui_state.camera_view);
    } else if (IsKeyPressed(KEY_THREE)) {
      ui_state.camera_view = CameraView::kSide;
      PlaceCamera(camera, session, ui_state.camera_view);
    } else if (IsKeyPressed(KEY_F)) {
      PlaceCamera(camera, session, ui_state.camera_view);
    } else if (IsKeyPressed(KEY_O)) {
      ui_state.auto_orbit = !ui_state.auto_orbit;
    }
  }
  // raylib's orbital mode turns about the target and zooms on the wheel.
  if (ui_state.auto_orbit && !ImGui::GetIO().WantCaptureMouse) {
    UpdateCamera(camera, CAMERA_ORBITAL);
  }
}

void UpdatePickInput(const PlannerSession& session, const Camera3D& camera, ViewerUiState& ui_state) {
  ImGuiIO& io = ImGui::GetIO();
  if (io.WantCaptureMouse || !IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    return;
  }
  const Ray ray = GetMouseRay(GetMousePosition(), camera);
  EntityId best_id = lineplan::core::kInvalidEntityId;
  float best_distance = 0.0f;
  for (const PlacedEntity& entity : session.layout.entities) {
    if (!entity.is_machine() && !ui_state.show_fixtures) {
      continue;
    }
    const RayCollision hit = GetRayCollisionBox(ray, EntityPickBounds(entity));
    if (hit.hit && (best_id == lineplan::core::kInvalidEntityId || hit.distance < best_distance)) {
      best_id = entity.id;
      best_distance = hit.distance;
    }
  }
  ui_state.selected_id = best_id;
}

void DrawAxes() {
  DrawLine3D(ToRaylib({0.0, 0.0, 0.0}), ToRaylib({kAxisLength, 0.0, 0.0}), RED);
  DrawLine3D(ToRaylib({0.0, 0.0, 0.0}), ToRaylib({0.0, kAxisLength, 0.0}), GREEN);
  DrawLine3D(ToRaylib({0.0, 0.0, 0.0}), ToRaylib({0.0, 0.0, kAxisLength}), BLUE);
}

void DrawLaneGuides(const PlannerSession& session) {
  if (!session.has_layout || session.layout.entities.empty()) {
    return;
  }
  const auto& offsets = session.generator.settings().lane_offsets;
  const double min_x = session.layout.summary.bounds.min.x - 1.0;
  const double max_x = session.layout.summary.bounds.max.x + 1.0;
  for (int i = 0; i < lineplan::core::kLaneCount; ++i) {
    const double z = offsets.of(static_cast<lineplan::core::Lane>(i));
    DrawLine3D(ToRaylib({min_x, 0.01, z}), ToRaylib({max_x, 0.01, z}), Color{80, 90, 105, 255});
  }
}

void DrawLayout(const PlannerSession& session, const ViewerUiState& ui_state) {
  for (const PlacedEntity& entity : session.layout.entities) {
    const bool is_machine = entity.is_machine();
    if (!is_machine && !ui_state.show_fixtures) {
      continue;
    }
    Color color = is_machine ? CategoryColor(entity.category) : FixtureColor(entity.fixture()->kind);
    if (entity.id == ui_state.selected_id) {
      color = GOLD;
    }
    const float length = static_cast<float>(std::max(entity.footprint.length_m, 0.05));
    const float width = static_cast<float>(std::max(entity.footprint.width_m, 0.05));
    const float height = EntityHeight(entity);

    rlPushMatrix();
    rlTranslatef(static_cast<float>(entity.transform.position.x), static_cast<float>(entity.transform.position.y),
                 static_cast<float>(entity.transform.position.z));
    rlRotatef(static_cast<float>(entity.yaw_deg()), 0.0f, 1.0f, 0.0f);
    DrawCube(Vector3{0.0f, height * 0.5f, 0.0f}, length, height, width, color);
    DrawCubeWires(Vector3{0.0f, height * 0.5f, 0.0f}, length, height, width, Color{20, 24, 30, 255});
    rlPopMatrix();

    if (ui_state.show_facing && is_machine) {
      const Vector3 base = Vector3Add(ToRaylib(entity.transform.position), Vector3{0.0f, height + 0.05f, 0.0f});
      const Vector3 tip = Vector3Add(base, Vector3Scale(FacingDirection(entity.yaw_deg()), 0.6f));
      DrawLine3D(base, tip, RED);
      DrawSphere(tip, 0.05f, RED);
    }
  }

  if (ui_state.show_bounds && session.has_layout && !session.layout.entities.empty()) {
    DrawBoundingBox(ToRaylibBounds(session.layout.summary.bounds), Color{120, 255, 180, 200});
  }
}

void DrawEntityLabels(const PlannerSession& session, const Camera3D& camera, const ViewerUiState& ui_state) {
  if (!ui_state.show_labels) {
    return;
  }
  for (const PlacedEntity& entity : session.layout.entities) {
    if (!entity.is_machine() && !ui_state.show_fixtures) {
      continue;
    }
    const Vector3 anchor =
        Vector3Add(ToRaylib(entity.transform.position), Vector3{0.0f, EntityHeight(entity) + 0.2f, 0.0f});
    const Vector2 screen = GetWorldToScreen(anchor, camera);
    DrawText(entity.display_id.c_str(), static_cast<int>(screen.x), static_cast<int>(screen.y), 10, RAYWHITE);
  }
}

void DrawPlannerContent(PlannerSession& session, ViewerUiState& ui_state) {
  if (!ui_state.settings_edit_loaded) {
    ui_state.settings_edit = session.generator.settings();
    ui_state.settings_edit_loaded = true;
  }

  if (ImGui::CollapsingHeader("Demand", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::InputDouble("Target / day", &ui_state.target_output_per_day, 50.0, 200.0, "%.0f");
    ImGui::InputDouble("Working min / day", &ui_state.working_minutes_per_day, 10.0, 60.0, "%.0f");
    ImGui::Checkbox("Auto Generate", &ui_state.auto_generate);
    if (ImGui::Button("Generate Layout")) {
      RunGenerate(session, ui_state);
    }
    ImGui::SameLine();
    if (ImGui::Button("Reload Demo Bulletin")) {
      session.operations = lineplan::core::make_demo_operations();
      PushLog(ui_state, "[info] demo bulletin loaded (" + std::to_string(session.operations.size()) + " ops)");
      if (ui_state.auto_generate) {
        RunGenerate(session, ui_state);
      }
    }
  }

  if (ImGui::CollapsingHeader("Operations")) {
    if (ImGui::BeginTable("OperationsTable", 5, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
      ImGui::TableSetupColumn("Op");
      ImGui::TableSetupColumn("Name");
      ImGui::TableSetupColumn("Machine");
      ImGui::TableSetupColumn("SMV");
      ImGui::TableSetupColumn("Count");
      ImGui::TableHeadersRow();
      for (const auto& item : session.layout.balanced) {
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted(item.operation.op_no.c_str());
        ImGui::TableSetColumnIndex(1);
        ImGui::TextUnformatted(item.operation.op_name.c_str());
        ImGui::TableSetColumnIndex(2);
        ImGui::TextUnformatted(item.operation.machine_type.c_str());
        ImGui::TableSetColumnIndex(3);
        ImGui::Text("%.2f", item.operation.smv);
        ImGui::TableSetColumnIndex(4);
        ImGui::Text("%d", item.required_machine_count);
      }
      ImGui::EndTable();
    }
  }

  if (ImGui::CollapsingHeader("Layout Settings", ImGuiTreeNodeFlags_DefaultOpen)) {
    LayoutSettings& s = ui_state.settings_edit;
    ImGui::InputDouble("Lane A z", &s.lane_offsets.a, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Lane B z", &s.lane_offsets.b, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Lane C z", &s.lane_offsets.c, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Lane D z", &s.lane_offsets.d, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Machine Pitch", &s.machine_pitch_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Section Gap", &s.section_gap_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Board Clearance", &s.board_clearance_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Board Height", &s.board_height_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Inspection Gap", &s.inspection_gap_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Trolley Along", &s.trolley_along_offset_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Trolley Across", &s.trolley_across_offset_m, 0.1, 0.5, "%.2f");
    ImGui::InputDouble("Fixture Clearance", &s.fixture_clearance_m, 0.1, 0.5, "%.2f");
    if (ImGui::TreeNode("Facing Yaw (deg)")) {
      ImGui::InputDouble("Front", &s.facing.front_deg, 1.0, 15.0, "%.1f");
      ImGui::InputDouble("Back", &s.facing.back_deg, 1.0, 15.0, "%.1f");
      ImGui::InputDouble("Left", &s.facing.left_deg, 1.0, 15.0, "%.1f");
      ImGui::InputDouble("Right", &s.facing.right_deg, 1.0, 15.0, "%.1f");
      ImGui::TreePop();
    }
    ImGui::Checkbox("Post-prep Fixtures", &s.post_prep_fixtures.enabled);
    ImGui::InputDouble("Post-prep Depth", &s.post_prep_fixtures.depth_m, 0.1, 0.5, "%.2f");

    if (ImGui::Button("Apply Settings")) {
      ApplySettings(session, ui_state, ui_state.settings_edit);
    }
    ImGui::SameLine();
    if (ImGui::Button("Defaults")) {
      ui_state.settings_edit = LayoutSettings{};
    }
    ImGui::SameLine();
    if (ImGui::Button("Load")) {
      LoadSettingsFromFile(session, ui_state, false);
    }
    ImGui::SameLine();
    if (ImGui::Button("Save")) {
      SaveSettingsToFile(session, ui_state);
    }
  }
}

void DrawInspectorContent(const PlannerSession& session, const ViewerUiState& ui_state) {
  ImGui::TextUnformatted("Selected");
  ImGui::Separator();
  const PlacedEntity* entity = FindEntity(session, ui_state.selected_id);
  if (entity == nullptr) {
    ImGui::TextUnformatted("None");
    return;
  }

  ImGui::Text("ID: %s (%llu)", entity->display_id.c_str(), static_cast<unsigned long long>(entity->id));
  ImGui::Text("Section: %s", entity->section.c_str());
  ImGui::Text("Lane: %s", LaneLabel(entity->lane));
  ImGui::Text("Pos: %.2f %.2f %.2f", entity->transform.position.x, entity->transform.position.y,
              entity->transform.position.z);
  ImGui::Text("Yaw: %.1f deg", entity->yaw_deg());
  ImGui::Text("Footprint: %.2f x %.2f m", entity->footprint.length_m, entity->footprint.width_m);
  if (const Operation* operation = entity->operation(); operation != nullptr) {
    ImGui::Separator();
    ImGui::Text("Type: Machine");
    ImGui::Text("Op: %s %s", operation->op_no.c_str(), operation->op_name.c_str());
    ImGui::Text("Machine: %s (%s)", operation->machine_type.c_str(), CategoryLabel(entity->category));
    ImGui::Text("SMV: %.3f", operation->smv);
    ImGui::Text("Sequence: %d", entity->sequence_index);
  } else if (const lineplan::core::Fixture* fixture = entity->fixture(); fixture != nullptr) {
    ImGui::Separator();
    ImGui::Text("Type: %s", FixtureKindLabel(fixture->kind));
    ImGui::Text("Label: %s", fixture->label.c_str());
  }
  if (const auto envelope = lineplan::core::SectionEnvelope("", entity->section); envelope.has_value()) {
    ImGui::Text("Section envelope: %.1f x %.1f m", envelope->length_m, envelope->width_m);
  }
}

void DrawEntityList(ViewerUiState& ui_state, const char* header, const std::vector<const PlacedEntity*>& entities,
                    const std::function<std::string(const PlacedEntity&)>& make_label) {
  if (!ImGui::TreeNodeEx(header, ImGuiTreeNodeFlags_DefaultOpen)) {
    return;
  }
  for (const PlacedEntity* entity : entities) {
    const std::string label = make_label(*entity);
    const bool is_selected = (ui_state.selected_id == entity->id);
    if (ImGui::Selectable(label.c_str(), is_selected)) {
      ui_state.selected_id = entity->id;
    }
  }
  ImGui::TreePop();
}

void DrawOutlinerContent(const PlannerSession& session, ViewerUiState& ui_state) {
  std::vector<std::string> sections;
  for (const PlacedEntity& entity : session.layout.entities) {
    if (std::find(sections.begin(), sections.end(), entity.section) == sections.end()) {
      sections.push_back(entity.section);
    }
  }
  for (const std::string& section : sections) {
    std::vector<const PlacedEntity*> members;
    for (const PlacedEntity& entity : session.layout.entities) {
      if (entity.section == section) {
        members.push_back(&entity);
      }
    }
    const std::string header = section + " (" + std::to_string(members.size()) + ")";
    DrawEntityList(ui_state, header.c_str(), members, [](const PlacedEntity& entity) {
      return std::string("[") + LaneLabel(entity.lane) + "] " + EntityLabel(entity);
    });
  }
}

void DrawDiagnosticsContent(const PlannerSession& session, ViewerUiState& ui_state) {
  const auto& summary = session.layout.summary;
  if (ImGui::CollapsingHeader("Summary", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::Text("Total SMV: %.3f  Takt: %.3f min", summary.total_smv, summary.takt_time_min);
    ImGui::Text("Machines: %d  Fixtures: %d  Efficiency: %.1f%%", summary.machine_count, summary.fixture_count,
                summary.balance_efficiency * 100.0);
    for (const auto& lane : summary.lanes) {
      ImGui::Text("Lane %s: %d machine(s) x=[%.1f, %.1f]", LaneLabel(lane.lane), lane.machine_count, lane.min_x,
                  lane.max_x);
    }
    for (const auto& section : summary.sections) {
      ImGui::Text("%s [%s] ops=%d machines=%d smv=%.2f x=[%.1f, %.1f]", section.label.c_str(),
                  SectionKindLabel(section.kind), section.operation_count, section.machine_count, section.total_smv,
                  section.start_x, section.end_x);
    }
  }

  if (ImGui::CollapsingHeader("Validation", ImGuiTreeNodeFlags_DefaultOpen)) {
    ImGui::Text("Validation: %s (%d issue(s))", session.validation.ok() ? "OK" : "ERROR",
                static_cast<int>(session.validation.issues.size()));
    for (const auto& issue : session.validation.issues) {
      const bool is_error = issue.severity == lineplan::core::ValidationSeverity::kError;
      ImGui::TextWrapped("%s %s #%llu: %s", is_error ? "[E]" : "[W]", issue.code.c_str(),
                         static_cast<unsigned long long>(issue.entity_id), issue.message.c_str());
    }
  }

  if (ImGui::CollapsingHeader("Section Placement Debug")) {
    const auto& records = session.layout.section_debug;
    ImGui::Text("Sections: %d", static_cast<int>(records.size()));
    if (!records.empty()) {
      ui_state.selected_section_debug_index =
          std::clamp(ui_state.selected_section_debug_index, 0, static_cast<int>(records.size() - 1));
      ImGui::SliderInt("Section Index", &ui_state.selected_section_debug_index, 0,
                       static_cast<int>(records.size() - 1));
      const auto& record = records[static_cast<std::size_t>(ui_state.selected_section_debug_index)];
      ImGui::Text("Label=%s Kind=%s", record.label.c_str(), SectionKindLabel(record.kind));
      ImGui::Text("Rule=%s%s", record.matched_keyword.empty() ? "-" : record.matched_keyword.c_str(),
                  record.defaulted_kind ? " (default)" : "");
      ImGui::Text("Lanes=%s", !record.lane_group.has_value()
                                   ? "ABCD"
                                   : (*record.lane_group == lineplan::core::LaneGroup::kAB ? "AB" : "CD"));
      ImGui::Text("x=[%.2f, %.2f] machines=%d buttoning=%d fixtures=%d", record.start_x, record.end_x,
                  record.machine_count, record.buttoning_machine_count, record.fixture_count);
      ImGui::Text("Post-prep before: %s", record.post_prep_fixtures_before ? "true" : "false");
    }
  }

  if (!ui_state.last_error.empty()) {
    ImGui::Separator();
    ImGui::TextWrapped("Error: %s", ui_state.last_error.c_str());
  }
  ImGui::Separator();
  ImGui::BeginChild("LogArea", ImVec2(0.0f, 90.0f), true, ImGuiWindowFlags_HorizontalScrollbar);
  for (const std::string& line : ui_state.logs) {
    ImGui::TextWrapped("%s", line.c_str());
  }
  ImGui::EndChild();
}

void DrawMenuBar(PlannerSession& session, Camera3D* camera, ViewerUiState& ui_state) {
  if (!ImGui::BeginMainMenuBar()) {
    return;
  }
  if (ImGui::BeginMenu("Layout")) {
    if (ImGui::MenuItem("Generate")) {
      RunGenerate(session, ui_state);
    }
    if (ImGui::MenuItem("Load settings")) {
      LoadSettingsFromFile(session, ui_state, false);
    }
    if (ImGui::MenuItem("Save settings")) {
      SaveSettingsToFile(session, ui_state);
    }
    ImGui::EndMenu();
  }
  if (ImGui::BeginMenu("View")) {
    ImGui::MenuItem("Labels", nullptr, &ui_state.show_labels);
    ImGui::MenuItem("Fixtures", nullptr, &ui_state.show_fixtures);
    ImGui::MenuItem("Facing", nullptr, &ui_state.show_facing);
    ImGui::MenuItem("Layout bounds", nullptr, &ui_state.show_bounds);
    ImGui::Separator();
    ImGui::MenuItem("Auto orbit", "O", &ui_state.auto_orbit);
    const std::array<std::pair<const char*, CameraView>, 3> views = {{
        {"Perspective", CameraView::kPerspective},
        {"Top", CameraView::kTop},
        {"Side", CameraView::kSide},
    }};
    for (const auto& [name, view] : views) {
      if (ImGui::MenuItem(name, nullptr, ui_state.camera_view == view)) {
        ui_state.camera_view = view;
        PlaceCamera(camera, session, view);
      }
    }
    ImGui::EndMenu();
  }
  const auto& summary = session.layout.summary;
  ImGui::Text("| ops %d  machines %d  fixtures %d  takt %.3f min  eff %.1f%%  | %s", summary.operation_count,
              summary.machine_count, summary.fixture_count, summary.takt_time_min, summary.balance_efficiency * 100.0,
              session.validation.ok() ? "valid" : "INVALID");
  ImGui::EndMainMenuBar();
}


void DrawWorkspace(PlannerSession& session, ViewerUiState& ui_state) {
  const float screen_w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(std::max(0.0f, screen_w - 440.0f), 30.0f), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(430.0f, 640.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Line Planner")) {
    ImGui::End();
    return;
  }
  if (ImGui::BeginTabBar("PlannerTabs")) {
    if (ImGui::BeginTabItem("Planner")) {
      DrawPlannerContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Inspector")) {
      DrawInspectorContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Outliner")) {
      DrawOutlinerContent(session, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnosticsContent(session, ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

} // namespace

int main() {
  ViewerUiState ui_state;
  LoadViewerState(ui_state);

  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
  InitWindow(1280, 720, "lineplan viewer");
  SetTargetFPS(60);

  PlannerSession session;
  session.operations = lineplan::core::make_demo_operations();
  PushLog(ui_state, "[info] demo bulletin loaded (" + std::to_string(session.operations.size()) + " ops)");
  LoadSettingsFromFile(session, ui_state, true);
  RunGenerate(session, ui_state);

  Camera3D camera{};
  camera.fovy = 45.0f;
  camera.projection = CAMERA_PERSPECTIVE;
  PlaceCamera(&camera, session, ui_state.camera_view);
  PushLog(ui_state, "[hint] LMB select, 1/2/3 views, F reframe, O orbit");

  rlImGuiSetup(true);
  while (!WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{28, 30, 36, 255});
    rlImGuiBegin();

    UpdateViewCamera(&camera, session, ui_state);
    UpdatePickInput(session, camera, ui_state);

    BeginMode3D(camera);
    DrawGrid(80, 1.0f);
    DrawAxes();
    DrawLaneGuides(session);
    DrawLayout(session, ui_state);
    EndMode3D();
    DrawEntityLabels(session, camera, ui_state);

    DrawMenuBar(session, &camera, ui_state);
    DrawWorkspace(session, ui_state);
    rlImGuiEnd();
    EndDrawing();
  }

  rlImGuiShutdown();
  CloseWindow();
  SaveViewerState(ui_state);
  return 0;
}

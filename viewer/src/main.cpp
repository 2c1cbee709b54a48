#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "imgui.h"
#include "raylib.h"
#include "rlImGui.h"
#include "ollama_audit_backend.hpp"
#include "proflex/core/editor.hpp"
#include "proflex/io/app_settings.hpp"
#include "proflex/io/audit.hpp"
#include "proflex/io/project_io.hpp"
#include "proflex/io/project_library.hpp"

namespace {

using proflex::core::Editor;
using proflex::core::EditorStepResult;
using proflex::core::InputDevice;
using proflex::core::IntentKind;
using proflex::core::NodeType;
using proflex::core::ObjectId;
using proflex::core::PipeSize;
using proflex::core::PointerTarget;
using proflex::core::TargetKind;
using proflex::core::ToolMode;
using proflex::core::Vec2d;

constexpr float kTopbarHeight = 74.0f;
constexpr float kMargin = 8.0f;
constexpr float kAffordanceGap = 14.0f;
constexpr float kAffordanceRadius = 18.0f;
constexpr double kNodePickSlackMouse = 8.0;
constexpr double kNodePickSlackTouch = 24.0;
constexpr double kEdgePickDistanceMouse = 8.0;
constexpr double kEdgePickDistanceTouch = 20.0;
constexpr std::size_t kMaxLogLines = 12;

// Screen placement of the 0..1000 logical canvas.
struct CanvasView {
  float left = 0.0f;
  float top = 0.0f;
  float scale = 1.0f;
};

struct ViewerUiState {
  std::string project_name = std::string(proflex::io::kDefaultProjectName);
  std::string project_id{};
  std::array<char, 128> project_name_buf{};
  std::array<char, 128> save_as_buf{};
  std::array<char, 260> file_path_buf{};

  ObjectId inspector_owner_id = proflex::core::kInvalidObjectId;
  std::array<char, 128> node_name_buf{};
  double node_demand = 0.0;
  int edge_size_index = static_cast<int>(PipeSize::kHalf);
  double edge_length_ft = proflex::core::kDefaultEdgeLengthFt;
  bool open_edit_popup = false;

  bool gesture_active = false;
  bool gesture_on_affordance = false;
  InputDevice gesture_device = InputDevice::kMouse;
  PointerTarget pressed_target{};
  Vector2 last_mouse{};

  bool show_audit_window = false;
  bool audit_running = false;
  std::future<proflex::io::AuditOutcome> audit_future{};
  std::vector<proflex::io::AuditSection> audit_sections{};

  std::string last_error;
  std::vector<std::string> logs;
  float ui_workspace_width = 420.0f;
};

void PushLog(ViewerUiState& ui_state, const std::string& line) {
  ui_state.logs.push_back(line);
  if (ui_state.logs.size() > kMaxLogLines) {
    ui_state.logs.erase(ui_state.logs.begin());
  }
}

void HandleResultError(ViewerUiState& ui_state, const std::string& error, const std::string& fallback_log) {
  if (!error.empty()) {
    ui_state.last_error = error;
  } else {
    ui_state.last_error = fallback_log;
  }
  PushLog(ui_state, fallback_log);
}

template <std::size_t N>
void CopyToBuffer(std::array<char, N>& buffer, const std::string& text) {
  std::snprintf(buffer.data(), buffer.size(), "%s", text.c_str());
}

std::int64_t NowMs() {
  return static_cast<std::int64_t>(GetTime() * 1000.0);
}

Color ToRaylib(const proflex::core::Rgba8& color) {
  return Color{color.r, color.g, color.b, color.a};
}

const char* ToolModeLabel(ToolMode mode) {
  return mode == ToolMode::kPipe ? "Pipe" : "Select";
}

const char* NodeTypeLabel(NodeType type) {
  return proflex::core::traits_of(type).default_name;
}

std::string PipeSizeComboItems() {
  std::string items;
  for (const proflex::core::PipeSpec& spec : proflex::core::kPipeSpecs) {
    items += spec.label;
    items += " (";
    items += std::to_string(spec.nominal_capacity / 1000);
    items += "k)";
    items.push_back('\0');
  }
  return items;
}

std::string FormatTimestamp(std::int64_t timestamp_ms) {
  const std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  std::array<char, 32> text{};
  std::strftime(text.data(), text.size(), "%Y-%m-%d %H:%M", &local);
  return text.data();
}

CanvasView ComputeCanvasView(const ViewerUiState& ui_state) {
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float top = kTopbarHeight + kMargin * 2.0f;
  const float avail_w = std::max(200.0f, screen_w - ui_state.ui_workspace_width - kMargin * 3.0f);
  const float avail_h = std::max(200.0f, screen_h - top - kMargin);
  const float side = std::min(avail_w, avail_h);

  CanvasView view;
  view.scale = side / static_cast<float>(proflex::core::kCanvasMax - proflex::core::kCanvasMin);
  view.left = kMargin + (avail_w - side) * 0.5f;
  view.top = top + (avail_h - side) * 0.5f;
  return view;
}

Vector2 CanvasToScreen(const CanvasView& view, const Vec2d& p) {
  return Vector2{view.left + static_cast<float>(p.x) * view.scale, view.top + static_cast<float>(p.y) * view.scale};
}

Vec2d ScreenToCanvas(const CanvasView& view, Vector2 p) {
  return Vec2d{(p.x - view.left) / view.scale, (p.y - view.top) / view.scale};
}

bool InsideCanvas(const Vec2d& p) {
  return p.x >= proflex::core::kCanvasMin && p.x <= proflex::core::kCanvasMax && p.y >= proflex::core::kCanvasMin &&
         p.y <= proflex::core::kCanvasMax;
}

Vec2d AffordanceCenter(const proflex::core::Node& node) {
  const double offset = proflex::core::traits_of(node.type).radius + kAffordanceGap;
  return Vec2d{node.position.x + offset, node.position.y - offset};
}

// The delete button is only shown on the selected node in select mode.
ObjectId PickDeleteAffordance(const Editor& editor, const Vec2d& at) {
  if (editor.interaction().mode != ToolMode::kSelect || editor.selected_kind() != TargetKind::kNode) {
    return proflex::core::kInvalidObjectId;
  }
  const proflex::core::Node* node = editor.design().nodes().find(editor.selected_id());
  if (node == nullptr || proflex::core::length(at - AffordanceCenter(*node)) > kAffordanceRadius) {
    return proflex::core::kInvalidObjectId;
  }
  return node->id;
}

PointerTarget PickTarget(const Editor& editor, const Vec2d& at, InputDevice device) {
  const auto& design = editor.design();
  const double slack = device == InputDevice::kTouch ? kNodePickSlackTouch : kNodePickSlackMouse;
  const auto& nodes = design.nodes().items();
  // Topmost first.
  for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
    const double radius = proflex::core::traits_of(it->type).radius + slack;
    if (proflex::core::length(at - it->position) <= radius) {
      return {TargetKind::kNode, it->id};
    }
  }

  const double edge_distance = device == InputDevice::kTouch ? kEdgePickDistanceTouch : kEdgePickDistanceMouse;
  for (const proflex::core::Edge& edge : design.edges().items()) {
    const proflex::core::Node* from = design.nodes().find(edge.from_node_id);
    const proflex::core::Node* to = design.nodes().find(edge.to_node_id);
    if (from == nullptr || to == nullptr) {
      continue;
    }
    if (proflex::core::distance_to_segment(at, from->position, to->position) <= edge_distance) {
      return {TargetKind::kEdge, edge.id};
    }
  }
  return {};
}

void LogStep(ViewerUiState& ui_state, const EditorStepResult& step) {
  for (const auto& applied : step.applied) {
    if (!applied.ok) {
      HandleResultError(ui_state, applied.error, "Canvas edit failed");
      continue;
    }
    if (applied.intent.kind == IntentKind::kAddEdge && !applied.change_set.created_ids.empty()) {
      ui_state.last_error.clear();
      PushLog(ui_state, "Connected pipe id=" + std::to_string(applied.change_set.created_ids.front()));
    } else if (applied.intent.kind == IntentKind::kDeleteNode) {
      ui_state.last_error.clear();
      PushLog(ui_state, "Deleted node id=" + std::to_string(applied.intent.target.id));
    }
  }
}

void UpdateCanvasInput(Editor& editor, ViewerUiState& ui_state, const CanvasView& view) {
  ImGuiIO& io = ImGui::GetIO();
  const Vector2 mouse = GetMousePosition();
  const Vec2d at = ScreenToCanvas(view, mouse);

  if (!io.WantCaptureMouse && InsideCanvas(at) && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    const InputDevice device = GetTouchPointCount() > 0 ? InputDevice::kTouch : InputDevice::kMouse;
    const ObjectId affordance = PickDeleteAffordance(editor, at);
    if (affordance != proflex::core::kInvalidObjectId) {
      ui_state.gesture_on_affordance = true;
      LogStep(ui_state, editor.HandleEvent(proflex::core::MakeDeleteAffordanceTap(affordance)));
    } else {
      ui_state.gesture_active = true;
      ui_state.gesture_device = device;
      ui_state.pressed_target = PickTarget(editor, at, device);
      LogStep(ui_state, editor.HandleEvent(proflex::core::MakePointerDown(at, ui_state.pressed_target, device, NowMs())));
    }
  }

  const bool moved = mouse.x != ui_state.last_mouse.x || mouse.y != ui_state.last_mouse.y;
  ui_state.last_mouse = mouse;
  if (moved && (ui_state.gesture_active || (!io.WantCaptureMouse && InsideCanvas(at)))) {
    const InputDevice device = ui_state.gesture_active ? ui_state.gesture_device : InputDevice::kMouse;
    LogStep(ui_state, editor.HandleEvent(proflex::core::MakePointerMove(at, device)));
  }

  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    if (ui_state.gesture_active) {
      const InputDevice device = ui_state.gesture_device;
      const PointerTarget under = PickTarget(editor, at, device);
      // A touch gesture keeps reporting the element it started on.
      const PointerTarget target = device == InputDevice::kTouch ? ui_state.pressed_target : under;
      LogStep(ui_state, editor.HandleEvent(proflex::core::MakePointerUp(at, target, under, device, NowMs())));
    }
    ui_state.gesture_active = false;
    ui_state.gesture_on_affordance = false;
  }

  if (editor.edit_request_id() != proflex::core::kInvalidObjectId) {
    ui_state.open_edit_popup = true;
    editor.ClearEditRequest();
  }

  if (!io.WantCaptureKeyboard) {
    if (IsKeyPressed(KEY_DELETE) && editor.selected_kind() != TargetKind::kBackground) {
      const auto result = editor.DeleteSelected();
      if (!result.ok) {
        HandleResultError(ui_state, result.error, "Delete failed");
      } else {
        ui_state.last_error.clear();
        PushLog(ui_state, "Deleted id=" + std::to_string(result.value));
      }
    }
    if (IsKeyPressed(KEY_V)) {
      (void)editor.SetToolMode(ToolMode::kSelect);
    }
    if (IsKeyPressed(KEY_P)) {
      (void)editor.SetToolMode(ToolMode::kPipe);
    }
  }
}

void DrawCanvasGrid(const CanvasView& view) {
  const float side = 1000.0f * view.scale;
  DrawRectangleV(Vector2{view.left, view.top}, Vector2{side, side}, Color{241, 245, 249, 255});
  for (int i = 0; i <= 1000; i += 40) {
    const float offset = static_cast<float>(i) * view.scale;
    const Color line = Color{226, 232, 240, 255};
    DrawLineV(Vector2{view.left + offset, view.top}, Vector2{view.left + offset, view.top + side}, line);
    DrawLineV(Vector2{view.left, view.top + offset}, Vector2{view.left + side, view.top + offset}, line);
  }
}

void DrawCanvas(const Editor& editor, const CanvasView& view) {
  const auto& design = editor.design();
  const ObjectId selected = editor.selected_id();
  const ObjectId pipe_source = editor.interaction().pipe_source_id;
  const bool pipe_mode = editor.interaction().mode == ToolMode::kPipe;
  const int font = std::max(10, static_cast<int>(11.0f * view.scale));

  DrawCanvasGrid(view);

  for (const proflex::core::Edge& edge : design.edges().items()) {
    const proflex::core::Node* from = design.nodes().find(edge.from_node_id);
    const proflex::core::Node* to = design.nodes().find(edge.to_node_id);
    if (from == nullptr || to == nullptr) {
      continue;
    }
    const proflex::core::EdgeVerdict* verdict = design.find_verdict(edge.id);
    const bool valid = verdict == nullptr || verdict->is_valid;
    Color color = Color{148, 163, 184, 255};
    if (!valid) {
      color = Color{239, 68, 68, 255};
    } else if (edge.id == selected) {
      color = Color{99, 102, 241, 255};
    }
    const float width = (4.0f + static_cast<float>(edge.size) * 2.0f) * view.scale;
    const Vector2 a = CanvasToScreen(view, from->position);
    const Vector2 b = CanvasToScreen(view, to->position);
    DrawLineEx(a, b, std::max(1.5f, width), color);

    char label[32];
    std::snprintf(label, sizeof(label), "%.0fft", edge.length_ft);
    const Vector2 mid{(a.x + b.x) * 0.5f, (a.y + b.y) * 0.5f};
    const int text_w = MeasureText(label, font);
    DrawRectangleRounded(Rectangle{mid.x - text_w * 0.5f - 6.0f, mid.y - font * 0.5f - 3.0f, text_w + 12.0f,
                                   font + 6.0f},
                         0.5f, 6, RAYWHITE);
    DrawText(label, static_cast<int>(mid.x - text_w * 0.5f), static_cast<int>(mid.y - font * 0.5f), font, color);
  }

  if (const auto guide = proflex::core::CurrentPipeGuide(editor.interaction()); guide.has_value()) {
    if (const proflex::core::Node* source = design.nodes().find(guide->source_node_id); source != nullptr) {
      DrawLineEx(CanvasToScreen(view, source->position), CanvasToScreen(view, guide->end), 3.0f,
                 Color{99, 102, 241, 160});
    }
  }

  for (const proflex::core::Node& node : design.nodes().items()) {
    const auto& traits = proflex::core::traits_of(node.type);
    const Vector2 center = CanvasToScreen(view, node.position);
    const float radius = static_cast<float>(traits.radius) * view.scale;

    if (pipe_mode) {
      const bool is_source = node.id == pipe_source;
      DrawCircleLines(static_cast<int>(center.x), static_cast<int>(center.y), radius + 24.0f * view.scale,
                      is_source ? Color{99, 102, 241, 255} : Color{203, 213, 225, 255});
      if (is_source) {
        DrawRing(center, radius + 20.0f * view.scale, radius + 26.0f * view.scale, 0.0f, 360.0f, 48,
                 Color{99, 102, 241, 200});
      }
    }

    const Color outline = node.id == selected ? Color{99, 102, 241, 255} : WHITE;
    const float outline_w = (node.id == selected ? 4.0f : 2.0f) * view.scale;
    if (node.type == NodeType::kJunction) {
      DrawCircleV(center, radius + outline_w, outline);
      DrawCircleV(center, radius, ToRaylib(traits.color));
    } else {
      DrawRectangleRounded(Rectangle{center.x - radius - outline_w, center.y - radius - outline_w,
                                     (radius + outline_w) * 2.0f, (radius + outline_w) * 2.0f},
                           0.2f, 6, outline);
      DrawRectangleRounded(Rectangle{center.x - radius, center.y - radius, radius * 2.0f, radius * 2.0f}, 0.2f, 6,
                           ToRaylib(traits.color));
    }

    const int name_w = MeasureText(node.name.c_str(), font);
    DrawText(node.name.c_str(), static_cast<int>(center.x - name_w * 0.5f),
             static_cast<int>(center.y + radius + 6.0f * view.scale), font, Color{15, 23, 42, 255});

    if (!pipe_mode && node.id == selected) {
      const Vector2 button = CanvasToScreen(view, AffordanceCenter(node));
      DrawCircleV(button, kAffordanceRadius * view.scale, Color{239, 68, 68, 255});
      const int x_w = MeasureText("x", font + 4);
      DrawText("x", static_cast<int>(button.x - x_w * 0.5f), static_cast<int>(button.y - (font + 4) * 0.5f),
               font + 4, WHITE);
    }
  }
}

void DrawModeButtons(Editor& editor, ViewerUiState& ui_state) {
  const std::array<std::pair<ToolMode, const char*>, 2> modes = {{
      {ToolMode::kSelect, "Select (V)"},
      {ToolMode::kPipe, "Pipe (P)"},
  }};
  for (std::size_t i = 0; i < modes.size(); ++i) {
    const bool active = (editor.interaction().mode == modes[i].first);
    if (active) {
      ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.22f, 0.34f, 0.48f, 1.0f));
      ImGui::PushStyleColor(ImGuiCol_ButtonHovered, ImVec4(0.26f, 0.40f, 0.58f, 1.0f));
    }
    if (ImGui::Button(modes[i].second)) {
      LogStep(ui_state, editor.SetToolMode(modes[i].first));
      PushLog(ui_state, std::string("Tool -> ") + ToolModeLabel(modes[i].first));
    }
    if (active) {
      ImGui::PopStyleColor(2);
    }
    ImGui::SameLine();
  }
}

void StartAudit(const Editor& editor, const proflex::io::AppSettings& settings, ViewerUiState& ui_state) {
  if (ui_state.audit_running) {
    return;
  }
  proflex::core::DesignState snapshot = editor.design();
  const std::string host = settings.audit_host;
  const int port = settings.audit_port;
  const std::string model = settings.audit_model;
  // Detached so that closing the window never waits on the HTTP read timeout.
  std::packaged_task<proflex::io::AuditOutcome()> task([snapshot = std::move(snapshot), host, port, model]() {
    proflex::viewer::OllamaAuditBackend backend(host, port, model);
    return proflex::io::RunAudit(backend, snapshot);
  });
  ui_state.audit_future = task.get_future();
  std::thread(std::move(task)).detach();
  ui_state.audit_running = true;
  ui_state.show_audit_window = true;
  ui_state.audit_sections.clear();
  PushLog(ui_state, "Audit started");
}

void PollAudit(ViewerUiState& ui_state) {
  if (!ui_state.audit_running) {
    return;
  }
  if (ui_state.audit_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    return;
  }
  ui_state.audit_running = false;
  const proflex::io::AuditOutcome outcome = ui_state.audit_future.get();
  ui_state.audit_sections = proflex::io::ParseAuditReport(outcome.report);
  if (outcome.used_fallback) {
    HandleResultError(ui_state, outcome.error, "Audit unavailable, showing fallback");
  } else {
    ui_state.last_error.clear();
    PushLog(ui_state, "Audit finished sections=" + std::to_string(ui_state.audit_sections.size()));
  }
}

void DrawTopbarWindow(Editor& editor, const proflex::io::AppSettings& settings, ViewerUiState& ui_state) {
  const float w = static_cast<float>(GetScreenWidth());
  ImGui::SetNextWindowPos(ImVec2(kMargin, kMargin), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(std::max(320.0f, w - kMargin * 2.0f), kTopbarHeight), ImGuiCond_Always);
  const ImGuiWindowFlags flags =
      ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize;
  if (!ImGui::Begin("Topbar", nullptr, flags)) {
    ImGui::End();
    return;
  }

  DrawModeButtons(editor, ui_state);
  ImGui::SetNextItemWidth(150.0f);
  int pipe_size = static_cast<int>(editor.interaction_settings().pipe_size);
  static const std::string pipe_items = PipeSizeComboItems();
  if (ImGui::Combo("New Pipe", &pipe_size, pipe_items.c_str())) {
    editor.SetDefaultPipeSize(static_cast<PipeSize>(pipe_size));
  }
  ImGui::SameLine();
  ImGui::BeginDisabled(ui_state.audit_running);
  if (ImGui::Button(ui_state.audit_running ? "Auditing..." : "AI Audit")) {
    StartAudit(editor, settings, ui_state);
  }
  ImGui::EndDisabled();

  ImGui::Separator();
  const auto summary = editor.design().SummarizeParts();
  ImGui::Text("%s  |  Nodes:%d  Pipes:%d  Failing:%d  Demand:%.0f", ui_state.project_name.c_str(),
              static_cast<int>(editor.design().nodes().size()), static_cast<int>(summary.segment_count),
              static_cast<int>(summary.failing_segment_count), summary.total_appliance_demand);
  ImGui::SameLine();
  ImGui::Text("|  Tool: %s", ToolModeLabel(editor.interaction().mode));
  if (const auto guide = proflex::core::CurrentPipeGuide(editor.interaction()); guide.has_value()) {
    ImGui::SameLine();
    ImGui::Text("|  Source locked: %llu", static_cast<unsigned long long>(guide->source_node_id));
  }
  ImGui::End();
}

void DrawToolboxContent(Editor& editor, ViewerUiState& ui_state) {
  ImGui::TextUnformatted("Components");
  ImGui::Separator();
  for (const proflex::core::NodeTypeTraits& traits : proflex::core::kNodeTypeTraits) {
    if (traits.has_demand) {
      continue;
    }
    if (ImGui::Button(traits.default_name)) {
      const auto result = editor.AddComponent(traits.type);
      if (!result.ok) {
        HandleResultError(ui_state, result.error, "Add component failed");
      } else {
        ui_state.last_error.clear();
        PushLog(ui_state, std::string("Added ") + traits.default_name + " id=" + std::to_string(result.value));
      }
    }
    ImGui::SameLine();
  }
  ImGui::NewLine();

  ImGui::TextUnformatted("Appliances");
  ImGui::Separator();
  for (const proflex::core::AppliancePreset& preset : proflex::core::kAppliancePresets) {
    char label[64];
    std::snprintf(label, sizeof(label), "%s (%.0fk)", preset.name, preset.demand / 1000.0);
    if (ImGui::Button(label)) {
      const auto result = editor.AddComponent(NodeType::kAppliance, preset.name, preset.demand);
      if (!result.ok) {
        HandleResultError(ui_state, result.error, "Add appliance failed");
      } else {
        ui_state.last_error.clear();
        PushLog(ui_state, std::string("Added ") + preset.name + " id=" + std::to_string(result.value));
      }
    }
  }
  if (ImGui::Button("Custom Appliance")) {
    const auto result = editor.AddComponent(NodeType::kAppliance);
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Add appliance failed");
    } else {
      ui_state.last_error.clear();
      PushLog(ui_state, "Added Appliance id=" + std::to_string(result.value));
    }
  }

  ImGui::Separator();
  ImGui::TextUnformatted("Pipe table (nominal capacity)");
  for (const proflex::core::PipeSpec& spec : proflex::core::kPipeSpecs) {
    ImGui::BulletText("%s  %lld", spec.label, static_cast<long long>(spec.nominal_capacity));
  }
}

// Keeps the edit buffers in sync with the current selection.
void SyncInspector(const Editor& editor, ViewerUiState& ui_state) {
  if (ui_state.inspector_owner_id == editor.selected_id()) {
    return;
  }
  ui_state.inspector_owner_id = editor.selected_id();
  if (const auto* node = editor.design().nodes().find(editor.selected_id()); node != nullptr) {
    CopyToBuffer(ui_state.node_name_buf, node->name);
    ui_state.node_demand = node->demand;
  } else if (const auto* edge = editor.design().edges().find(editor.selected_id()); edge != nullptr) {
    ui_state.edge_size_index = static_cast<int>(edge->size);
    ui_state.edge_length_ft = edge->length_ft;
  }
}

void DrawNodeEditor(Editor& editor, ViewerUiState& ui_state, const proflex::core::Node& node) {
  ImGui::Text("Type: %s", NodeTypeLabel(node.type));
  ImGui::Text("ID: %llu", static_cast<unsigned long long>(node.id));
  ImGui::Text("Pos: %.1f %.1f", node.position.x, node.position.y);

  ImGui::InputText("Name", ui_state.node_name_buf.data(), ui_state.node_name_buf.size());
  if (ImGui::Button("Rename")) {
    const auto result = editor.design().RenameNode(node.id, ui_state.node_name_buf.data());
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Rename failed");
    } else {
      ui_state.last_error.clear();
      PushLog(ui_state, "Renamed id=" + std::to_string(node.id));
    }
  }

  if (proflex::core::traits_of(node.type).has_demand) {
    ImGui::InputDouble("Demand (BTU/h)", &ui_state.node_demand, 1000.0, 10000.0, "%.0f");
    if (ImGui::Button("Apply Demand")) {
      const auto result = editor.design().SetNodeDemand(node.id, ui_state.node_demand);
      if (!result.ok) {
        HandleResultError(ui_state, result.error, "Set demand failed");
      } else {
        ui_state.last_error.clear();
        PushLog(ui_state, "Demand updated id=" + std::to_string(node.id));
      }
    }
  }
}

void DrawEdgeEditor(Editor& editor, ViewerUiState& ui_state, const proflex::core::Edge& edge) {
  ImGui::Text("Pipe ID: %llu", static_cast<unsigned long long>(edge.id));
  ImGui::Text("From %llu -> To %llu", static_cast<unsigned long long>(edge.from_node_id),
              static_cast<unsigned long long>(edge.to_node_id));
  if (const auto* verdict = editor.design().find_verdict(edge.id); verdict != nullptr) {
    ImGui::Text("Flow: %.0f / Capacity: %lld", verdict->flow, static_cast<long long>(verdict->capacity));
    if (verdict->in_cycle) {
      ImGui::TextColored(ImVec4(0.94f, 0.27f, 0.27f, 1.0f), "Loop detected");
    } else if (!verdict->is_valid) {
      ImGui::TextColored(ImVec4(0.94f, 0.27f, 0.27f, 1.0f), "Undersized");
    } else {
      ImGui::TextColored(ImVec4(0.06f, 0.73f, 0.51f, 1.0f), "OK");
    }
  }

  static const std::string pipe_items = PipeSizeComboItems();
  if (ImGui::Combo("Size", &ui_state.edge_size_index, pipe_items.c_str())) {
    const auto result = editor.design().SetEdgeSize(edge.id, static_cast<PipeSize>(ui_state.edge_size_index));
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Resize failed");
    } else {
      ui_state.last_error.clear();
      PushLog(ui_state, "Resized pipe id=" + std::to_string(edge.id));
    }
  }
  ImGui::InputDouble("Length (ft)", &ui_state.edge_length_ft, 1.0, 5.0, "%.1f");
  if (ImGui::Button("Apply Length")) {
    const auto result = editor.design().SetEdgeLength(edge.id, ui_state.edge_length_ft);
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Set length failed");
    } else {
      ui_state.last_error.clear();
      PushLog(ui_state, "Length updated id=" + std::to_string(edge.id));
    }
  }
}

void DrawInspectorContent(Editor& editor, ViewerUiState& ui_state) {
  SyncInspector(editor, ui_state);
  ImGui::TextUnformatted("Selected");
  ImGui::Separator();

  const ObjectId selected = editor.selected_id();
  if (const auto* node = editor.design().nodes().find(selected); node != nullptr) {
    DrawNodeEditor(editor, ui_state, *node);
  } else if (const auto* edge = editor.design().edges().find(selected); edge != nullptr) {
    DrawEdgeEditor(editor, ui_state, *edge);
  } else {
    ImGui::TextUnformatted("None");
    return;
  }

  ImGui::Separator();
  if (ImGui::Button("Delete Selected")) {
    const auto result = editor.DeleteSelected();
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Delete failed");
    } else {
      ui_state.last_error.clear();
      PushLog(ui_state, "Deleted id=" + std::to_string(result.value));
    }
  }
}

void LoadDocument(Editor& editor, ViewerUiState& ui_state, proflex::io::ProjectDocument document,
                  const std::string& project_id) {
  const std::string name = document.name;
  const auto result = proflex::io::ApplyDocument(editor, std::move(document));
  if (!result.ok) {
    HandleResultError(ui_state, result.error, "Load failed");
    return;
  }
  ui_state.project_name = name;
  ui_state.project_id = project_id;
  CopyToBuffer(ui_state.project_name_buf, name);
  ui_state.last_error.clear();
  PushLog(ui_state, "Loaded " + name);
}

void DrawProjectContent(Editor& editor, proflex::io::ProjectLibrary& library, ViewerUiState& ui_state) {
  if (ImGui::InputText("Project", ui_state.project_name_buf.data(), ui_state.project_name_buf.size())) {
    ui_state.project_name = ui_state.project_name_buf.data();
  }
  if (ImGui::Button("New Project")) {
    editor.ResetDesign();
    ui_state.project_name = std::string(proflex::io::kDefaultProjectName);
    ui_state.project_id.clear();
    CopyToBuffer(ui_state.project_name_buf, ui_state.project_name);
    ui_state.last_error.clear();
    PushLog(ui_state, "New project");
  }
  ImGui::SameLine();
  if (ImGui::Button("Save")) {
    const auto result = library.Save(ui_state.project_id, ui_state.project_name, editor.design(),
                                     proflex::io::NowMillis());
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Save failed");
    } else {
      ui_state.project_id = result.value;
      ui_state.last_error.clear();
      PushLog(ui_state, "Design Saved");
    }
  }

  ImGui::InputText("##SaveAsName", ui_state.save_as_buf.data(), ui_state.save_as_buf.size());
  ImGui::SameLine();
  if (ImGui::Button("Save As")) {
    const std::string name = ui_state.save_as_buf.data();
    const auto result = library.SaveAs(name, editor.design(), proflex::io::NowMillis());
    if (!result.ok) {
      HandleResultError(ui_state, result.error, "Save As failed");
    } else {
      ui_state.project_name = name;
      ui_state.project_id = result.value;
      CopyToBuffer(ui_state.project_name_buf, name);
      ui_state.save_as_buf[0] = '\0';
      ui_state.last_error.clear();
      PushLog(ui_state, "Saved as " + name);
    }
  }

  if (ImGui::CollapsingHeader("Recent Designs", ImGuiTreeNodeFlags_DefaultOpen)) {
    if (library.entries().empty()) {
      ImGui::TextUnformatted("No saved designs");
    }
    // Copy out before loading: selecting an entry must not alias the library while it changes.
    std::optional<proflex::io::RecentProject> picked;
    for (const proflex::io::RecentProject& entry : library.entries()) {
      const std::string label = entry.name + "  (" + FormatTimestamp(entry.timestamp_ms) + ")##" + entry.id;
      if (ImGui::Selectable(label.c_str(), entry.id == ui_state.project_id)) {
        picked = entry;
      }
    }
    if (picked.has_value()) {
      LoadDocument(editor, ui_state, picked->document, picked->id);
    }
  }

  if (ImGui::CollapsingHeader("File")) {
    ImGui::InputText("Path", ui_state.file_path_buf.data(), ui_state.file_path_buf.size());
    if (ImGui::Button("Export")) {
      const auto result = proflex::io::SaveProjectFile(ui_state.file_path_buf.data(), editor.design(),
                                                       ui_state.project_name);
      if (!result.ok) {
        HandleResultError(ui_state, result.error, "Export failed");
      } else {
        ui_state.last_error.clear();
        PushLog(ui_state, std::string("Exported ") + ui_state.file_path_buf.data());
      }
    }
    ImGui::SameLine();
    if (ImGui::Button("Import")) {
      auto loaded = proflex::io::LoadProjectFile(ui_state.file_path_buf.data());
      if (!loaded.ok) {
        HandleResultError(ui_state, loaded.error, "Invalid .proflex file");
      } else {
        LoadDocument(editor, ui_state, std::move(loaded.value), {});
      }
    }
  }
}

void DrawPartsContent(const Editor& editor) {
  const auto summary = editor.design().SummarizeParts();
  if (ImGui::CollapsingHeader("Components", ImGuiTreeNodeFlags_DefaultOpen)) {
    for (const auto& [type, count] : summary.component_counts) {
      ImGui::BulletText("%s x%d", NodeTypeLabel(type), static_cast<int>(count));
    }
  }
  if (ImGui::CollapsingHeader("Pipe", ImGuiTreeNodeFlags_DefaultOpen)) {
    for (const auto& [size, length_ft] : summary.pipe_length_ft_by_size) {
      ImGui::BulletText("%s  %.1f ft", proflex::core::spec_of(size).label, length_ft);
    }
  }
  ImGui::Separator();
  ImGui::Text("Segments: %d  Failing: %d", static_cast<int>(summary.segment_count),
              static_cast<int>(summary.failing_segment_count));
  ImGui::Text("Total demand: %.0f BTU/h", summary.total_appliance_demand);
}

void DrawDiagnosticsContent(const Editor& editor, const ViewerUiState& ui_state) {
  const auto& settings = editor.design().settings();
  ImGui::Text("Design pressure drop: %.2f", settings.design_pressure_drop);
  ImGui::Text("Revision: %llu", static_cast<unsigned long long>(editor.design().revision()));

  if (ImGui::CollapsingHeader("Validation", ImGuiTreeNodeFlags_DefaultOpen)) {
    const auto validation = editor.design().Validate();
    if (validation.issues.empty()) {
      ImGui::TextUnformatted("No issues");
    }
    for (const auto& issue : validation.issues) {
      const bool is_error = issue.severity == proflex::core::ValidationSeverity::kError;
      const ImVec4 color = is_error ? ImVec4(0.94f, 0.27f, 0.27f, 1.0f) : ImVec4(0.96f, 0.62f, 0.04f, 1.0f);
      ImGui::TextColored(color, "%s #%llu", issue.code.c_str(), static_cast<unsigned long long>(issue.object_id));
      if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("%s", issue.message.c_str());
      }
    }
  }

  if (ImGui::CollapsingHeader("Log", ImGuiTreeNodeFlags_DefaultOpen)) {
    if (!ui_state.last_error.empty()) {
      ImGui::TextColored(ImVec4(0.94f, 0.27f, 0.27f, 1.0f), "Error: %s", ui_state.last_error.c_str());
    }
    for (const std::string& line : ui_state.logs) {
      ImGui::TextUnformatted(line.c_str());
    }
  }
}

void DrawWorkspaceWindow(Editor& editor, proflex::io::ProjectLibrary& library, ViewerUiState& ui_state) {
  const float screen_w = static_cast<float>(GetScreenWidth());
  const float screen_h = static_cast<float>(GetScreenHeight());
  const float min_w = 300.0f;
  const float max_w = std::max(min_w, std::min(760.0f, screen_w - kMargin * 2.0f));
  ui_state.ui_workspace_width = std::clamp(ui_state.ui_workspace_width, min_w, max_w);
  const float x = std::max(kMargin, screen_w - ui_state.ui_workspace_width - kMargin);
  const float y = kTopbarHeight + kMargin * 2.0f;
  const float h = std::max(240.0f, screen_h - y - kMargin);

  ImGui::SetNextWindowPos(ImVec2(x, y), ImGuiCond_Always);
  ImGui::SetNextWindowSize(ImVec2(ui_state.ui_workspace_width, h), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSizeConstraints(ImVec2(min_w, 240.0f), ImVec2(max_w, h));
  const ImGuiWindowFlags flags = ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoMove;
  if (!ImGui::Begin("Workspace", nullptr, flags)) {
    ImGui::End();
    return;
  }
  ui_state.ui_workspace_width = ImGui::GetWindowSize().x;
  if (ImGui::BeginTabBar("WorkspaceTabs")) {
    if (ImGui::BeginTabItem("Toolbox")) {
      DrawToolboxContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Inspector")) {
      DrawInspectorContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Project")) {
      DrawProjectContent(editor, library, ui_state);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Parts")) {
      DrawPartsContent(editor);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Diagnostics")) {
      DrawDiagnosticsContent(editor, ui_state);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }
  ImGui::End();
}

void DrawEditPopup(Editor& editor, ViewerUiState& ui_state) {
  if (ui_state.open_edit_popup) {
    ImGui::OpenPopup("Edit Component");
    ui_state.open_edit_popup = false;
  }
  ImGui::SetNextWindowSize(ImVec2(360.0f, 0.0f), ImGuiCond_Appearing);
  if (!ImGui::BeginPopupModal("Edit Component", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
    return;
  }
  SyncInspector(editor, ui_state);
  if (const auto* node = editor.design().nodes().find(editor.selected_id()); node != nullptr) {
    DrawNodeEditor(editor, ui_state, *node);
  } else if (const auto* edge = editor.design().edges().find(editor.selected_id()); edge != nullptr) {
    DrawEdgeEditor(editor, ui_state, *edge);
  } else {
    ImGui::TextUnformatted("Selection is gone");
  }
  ImGui::Separator();
  if (ImGui::Button("Close")) {
    ImGui::CloseCurrentPopup();
  }
  ImGui::EndPopup();
}

void DrawAuditWindow(ViewerUiState& ui_state) {
  if (!ui_state.show_audit_window) {
    return;
  }
  const float w = static_cast<float>(GetScreenWidth());
  const float h = static_cast<float>(GetScreenHeight());
  ImGui::SetNextWindowPos(ImVec2(w * 0.5f, h * 0.5f), ImGuiCond_FirstUseEver, ImVec2(0.5f, 0.5f));
  ImGui::SetNextWindowSize(ImVec2(560.0f, 460.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("System Audit Results", &ui_state.show_audit_window, ImGuiWindowFlags_NoCollapse)) {
    ImGui::End();
    return;
  }
  if (ui_state.audit_running) {
    ImGui::TextUnformatted("Waiting for the audit service...");
  }
  for (const proflex::io::AuditSection& section : ui_state.audit_sections) {
    ImGui::TextColored(ImVec4(0.39f, 0.40f, 0.95f, 1.0f), "%s", section.title.c_str());
    ImGui::Separator();
    for (const std::string& bullet : section.bullets) {
      ImGui::Bullet();
      ImGui::TextWrapped("%s", bullet.c_str());
    }
    ImGui::Spacing();
  }
  ImGui::End();
}

}  // namespace

int main() {
  proflex::io::AppSettings settings = proflex::io::LoadAppSettings(proflex::io::kAppSettingsFile);
  SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT | FLAG_VSYNC_HINT);
  InitWindow(settings.window_width, settings.window_height, "proflex");
  SetExitKey(KEY_NULL);
  SetTargetFPS(60);

  Editor editor(proflex::core::make_demo_state());
  ViewerUiState ui_state;
  {
    const auto applied = editor.UpdateDesignSettings(proflex::io::ToDesignSettings(settings));
    if (!applied.ok) {
      HandleResultError(ui_state, applied.error, "[config] design settings rejected");
    }
    editor.interaction_settings() = proflex::io::ToInteractionSettings(settings);
  }
  CopyToBuffer(ui_state.project_name_buf, ui_state.project_name);
  CopyToBuffer(ui_state.file_path_buf, std::string("design") + std::string(proflex::io::kProjectFileExtension));

  proflex::io::ProjectLibrary library(settings.library_path);
  {
    const auto loaded = library.Load();
    if (!loaded.ok) {
      HandleResultError(ui_state, loaded.error, "[library] recent designs unreadable");
    } else {
      PushLog(ui_state, "[library] recent designs=" + std::to_string(loaded.value));
    }
  }
  PushLog(ui_state, "[info] viewer started");
  PushLog(ui_state, "[info] demo design loaded");
  PushLog(ui_state, "[hint] Pipe tool: tap source, then target");
  PushLog(ui_state, "[hint] Double tap a component to edit");

  rlImGuiSetup(true);
  ImGui::StyleColorsDark();
  {
    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 3.0f;
    style.FrameRounding = 2.0f;
    style.GrabRounding = 2.0f;
    style.WindowBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
  }
  while (!WindowShouldClose()) {
    BeginDrawing();
    ClearBackground(Color{26, 32, 39, 255});

    rlImGuiBegin();
    const CanvasView view = ComputeCanvasView(ui_state);
    UpdateCanvasInput(editor, ui_state, view);
    PollAudit(ui_state);

    DrawCanvas(editor, view);

    DrawTopbarWindow(editor, settings, ui_state);
    DrawWorkspaceWindow(editor, library, ui_state);
    DrawEditPopup(editor, ui_state);
    DrawAuditWindow(ui_state);
    rlImGuiEnd();

    EndDrawing();
  }

  rlImGuiShutdown();
  if (ui_state.audit_running) {
    std::fprintf(stderr, "[audit] exiting with an audit still running; its result is discarded\n");
  }
  {
    settings.window_width = GetScreenWidth();
    settings.window_height = GetScreenHeight();
    settings.design_pressure_drop = editor.design().settings().design_pressure_drop;
    settings.default_pipe_size = editor.interaction_settings().pipe_size;
    if (!proflex::io::SaveAppSettings(proflex::io::kAppSettingsFile, settings)) {
      std::fprintf(stderr, "[config] cannot write %s\n", std::string(proflex::io::kAppSettingsFile).c_str());
    }
  }
  CloseWindow();
  return 0;
}

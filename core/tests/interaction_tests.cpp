#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <vector>

#include "proflex/core/editor.hpp"
#include "proflex/core/interaction.hpp"

namespace {

using proflex::core::Editor;
using proflex::core::EditorStepResult;
using proflex::core::InputDevice;
using proflex::core::IntentKind;
using proflex::core::InteractionSettings;
using proflex::core::InteractionState;
using proflex::core::NodeType;
using proflex::core::ObjectId;
using proflex::core::PipeSize;
using proflex::core::PointerTarget;
using proflex::core::TargetKind;
using proflex::core::ToolMode;
using proflex::core::Vec2d;
using proflex::core::kInvalidObjectId;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

PointerTarget node_target(ObjectId id) {
  return {TargetKind::kNode, id};
}

PointerTarget edge_target(ObjectId id) {
  return {TargetKind::kEdge, id};
}

PointerTarget background() {
  return {};
}

// Press and release in place.
EditorStepResult tap(Editor& editor, PointerTarget target, std::int64_t timestamp_ms,
                     InputDevice device = InputDevice::kMouse, Vec2d at = {200.0, 200.0}) {
  (void)editor.HandleEvent(proflex::core::MakePointerDown(at, target, device, timestamp_ms));
  return editor.HandleEvent(proflex::core::MakePointerUp(at, target, target, device, timestamp_ms + 40));
}

struct TwoNodeFixture {
  Editor editor;
  ObjectId a = kInvalidObjectId;
  ObjectId b = kInvalidObjectId;
};

TwoNodeFixture make_two_nodes() {
  TwoNodeFixture fixture;
  fixture.a = fixture.editor.design().AddNode(NodeType::kMeter, {100.0, 100.0}).value;
  fixture.b = fixture.editor.design().AddNode(NodeType::kAppliance, {300.0, 100.0}, "Heater", 40000.0).value;
  return fixture;
}

// Intent: two taps on different nodes in pipe mode create exactly one edge.
bool test_pipe_two_taps_create_edge() {
  TwoNodeFixture f = make_two_nodes();
  f.editor.SetDefaultPipeSize(PipeSize::kThreeQuarters);
  (void)f.editor.SetToolMode(ToolMode::kPipe);

  const EditorStepResult first = tap(f.editor, node_target(f.a), 0);
  const bool locked = f.editor.interaction().pipe_source_id == f.a && f.editor.design().edges().empty() &&
                      first.count(IntentKind::kClearSelection) == 1;
  const EditorStepResult second = tap(f.editor, node_target(f.b), 1000);

  if (!locked || second.count(IntentKind::kAddEdge) != 1 || second.has_errors() ||
      f.editor.design().edges().size() != 1) {
    return false;
  }
  const auto& edge = f.editor.design().edges().items().front();
  return edge.from_node_id == f.a && edge.to_node_id == f.b && edge.size == PipeSize::kThreeQuarters &&
         f.editor.interaction().pipe_source_id == kInvalidObjectId &&
         f.editor.design().find_verdict(edge.id) != nullptr;
}

// Intent: tapping the locked node again cancels the lock without an edge.
bool test_pipe_same_node_cancels() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0);
  (void)tap(f.editor, node_target(f.a), 2000);
  return f.editor.design().edges().empty() && f.editor.interaction().pipe_source_id == kInvalidObjectId;
}

// Intent: a background tap clears the lock and the selection.
bool test_pipe_background_clears_lock() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0);
  const EditorStepResult cleared = tap(f.editor, background(), 600);
  (void)tap(f.editor, node_target(f.b), 1200);
  return cleared.count(IntentKind::kClearSelection) == 1 && f.editor.design().edges().empty() &&
         f.editor.interaction().pipe_source_id == f.b;
}

// Intent: releasing over an edge in pipe mode keeps the lock.
bool test_pipe_edge_release_is_ignored() {
  TwoNodeFixture f = make_two_nodes();
  const ObjectId edge = f.editor.design().AddEdge(f.a, f.b).value;
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.b), 0);
  const EditorStepResult on_edge = tap(f.editor, edge_target(edge), 600);
  return on_edge.applied.empty() && f.editor.interaction().pipe_source_id == f.b;
}

// Intent: a refused connection reports its error and still releases the lock.
bool test_pipe_rejected_connection_unlocks() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.design().AddEdge(f.a, f.b);
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.b), 0);
  const EditorStepResult result = tap(f.editor, node_target(f.a), 600);
  return result.has_errors() && f.editor.design().edges().size() == 1 &&
         f.editor.interaction().pipe_source_id == kInvalidObjectId;
}

// Intent: the pipe guide follows the pointer while a source is locked.
bool test_pipe_guide_follows_pointer() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  const bool none_before = !proflex::core::CurrentPipeGuide(f.editor.interaction()).has_value();
  (void)tap(f.editor, node_target(f.a), 0);
  (void)f.editor.HandleEvent(proflex::core::MakePointerMove({640.0, 410.0}, InputDevice::kMouse));
  const auto guide = proflex::core::CurrentPipeGuide(f.editor.interaction());
  return none_before && guide.has_value() && guide->source_node_id == f.a && guide->end == Vec2d{640.0, 410.0};
}

// Intent: switching back to select mode drops the pipe lock.
bool test_mode_switch_clears_lock() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0);
  (void)f.editor.SetToolMode(ToolMode::kSelect);
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.b), 600);
  return f.editor.design().edges().empty() && f.editor.interaction().pipe_source_id == f.b;
}

// Intent: two taps on one node inside the window request an edit once.
bool test_double_tap_requests_edit() {
  TwoNodeFixture f = make_two_nodes();
  const EditorStepResult first = tap(f.editor, node_target(f.b), 1000);
  const EditorStepResult second = tap(f.editor, node_target(f.b), 1300);
  return first.count(IntentKind::kSelect) == 1 && first.count(IntentKind::kRequestEdit) == 0 &&
         second.count(IntentKind::kRequestEdit) == 1 && second.count(IntentKind::kSelect) == 0 &&
         f.editor.edit_request_id() == f.b && f.editor.selected_id() == f.b;
}

// Intent: taps at or beyond the window are separate selections.
bool test_slow_taps_only_select() {
  TwoNodeFixture f = make_two_nodes();
  const EditorStepResult first = tap(f.editor, node_target(f.a), 0);
  const EditorStepResult second = tap(f.editor, node_target(f.a), 500);
  const EditorStepResult third = tap(f.editor, node_target(f.a), 1700);
  return first.count(IntentKind::kSelect) == 1 && second.count(IntentKind::kSelect) == 1 &&
         third.count(IntentKind::kSelect) == 1 && f.editor.edit_request_id() == kInvalidObjectId;
}

// Intent: a third quick tap starts a new count instead of editing again.
bool test_triple_tap_edits_once() {
  TwoNodeFixture f = make_two_nodes();
  std::size_t edits = 0;
  std::size_t selects = 0;
  for (std::int64_t t : {0, 200, 400}) {
    const EditorStepResult step = tap(f.editor, node_target(f.a), t);
    edits += step.count(IntentKind::kRequestEdit);
    selects += step.count(IntentKind::kSelect);
  }
  return edits == 1 && selects == 2;
}

// Intent: alternating targets never counts as a double tap.
bool test_taps_on_different_nodes_select() {
  TwoNodeFixture f = make_two_nodes();
  (void)tap(f.editor, node_target(f.a), 0);
  const EditorStepResult other = tap(f.editor, node_target(f.b), 100);
  return other.count(IntentKind::kSelect) == 1 && f.editor.selected_id() == f.b &&
         f.editor.edit_request_id() == kInvalidObjectId;
}

// Intent: background tap in select mode clears the selection.
bool test_background_tap_clears_selection() {
  TwoNodeFixture f = make_two_nodes();
  (void)tap(f.editor, node_target(f.a), 0);
  const bool selected = f.editor.selected_id() == f.a;
  (void)tap(f.editor, background(), 800);
  return selected && f.editor.selected_id() == kInvalidObjectId &&
         f.editor.selected_kind() == TargetKind::kBackground;
}

// Intent: a press on empty canvas that drifts past the threshold still clears the selection.
bool test_background_swipe_clears_selection() {
  TwoNodeFixture f = make_two_nodes();
  (void)tap(f.editor, node_target(f.a), 0);
  const bool selected = f.editor.selected_id() == f.a;
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({600.0, 600.0}, background(), InputDevice::kMouse, 800));
  (void)f.editor.HandleEvent(proflex::core::MakePointerMove({620.0, 600.0}, InputDevice::kMouse));
  const EditorStepResult released = f.editor.HandleEvent(
      proflex::core::MakePointerUp({620.0, 600.0}, background(), background(), InputDevice::kMouse, 900));
  return selected && released.count(IntentKind::kClearSelection) == 1 &&
         f.editor.selected_id() == kInvalidObjectId;
}

// Intent: a background swipe in pipe mode drops the locked source and its guide.
bool test_pipe_background_swipe_clears_lock() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0);
  const bool locked = f.editor.interaction().pipe_source_id == f.a;
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({600.0, 600.0}, background(), InputDevice::kTouch, 800));
  (void)f.editor.HandleEvent(proflex::core::MakePointerMove({660.0, 640.0}, InputDevice::kTouch));
  (void)f.editor.HandleEvent(
      proflex::core::MakePointerUp({660.0, 640.0}, background(), background(), InputDevice::kTouch, 1000));
  return locked && f.editor.interaction().pipe_source_id == kInvalidObjectId &&
         !proflex::core::CurrentPipeGuide(f.editor.interaction()).has_value() &&
         f.editor.design().edges().empty();
}

// Intent: tapping an edge selects it.
bool test_edge_tap_selects_edge() {
  TwoNodeFixture f = make_two_nodes();
  const ObjectId edge = f.editor.design().AddEdge(f.a, f.b).value;
  (void)tap(f.editor, edge_target(edge), 0);
  return f.editor.selected_id() == edge && f.editor.selected_kind() == TargetKind::kEdge;
}

// Intent: mouse drags start moving the node only past 8 units.
bool test_mouse_drag_threshold() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({100.0, 100.0}, node_target(f.a), InputDevice::kMouse, 0));
  const EditorStepResult small = f.editor.HandleEvent(proflex::core::MakePointerMove({107.0, 105.0}, InputDevice::kMouse));
  const bool unmoved = small.count(IntentKind::kMoveNode) == 0 &&
                       f.editor.design().nodes().find(f.a)->position == Vec2d{100.0, 100.0};
  const EditorStepResult large = f.editor.HandleEvent(proflex::core::MakePointerMove({109.0, 100.0}, InputDevice::kMouse));
  const bool moved = large.count(IntentKind::kMoveNode) == 1 &&
                     f.editor.design().nodes().find(f.a)->position == Vec2d{109.0, 100.0};
  const EditorStepResult back = f.editor.HandleEvent(proflex::core::MakePointerMove({104.0, 100.0}, InputDevice::kMouse));
  const EditorStepResult release = f.editor.HandleEvent(
      proflex::core::MakePointerUp({104.0, 100.0}, node_target(f.a), node_target(f.a), InputDevice::kMouse, 300));
  return unmoved && moved && back.count(IntentKind::kMoveNode) == 1 && release.applied.empty() &&
         f.editor.selected_id() == kInvalidObjectId;
}

// Intent: touch drags use the wider 30 unit threshold.
bool test_touch_drag_threshold() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({100.0, 100.0}, node_target(f.a), InputDevice::kTouch, 0));
  const EditorStepResult jitter = f.editor.HandleEvent(proflex::core::MakePointerMove({125.0, 120.0}, InputDevice::kTouch));
  const EditorStepResult drag = f.editor.HandleEvent(proflex::core::MakePointerMove({100.0, 131.0}, InputDevice::kTouch));
  return jitter.count(IntentKind::kMoveNode) == 0 && drag.count(IntentKind::kMoveNode) == 1 &&
         f.editor.design().nodes().find(f.a)->position == Vec2d{100.0, 131.0};
}

// Intent: small jitter below the threshold still counts as a tap.
bool test_jitter_still_taps() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({100.0, 100.0}, node_target(f.a), InputDevice::kTouch, 0));
  (void)f.editor.HandleEvent(proflex::core::MakePointerMove({120.0, 90.0}, InputDevice::kTouch));
  const EditorStepResult release = f.editor.HandleEvent(
      proflex::core::MakePointerUp({120.0, 90.0}, node_target(f.a), node_target(f.a), InputDevice::kTouch, 100));
  return release.count(IntentKind::kSelect) == 1 && f.editor.selected_id() == f.a &&
         f.editor.design().nodes().find(f.a)->position == Vec2d{100.0, 100.0};
}

// Intent: touch drags in pipe mode connect to the node under the finger at release.
bool test_touch_release_target_reresolved() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0, InputDevice::kTouch, {100.0, 100.0});
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({100.0, 100.0}, node_target(f.a), InputDevice::kTouch, 800));
  (void)f.editor.HandleEvent(proflex::core::MakePointerMove({300.0, 100.0}, InputDevice::kTouch));
  const EditorStepResult release = f.editor.HandleEvent(
      proflex::core::MakePointerUp({300.0, 100.0}, node_target(f.a), node_target(f.b), InputDevice::kTouch, 1200));
  if (release.count(IntentKind::kAddEdge) != 1 || f.editor.design().edges().size() != 1) {
    return false;
  }
  const auto& edge = f.editor.design().edges().items().front();
  return edge.from_node_id == f.a && edge.to_node_id == f.b &&
         f.editor.design().nodes().find(f.a)->position == Vec2d{100.0, 100.0};
}

// Intent: mouse releases trust the reported target, so a drag back onto the source does nothing.
bool test_mouse_release_target_not_reresolved() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0);
  (void)f.editor.HandleEvent(proflex::core::MakePointerDown({100.0, 100.0}, node_target(f.a), InputDevice::kMouse, 800));
  (void)f.editor.HandleEvent(proflex::core::MakePointerMove({300.0, 100.0}, InputDevice::kMouse));
  const EditorStepResult release = f.editor.HandleEvent(
      proflex::core::MakePointerUp({300.0, 100.0}, node_target(f.a), node_target(f.b), InputDevice::kMouse, 1200));
  return release.applied.empty() && f.editor.design().edges().empty() &&
         f.editor.interaction().pipe_source_id == f.a;
}

// Intent: the delete affordance removes the node and its edges without affecting tap counting.
bool test_delete_affordance() {
  TwoNodeFixture f = make_two_nodes();
  const ObjectId c = f.editor.design().AddNode(NodeType::kJunction).value;
  (void)f.editor.design().AddEdge(f.a, c);
  (void)f.editor.design().AddEdge(c, f.b);
  (void)tap(f.editor, node_target(c), 0);
  const EditorStepResult deleted = f.editor.HandleEvent(proflex::core::MakeDeleteAffordanceTap(c));
  const EditorStepResult after = tap(f.editor, node_target(f.b), 100);
  return deleted.count(IntentKind::kDeleteNode) == 1 && !deleted.has_errors() &&
         !f.editor.design().nodes().contains(c) && f.editor.design().edges().empty() &&
         f.editor.design().verdicts().empty() && after.count(IntentKind::kSelect) == 1;
}

// Intent: the delete button does nothing outside select mode.
bool test_delete_affordance_ignored_in_pipe_mode() {
  TwoNodeFixture f = make_two_nodes();
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.a), 0);
  const EditorStepResult ignored = f.editor.HandleEvent(proflex::core::MakeDeleteAffordanceTap(f.a));
  return ignored.applied.empty() && f.editor.design().nodes().contains(f.a) &&
         f.editor.interaction().pipe_source_id == f.a;
}

// Intent: a release without a preceding press is ignored.
bool test_orphan_release_ignored() {
  const InteractionState state{};
  const auto step = proflex::core::Reduce(
      state,
      proflex::core::MakePointerUp({10.0, 10.0}, node_target(4), node_target(4), InputDevice::kMouse, 10),
      InteractionSettings{});
  return step.intents.empty() && step.state.last_tapped_id == kInvalidObjectId;
}

// Intent: the reducer is pure; the input state is not changed.
bool test_reduce_is_pure() {
  InteractionState state{};
  state.mode = ToolMode::kPipe;
  const auto down = proflex::core::Reduce(
      state, proflex::core::MakePointerDown({1.0, 1.0}, node_target(9), InputDevice::kMouse, 0), InteractionSettings{});
  const auto up = proflex::core::Reduce(
      down.state, proflex::core::MakePointerUp({1.0, 1.0}, node_target(9), node_target(9), InputDevice::kMouse, 5),
      InteractionSettings{});
  return !state.pointer_down && state.pipe_source_id == kInvalidObjectId && down.state.pointer_down &&
         up.state.pipe_source_id == 9 && !up.state.pointer_down;
}

// Intent: toolbar add places the component at the canvas centre and selects it.
bool test_add_component_selects() {
  Editor editor;
  const auto added = editor.AddComponent(NodeType::kAppliance, "Furnace", 100000.0);
  const auto* node = editor.design().nodes().find(added.value);
  return added.ok && node != nullptr && node->position == proflex::core::kDefaultNodePosition &&
         node->name == "Furnace" && editor.selected_id() == added.value;
}

// Intent: DeleteSelected removes a selected edge, or reports when nothing is selected.
bool test_delete_selected() {
  TwoNodeFixture f = make_two_nodes();
  const bool nothing = !f.editor.DeleteSelected().ok;
  const ObjectId edge = f.editor.design().AddEdge(f.a, f.b).value;
  (void)tap(f.editor, edge_target(edge), 0);
  const auto deleted = f.editor.DeleteSelected();
  return nothing && deleted.ok && f.editor.design().edges().empty() && f.editor.design().nodes().size() == 2 &&
         f.editor.selected_id() == kInvalidObjectId;
}

// Intent: loading a design clears selection, edit request and lock.
bool test_replace_design_resets_session() {
  TwoNodeFixture f = make_two_nodes();
  (void)tap(f.editor, node_target(f.a), 0);
  (void)tap(f.editor, node_target(f.a), 100);
  (void)f.editor.SetToolMode(ToolMode::kPipe);
  (void)tap(f.editor, node_target(f.b), 700);

  proflex::core::Node meter{};
  meter.id = 1;
  meter.type = NodeType::kMeter;
  const auto replaced = f.editor.ReplaceDesign({meter}, {});
  return replaced.ok && f.editor.selected_id() == kInvalidObjectId &&
         f.editor.edit_request_id() == kInvalidObjectId &&
         f.editor.interaction().pipe_source_id == kInvalidObjectId && f.editor.design().nodes().size() == 1;
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Pipe_TwoTapsCreateEdge", "Second tap completes one edge", test_pipe_two_taps_create_edge},
      {"Pipe_SameNodeCancels", "Tapping locked node unlocks", test_pipe_same_node_cancels},
      {"Pipe_BackgroundClearsLock", "Background tap clears lock", test_pipe_background_clears_lock},
      {"Pipe_EdgeReleaseIgnored", "Edge release keeps lock", test_pipe_edge_release_is_ignored},
      {"Pipe_RejectedConnectionUnlocks", "Refused edge still unlocks", test_pipe_rejected_connection_unlocks},
      {"Pipe_GuideFollowsPointer", "Guide ends at pointer", test_pipe_guide_follows_pointer},
      {"Mode_SwitchClearsLock", "Select mode drops lock", test_mode_switch_clears_lock},
      {"Tap_DoubleRequestsEdit", "Double tap requests edit", test_double_tap_requests_edit},
      {"Tap_SlowTapsSelect", "Taps >= 500ms apart select", test_slow_taps_only_select},
      {"Tap_TripleEditsOnce", "Triple tap edits once", test_triple_tap_edits_once},
      {"Tap_DifferentNodes", "Different targets do not double tap", test_taps_on_different_nodes_select},
      {"Tap_BackgroundClearsSelection", "Background clears selection", test_background_tap_clears_selection},
      {"Swipe_BackgroundClearsSelection", "Background swipe clears selection", test_background_swipe_clears_selection},
      {"Swipe_BackgroundClearsLock", "Background swipe clears pipe lock", test_pipe_background_swipe_clears_lock},
      {"Tap_EdgeSelects", "Edge tap selects edge", test_edge_tap_selects_edge},
      {"Drag_MouseThreshold", "Mouse threshold is 8", test_mouse_drag_threshold},
      {"Drag_TouchThreshold", "Touch threshold is 30", test_touch_drag_threshold},
      {"Drag_JitterStillTaps", "Sub-threshold move is a tap", test_jitter_still_taps},
      {"Touch_ReleaseReresolved", "Touch uses node under finger", test_touch_release_target_reresolved},
      {"Mouse_ReleaseNotReresolved", "Mouse keeps reported target", test_mouse_release_target_not_reresolved},
      {"Delete_Affordance", "Affordance deletes node and edges", test_delete_affordance},
      {"Delete_AffordanceSelectOnly", "Pipe mode ignores delete button", test_delete_affordance_ignored_in_pipe_mode},
      {"Reduce_OrphanReleaseIgnored", "Up without down is ignored", test_orphan_release_ignored},
      {"Reduce_Pure", "Reduce leaves input state untouched", test_reduce_is_pure},
      {"Editor_AddComponentSelects", "Added component is selected", test_add_component_selects},
      {"Editor_DeleteSelected", "DeleteSelected handles edges", test_delete_selected},
      {"Editor_ReplaceDesignResets", "Load clears session state", test_replace_design_resets_session},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "interaction tests failed\n";
    return 1;
  }

  std::cout << "interaction tests passed (" << tests.size() << " cases)\n";
  return 0;
}

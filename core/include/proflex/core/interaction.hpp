#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "proflex/core/design_state.hpp"
#include "proflex/core/entities.hpp"
#include "proflex/core/id.hpp"
#include "proflex/core/types.hpp"

namespace proflex::core {

enum class ToolMode : std::uint8_t {
  kSelect = 0,
  kPipe = 1,
};

enum class InputDevice : std::uint8_t {
  kMouse = 0,
  kTouch = 1,
};

enum class TargetKind : std::uint8_t {
  kBackground = 0,
  kNode = 1,
  kEdge = 2,
};

struct PointerTarget {
  TargetKind kind = TargetKind::kBackground;
  ObjectId id = kInvalidObjectId;

  bool operator==(const PointerTarget&) const = default;
};

enum class PointerEventKind : std::uint8_t {
  kDown = 0,
  kMove = 1,
  kUp = 2,
  kDeleteAffordance = 3,
  kSetMode = 4,
};

// One raw input sample, already hit-tested by the surface that produced it.
struct PointerEvent {
  PointerEventKind kind = PointerEventKind::kMove;
  Vec2d position{};
  // Element that received the event. For touch this stays the element under the finger at
  // touch start for the whole gesture.
  PointerTarget target{};
  // kUp only: element actually under the release point.
  PointerTarget release_target{};
  InputDevice device = InputDevice::kMouse;
  std::int64_t timestamp_ms = 0;
  ToolMode mode = ToolMode::kSelect;  // kSetMode only.
};

PointerEvent MakePointerDown(const Vec2d& position, PointerTarget target, InputDevice device, std::int64_t timestamp_ms);
PointerEvent MakePointerMove(const Vec2d& position, InputDevice device);
PointerEvent MakePointerUp(
    const Vec2d& position,
    PointerTarget target,
    PointerTarget release_target,
    InputDevice device,
    std::int64_t timestamp_ms);
PointerEvent MakeDeleteAffordanceTap(ObjectId node_id);
PointerEvent MakeModeSwitch(ToolMode mode);

struct InteractionSettings {
  PipeSize pipe_size = PipeSize::kHalf;
  double edge_length_ft = kDefaultEdgeLengthFt;
  double mouse_drag_threshold = 8.0;
  double touch_drag_threshold = 30.0;
  std::int64_t double_tap_window_ms = 500;
};

struct InteractionState {
  ToolMode mode = ToolMode::kSelect;
  ObjectId dragging_node_id = kInvalidObjectId;
  ObjectId pipe_source_id = kInvalidObjectId;
  Vec2d pointer_position{};
  Vec2d drag_start_position{};
  bool has_moved_past_threshold = false;
  bool pointer_down = false;
  PointerTarget pressed_target{};
  InputDevice device = InputDevice::kMouse;
  ObjectId last_tapped_id = kInvalidObjectId;
  std::int64_t last_tap_timestamp_ms = 0;
  int tap_count = 0;
};

enum class IntentKind : std::uint8_t {
  kSelect = 0,
  kClearSelection = 1,
  kRequestEdit = 2,
  kMoveNode = 3,
  kAddEdge = 4,
  kDeleteNode = 5,
};

struct Intent {
  IntentKind kind = IntentKind::kClearSelection;
  PointerTarget target{};                      // kSelect, kRequestEdit, kMoveNode, kDeleteNode, kAddEdge (to).
  ObjectId source_node_id = kInvalidObjectId;  // kAddEdge.
  Vec2d position{};                            // kMoveNode.
  PipeSize size = PipeSize::kHalf;             // kAddEdge.
  double length_ft = kDefaultEdgeLengthFt;     // kAddEdge.
};

struct InteractionStep {
  InteractionState state{};
  std::vector<Intent> intents{};
};

// Pure transition: the returned state replaces `state`; intents are applied by the caller in order.
[[nodiscard]] InteractionStep Reduce(
    const InteractionState& state,
    const PointerEvent& event,
    const InteractionSettings& settings);

struct PipeGuide {
  ObjectId source_node_id = kInvalidObjectId;
  Vec2d end{};
};

// Transient line from the locked pipe source to the pointer. Never part of the design.
[[nodiscard]] std::optional<PipeGuide> CurrentPipeGuide(const InteractionState& state);

[[nodiscard]] double DragThreshold(InputDevice device, const InteractionSettings& settings);

}  // namespace proflex::core

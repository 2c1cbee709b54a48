#include "proflex/core/interaction.hpp"

namespace proflex::core {

namespace {

Intent make_target_intent(IntentKind kind, PointerTarget target) {
  Intent intent;
  intent.kind = kind;
  intent.target = target;
  return intent;
}

Intent make_clear_selection() {
  Intent intent;
  intent.kind = IntentKind::kClearSelection;
  return intent;
}

void end_gesture(InteractionState& state) {
  state.pointer_down = false;
  state.dragging_node_id = kInvalidObjectId;
  state.has_moved_past_threshold = false;
  state.pressed_target = {};
}

void handle_mode_switch(InteractionStep& step, const PointerEvent& event) {
  InteractionState& state = step.state;
  state.mode = event.mode;
  state.dragging_node_id = kInvalidObjectId;
  if (state.mode == ToolMode::kSelect) {
    state.pipe_source_id = kInvalidObjectId;
  }
}

void handle_delete_affordance(InteractionStep& step, const PointerEvent& event) {
  InteractionState& state = step.state;
  // The delete button only exists on the selected node in select mode.
  if (state.mode != ToolMode::kSelect) {
    return;
  }
  if (event.target.kind != TargetKind::kNode || event.target.id == kInvalidObjectId) {
    return;
  }
  if (state.dragging_node_id == event.target.id) {
    end_gesture(state);
  }
  step.intents.push_back(make_target_intent(IntentKind::kDeleteNode, event.target));
}

void handle_down(InteractionStep& step, const PointerEvent& event) {
  InteractionState& state = step.state;
  state.pointer_down = true;
  state.device = event.device;
  state.pressed_target = event.target;
  state.pointer_position = event.position;
  state.drag_start_position = event.position;
  state.has_moved_past_threshold = false;
  state.dragging_node_id = kInvalidObjectId;
  if (state.mode == ToolMode::kSelect && event.target.kind == TargetKind::kNode) {
    state.dragging_node_id = event.target.id;
  }
}

void handle_move(InteractionStep& step, const PointerEvent& event, const InteractionSettings& settings) {
  InteractionState& state = step.state;
  state.pointer_position = event.position;
  if (!state.pointer_down) {
    return;
  }
  if (!state.has_moved_past_threshold &&
      chebyshev_distance(event.position, state.drag_start_position) > DragThreshold(state.device, settings)) {
    state.has_moved_past_threshold = true;
  }
  if (state.has_moved_past_threshold && state.dragging_node_id != kInvalidObjectId) {
    Intent intent = make_target_intent(IntentKind::kMoveNode, {TargetKind::kNode, state.dragging_node_id});
    intent.position = event.position;
    step.intents.push_back(intent);
  }
}

void handle_pipe_release(InteractionStep& step, const PointerEvent& event, const InteractionSettings& settings,
                         bool moved) {
  InteractionState& state = step.state;
  PointerTarget target = event.target;
  // Touch keeps reporting the element the finger started on; after a real drag the node under the
  // release point is the intended one.
  if (state.device == InputDevice::kTouch && moved && event.release_target.kind == TargetKind::kNode) {
    target = event.release_target;
  }

  if (target.kind == TargetKind::kBackground) {
    if (!moved) {
      state.pipe_source_id = kInvalidObjectId;
      step.intents.push_back(make_clear_selection());
    }
    return;
  }
  if (target.kind != TargetKind::kNode || target.id == kInvalidObjectId) {
    return;
  }

  if (state.pipe_source_id == kInvalidObjectId) {
    state.pipe_source_id = target.id;
    step.intents.push_back(make_clear_selection());
    return;
  }
  if (state.pipe_source_id == target.id) {
    if (!moved) {
      state.pipe_source_id = kInvalidObjectId;
    }
    return;
  }

  Intent intent = make_target_intent(IntentKind::kAddEdge, target);
  intent.source_node_id = state.pipe_source_id;
  intent.size = settings.pipe_size;
  intent.length_ft = settings.edge_length_ft;
  step.intents.push_back(intent);
  state.pipe_source_id = kInvalidObjectId;
}

void handle_select_release(InteractionStep& step, const PointerEvent& event, const InteractionSettings& settings,
                           bool moved) {
  InteractionState& state = step.state;
  if (moved) {
    return;
  }
  if (event.target.kind == TargetKind::kBackground || event.target.id == kInvalidObjectId) {
    state.pipe_source_id = kInvalidObjectId;
    step.intents.push_back(make_clear_selection());
    return;
  }

  const ObjectId tapped_id = event.target.id;
  if (tapped_id == state.last_tapped_id &&
      event.timestamp_ms - state.last_tap_timestamp_ms < settings.double_tap_window_ms) {
    ++state.tap_count;
  } else {
    state.tap_count = 1;
  }
  state.last_tapped_id = tapped_id;
  state.last_tap_timestamp_ms = event.timestamp_ms;

  if (state.tap_count >= 2) {
    state.tap_count = 0;
    step.intents.push_back(make_target_intent(IntentKind::kRequestEdit, event.target));
  } else {
    step.intents.push_back(make_target_intent(IntentKind::kSelect, event.target));
  }
}

void handle_up(InteractionStep& step, const PointerEvent& event, const InteractionSettings& settings) {
  InteractionState& state = step.state;
  state.pointer_position = event.position;
  if (!state.pointer_down) {
    return;
  }
  const bool moved = state.has_moved_past_threshold;
  if (state.pressed_target.kind == TargetKind::kBackground) {
    // A gesture that started on empty canvas always drops the selection and the pipe lock.
    state.pipe_source_id = kInvalidObjectId;
    step.intents.push_back(make_clear_selection());
  } else if (state.mode == ToolMode::kPipe) {
    handle_pipe_release(step, event, settings, moved);
  } else {
    handle_select_release(step, event, settings, moved);
  }
  end_gesture(state);
}

}  // namespace

PointerEvent MakePointerDown(const Vec2d& position, PointerTarget target, InputDevice device,
                             std::int64_t timestamp_ms) {
  PointerEvent event;
  event.kind = PointerEventKind::kDown;
  event.position = position;
  event.target = target;
  event.device = device;
  event.timestamp_ms = timestamp_ms;
  return event;
}

PointerEvent MakePointerMove(const Vec2d& position, InputDevice device) {
  PointerEvent event;
  event.kind = PointerEventKind::kMove;
  event.position = position;
  event.device = device;
  return event;
}

PointerEvent MakePointerUp(const Vec2d& position, PointerTarget target, PointerTarget release_target,
                           InputDevice device, std::int64_t timestamp_ms) {
  PointerEvent event;
  event.kind = PointerEventKind::kUp;
  event.position = position;
  event.target = target;
  event.release_target = release_target;
  event.device = device;
  event.timestamp_ms = timestamp_ms;
  return event;
}

PointerEvent MakeDeleteAffordanceTap(ObjectId node_id) {
  PointerEvent event;
  event.kind = PointerEventKind::kDeleteAffordance;
  event.target = {TargetKind::kNode, node_id};
  return event;
}

PointerEvent MakeModeSwitch(ToolMode mode) {
  PointerEvent event;
  event.kind = PointerEventKind::kSetMode;
  event.mode = mode;
  return event;
}

InteractionStep Reduce(const InteractionState& state, const PointerEvent& event,
                       const InteractionSettings& settings) {
  InteractionStep step;
  step.state = state;
  switch (event.kind) {
  case PointerEventKind::kSetMode:
    handle_mode_switch(step, event);
    break;
  case PointerEventKind::kDeleteAffordance:
    handle_delete_affordance(step, event);
    break;
  case PointerEventKind::kDown:
    handle_down(step, event);
    break;
  case PointerEventKind::kMove:
    handle_move(step, event, settings);
    break;
  case PointerEventKind::kUp:
    handle_up(step, event, settings);
    break;
  default:
    break;
  }
  return step;
}

std::optional<PipeGuide> CurrentPipeGuide(const InteractionState& state) {
  if (state.mode != ToolMode::kPipe || state.pipe_source_id == kInvalidObjectId) {
    return std::nullopt;
  }
  return PipeGuide{state.pipe_source_id, state.pointer_position};
}

double DragThreshold(InputDevice device, const InteractionSettings& settings) {
  return device == InputDevice::kTouch ? settings.touch_drag_threshold : settings.mouse_drag_threshold;
}

}  // namespace proflex::core

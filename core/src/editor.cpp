#include "proflex/core/editor.hpp"

#include <algorithm>
#include <utility>

namespace proflex::core {

namespace {

template <typename TValue>
void copy_outcome(AppliedIntent& applied, const EditResult<TValue>& result) {
  applied.ok = result.ok;
  applied.error = result.error;
  applied.change_set = result.change_set;
}

}  // namespace

bool EditorStepResult::has_errors() const {
  return std::any_of(applied.begin(), applied.end(), [](const AppliedIntent& a) { return !a.ok; });
}

std::size_t EditorStepResult::count(IntentKind kind) const {
  return static_cast<std::size_t>(
      std::count_if(applied.begin(), applied.end(), [kind](const AppliedIntent& a) { return a.intent.kind == kind; }));
}

Editor::Editor() = default;

Editor::Editor(DesignState design) : design_(std::move(design)) {
  interaction_settings_.pipe_size = design_.settings().default_pipe_size;
  interaction_settings_.edge_length_ft = design_.settings().default_edge_length_ft;
}

EditorStepResult Editor::HandleEvent(const PointerEvent& event) {
  EditorStepResult result;
  InteractionStep step = Reduce(interaction_, event, interaction_settings_);
  interaction_ = step.state;
  for (const Intent& intent : step.intents) {
    result.applied.push_back(apply(intent));
  }
  drop_stale_references();
  return result;
}

EditorStepResult Editor::SetToolMode(ToolMode mode) {
  return HandleEvent(MakeModeSwitch(mode));
}

EditResult<ObjectId> Editor::AddComponent(NodeType type, std::string_view name, double demand) {
  EditResult<ObjectId> result = design_.AddNode(type, kDefaultNodePosition, name, demand);
  if (result.ok) {
    selected_id_ = result.value;
  }
  return result;
}

EditResult<ObjectId> Editor::DeleteSelected() {
  EditResult<ObjectId> result;
  switch (selected_kind()) {
  case TargetKind::kNode:
    result = design_.DeleteNode(selected_id_);
    break;
  case TargetKind::kEdge:
    result = design_.DeleteEdge(selected_id_);
    break;
  default:
    result.error = "nothing selected";
    return result;
  }
  drop_stale_references();
  return result;
}

void Editor::SetDefaultPipeSize(PipeSize size) {
  interaction_settings_.pipe_size = size;
}

EditResult<bool> Editor::UpdateDesignSettings(const DesignSettings& settings) {
  EditResult<bool> result = design_.UpdateSettings(settings);
  if (result.ok) {
    interaction_settings_.pipe_size = settings.default_pipe_size;
    interaction_settings_.edge_length_ft = settings.default_edge_length_ft;
  }
  return result;
}

EditResult<bool> Editor::ReplaceDesign(std::vector<Node> nodes, std::vector<Edge> edges) {
  EditResult<bool> result = design_.ReplaceGraph(std::move(nodes), std::move(edges));
  if (result.ok) {
    selected_id_ = kInvalidObjectId;
    edit_request_id_ = kInvalidObjectId;
    interaction_.pipe_source_id = kInvalidObjectId;
    interaction_.dragging_node_id = kInvalidObjectId;
  }
  return result;
}

void Editor::ResetDesign() {
  design_.Clear();
  selected_id_ = kInvalidObjectId;
  edit_request_id_ = kInvalidObjectId;
  interaction_ = InteractionState{.mode = interaction_.mode};
}

TargetKind Editor::selected_kind() const {
  if (selected_id_ == kInvalidObjectId) {
    return TargetKind::kBackground;
  }
  if (design_.nodes().contains(selected_id_)) {
    return TargetKind::kNode;
  }
  if (design_.edges().contains(selected_id_)) {
    return TargetKind::kEdge;
  }
  return TargetKind::kBackground;
}

AppliedIntent Editor::apply(const Intent& intent) {
  AppliedIntent applied;
  applied.intent = intent;
  switch (intent.kind) {
  case IntentKind::kSelect:
    selected_id_ = intent.target.id;
    break;
  case IntentKind::kClearSelection:
    selected_id_ = kInvalidObjectId;
    break;
  case IntentKind::kRequestEdit:
    selected_id_ = intent.target.id;
    edit_request_id_ = intent.target.id;
    break;
  case IntentKind::kMoveNode:
    copy_outcome(applied, design_.MoveNode(intent.target.id, intent.position));
    break;
  case IntentKind::kAddEdge:
    copy_outcome(applied, design_.AddEdge(intent.source_node_id, intent.target.id, intent.size, intent.length_ft));
    break;
  case IntentKind::kDeleteNode:
    copy_outcome(applied, design_.DeleteNode(intent.target.id));
    break;
  default:
    applied.ok = false;
    applied.error = "unknown intent";
    break;
  }
  return applied;
}

void Editor::drop_stale_references() {
  if (selected_id_ != kInvalidObjectId && selected_kind() == TargetKind::kBackground) {
    selected_id_ = kInvalidObjectId;
  }
  if (edit_request_id_ != kInvalidObjectId && !design_.nodes().contains(edit_request_id_) &&
      !design_.edges().contains(edit_request_id_)) {
    edit_request_id_ = kInvalidObjectId;
  }
  if (interaction_.pipe_source_id != kInvalidObjectId && !design_.nodes().contains(interaction_.pipe_source_id)) {
    interaction_.pipe_source_id = kInvalidObjectId;
  }
}

}  // namespace proflex::core

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "proflex/core/design_state.hpp"
#include "proflex/core/interaction.hpp"

namespace proflex::core {

struct AppliedIntent {
  Intent intent{};
  bool ok = true;
  std::string error{};
  ChangeSet change_set{};
};

struct EditorStepResult {
  std::vector<AppliedIntent> applied{};

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] std::size_t count(IntentKind kind) const;
};

// Single-writer session: feeds input through the interaction reducer and applies the resulting
// intents to the design in order. Verdicts are current after every call returns.
class Editor {
 public:
  Editor();
  explicit Editor(DesignState design);

  EditorStepResult HandleEvent(const PointerEvent& event);
  EditorStepResult SetToolMode(ToolMode mode);

  // Toolbar action: new component at the canvas centre, selected afterwards.
  EditResult<ObjectId> AddComponent(NodeType type, std::string_view name = {}, double demand = 0.0);
  // Deletes the selected node (cascading) or edge.
  EditResult<ObjectId> DeleteSelected();
  void SetDefaultPipeSize(PipeSize size);
  EditResult<bool> UpdateDesignSettings(const DesignSettings& settings);
  EditResult<bool> ReplaceDesign(std::vector<Node> nodes, std::vector<Edge> edges);
  void ResetDesign();

  [[nodiscard]] ObjectId selected_id() const { return selected_id_; }
  [[nodiscard]] TargetKind selected_kind() const;
  [[nodiscard]] ObjectId edit_request_id() const { return edit_request_id_; }
  void ClearEditRequest() { edit_request_id_ = kInvalidObjectId; }

  [[nodiscard]] DesignState& design() { return design_; }
  [[nodiscard]] const DesignState& design() const { return design_; }
  [[nodiscard]] const InteractionState& interaction() const { return interaction_; }
  [[nodiscard]] InteractionSettings& interaction_settings() { return interaction_settings_; }
  [[nodiscard]] const InteractionSettings& interaction_settings() const { return interaction_settings_; }

 private:
  AppliedIntent apply(const Intent& intent);
  void drop_stale_references();

  DesignState design_{};
  InteractionState interaction_{};
  InteractionSettings interaction_settings_{};
  ObjectId selected_id_ = kInvalidObjectId;
  ObjectId edit_request_id_ = kInvalidObjectId;
};

}  // namespace proflex::core

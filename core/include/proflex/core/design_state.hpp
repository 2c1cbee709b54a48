#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "proflex/core/entities.hpp"
#include "proflex/core/flow_validation.hpp"
#include "proflex/core/id.hpp"
#include "proflex/core/object_store.hpp"
#include "proflex/core/pipe_sizing.hpp"
#include "proflex/core/types.hpp"

namespace proflex::core {

constexpr Vec2d kDefaultNodePosition{500.0, 500.0};
constexpr double kDefaultEdgeLengthFt = 10.0;

struct DesignSettings {
  // Per-project policy. Verdicts are rebuilt whenever these change.
  double design_pressure_drop = kDefaultDesignPressureDrop;
  PipeSize default_pipe_size = PipeSize::kHalf;
  double default_edge_length_ft = kDefaultEdgeLengthFt;
};

struct ChangeSet {
  std::vector<ObjectId> created_ids;
  std::vector<ObjectId> updated_ids;
  std::vector<ObjectId> deleted_ids;
};

template <typename TValue>
struct EditResult {
  bool ok = false;
  TValue value{};
  std::string error{};
  ChangeSet change_set{};
};

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  ObjectId object_id = kInvalidObjectId;
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
};

struct PartsSummary {
  std::map<NodeType, std::size_t> component_counts{};
  std::map<PipeSize, double> pipe_length_ft_by_size{};
  std::size_t segment_count = 0;
  std::size_t failing_segment_count = 0;
  double total_appliance_demand = 0.0;
};

class DesignState {
 public:
  DesignState();
  explicit DesignState(const DesignSettings& settings);

  EditResult<ObjectId> AddNode(
      NodeType type,
      const Vec2d& position = kDefaultNodePosition,
      std::string_view name = {},
      double demand = 0.0);
  // Uses the default pipe size and length from settings().
  EditResult<ObjectId> AddEdge(ObjectId from_node_id, ObjectId to_node_id);
  EditResult<ObjectId> AddEdge(ObjectId from_node_id, ObjectId to_node_id, PipeSize size, double length_ft);
  EditResult<ObjectId> MoveNode(ObjectId node_id, const Vec2d& position);
  EditResult<ObjectId> RenameNode(ObjectId node_id, std::string_view name);
  EditResult<ObjectId> SetNodeDemand(ObjectId node_id, double demand);
  EditResult<ObjectId> SetEdgeSize(ObjectId edge_id, PipeSize size);
  EditResult<ObjectId> SetEdgeLength(ObjectId edge_id, double length_ft);
  EditResult<ObjectId> DeleteEdge(ObjectId edge_id);
  // Removes the node and every edge touching it.
  EditResult<ObjectId> DeleteNode(ObjectId node_id);
  EditResult<bool> UpdateSettings(const DesignSettings& settings);

  // Replaces the whole graph with externally loaded content. Dangling edge endpoints and cycles are
  // accepted; duplicate ids are rejected and leave the current graph untouched.
  EditResult<bool> ReplaceGraph(std::vector<Node> nodes, std::vector<Edge> edges);
  void Clear();

  [[nodiscard]] const ObjectStore<Node>& nodes() const { return nodes_; }
  [[nodiscard]] const ObjectStore<Edge>& edges() const { return edges_; }
  [[nodiscard]] const DesignSettings& settings() const { return settings_; }
  [[nodiscard]] const EdgeVerdictMap& verdicts() const { return verdicts_; }
  [[nodiscard]] const EdgeVerdict* find_verdict(ObjectId edge_id) const;
  [[nodiscard]] std::uint64_t revision() const { return revision_; }

  // True when `to_node_id` can already reach `from_node_id`, so from -> to would close a loop.
  [[nodiscard]] bool WouldCreateCycle(ObjectId from_node_id, ObjectId to_node_id) const;
  [[nodiscard]] std::vector<ObjectId> EdgesTouching(ObjectId node_id) const;

  [[nodiscard]] ValidationResult Validate() const;
  [[nodiscard]] PartsSummary SummarizeParts() const;

 private:
  void revalidate();

  IdGenerator id_generator_{};
  DesignSettings settings_{};
  ObjectStore<Node> nodes_{};
  ObjectStore<Edge> edges_{};
  // Derived layer; rebuilt after every mutation.
  EdgeVerdictMap verdicts_{};
  std::uint64_t revision_ = 0;
};

DesignState make_demo_state();

}  // namespace proflex::core

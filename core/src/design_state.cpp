#include "proflex/core/design_state.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace proflex::core {

namespace {

bool is_valid_length(double length_ft) {
  return std::isfinite(length_ft) && length_ft > 0.0;
}

bool is_valid_demand(double demand) {
  return std::isfinite(demand) && demand >= 0.0;
}

bool is_valid_settings(const DesignSettings& settings, std::string* error) {
  if (!std::isfinite(settings.design_pressure_drop) || settings.design_pressure_drop <= 0.0) {
    *error = "design pressure drop must be > 0";
    return false;
  }
  if (!is_valid_length(settings.default_edge_length_ft)) {
    *error = "default edge length must be > 0";
    return false;
  }
  return true;
}

}  // namespace

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

DesignState::DesignState() = default;

DesignState::DesignState(const DesignSettings& settings) {
  std::string error;
  if (is_valid_settings(settings, &error)) {
    settings_ = settings;
  }
}

EditResult<ObjectId> DesignState::AddNode(NodeType type, const Vec2d& position, std::string_view name,
                                          double demand) {
  EditResult<ObjectId> result;
  if (!is_finite(position)) {
    result.error = "node position must be finite";
    return result;
  }
  if (!is_valid_demand(demand)) {
    result.error = "demand must be >= 0";
    return result;
  }

  const NodeTypeTraits& traits = traits_of(type);
  Node node{};
  node.id = id_generator_.next();
  node.type = type;
  node.position = clamp_to_canvas(position);
  node.name = name.empty() ? std::string(traits.default_name) : std::string(name);
  node.demand = traits.has_demand ? demand : 0.0;
  nodes_.insert(node);
  revalidate();

  result.ok = true;
  result.value = node.id;
  result.change_set.created_ids.push_back(node.id);
  return result;
}

EditResult<ObjectId> DesignState::AddEdge(ObjectId from_node_id, ObjectId to_node_id) {
  return AddEdge(from_node_id, to_node_id, settings_.default_pipe_size, settings_.default_edge_length_ft);
}

EditResult<ObjectId> DesignState::AddEdge(ObjectId from_node_id, ObjectId to_node_id, PipeSize size,
                                          double length_ft) {
  EditResult<ObjectId> result;
  if (!nodes_.contains(from_node_id) || !nodes_.contains(to_node_id)) {
    result.error = "edge nodes do not exist";
    return result;
  }
  if (from_node_id == to_node_id) {
    result.error = "edge endpoints must be different";
    return result;
  }
  if (!is_valid_length(length_ft)) {
    result.error = "edge length must be > 0";
    return result;
  }
  if (WouldCreateCycle(from_node_id, to_node_id)) {
    result.error = "edge would create a cycle";
    return result;
  }

  Edge edge{};
  edge.id = id_generator_.next();
  edge.from_node_id = from_node_id;
  edge.to_node_id = to_node_id;
  edge.size = size;
  edge.length_ft = length_ft;
  edges_.insert(edge);
  revalidate();

  result.ok = true;
  result.value = edge.id;
  result.change_set.created_ids.push_back(edge.id);
  return result;
}

EditResult<ObjectId> DesignState::MoveNode(ObjectId node_id, const Vec2d& position) {
  EditResult<ObjectId> result;
  Node* node = nodes_.find(node_id);
  if (node == nullptr) {
    result.error = "node not found";
    return result;
  }
  if (!is_finite(position)) {
    result.error = "node position must be finite";
    return result;
  }

  node->position = clamp_to_canvas(position);
  revalidate();

  result.ok = true;
  result.value = node_id;
  result.change_set.updated_ids.push_back(node_id);
  return result;
}

EditResult<ObjectId> DesignState::RenameNode(ObjectId node_id, std::string_view name) {
  EditResult<ObjectId> result;
  Node* node = nodes_.find(node_id);
  if (node == nullptr) {
    result.error = "node not found";
    return result;
  }

  node->name = std::string(name);
  revalidate();

  result.ok = true;
  result.value = node_id;
  result.change_set.updated_ids.push_back(node_id);
  return result;
}

EditResult<ObjectId> DesignState::SetNodeDemand(ObjectId node_id, double demand) {
  EditResult<ObjectId> result;
  Node* node = nodes_.find(node_id);
  if (node == nullptr) {
    result.error = "node not found";
    return result;
  }
  if (!traits_of(node->type).has_demand) {
    result.error = "demand applies to appliances only";
    return result;
  }
  if (!is_valid_demand(demand)) {
    result.error = "demand must be >= 0";
    return result;
  }

  node->demand = demand;
  revalidate();

  result.ok = true;
  result.value = node_id;
  result.change_set.updated_ids.push_back(node_id);
  return result;
}

EditResult<ObjectId> DesignState::SetEdgeSize(ObjectId edge_id, PipeSize size) {
  EditResult<ObjectId> result;
  Edge* edge = edges_.find(edge_id);
  if (edge == nullptr) {
    result.error = "edge not found";
    return result;
  }

  edge->size = size;
  revalidate();

  result.ok = true;
  result.value = edge_id;
  result.change_set.updated_ids.push_back(edge_id);
  return result;
}

EditResult<ObjectId> DesignState::SetEdgeLength(ObjectId edge_id, double length_ft) {
  EditResult<ObjectId> result;
  Edge* edge = edges_.find(edge_id);
  if (edge == nullptr) {
    result.error = "edge not found";
    return result;
  }
  if (!is_valid_length(length_ft)) {
    result.error = "edge length must be > 0";
    return result;
  }

  edge->length_ft = length_ft;
  revalidate();

  result.ok = true;
  result.value = edge_id;
  result.change_set.updated_ids.push_back(edge_id);
  return result;
}

EditResult<ObjectId> DesignState::DeleteEdge(ObjectId edge_id) {
  EditResult<ObjectId> result;
  if (!edges_.remove(edge_id)) {
    result.error = "edge not found";
    return result;
  }
  revalidate();

  result.ok = true;
  result.value = edge_id;
  result.change_set.deleted_ids.push_back(edge_id);
  return result;
}

EditResult<ObjectId> DesignState::DeleteNode(ObjectId node_id) {
  EditResult<ObjectId> result;
  if (!nodes_.remove(node_id)) {
    result.error = "node not found";
    return result;
  }

  result.change_set.deleted_ids = edges_.remove_if(
      [node_id](const Edge& edge) { return edge.from_node_id == node_id || edge.to_node_id == node_id; });
  result.change_set.deleted_ids.push_back(node_id);
  revalidate();

  result.ok = true;
  result.value = node_id;
  return result;
}

EditResult<bool> DesignState::UpdateSettings(const DesignSettings& settings) {
  EditResult<bool> result;
  if (!is_valid_settings(settings, &result.error)) {
    return result;
  }

  settings_ = settings;
  revalidate();

  result.ok = true;
  result.value = true;
  for (const Edge& edge : edges_.items()) {
    result.change_set.updated_ids.push_back(edge.id);
  }
  return result;
}

EditResult<bool> DesignState::ReplaceGraph(std::vector<Node> nodes, std::vector<Edge> edges) {
  EditResult<bool> result;
  std::unordered_set<ObjectId> seen_ids;
  ObjectId max_id = kInvalidObjectId;
  for (const Node& node : nodes) {
    if (node.id == kInvalidObjectId || !seen_ids.insert(node.id).second) {
      result.error = "duplicate or invalid node id";
      return result;
    }
    max_id = std::max(max_id, node.id);
  }
  for (const Edge& edge : edges) {
    if (edge.id == kInvalidObjectId || !seen_ids.insert(edge.id).second) {
      result.error = "duplicate or invalid edge id";
      return result;
    }
    max_id = std::max(max_id, edge.id);
  }

  for (const Node& node : nodes_.items()) {
    result.change_set.deleted_ids.push_back(node.id);
  }
  for (const Edge& edge : edges_.items()) {
    result.change_set.deleted_ids.push_back(edge.id);
  }

  nodes_.clear();
  edges_.clear();
  for (Node& node : nodes) {
    result.change_set.created_ids.push_back(node.id);
    node.position = clamp_to_canvas(node.position);
    nodes_.insert(std::move(node));
  }
  for (Edge& edge : edges) {
    result.change_set.created_ids.push_back(edge.id);
    edges_.insert(std::move(edge));
  }
  id_generator_.reset();
  id_generator_.advance_past(max_id);
  revalidate();

  result.ok = true;
  result.value = true;
  return result;
}

void DesignState::Clear() {
  nodes_.clear();
  edges_.clear();
  id_generator_.reset();
  revalidate();
}

const EdgeVerdict* DesignState::find_verdict(ObjectId edge_id) const {
  auto it = verdicts_.find(edge_id);
  if (it == verdicts_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool DesignState::WouldCreateCycle(ObjectId from_node_id, ObjectId to_node_id) const {
  if (from_node_id == to_node_id) {
    return true;
  }
  std::unordered_map<ObjectId, std::vector<ObjectId>> downstream;
  for (const Edge& edge : edges_.items()) {
    downstream[edge.from_node_id].push_back(edge.to_node_id);
  }

  std::vector<ObjectId> pending{to_node_id};
  std::unordered_set<ObjectId> visited{to_node_id};
  while (!pending.empty()) {
    const ObjectId current = pending.back();
    pending.pop_back();
    if (current == from_node_id) {
      return true;
    }
    auto it = downstream.find(current);
    if (it == downstream.end()) {
      continue;
    }
    for (ObjectId next : it->second) {
      if (visited.insert(next).second) {
        pending.push_back(next);
      }
    }
  }
  return false;
}

std::vector<ObjectId> DesignState::EdgesTouching(ObjectId node_id) const {
  std::vector<ObjectId> edge_ids;
  for (const Edge& edge : edges_.items()) {
    if (edge.from_node_id == node_id || edge.to_node_id == node_id) {
      edge_ids.push_back(edge.id);
    }
  }
  return edge_ids;
}

ValidationResult DesignState::Validate() const {
  ValidationResult result;

  std::unordered_map<ObjectId, std::size_t> inbound_counts;
  for (const Edge& edge : edges_.items()) {
    const bool from_missing = !nodes_.contains(edge.from_node_id);
    const bool to_missing = !nodes_.contains(edge.to_node_id);
    if (from_missing || to_missing) {
      result.issues.push_back(
          {ValidationSeverity::kError, "EdgeEndpointMissing", "Edge references a missing node", edge.id});
    } else if (edge.from_node_id == edge.to_node_id) {
      result.issues.push_back({ValidationSeverity::kError, "EdgeSelfLoop", "Edge starts and ends at the same node",
                               edge.id});
    }
    if (!is_valid_length(edge.length_ft)) {
      result.issues.push_back({ValidationSeverity::kError, "EdgeLengthInvalid", "Edge length must be > 0", edge.id});
    }
    if (!to_missing) {
      ++inbound_counts[edge.to_node_id];
    }

    const EdgeVerdict* verdict = find_verdict(edge.id);
    if (verdict == nullptr) {
      continue;
    }
    if (verdict->in_cycle) {
      result.issues.push_back(
          {ValidationSeverity::kError, "EdgeCycle", "Edge lies on a loop; downstream demand is undefined", edge.id});
    } else if (!verdict->is_valid) {
      result.issues.push_back({ValidationSeverity::kWarning, "EdgeCapacityExceeded",
                               "Downstream demand exceeds segment capacity", edge.id});
    }
  }

  bool has_meter = false;
  for (const Node& node : nodes_.items()) {
    if (!is_valid_demand(node.demand)) {
      result.issues.push_back(
          {ValidationSeverity::kError, "NodeDemandInvalid", "Node demand must be finite and >= 0", node.id});
    }
    auto inbound_it = inbound_counts.find(node.id);
    const std::size_t inbound = (inbound_it == inbound_counts.end()) ? 0 : inbound_it->second;
    if (node.type == NodeType::kMeter) {
      has_meter = true;
      if (inbound > 0) {
        result.issues.push_back(
            {ValidationSeverity::kWarning, "MeterHasInbound", "Meter is fed by another segment", node.id});
      }
    } else if (inbound > 1) {
      result.issues.push_back({ValidationSeverity::kWarning, "NodeMultipleInbound",
                               "Node is fed by more than one segment; demand is counted on each", node.id});
    }
  }
  if (!nodes_.empty() && !has_meter) {
    result.issues.push_back({ValidationSeverity::kWarning, "NoMeter", "Design has no supply meter", kInvalidObjectId});
  }
  return result;
}

PartsSummary DesignState::SummarizeParts() const {
  PartsSummary summary;
  for (const Node& node : nodes_.items()) {
    ++summary.component_counts[node.type];
    if (traits_of(node.type).has_demand && is_valid_demand(node.demand)) {
      summary.total_appliance_demand += node.demand;
    }
  }
  for (const Edge& edge : edges_.items()) {
    summary.pipe_length_ft_by_size[edge.size] += edge.length_ft;
    ++summary.segment_count;
    const EdgeVerdict* verdict = find_verdict(edge.id);
    if (verdict != nullptr && !verdict->is_valid) {
      ++summary.failing_segment_count;
    }
  }
  return summary;
}

void DesignState::revalidate() {
  verdicts_ = ValidateFlows(nodes_, edges_, settings_.design_pressure_drop);
  ++revision_;
}

DesignState make_demo_state() {
  DesignState state;
  const ObjectId meter = state.AddNode(NodeType::kMeter, {120.0, 500.0}).value;
  const ObjectId junction = state.AddNode(NodeType::kJunction, {340.0, 500.0}).value;
  const ObjectId manifold = state.AddNode(NodeType::kManifold, {560.0, 360.0}).value;
  const ObjectId water_heater = state.AddNode(NodeType::kAppliance, {560.0, 680.0}, "Water Heater", 40000.0).value;
  const ObjectId furnace = state.AddNode(NodeType::kAppliance, {800.0, 240.0}, "Furnace", 100000.0).value;
  const ObjectId cooktop = state.AddNode(NodeType::kAppliance, {800.0, 420.0}, "Cooktop", 65000.0).value;
  const ObjectId dryer = state.AddNode(NodeType::kAppliance, {800.0, 580.0}, "Dryer", 20000.0).value;

  (void)state.AddEdge(meter, junction, PipeSize::kOne, 20.0);
  (void)state.AddEdge(junction, manifold, PipeSize::kThreeQuarters, 15.0);
  (void)state.AddEdge(junction, water_heater, PipeSize::kHalf, 10.0);
  (void)state.AddEdge(manifold, furnace, PipeSize::kHalf, 10.0);
  (void)state.AddEdge(manifold, cooktop, PipeSize::kHalf, 25.0);
  (void)state.AddEdge(manifold, dryer, PipeSize::kThreeEighths, 10.0);
  return state;
}

}  // namespace proflex::core

#include "proflex/core/flow_validation.hpp"

#include <cmath>
#include <vector>

#include "proflex/core/pipe_sizing.hpp"

namespace proflex::core {

namespace {

double demand_of(const Node& node) {
  if (!traits_of(node.type).has_demand) {
    return 0.0;
  }
  if (!std::isfinite(node.demand) || node.demand < 0.0) {
    return 0.0;
  }
  return node.demand;
}

}  // namespace

EdgeVerdict MakeVerdict(double flow, std::int64_t capacity) {
  EdgeVerdict verdict;
  verdict.flow = flow;
  verdict.capacity = capacity;
  verdict.is_valid = flow <= static_cast<double>(capacity);
  return verdict;
}

DemandAggregator::DemandAggregator(const ObjectStore<Node>& nodes, const ObjectStore<Edge>& edges)
    : nodes_(nodes), edges_(edges) {
  for (const Edge& edge : edges_.items()) {
    outgoing_by_node_[edge.from_node_id].push_back(&edge);
  }
  for (const Edge& edge : edges_.items()) {
    if (!nodes_.contains(edge.from_node_id) || !nodes_.contains(edge.to_node_id)) {
      continue;
    }
    if (reaches(edge.to_node_id, edge.from_node_id)) {
      cycle_edge_ids_.insert(edge.id);
    }
  }
}

double DemandAggregator::FlowThrough(ObjectId edge_id) {
  const Edge* edge = edges_.find(edge_id);
  if (edge == nullptr) {
    return 0.0;
  }
  return flow_of(*edge);
}

double DemandAggregator::flow_of(const Edge& edge) {
  auto memo_it = flow_memo_.find(edge.id);
  if (memo_it != flow_memo_.end()) {
    return memo_it->second;
  }
  if (in_progress_.contains(edge.id)) {
    // Re-entered an edge still being summed; it is already in cycle_edge_ids_.
    return 0.0;
  }

  const Node* target = nodes_.find(edge.to_node_id);
  if (target == nullptr) {
    flow_memo_[edge.id] = 0.0;
    return 0.0;
  }

  in_progress_.insert(edge.id);

  double total = demand_of(*target);
  auto out_it = outgoing_by_node_.find(target->id);
  if (out_it != outgoing_by_node_.end()) {
    for (const Edge* outgoing : out_it->second) {
      total += flow_of(*outgoing);
    }
  }

  in_progress_.erase(edge.id);
  flow_memo_[edge.id] = total;
  return total;
}

bool DemandAggregator::reaches(ObjectId from_node_id, ObjectId to_node_id) const {
  std::vector<ObjectId> pending{from_node_id};
  std::unordered_set<ObjectId> visited{from_node_id};
  while (!pending.empty()) {
    const ObjectId current = pending.back();
    pending.pop_back();
    if (current == to_node_id) {
      return true;
    }
    auto it = outgoing_by_node_.find(current);
    if (it == outgoing_by_node_.end()) {
      continue;
    }
    for (const Edge* outgoing : it->second) {
      if (nodes_.contains(outgoing->to_node_id) && visited.insert(outgoing->to_node_id).second) {
        pending.push_back(outgoing->to_node_id);
      }
    }
  }
  return false;
}

EdgeVerdictMap ValidateFlows(const ObjectStore<Node>& nodes, const ObjectStore<Edge>& edges,
                             double design_pressure_drop) {
  DemandAggregator aggregator(nodes, edges);
  EdgeVerdictMap verdicts;
  for (const Edge& edge : edges.items()) {
    const double flow = aggregator.FlowThrough(edge.id);
    const std::int64_t capacity = ComputeCapacity(edge.size, edge.length_ft, design_pressure_drop);
    verdicts[edge.id] = MakeVerdict(flow, capacity);
  }
  if (aggregator.cycle_detected()) {
    for (auto& [edge_id, verdict] : verdicts) {
      if (aggregator.in_cycle(edge_id)) {
        verdict.in_cycle = true;
        verdict.is_valid = false;
      }
    }
  }
  return verdicts;
}

}  // namespace proflex::core

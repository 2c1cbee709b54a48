#pragma once

#include <cstdint>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "proflex/core/entities.hpp"
#include "proflex/core/id.hpp"
#include "proflex/core/object_store.hpp"

namespace proflex::core {

struct EdgeVerdict {
  bool is_valid = true;
  double flow = 0.0;
  std::int64_t capacity = 0;
  bool in_cycle = false;  // Edge lies on a directed cycle; its flow is not meaningful.

  bool operator==(const EdgeVerdict&) const = default;
};

// Ordered by edge id so two passes over the same graph compare equal element by element.
using EdgeVerdictMap = std::map<ObjectId, EdgeVerdict>;

// flow <= capacity passes; exactly at capacity is still valid.
[[nodiscard]] EdgeVerdict MakeVerdict(double flow, std::int64_t capacity);

// Downstream demand per edge for one validation pass. Results are memoized for the lifetime of the
// aggregator, so it must not outlive a graph mutation.
class DemandAggregator {
 public:
  DemandAggregator(const ObjectStore<Node>& nodes, const ObjectStore<Edge>& edges);

  // Demand at the edge's downstream node (appliances only) plus the flow of every edge leaving that
  // node. Unknown edges and edges whose downstream node is missing carry 0.
  [[nodiscard]] double FlowThrough(ObjectId edge_id);

  // Edge u->v lies on a directed cycle exactly when v can reach u. Known from construction.
  [[nodiscard]] bool in_cycle(ObjectId edge_id) const { return cycle_edge_ids_.contains(edge_id); }
  [[nodiscard]] bool cycle_detected() const { return !cycle_edge_ids_.empty(); }

 private:
  double flow_of(const Edge& edge);
  [[nodiscard]] bool reaches(ObjectId from_node_id, ObjectId to_node_id) const;

  const ObjectStore<Node>& nodes_;
  const ObjectStore<Edge>& edges_;
  std::unordered_map<ObjectId, std::vector<const Edge*>> outgoing_by_node_{};
  std::unordered_map<ObjectId, double> flow_memo_{};
  std::unordered_set<ObjectId> in_progress_{};
  std::unordered_set<ObjectId> cycle_edge_ids_{};
};

// Complete verdict map for every edge currently in `edges`. Pure; no state is kept between calls.
[[nodiscard]] EdgeVerdictMap ValidateFlows(
    const ObjectStore<Node>& nodes,
    const ObjectStore<Edge>& edges,
    double design_pressure_drop);

}  // namespace proflex::core

#pragma once

#include <cstdint>

namespace proflex::core {

using ObjectId = std::uint64_t;
constexpr ObjectId kInvalidObjectId = 0;

// Shared by nodes and edges of one design, so a node id never equals an edge id.
class IdGenerator {
 public:
  explicit IdGenerator(ObjectId next_id = 1) : next_id_(next_id) {}

  [[nodiscard]] ObjectId next() { return next_id_++; }

  [[nodiscard]] ObjectId peek() const { return next_id_; }

  void reset(ObjectId next_id = 1) { next_id_ = next_id; }

  // Used after loading a design so fresh ids never reuse a loaded one.
  void advance_past(ObjectId used_id) {
    if (used_id >= next_id_) {
      next_id_ = used_id + 1;
    }
  }

 private:
  ObjectId next_id_ = 1;
};

}  // namespace proflex::core

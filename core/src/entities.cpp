#include "proflex/core/entities.hpp"

namespace proflex::core {

std::optional<NodeType> node_type_from_key(std::string_view key) {
  for (const NodeTypeTraits& traits : kNodeTypeTraits) {
    if (key == traits.key) {
      return traits.type;
    }
  }
  return std::nullopt;
}

std::optional<PipeSize> pipe_size_from_label(std::string_view label) {
  for (const PipeSpec& spec : kPipeSpecs) {
    if (label == spec.label) {
      return spec.size;
    }
  }
  return std::nullopt;
}

}  // namespace proflex::core

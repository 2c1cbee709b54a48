#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "proflex/core/id.hpp"
#include "proflex/core/types.hpp"

namespace proflex::core {

enum class NodeType : std::uint8_t {
  kMeter = 0,
  kJunction = 1,
  kManifold = 2,
  kAppliance = 3,
};

enum class PipeSize : std::uint8_t {
  kThreeEighths = 0,
  kHalf = 1,
  kThreeQuarters = 2,
  kOne = 3,
  kOneAndQuarter = 4,
};

struct Rgba8 {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;
  std::uint8_t a = 255;
};

struct NodeTypeTraits {
  NodeType type = NodeType::kJunction;
  const char* key = "";           // Stable identifier used in project files.
  const char* default_name = "";
  double radius = 14.0;           // Canvas units; also the pick radius.
  bool has_demand = false;        // Only appliances contribute demand.
  Rgba8 color{};
};

// Fitted sizing constants per nominal diameter plus the tabulated capacity shown to the user.
struct PipeSpec {
  PipeSize size = PipeSize::kHalf;
  const char* label = "";
  double coeff = 0.0;
  double exp = 1.0;
  std::int64_t nominal_capacity = 0;
};

inline constexpr std::array<NodeTypeTraits, 4> kNodeTypeTraits = {{
    {NodeType::kMeter, "METER", "Gas Meter", 20.0, false, {16, 185, 129, 255}},
    {NodeType::kJunction, "JUNCTION", "T-Junction", 14.0, false, {99, 102, 241, 255}},
    {NodeType::kManifold, "MANIFOLD", "Manifold", 14.0, false, {6, 182, 212, 255}},
    {NodeType::kAppliance, "APPLIANCE", "Appliance", 14.0, true, {245, 158, 11, 255}},
}};

inline constexpr std::array<PipeSpec, 5> kPipeSpecs = {{
    {PipeSize::kThreeEighths, "3/8\"", 0.00002158927, 2.02558185, 46000},
    {PipeSize::kHalf, "1/2\"", 0.00000410606, 2.1590935, 77000},
    {PipeSize::kThreeQuarters, "3/4\"", 0.00000123682, 2.00156167, 200000},
    {PipeSize::kOne, "1\"", 0.0000010746, 1.77654817, 423000},
    {PipeSize::kOneAndQuarter, "1-1/4\"", 1.1678553403503E-07, 1.992081557687, 662000},
}};

inline const NodeTypeTraits& traits_of(NodeType type) {
  return kNodeTypeTraits[static_cast<std::size_t>(type)];
}

inline const PipeSpec& spec_of(PipeSize size) {
  return kPipeSpecs[static_cast<std::size_t>(size)];
}

std::optional<NodeType> node_type_from_key(std::string_view key);
std::optional<PipeSize> pipe_size_from_label(std::string_view label);

struct AppliancePreset {
  const char* name = "";
  double demand = 0.0;
};

inline constexpr std::array<AppliancePreset, 5> kAppliancePresets = {{
    {"Furnace", 100000.0},
    {"Water Heater", 40000.0},
    {"Cooktop", 65000.0},
    {"Fireplace", 30000.0},
    {"Dryer", 20000.0},
}};

struct Node {
  ObjectId id = kInvalidObjectId;
  NodeType type = NodeType::kJunction;
  Vec2d position{500.0, 500.0};
  std::string name{};
  double demand = 0.0;  // Gas consumption rate; ignored unless traits_of(type).has_demand.
};

struct Edge {
  ObjectId id = kInvalidObjectId;
  ObjectId from_node_id = kInvalidObjectId;
  ObjectId to_node_id = kInvalidObjectId;  // Downstream end.
  PipeSize size = PipeSize::kHalf;
  double length_ft = 10.0;
};

}  // namespace proflex::core

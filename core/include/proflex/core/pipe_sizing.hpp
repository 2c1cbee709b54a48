#pragma once

#include <cstdint>

#include "proflex/core/entities.hpp"

namespace proflex::core {

constexpr double kDefaultDesignPressureDrop = 0.5;
constexpr std::int64_t kCapacityRoundingUnit = 1000;

// Maximum flow a segment of `size` and `length_ft` carries without exceeding
// `design_pressure_drop` over its length:
//   floor(((design_pressure_drop / length_ft) / coeff) ^ (1 / exp)) * 1000
// Degenerate input (length <= 0, non-positive or non-finite pressure drop) yields 0.
[[nodiscard]] std::int64_t ComputeCapacity(PipeSize size, double length_ft, double design_pressure_drop);

}  // namespace proflex::core

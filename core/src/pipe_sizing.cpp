#include "proflex/core/pipe_sizing.hpp"

#include <cmath>

namespace proflex::core {

std::int64_t ComputeCapacity(PipeSize size, double length_ft, double design_pressure_drop) {
  if (!(length_ft > 0.0) || !std::isfinite(length_ft)) {
    return 0;
  }
  if (!(design_pressure_drop > 0.0) || !std::isfinite(design_pressure_drop)) {
    return 0;
  }
  const PipeSpec& spec = spec_of(size);
  const double drop_per_foot = design_pressure_drop / length_ft;
  const double units = std::pow(drop_per_foot / spec.coeff, 1.0 / spec.exp);
  if (!std::isfinite(units) || units < 0.0) {
    return 0;
  }
  return static_cast<std::int64_t>(std::floor(units)) * kCapacityRoundingUnit;
}

}  // namespace proflex::core

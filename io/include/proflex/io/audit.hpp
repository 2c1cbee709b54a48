#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proflex/core/design_state.hpp"

namespace proflex::io {

inline constexpr std::string_view kSafetySectionTitle = "Safety & Compliance Audit";
inline constexpr std::string_view kPerformanceSectionTitle = "Performance & Optimization";
inline constexpr std::size_t kMaxBulletsPerSection = 5;

// Text-generation service that produces the audit narrative.
class AuditBackend {
 public:
  virtual ~AuditBackend() = default;

  // nullopt when the service could not be reached or answered with something unusable.
  virtual std::optional<std::string> Generate(const std::string& prompt) = 0;
};

struct AuditSection {
  std::string title{};
  std::vector<std::string> bullets{};
};

struct AuditOutcome {
  std::string report{};
  bool used_fallback = false;
  std::string error{};
};

// Fixed two-section report shown whenever the backend fails.
[[nodiscard]] const std::string& FallbackAuditReport();
[[nodiscard]] std::string BuildAuditPrompt(const core::DesignState& design);

// Splits the report in front of each section title. Each section keeps its first line as title and
// at most kMaxBulletsPerSection non-blank lines with leading list markers removed.
[[nodiscard]] std::vector<AuditSection> ParseAuditReport(std::string_view report);

// Blocking; never fails. Backend errors are recorded in `error` and replaced by the fallback text.
AuditOutcome RunAudit(AuditBackend& backend, const core::DesignState& design);

}  // namespace proflex::io

#include "proflex/io/audit.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <utility>

#include "proflex/io/project_io.hpp"

namespace proflex::io {

namespace {

std::string_view trim_view(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

// Drops "- ", "* ", "| ", "1. " and similar prefixes.
std::string strip_list_marker(std::string_view line) {
  std::size_t pos = 0;
  while (pos < line.size() &&
         (line[pos] == '-' || line[pos] == '*' || line[pos] == '|' || line[pos] == '.' ||
          std::isdigit(static_cast<unsigned char>(line[pos])) != 0)) {
    ++pos;
  }
  if (pos == 0) {
    return std::string(line);
  }
  while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])) != 0) {
    ++pos;
  }
  return std::string(line.substr(pos));
}

std::size_t next_title(std::string_view report, std::size_t from) {
  const std::size_t safety = report.find(kSafetySectionTitle, from);
  const std::size_t performance = report.find(kPerformanceSectionTitle, from);
  return std::min(safety, performance);
}

AuditSection parse_section(std::string_view chunk) {
  AuditSection section;
  std::istringstream lines{std::string(chunk)};
  std::string line;
  bool has_title = false;
  while (std::getline(lines, line)) {
    if (!has_title) {
      section.title = std::string(trim_view(line));
      has_title = true;
      continue;
    }
    const std::string_view trimmed = trim_view(line);
    if (trimmed.empty()) {
      continue;
    }
    section.bullets.push_back(strip_list_marker(trimmed));
    if (section.bullets.size() == kMaxBulletsPerSection) {
      break;
    }
  }
  return section;
}

}  // namespace

const std::string& FallbackAuditReport() {
  static const std::string kReport =
      "Safety & Compliance Audit\n"
      "- Connection error.\n"
      "- Verify API key.\n"
      "- Check network.\n"
      "- Ensure valid nodes.\n"
      "- Please try again.\n"
      "\n"
      "Performance & Optimization\n"
      "- Insufficient data.\n"
      "- Calculation interrupted.\n"
      "- Try smaller segments.\n"
      "- Link all appliances.\n"
      "- Refresh and retry.";
  return kReport;
}

std::string BuildAuditPrompt(const core::DesignState& design) {
  const nlohmann::json graph = GraphToJson(design);
  std::ostringstream prompt;
  prompt << "Analyze this gas piping system layout for a professional engineering audit.\n";
  prompt << "Nodes: " << graph["nodes"].dump() << "\n";
  prompt << "Edges: " << graph["edges"].dump() << "\n";
  prompt << "\n";
  prompt << "STRUCTURE YOUR RESPONSE EXACTLY AS FOLLOWS:\n";
  prompt << "1. PROVIDE EXACTLY TWO SECTIONS.\n";
  prompt << "2. SECTION 1 TITLE: \"" << kSafetySectionTitle << "\"\n";
  prompt << "3. SECTION 2 TITLE: \"" << kPerformanceSectionTitle << "\"\n";
  prompt << "4. PROVIDE EXACTLY " << kMaxBulletsPerSection << " BULLET POINTS PER SECTION.\n";
  prompt << "5. KEEP BULLETS CONCISE AND PROFESSIONAL.\n";
  prompt << "\n";
  prompt << "DO NOT INCLUDE ANY INTRO OR OUTRO TEXT.\n";
  return prompt.str();
}

std::vector<AuditSection> ParseAuditReport(std::string_view report) {
  std::vector<AuditSection> sections;
  std::size_t begin = 0;
  while (begin < report.size()) {
    // A title at `begin` belongs to the current chunk; look for the next one after it.
    std::size_t end = next_title(report, begin + 1);
    if (end == std::string_view::npos) {
      end = report.size();
    }
    const std::string_view chunk = trim_view(report.substr(begin, end - begin));
    if (!chunk.empty()) {
      sections.push_back(parse_section(chunk));
    }
    begin = end;
  }
  return sections;
}

AuditOutcome RunAudit(AuditBackend& backend, const core::DesignState& design) {
  AuditOutcome outcome;
  std::optional<std::string> text;
  try {
    text = backend.Generate(BuildAuditPrompt(design));
  } catch (const std::exception& e) {
    outcome.error = e.what();
  }

  if (text.has_value() && !trim_view(*text).empty()) {
    outcome.report = std::move(*text);
    return outcome;
  }
  if (outcome.error.empty()) {
    outcome.error = "audit service returned no report";
  }
  outcome.report = FallbackAuditReport();
  outcome.used_fallback = true;
  return outcome;
}

}  // namespace proflex::io

#pragma once

#include <optional>
#include <string>

#include "proflex/io/audit.hpp"

namespace proflex::viewer {

// Sends the audit prompt to an Ollama server (POST /api/generate) and returns its `response` text.
class OllamaAuditBackend final : public io::AuditBackend {
 public:
  OllamaAuditBackend(std::string host, int port, std::string model);

  std::optional<std::string> Generate(const std::string& prompt) override;

 private:
  std::string host_;
  int port_;
  std::string model_;
};

}  // namespace proflex::viewer

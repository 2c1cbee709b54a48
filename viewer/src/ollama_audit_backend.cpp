#include "ollama_audit_backend.hpp"

#include <iostream>
#include <utility>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace proflex::viewer {

using json = nlohmann::json;

namespace {
// Low temperature keeps the two-section layout stable.
constexpr double kAuditTemperature = 0.2;
constexpr int kConnectTimeoutSec = 5;
constexpr int kReadTimeoutSec = 120;
}  // namespace

OllamaAuditBackend::OllamaAuditBackend(std::string host, int port, std::string model)
    : host_(std::move(host)), port_(port), model_(std::move(model)) {}

std::optional<std::string> OllamaAuditBackend::Generate(const std::string& prompt) {
  httplib::Client cli(host_, port_);
  cli.set_connection_timeout(kConnectTimeoutSec);
  cli.set_read_timeout(kReadTimeoutSec);

  const json request = {
      {"model", model_},
      {"prompt", prompt},
      {"stream", false},
      {"options", {{"temperature", kAuditTemperature}}},
  };

  auto res = cli.Post("/api/generate", request.dump(), "application/json");
  if (!res) {
    std::cerr << "[OllamaAuditBackend] Connection failed: " << httplib::to_string(res.error()) << std::endl;
    return std::nullopt;
  }
  if (res->status != 200) {
    std::cerr << "[OllamaAuditBackend] HTTP Error " << res->status << ": " << res->body << std::endl;
    return std::nullopt;
  }
  try {
    const json body = json::parse(res->body);
    if (body.contains("response") && body["response"].is_string()) {
      return body["response"].get<std::string>();
    }
    std::cerr << "[OllamaAuditBackend] Reply has no response field" << std::endl;
  } catch (const json::exception& e) {
    std::cerr << "[OllamaAuditBackend] JSON Parse Error: " << e.what() << std::endl;
  }
  return std::nullopt;
}

}  // namespace proflex::viewer

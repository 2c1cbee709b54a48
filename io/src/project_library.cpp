#include "proflex/io/project_library.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <random>
#include <sstream>
#include <utility>

namespace proflex::io {

using json = nlohmann::json;

namespace {

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

json entry_to_json(const RecentProject& entry) {
  return json{
      {"id", entry.id},
      {"name", entry.name},
      {"timestamp", entry.timestamp_ms},
      {"data", GraphToJson(entry.document)},
  };
}

core::EditResult<RecentProject> entry_from_json(const json& item) {
  core::EditResult<RecentProject> result;
  if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
    result.error = "library entry without id";
    return result;
  }
  RecentProject entry;
  entry.id = item["id"].get<std::string>();
  if (item.contains("name") && item["name"].is_string()) {
    entry.name = item["name"].get<std::string>();
  } else {
    entry.name = std::string(kDefaultProjectName);
  }
  if (item.contains("timestamp") && item["timestamp"].is_number()) {
    entry.timestamp_ms = item["timestamp"].get<std::int64_t>();
  }
  const json data = item.contains("data") ? item["data"] : json::object();
  auto document = ProjectFromJson(data);
  if (!document.ok) {
    result.error = "library entry " + entry.id + ": " + document.error;
    return result;
  }
  entry.document = std::move(document.value);
  entry.document.name = entry.name;
  result.ok = true;
  result.value = std::move(entry);
  return result;
}

}  // namespace

ProjectLibrary::ProjectLibrary(std::filesystem::path path) : path_(std::move(path)) {}

core::EditResult<std::size_t> ProjectLibrary::Load() {
  core::EditResult<std::size_t> result;
  entries_.clear();

  std::ifstream ifs(path_);
  if (!ifs.is_open()) {
    result.ok = true;
    return result;
  }
  std::ostringstream buffer;
  buffer << ifs.rdbuf();

  json root;
  try {
    root = json::parse(buffer.str());
  } catch (const json::exception& e) {
    result.error = std::string("recent projects unreadable: ") + e.what();
    return result;
  }
  if (!root.is_array()) {
    result.error = "recent projects must be an array";
    return result;
  }

  std::vector<RecentProject> loaded;
  for (const json& item : root) {
    auto entry = entry_from_json(item);
    if (!entry.ok) {
      result.error = entry.error;
      return result;
    }
    loaded.push_back(std::move(entry.value));
    if (loaded.size() == kMaxRecentProjects) {
      break;
    }
  }

  entries_ = std::move(loaded);
  result.ok = true;
  result.value = entries_.size();
  return result;
}

core::EditResult<std::string> ProjectLibrary::Save(std::string_view project_id, std::string_view name,
                                                   const core::DesignState& design, std::int64_t timestamp_ms) {
  core::EditResult<std::string> result;
  const std::string id = project_id.empty() ? MakeProjectId() : std::string(project_id);

  RecentProject entry;
  entry.id = id;
  entry.name = std::string(name);
  entry.timestamp_ms = timestamp_ms;
  entry.document = SnapshotDocument(design, name);

  std::vector<RecentProject> updated;
  updated.reserve(entries_.size() + 1);
  updated.push_back(std::move(entry));
  for (const RecentProject& existing : entries_) {
    if (existing.id != id && updated.size() < kMaxRecentProjects) {
      updated.push_back(existing);
    }
  }

  // The in-memory list only changes once the file holds the same content.
  const auto flushed = flush(updated);
  if (!flushed.ok) {
    result.error = flushed.error;
    return result;
  }
  entries_ = std::move(updated);
  result.ok = true;
  result.value = id;
  return result;
}

core::EditResult<std::string> ProjectLibrary::SaveAs(std::string_view name, const core::DesignState& design,
                                                     std::int64_t timestamp_ms) {
  if (is_blank(name)) {
    core::EditResult<std::string> result;
    result.error = "project name must not be empty";
    return result;
  }
  return Save({}, name, design, timestamp_ms);
}

const RecentProject* ProjectLibrary::Find(std::string_view project_id) const {
  for (const RecentProject& entry : entries_) {
    if (entry.id == project_id) {
      return &entry;
    }
  }
  return nullptr;
}

core::EditResult<bool> ProjectLibrary::flush(const std::vector<RecentProject>& entries) const {
  core::EditResult<bool> result;
  json root = json::array();
  for (const RecentProject& entry : entries) {
    root.push_back(entry_to_json(entry));
  }

  std::ofstream ofs(path_, std::ios::trunc);
  if (!ofs.is_open()) {
    result.error = "cannot write " + path_.string();
    return result;
  }
  ofs << root.dump() << "\n";
  if (!ofs) {
    result.error = "write failed: " + path_.string();
    return result;
  }
  result.ok = true;
  result.value = true;
  return result;
}

std::string MakeProjectId() {
  static constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
  std::string id(9, '0');
  for (char& c : id) {
    c = kAlphabet[pick(engine)];
  }
  return id;
}

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace proflex::io

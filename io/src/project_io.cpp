#include "proflex/io/project_io.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace proflex::io {

using json = nlohmann::json;

namespace {

bool read_id(const json& value, std::string* out) {
  if (value.is_string()) {
    *out = value.get<std::string>();
    return !out->empty();
  }
  if (value.is_number_integer() || value.is_number_unsigned()) {
    *out = value.dump();
    return true;
  }
  return false;
}

bool read_number(const json& object, const char* key, double fallback, double* out) {
  if (!object.contains(key)) {
    *out = fallback;
    return true;
  }
  const json& value = object.at(key);
  if (!value.is_number()) {
    return false;
  }
  *out = value.get<double>();
  return true;
}

json node_to_json(const core::Node& node) {
  return json{
      {"id", std::to_string(node.id)},
      {"type", core::traits_of(node.type).key},
      {"x", node.position.x},
      {"y", node.position.y},
      {"name", node.name},
      {"btu", node.demand},
  };
}

json edge_to_json(const core::Edge& edge) {
  return json{
      {"id", std::to_string(edge.id)},
      {"from", std::to_string(edge.from_node_id)},
      {"to", std::to_string(edge.to_node_id)},
      {"size", core::spec_of(edge.size).label},
      {"length", edge.length_ft},
  };
}

template <typename NodeRange, typename EdgeRange>
json graph_to_json(const NodeRange& node_items, const EdgeRange& edge_items) {
  json nodes = json::array();
  for (const core::Node& node : node_items) {
    nodes.push_back(node_to_json(node));
  }
  json edges = json::array();
  for (const core::Edge& edge : edge_items) {
    edges.push_back(edge_to_json(edge));
  }
  return json{{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
}

}  // namespace

json GraphToJson(const core::DesignState& design) {
  return graph_to_json(design.nodes().items(), design.edges().items());
}

json GraphToJson(const ProjectDocument& document) {
  return graph_to_json(document.nodes, document.edges);
}

ProjectDocument SnapshotDocument(const core::DesignState& design, std::string_view project_name) {
  ProjectDocument document;
  document.name = std::string(project_name);
  document.nodes.assign(design.nodes().items().begin(), design.nodes().items().end());
  document.edges.assign(design.edges().items().begin(), design.edges().items().end());
  return document;
}

json ProjectToJson(const core::DesignState& design, std::string_view project_name) {
  json root = GraphToJson(design);
  root["projectName"] = std::string(project_name);
  return root;
}

core::EditResult<ProjectDocument> ProjectFromJson(const json& root) {
  core::EditResult<ProjectDocument> result;
  if (!root.is_object()) {
    result.error = "project root must be an object";
    return result;
  }

  ProjectDocument document;
  document.name = std::string(kImportedProjectName);
  if (root.contains("projectName") && root["projectName"].is_string()) {
    document.name = root["projectName"].get<std::string>();
  }

  core::IdGenerator ids;
  std::unordered_map<std::string, core::ObjectId> node_id_by_file_id;

  if (root.contains("nodes")) {
    const json& nodes = root["nodes"];
    if (!nodes.is_array()) {
      result.error = "nodes must be an array";
      return result;
    }
    for (const json& item : nodes) {
      if (!item.is_object()) {
        result.error = "node entry must be an object";
        return result;
      }
      std::string file_id;
      if (!item.contains("id") || !read_id(item["id"], &file_id)) {
        result.error = "node id missing";
        return result;
      }
      if (node_id_by_file_id.contains(file_id)) {
        result.error = "duplicate node id: " + file_id;
        return result;
      }
      if (!item.contains("type") || !item["type"].is_string()) {
        result.error = "node type missing: " + file_id;
        return result;
      }
      const auto type = core::node_type_from_key(item["type"].get<std::string>());
      if (!type.has_value()) {
        result.error = "unknown node type: " + item["type"].get<std::string>();
        return result;
      }

      core::Node node{};
      node.id = ids.next();
      node.type = *type;
      if (!read_number(item, "x", core::kDefaultNodePosition.x, &node.position.x) ||
          !read_number(item, "y", core::kDefaultNodePosition.y, &node.position.y) ||
          !read_number(item, "btu", 0.0, &node.demand)) {
        result.error = "node has a non-numeric field: " + file_id;
        return result;
      }
      if (node.demand < 0.0) {
        result.error = "node demand must be >= 0: " + file_id;
        return result;
      }
      if (item.contains("name") && item["name"].is_string()) {
        node.name = item["name"].get<std::string>();
      } else {
        node.name = core::traits_of(node.type).default_name;
      }
      node_id_by_file_id.emplace(file_id, node.id);
      document.nodes.push_back(std::move(node));
    }
  }

  if (root.contains("edges")) {
    const json& edges = root["edges"];
    if (!edges.is_array()) {
      result.error = "edges must be an array";
      return result;
    }
    for (const json& item : edges) {
      if (!item.is_object()) {
        result.error = "edge entry must be an object";
        return result;
      }
      std::string from_id;
      std::string to_id;
      if (!item.contains("from") || !read_id(item["from"], &from_id) || !item.contains("to") ||
          !read_id(item["to"], &to_id)) {
        result.error = "edge endpoints missing";
        return result;
      }

      core::Edge edge{};
      edge.id = ids.next();
      auto from_it = node_id_by_file_id.find(from_id);
      auto to_it = node_id_by_file_id.find(to_id);
      edge.from_node_id = (from_it == node_id_by_file_id.end()) ? core::kInvalidObjectId : from_it->second;
      edge.to_node_id = (to_it == node_id_by_file_id.end()) ? core::kInvalidObjectId : to_it->second;
      if (item.contains("size")) {
        const json& size_value = item["size"];
        const auto size = size_value.is_string() ? core::pipe_size_from_label(size_value.get<std::string>())
                                                 : std::nullopt;
        if (!size.has_value()) {
          result.error = "unknown pipe size: " + size_value.dump();
          return result;
        }
        edge.size = *size;
      }
      if (!read_number(item, "length", core::kDefaultEdgeLengthFt, &edge.length_ft)) {
        result.error = "edge length must be numeric";
        return result;
      }
      document.edges.push_back(edge);
    }
  }

  result.ok = true;
  result.value = std::move(document);
  return result;
}

core::EditResult<ProjectDocument> ParseProjectText(std::string_view text) {
  core::EditResult<ProjectDocument> result;
  try {
    return ProjectFromJson(json::parse(std::string(text)));
  } catch (const json::exception& e) {
    result.error = std::string("invalid project file: ") + e.what();
    return result;
  }
}

core::EditResult<ProjectDocument> LoadProjectFile(const std::filesystem::path& path) {
  core::EditResult<ProjectDocument> result;
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    result.error = "cannot open " + path.string();
    return result;
  }
  std::ostringstream buffer;
  buffer << ifs.rdbuf();
  return ParseProjectText(buffer.str());
}

core::EditResult<bool> SaveProjectFile(const std::filesystem::path& path, const core::DesignState& design,
                                       std::string_view project_name) {
  core::EditResult<bool> result;
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs.is_open()) {
    result.error = "cannot write " + path.string();
    return result;
  }
  ofs << ProjectToJson(design, project_name).dump(2) << "\n";
  if (!ofs) {
    result.error = "write failed: " + path.string();
    return result;
  }
  result.ok = true;
  result.value = true;
  return result;
}

core::EditResult<bool> ApplyDocument(core::Editor& editor, ProjectDocument document) {
  return editor.ReplaceDesign(std::move(document.nodes), std::move(document.edges));
}

}  // namespace proflex::io

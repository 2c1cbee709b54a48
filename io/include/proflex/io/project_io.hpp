#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "proflex/core/design_state.hpp"
#include "proflex/core/editor.hpp"

namespace proflex::io {

inline constexpr std::string_view kDefaultProjectName = "New Project";
inline constexpr std::string_view kImportedProjectName = "Imported Design";
inline constexpr std::string_view kProjectFileExtension = ".proflex";

// Deserialized `{ projectName, nodes, edges }`. Ids are already remapped to in-memory ids.
struct ProjectDocument {
  std::string name{};
  std::vector<core::Node> nodes{};
  std::vector<core::Edge> edges{};
};

// `{ nodes: [...], edges: [...] }` in file field naming (x, y, btu, from, to, length).
[[nodiscard]] nlohmann::json GraphToJson(const core::DesignState& design);
[[nodiscard]] nlohmann::json GraphToJson(const ProjectDocument& document);
[[nodiscard]] nlohmann::json ProjectToJson(const core::DesignState& design, std::string_view project_name);

// Copy of the current graph, ids unchanged.
[[nodiscard]] ProjectDocument SnapshotDocument(const core::DesignState& design, std::string_view project_name);

// File ids are opaque strings (numbers are accepted too) and are replaced by fresh ids; edges whose
// endpoints are not in the file keep an invalid endpoint and carry no flow.
[[nodiscard]] core::EditResult<ProjectDocument> ProjectFromJson(const nlohmann::json& root);
[[nodiscard]] core::EditResult<ProjectDocument> ParseProjectText(std::string_view text);
[[nodiscard]] core::EditResult<ProjectDocument> LoadProjectFile(const std::filesystem::path& path);
core::EditResult<bool> SaveProjectFile(
    const std::filesystem::path& path,
    const core::DesignState& design,
    std::string_view project_name);

// Replaces the editor's design; on failure the editor is untouched.
core::EditResult<bool> ApplyDocument(core::Editor& editor, ProjectDocument document);

}  // namespace proflex::io

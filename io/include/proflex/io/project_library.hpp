#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "proflex/core/design_state.hpp"
#include "proflex/io/project_io.hpp"

namespace proflex::io {

inline constexpr std::size_t kMaxRecentProjects = 15;
inline constexpr std::string_view kDefaultLibraryFile = "proflex_recents.json";

struct RecentProject {
  std::string id{};
  std::string name{};
  std::int64_t timestamp_ms = 0;
  ProjectDocument document{};
};

// Recently saved designs, newest first, persisted as one JSON array:
// `[{ id, name, timestamp, data: { nodes, edges } }, ...]`.
class ProjectLibrary {
 public:
  explicit ProjectLibrary(std::filesystem::path path);

  // A missing file is an empty library. A corrupt file also leaves the library empty, but is
  // reported through the result so the caller can log it.
  core::EditResult<std::size_t> Load();

  // Stores the design under `project_id`, or under a fresh id when it is empty. The entry moves to
  // the front; older entries past kMaxRecentProjects are dropped. Returns the id used.
  core::EditResult<std::string> Save(
      std::string_view project_id,
      std::string_view name,
      const core::DesignState& design,
      std::int64_t timestamp_ms);
  // Always stores under a fresh id. The name must not be blank.
  core::EditResult<std::string> SaveAs(std::string_view name, const core::DesignState& design, std::int64_t timestamp_ms);

  [[nodiscard]] const RecentProject* Find(std::string_view project_id) const;
  [[nodiscard]] const std::vector<RecentProject>& entries() const { return entries_; }
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  core::EditResult<bool> flush(const std::vector<RecentProject>& entries) const;

  std::filesystem::path path_;
  std::vector<RecentProject> entries_{};
};

// 9 random characters from [0-9a-z].
[[nodiscard]] std::string MakeProjectId();
[[nodiscard]] std::int64_t NowMillis();

}  // namespace proflex::io

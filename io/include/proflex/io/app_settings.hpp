#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

#include "proflex/core/design_state.hpp"
#include "proflex/core/interaction.hpp"

namespace proflex::io {

inline constexpr std::string_view kAppSettingsFile = "proflex_viewer.ini";

// Persisted viewer preferences, `key=value` per line. Unknown keys and malformed values are
// skipped; out-of-range values are clamped.
struct AppSettings {
  int window_width = 1280;
  int window_height = 720;
  double design_pressure_drop = core::kDefaultDesignPressureDrop;
  core::PipeSize default_pipe_size = core::PipeSize::kHalf;
  double default_edge_length_ft = core::kDefaultEdgeLengthFt;
  double mouse_drag_threshold = 8.0;
  double touch_drag_threshold = 30.0;
  std::int64_t double_tap_window_ms = 500;
  std::string library_path = "proflex_recents.json";
  std::string audit_host = "localhost";
  int audit_port = 11434;
  std::string audit_model = "llama3";
};

[[nodiscard]] AppSettings ParseAppSettings(std::istream& in);
// Defaults when the file does not exist.
[[nodiscard]] AppSettings LoadAppSettings(const std::filesystem::path& path);
void WriteAppSettings(std::ostream& out, const AppSettings& settings);
bool SaveAppSettings(const std::filesystem::path& path, const AppSettings& settings);

[[nodiscard]] core::DesignSettings ToDesignSettings(const AppSettings& settings);
[[nodiscard]] core::InteractionSettings ToInteractionSettings(const AppSettings& settings);

}  // namespace proflex::io

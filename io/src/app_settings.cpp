#include "proflex/io/app_settings.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace proflex::io {

namespace {

std::string trim(const std::string& text) {
  const std::size_t begin = text.find_first_not_of(" \t\r");
  if (begin == std::string::npos) {
    return {};
  }
  const std::size_t end = text.find_last_not_of(" \t\r");
  return text.substr(begin, end - begin + 1);
}

double parse_positive(const std::string& value) {
  const double parsed = std::stod(value);
  if (!(parsed > 0.0)) {
    throw std::invalid_argument("value must be > 0");
  }
  return parsed;
}

}  // namespace

AppSettings ParseAppSettings(std::istream& in) {
  AppSettings settings{};
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty() || line.front() == '#' || line.front() == ';') {
      continue;
    }
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= line.size()) {
      continue;
    }
    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));
    if (value.empty()) {
      continue;
    }
    try {
      if (key == "window_width") {
        settings.window_width = std::max(640, std::stoi(value));
      } else if (key == "window_height") {
        settings.window_height = std::max(480, std::stoi(value));
      } else if (key == "design_pressure_drop") {
        settings.design_pressure_drop = std::clamp(parse_positive(value), 0.01, 10.0);
      } else if (key == "default_pipe_size") {
        if (const auto size = core::pipe_size_from_label(value)) {
          settings.default_pipe_size = *size;
        }
      } else if (key == "default_edge_length_ft") {
        settings.default_edge_length_ft = std::min(parse_positive(value), 1000.0);
      } else if (key == "mouse_drag_threshold") {
        settings.mouse_drag_threshold = std::clamp(parse_positive(value), 1.0, 100.0);
      } else if (key == "touch_drag_threshold") {
        settings.touch_drag_threshold = std::clamp(parse_positive(value), 1.0, 200.0);
      } else if (key == "double_tap_window_ms") {
        settings.double_tap_window_ms = std::clamp<std::int64_t>(std::stoll(value), 100, 2000);
      } else if (key == "library_path") {
        settings.library_path = value;
      } else if (key == "audit_host") {
        settings.audit_host = value;
      } else if (key == "audit_port") {
        settings.audit_port = std::clamp(std::stoi(value), 1, 65535);
      } else if (key == "audit_model") {
        settings.audit_model = value;
      }
    } catch (const std::exception&) {
      // Malformed line: keep the default.
    }
  }
  return settings;
}

AppSettings LoadAppSettings(const std::filesystem::path& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return AppSettings{};
  }
  return ParseAppSettings(ifs);
}

void WriteAppSettings(std::ostream& out, const AppSettings& settings) {
  out << "window_width=" << settings.window_width << "\n";
  out << "window_height=" << settings.window_height << "\n";
  out << "design_pressure_drop=" << settings.design_pressure_drop << "\n";
  out << "default_pipe_size=" << core::spec_of(settings.default_pipe_size).label << "\n";
  out << "default_edge_length_ft=" << settings.default_edge_length_ft << "\n";
  out << "mouse_drag_threshold=" << settings.mouse_drag_threshold << "\n";
  out << "touch_drag_threshold=" << settings.touch_drag_threshold << "\n";
  out << "double_tap_window_ms=" << settings.double_tap_window_ms << "\n";
  out << "library_path=" << settings.library_path << "\n";
  out << "audit_host=" << settings.audit_host << "\n";
  out << "audit_port=" << settings.audit_port << "\n";
  out << "audit_model=" << settings.audit_model << "\n";
}

bool SaveAppSettings(const std::filesystem::path& path, const AppSettings& settings) {
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs.is_open()) {
    return false;
  }
  WriteAppSettings(ofs, settings);
  return static_cast<bool>(ofs);
}

core::DesignSettings ToDesignSettings(const AppSettings& settings) {
  core::DesignSettings design{};
  design.design_pressure_drop = settings.design_pressure_drop;
  design.default_pipe_size = settings.default_pipe_size;
  design.default_edge_length_ft = settings.default_edge_length_ft;
  return design;
}

core::InteractionSettings ToInteractionSettings(const AppSettings& settings) {
  core::InteractionSettings interaction{};
  interaction.pipe_size = settings.default_pipe_size;
  interaction.edge_length_ft = settings.default_edge_length_ft;
  interaction.mouse_drag_threshold = settings.mouse_drag_threshold;
  interaction.touch_drag_threshold = settings.touch_drag_threshold;
  interaction.double_tap_window_ms = settings.double_tap_window_ms;
  return interaction;
}

}  // namespace proflex::io

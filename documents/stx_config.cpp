#include "stx_config.h"
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace {

  // unset and empty variables both mean "use the built-in value"
  stx_string setting(const char* name, const stx_string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
      return fallback;
    }
    return stx_string(value);
  }

}

bool parse_output_kind(const stx_string& name, stx_output_kind& kind) {
  stx_string lower = name.trim().to_lower();
  if (lower == "latex-pdf") kind = stx_output_kind::LATEX_PDF;
  else if (lower == "latex-eps") kind = stx_output_kind::LATEX_EPS;
  else if (lower == "latex-png") kind = stx_output_kind::LATEX_PNG;
  else if (lower == "pdf") kind = stx_output_kind::PDF;
  else if (lower == "eps") kind = stx_output_kind::EPS;
  else if (lower == "png") kind = stx_output_kind::PNG;
  else return false;
  return true;
}

stx_string output_kind_name(stx_output_kind kind) {
  switch (kind) {
    case stx_output_kind::LATEX_PDF: return "latex-pdf";
    case stx_output_kind::LATEX_EPS: return "latex-eps";
    case stx_output_kind::LATEX_PNG: return "latex-png";
    case stx_output_kind::PDF: return "pdf";
    case stx_output_kind::EPS: return "eps";
    case stx_output_kind::PNG: return "png";
  }
  return "";
}

stx::render::artifact_format output_artifact_format(stx_output_kind kind) {
  switch (kind) {
    case stx_output_kind::LATEX_EPS:
    case stx_output_kind::EPS:
      return stx::render::artifact_format::EPS;
    case stx_output_kind::LATEX_PNG:
    case stx_output_kind::PNG:
      return stx::render::artifact_format::PNG;
    case stx_output_kind::LATEX_PDF:
    case stx_output_kind::PDF:
    default:
      return stx::render::artifact_format::PDF;
  }
}

bool has_overlay(stx_output_kind kind) {
  return kind == stx_output_kind::LATEX_PDF ||
         kind == stx_output_kind::LATEX_EPS ||
         kind == stx_output_kind::LATEX_PNG;
}

stx_config stx_config::from_environment() {
  stx_config config;
  config.inkscape = setting("STX_INKSCAPE", config.inkscape);
  config.inkscape_legacy = setting("STX_INKSCAPE_LEGACY", "0").trim() == "1";

  stx_string dpi = setting("STX_DPI", "");
  if (!dpi.empty()) {
    double value = 0.0;
    if (dpi.parse_double(value) && value > 0.0) {
      config.dpi = value;
    } else {
      std::cerr << "Warning: Ignoring invalid STX_DPI '" << dpi.c_str() << "'" << std::endl;
    }
  }

  config.tmpdir = setting("STX_TMPDIR", setting("TMPDIR", config.tmpdir));

  stx_style_tables::add_entries(config.tables.font_families, setting("STX_FONT_FAMILIES", ""));
  stx_style_tables::add_entries(config.tables.font_sizes, setting("STX_FONT_SIZES", ""));
  return config;
}

size_t stx_config::load_settings_file(const stx_string& path) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) {
    return 0;
  }

  size_t count = 0;
  std::string raw;
  while (std::getline(in, raw)) {
    stx_string line = stx_string(raw).trim();
    if (line.empty() || line.starts_with("#")) {
      continue;
    }
    if (line.starts_with("export ")) {
      line = line.substr(7).trim();
    }

    stx_string name;
    stx_string value;
    line.partition("=", name, value);
    name = name.trim();
    if (name.empty() || !line.contains("=") || name.contains(" ")) {
      continue;
    }
    if (setenv(name.c_str(), value.trim().unquote().c_str(), 1) == 0) {
      ++count;
    }
  }
  return count;
}

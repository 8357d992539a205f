#ifndef STX_CONFIG_H
#define STX_CONFIG_H

#include "../utils/stx_string.h"
#include "render/stx_renderer.h"
#include "svg/stx_svg_style.h"
#include "svg/stx_svg_units.h"

enum class stx_output_kind {
  LATEX_PDF,
  LATEX_EPS,
  LATEX_PNG,
  PDF,
  EPS,
  PNG
};

// "latex-pdf", "latex-eps", "latex-png", "pdf", "eps", "png"
bool parse_output_kind(const stx_string& name, stx_output_kind& kind);
stx_string output_kind_name(stx_output_kind kind);

// Format of the rendered background (or of the whole drawing for plain kinds)
stx::render::artifact_format output_artifact_format(stx_output_kind kind);

// true for the latex-* kinds that strip text and write an overlay
bool has_overlay(stx_output_kind kind);

struct stx_config {
  stx_string inkscape = "inkscape";
  bool inkscape_legacy = false;
  double dpi = stx_units::default_dpi;
  stx_string tmpdir = "/tmp";
  stx_style_tables tables = stx_style_tables::defaults();

  // STX_INKSCAPE, STX_INKSCAPE_LEGACY, STX_DPI, STX_TMPDIR / TMPDIR,
  // STX_FONT_FAMILIES, STX_FONT_SIZES
  static stx_config from_environment();

  // Exports the NAME=value lines of a settings file (usually .env) so that
  // from_environment() picks them up. Comment lines and lines without '=' are
  // skipped; an "export " prefix and one pair of quotes are dropped.
  // Returns the number of variables set, 0 when the file cannot be opened.
  static size_t load_settings_file(const stx_string& path);
};

#endif // STX_CONFIG_H

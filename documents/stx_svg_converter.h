#ifndef STX_SVG_CONVERTER_H
#define STX_SVG_CONVERTER_H

#include "../utils/stx_string.h"
#include "stx_config.h"
#include "render/stx_renderer.h"
#include "svg/stx_svg_style.h"
#include <exception>
#include <vector>

// Output files of one conversion
struct stx_conversion_output {
  stx_string artifact_path;
  stx_string overlay_path;   // empty for plain pdf/eps/png
  size_t label_count = 0;
};

// extract -> query original -> query + render stripped -> reconcile -> emit.
// The renderer is borrowed and must outlive the converter.
class stx_svg_converter
{
  stx_config config;
  stx::render::i_renderer& renderer;
  std::vector<stx_style_warning> warnings;
  size_t label_count = 0;

public:
  stx_svg_converter(const stx_config& config, stx::render::i_renderer& renderer);

  // Writes <output_stem>.<ext> and, for the latex kinds, <output_stem>.<ext>_tex.
  // Nothing is written under the final names when a step fails.
  stx_conversion_output convert(const stx_string& svg_path, const stx_string& output_stem, stx_output_kind kind);

  // Runs the overlay pipeline and returns the picture markup. The stripped
  // drawing is rendered to background_path, background_name is what the
  // markup passes to \includegraphics.
  stx_string convert_to_latex(const stx_string& svg_path,
                              const stx_string& background_path,
                              const stx_string& background_name,
                              stx::render::artifact_format format);

  // Unmapped style values of the last conversion
  const std::vector<stx_style_warning>& get_warnings() const { return warnings; }

  // "drawing.svg" -> "drawing", "dir/drawing.svg" -> "dir/drawing"
  static stx_string default_output_stem(const stx_string& svg_path);

  // "Error: <svg_path>: <what>" for reporting a failed conversion
  static stx_string error_message(const stx_string& svg_path, const std::exception& e);

private:
  static void require_input(const stx_string& svg_path);
};

#endif // STX_SVG_CONVERTER_H

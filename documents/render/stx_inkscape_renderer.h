#ifndef STX_INKSCAPE_RENDERER_H
#define STX_INKSCAPE_RENDERER_H

#include "stx_renderer.h"
#include <vector>

namespace stx::render {
  // Runs the Inkscape command line. Inkscape 1.x syntax by default,
  // legacy selects the 0.92 flags (--without-gui, --export-pdf=...).
  class inkscape_renderer final : public i_renderer {
    stx_string executable;
    bool legacy;
    double dpi;
  public:
    inkscape_renderer(const stx_string& executable, bool legacy, double dpi);

    stx_box_map query_boxes(const stx_string& svg_path) override;
    artifact_info render(const stx_string& svg_path, const stx_string& out_path, artifact_format format) override;

    std::vector<stx_string> query_command(const stx_string& svg_path) const;
    std::vector<stx_string> export_command(const stx_string& svg_path, const stx_string& out_path, artifact_format format) const;

    // Parses "id,x,y,w,h" lines; malformed lines are skipped with a warning
    static stx_box_map parse_query_output(const stx_string& output);
  };
} // namespace stx::render

#endif // STX_INKSCAPE_RENDERER_H

#ifndef STX_RENDERER_H
#define STX_RENDERER_H

#include "../../utils/stx_string.h"
#include "../layout/stx_box_map.h"

namespace stx::render {
  enum class artifact_format {
    PDF,
    EPS,
    PNG
  };

  // "pdf", "eps" or "png"
  stx_string format_extension(artifact_format format);

  // What the renderer produced. Size is in bp for PDF, in pixels for PNG
  // and zero for EPS.
  struct artifact_info {
    artifact_format format = artifact_format::PDF;
    stx_string path;
    unsigned int pages = 0;
    double width = 0.0;
    double height = 0.0;
  };

  // External vector renderer. Both calls block; a failed run throws
  // stx_renderer_failure and nothing after it may run.
  class i_renderer {
  public:
    virtual ~i_renderer() = default;

    // Element id -> box in document user units, in renderer output order
    virtual stx_box_map query_boxes(const stx_string& svg_path) = 0;

    // Exports the drawing area of svg_path to out_path
    virtual artifact_info render(const stx_string& svg_path, const stx_string& out_path, artifact_format format) = 0;
  };
} // namespace stx::render

#endif // STX_RENDERER_H

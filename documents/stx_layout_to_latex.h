#ifndef STX_LAYOUT_TO_LATEX_H
#define STX_LAYOUT_TO_LATEX_H

#include "../utils/stx_string.h"
#include "stx_bbox_reconciler.h"
#include "layout/stx_label.h"
#include "svg/stx_svg_units.h"
#include <memory>
#include <vector>

// Writes the LaTeX picture overlay for one converted drawing
class stx_layout_to_latex
{
public:
  explicit stx_layout_to_latex(double dpi = stx_units::default_dpi);

  // Main conversion method. background is the file name given to
  // \includegraphics, relative to the overlay file.
  stx_string convert_to_picture(const stx_canonical_frame& frame,
                                const stx_layout_bounds& pdf_box,
                                const stx_string& background,
                                const std::vector<std::unique_ptr<stx_label>>& labels) const;

private:
  double dpi;

  stx_string generate_preamble(const stx_canonical_frame& frame) const;
  stx_string generate_background_put(const stx_canonical_frame& frame,
                                     const stx_layout_bounds& pdf_box,
                                     const stx_string& background) const;
  stx_string generate_label_put(const stx_canonical_frame& frame, const stx_label& label) const;

  // document x/y -> picture units, origin at the lower left frame corner
  static double normalize_x(const stx_canonical_frame& frame, double x);
  static double normalize_y(const stx_canonical_frame& frame, double y);
  static void check_unit_width(const stx_canonical_frame& frame);
};

#endif // STX_LAYOUT_TO_LATEX_H

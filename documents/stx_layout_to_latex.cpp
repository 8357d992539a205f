#include "stx_layout_to_latex.h"
#include "../utils/stx_exceptions.h"
#include "../utils/stx_number_format.h"
#include <cmath>
#include <sstream>

namespace {

  const char* const picture_preamble_head =
    "% Picture generated by svgtex\n"
    "\\makeatletter\n"
    "\\providecommand\\color[2][]{%\n"
    "  \\errmessage{(svgtex) Color is used for the text in Inkscape,\n"
    "    but the package 'color.sty' is not loaded}%\n"
    "  \\renewcommand\\color[2][]{}}%\n"
    "\\providecommand\\transparent[1]{%\n"
    "  \\errmessage{\n"
    "    (svgtex) Transparency is used for the text in Inkscape,\n"
    "    but the package 'transparent.sty' is not loaded}%\n"
    "  \\renewcommand\\transparent[1]{}}%\n";

  const char* const picture_preamble_tail =
    "\\global\\let\\svgwidth\\undefined%\n"
    "\\makeatother\n";

}

stx_layout_to_latex::stx_layout_to_latex(double dpi) : dpi(dpi) {
}

stx_string stx_layout_to_latex::convert_to_picture(const stx_canonical_frame& frame,
                                                   const stx_layout_bounds& pdf_box,
                                                   const stx_string& background,
                                                   const std::vector<std::unique_ptr<stx_label>>& labels) const {
  check_unit_width(frame);

  std::vector<stx_string> puts;
  puts.push_back(generate_background_put(frame, pdf_box, background));
  for (const auto& label : labels) {
    puts.push_back(generate_label_put(frame, *label));
  }

  stx_string height = stx_format_number(frame.height() / frame.width(), 3);

  stx_string tex = "\\begingroup%\n";
  tex += generate_preamble(frame);
  tex += stx_string("\\begin{picture}(1.0, ") + height + ")%\n";
  tex += stx_string("\n").join(puts) + "\n";
  tex += "\\end{picture}%\n";
  tex += "\\endgroup%\n";
  return tex;
}

// ============================================================================
// Picture parts
// ============================================================================

stx_string stx_layout_to_latex::generate_preamble(const stx_canonical_frame& frame) const {
  stx_string width_bp = stx_format_number(stx_units::user_units_to_big_points(frame.width(), dpi), 3);

  stx_string preamble = picture_preamble_head;
  preamble += "\\ifx\\svgwidth\\undefined%\n";
  preamble += stx_string("  \\setlength{\\unitlength}{") + width_bp + "bp}%\n";
  preamble += "\\else%\n";
  preamble += "  \\setlength{\\unitlength}{\\svgwidth}%\n";
  preamble += "\\fi%\n";
  preamble += picture_preamble_tail;
  return preamble;
}

stx_string stx_layout_to_latex::generate_background_put(const stx_canonical_frame& frame,
                                                        const stx_layout_bounds& pdf_box,
                                                        const stx_string& background) const {
  // lower left corner of the rendered area
  double x = normalize_x(frame, pdf_box.get_left());
  double y = normalize_y(frame, pdf_box.get_bottom());
  double scale = pdf_box.width / frame.width();

  return stx_string("\\put(") + stx_format_number(x, 3) + ", " + stx_format_number(y, 3) + "){"
       + "\\includegraphics[width=" + stx_format_number(scale, 6) + "\\unitlength]{" + background + "}"
       + "}%";
}

stx_string stx_layout_to_latex::generate_label_put(const stx_canonical_frame& frame, const stx_label& label) const {
  double x = normalize_x(frame, label.pos.x);
  double y = normalize_y(frame, label.pos.y);
  return stx_string("\\put(") + stx_format_number(x, 3) + ", " + stx_format_number(y, 3) + "){"
       + label.texcode() + "}%";
}

// ============================================================================
// Normalization
// ============================================================================

double stx_layout_to_latex::normalize_x(const stx_canonical_frame& frame, double x) {
  return (x - frame.x_min) / frame.width();
}

double stx_layout_to_latex::normalize_y(const stx_canonical_frame& frame, double y) {
  // SVG y grows downwards, picture y upwards
  return ((frame.height() + frame.y_min) - y) / frame.width();
}

void stx_layout_to_latex::check_unit_width(const stx_canonical_frame& frame) {
  double unit = frame.width();
  if (!std::isfinite(unit) || !(unit > 0.0)) {
    throw stx_reconciliation_error("Canonical frame width must be positive");
  }
  double normalized = normalize_x(frame, frame.x_max);
  if (std::fabs(normalized - 1.0) > 1e-9) {
    std::ostringstream msg;
    msg.precision(17);
    msg << "Normalized frame width is " << normalized << ", expected 1";
    throw stx_reconciliation_error(stx_string(msg.str()));
  }
}

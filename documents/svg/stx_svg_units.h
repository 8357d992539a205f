#ifndef STX_SVG_UNITS_H
#define STX_SVG_UNITS_H

#include "../../utils/stx_string.h"
#include <stdexcept>

namespace stx_units {
  // 96 SVG user units (px) per inch, 72 PostScript big points per inch
  const double default_dpi = 96.0;
  const double big_points_per_inch = 72.0;

  /**
   * @brief Converts an SVG length ("210mm", "4in", "300", "12pt") to user units.
   * @param length Length attribute text, unit suffix optional.
   * @param dpi User units per inch.
   * @param out Converted value.
   * @return false when the number or the unit cannot be interpreted.
   */
  inline bool length_to_user_units(const stx_string& length, double dpi, double& out) {
    if (dpi <= 0) {
      throw std::invalid_argument("DPI must be positive.");
    }
    stx_string text = length.trim();
    double per_unit = 1.0;
    size_t suffix_len = 0;
    if (text.ends_with("px")) { per_unit = 1.0; suffix_len = 2; }
    else if (text.ends_with("mm")) { per_unit = dpi / 25.4; suffix_len = 2; }
    else if (text.ends_with("cm")) { per_unit = dpi / 2.54; suffix_len = 2; }
    else if (text.ends_with("in")) { per_unit = dpi; suffix_len = 2; }
    else if (text.ends_with("pt")) { per_unit = dpi / 72.0; suffix_len = 2; }
    else if (text.ends_with("pc")) { per_unit = dpi / 6.0; suffix_len = 2; }

    double value = 0.0;
    if (!text.substr(0, text.size() - suffix_len).parse_double(value)) {
      return false;
    }
    out = value * per_unit;
    return true;
  }

  inline double user_units_to_inches(double value, double dpi) {
    return value / dpi;
  }

  inline double user_units_to_big_points(double value, double dpi) {
    return value * big_points_per_inch / dpi;
  }
} // namespace stx_units

#endif // STX_SVG_UNITS_H

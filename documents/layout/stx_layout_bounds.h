#ifndef STX_LAYOUT_BOUNDS_H
#define STX_LAYOUT_BOUNDS_H

#include "../../utils/stx_geometry.h"
#include <vector>

// Axis-aligned box in document user units, y axis pointing down
// (top = y, bottom = y + height).
class stx_layout_bounds
{
public:
  double x = 0.0;
  double y = 0.0;
  double width = 0.0;
  double height = 0.0;

  stx_layout_bounds();
  stx_layout_bounds(double x_val, double y_val, double width_val, double height_val);

  // Smallest box holding every point; an empty list yields a zero box at the origin.
  static stx_layout_bounds from_points(const std::vector<stx_point>& points);

  double get_left() const;
  double get_right() const;
  double get_top() const;
  double get_bottom() const;

  stx_point top_left() const;
  stx_point top_right() const;
  stx_point bottom_left() const;
  stx_point bottom_right() const;

  bool operator==(const stx_layout_bounds& other) const;
};

#endif // STX_LAYOUT_BOUNDS_H

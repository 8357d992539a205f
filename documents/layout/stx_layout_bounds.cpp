#include "stx_layout_bounds.h"
#include <algorithm>

stx_layout_bounds::stx_layout_bounds() {}

stx_layout_bounds::stx_layout_bounds(double x_val, double y_val, double width_val, double height_val)
  : x(x_val), y(y_val), width(width_val), height(height_val)
{
}

stx_layout_bounds stx_layout_bounds::from_points(const std::vector<stx_point>& points) {
  if (points.empty()) {
    return stx_layout_bounds();
  }
  double x_min = points[0].x;
  double x_max = points[0].x;
  double y_min = points[0].y;
  double y_max = points[0].y;
  for (const auto& p : points) {
    x_min = std::min(x_min, p.x);
    x_max = std::max(x_max, p.x);
    y_min = std::min(y_min, p.y);
    y_max = std::max(y_max, p.y);
  }
  return stx_layout_bounds(x_min, y_min, x_max - x_min, y_max - y_min);
}

double stx_layout_bounds::get_left() const {
  return x;
}

double stx_layout_bounds::get_right() const {
  return x + width;
}

double stx_layout_bounds::get_top() const {
  return y;
}

double stx_layout_bounds::get_bottom() const {
  return y + height;
}

stx_point stx_layout_bounds::top_left() const {
  return stx_point(get_left(), get_top());
}

stx_point stx_layout_bounds::top_right() const {
  return stx_point(get_right(), get_top());
}

stx_point stx_layout_bounds::bottom_left() const {
  return stx_point(get_left(), get_bottom());
}

stx_point stx_layout_bounds::bottom_right() const {
  return stx_point(get_right(), get_bottom());
}

bool stx_layout_bounds::operator==(const stx_layout_bounds& other) const {
  return x == other.x && y == other.y && width == other.width && height == other.height;
}

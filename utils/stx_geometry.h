#ifndef STX_GEOMETRY_H
#define STX_GEOMETRY_H

// 2D point in document user units (y axis pointing down)
class stx_point {
public:
  double x;
  double y;

  stx_point() : x(0.0), y(0.0) {}
  stx_point(double x, double y) : x(x), y(y) {}

  bool operator==(const stx_point& other) const {
    return x == other.x && y == other.y;
  }
  bool operator!=(const stx_point& other) const {
    return !(*this == other);
  }
};

#endif // STX_GEOMETRY_H

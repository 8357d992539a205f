#ifndef STX_AFFINE_TRANSFORM_H
#define STX_AFFINE_TRANSFORM_H

#include "../../utils/stx_string.h"
#include "../../utils/stx_geometry.h"

// 2D affine map from local to parent coordinates, stored like the SVG
// matrix(a, b, c, d, e, f):
//
//   | a c e |     x' = a*x + c*y + e
//   | b d f |     y' = b*x + d*y + f
//   | 0 0 1 |
//
// Value type; every operation returns a new transform.
class stx_affine_transform
{
public:
  double a = 1.0;
  double b = 0.0;
  double c = 0.0;
  double d = 1.0;
  double e = 0.0;
  double f = 0.0;

  stx_affine_transform();
  stx_affine_transform(double a, double b, double c, double d, double e, double f);

  static stx_affine_transform identity();
  static stx_affine_transform matrix(double a, double b, double c, double d, double e, double f);

  // outer(inner(p)): linear parts multiplied, translation = outer.L * inner.t + outer.t
  static stx_affine_transform compose(const stx_affine_transform& outer, const stx_affine_transform& inner);

  // The primitive is applied to points before the current transform.
  stx_affine_transform translate(double tx, double ty) const;
  stx_affine_transform scale(double sx) const;
  stx_affine_transform scale(double sx, double sy) const;
  stx_affine_transform rotate_degrees(double angle, double cx = 0.0, double cy = 0.0) const;

  stx_point apply_to_point(const stx_point& p) const;

  // atan2(b, a) in degrees. Only meaningful for a rotation, optionally with
  // uniform scale; shear and non-uniform scale give an approximate angle.
  double get_rotation_degrees() const;

  stx_affine_transform operator*(const stx_affine_transform& inner) const;
  bool operator==(const stx_affine_transform& other) const;
  bool operator!=(const stx_affine_transform& other) const;


  // Parses one transform function: matrix(6), translate(1-2), scale(1-2),
  // rotate(1 or 3). Arguments are separated by commas and/or whitespace.
  // Throws stx_parse_error carrying the full attribute text.
  static stx_affine_transform parse(const stx_string& attribute);
};

#endif // STX_AFFINE_TRANSFORM_H

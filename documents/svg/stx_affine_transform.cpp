#include "stx_affine_transform.h"
#include "../../utils/stx_exceptions.h"
#include <cmath>
#include <cctype>
#include <sstream>
#include <vector>

namespace {

  const double pi = 3.14159265358979323846;

  bool is_name_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_';
  }

  // Splits "name(args)" and converts the arguments.
  void split_function(const stx_string& attribute, stx_string& name, std::vector<double>& args) {
    stx_string text = attribute.trim();

    size_t open = text.find("(");
    if (open == stx_string::npos || text.empty() || text[text.size() - 1] != ')') {
      throw stx_parse_error("bad transform", attribute);
    }

    name = text.substr(0, open).trim();
    if (name.empty()) {
      throw stx_parse_error("bad transform", attribute);
    }
    for (size_t i = 0; i < name.size(); ++i) {
      if (!is_name_char(name[i])) {
        throw stx_parse_error("bad transform", attribute);
      }
    }

    stx_string body = text.substr(open + 1, text.size() - open - 2);
    if (body.contains("(") || body.contains(")")) {
      throw stx_parse_error("bad transform", attribute);
    }

    stx_string normalized = body;
    normalized.replace(",", " ");
    std::istringstream tokens(normalized.to_std_const());
    std::string token;
    while (tokens >> token) {
      double value = 0.0;
      if (!stx_string(token).parse_double(value)) {
        throw stx_parse_error("bad transform argument", attribute);
      }
      args.push_back(value);
    }
  }

}

stx_affine_transform::stx_affine_transform() {}

stx_affine_transform::stx_affine_transform(double a, double b, double c, double d, double e, double f)
  : a(a), b(b), c(c), d(d), e(e), f(f)
{
}

stx_affine_transform stx_affine_transform::identity() {
  return stx_affine_transform();
}

stx_affine_transform stx_affine_transform::matrix(double a, double b, double c, double d, double e, double f) {
  return stx_affine_transform(a, b, c, d, e, f);
}

stx_affine_transform stx_affine_transform::compose(const stx_affine_transform& outer, const stx_affine_transform& inner) {
  return stx_affine_transform(
    outer.a * inner.a + outer.c * inner.b,
    outer.b * inner.a + outer.d * inner.b,
    outer.a * inner.c + outer.c * inner.d,
    outer.b * inner.c + outer.d * inner.d,
    outer.a * inner.e + outer.c * inner.f + outer.e,
    outer.b * inner.e + outer.d * inner.f + outer.f);
}

stx_affine_transform stx_affine_transform::translate(double tx, double ty) const {
  return compose(*this, stx_affine_transform(1.0, 0.0, 0.0, 1.0, tx, ty));
}

stx_affine_transform stx_affine_transform::scale(double sx) const {
  return scale(sx, sx);
}

stx_affine_transform stx_affine_transform::scale(double sx, double sy) const {
  return compose(*this, stx_affine_transform(sx, 0.0, 0.0, sy, 0.0, 0.0));
}

stx_affine_transform stx_affine_transform::rotate_degrees(double angle, double cx, double cy) const {
  double radians = angle * pi / 180.0;
  double sin_a = std::sin(radians);
  double cos_a = std::cos(radians);
  stx_affine_transform rotation(cos_a, sin_a, -sin_a, cos_a, 0.0, 0.0);
  if (cx != 0.0 || cy != 0.0) {
    return translate(cx, cy) * rotation * stx_affine_transform().translate(-cx, -cy);
  }
  return compose(*this, rotation);
}

stx_point stx_affine_transform::apply_to_point(const stx_point& p) const {
  return stx_point(a * p.x + c * p.y + e,
                   b * p.x + d * p.y + f);
}

double stx_affine_transform::get_rotation_degrees() const {
  return std::atan2(b, a) * 180.0 / pi;
}

stx_affine_transform stx_affine_transform::operator*(const stx_affine_transform& inner) const {
  return compose(*this, inner);
}

bool stx_affine_transform::operator==(const stx_affine_transform& other) const {
  return a == other.a && b == other.b && c == other.c &&
         d == other.d && e == other.e && f == other.f;
}

bool stx_affine_transform::operator!=(const stx_affine_transform& other) const {
  return !(*this == other);
}

stx_affine_transform stx_affine_transform::parse(const stx_string& attribute) {
  stx_string name;
  std::vector<double> args;
  split_function(attribute, name, args);

  stx_affine_transform xform;
  if (name == "matrix") {
    if (args.size() != 6) {
      throw stx_parse_error("bad matrix transform", attribute);
    }
    return matrix(args[0], args[1], args[2], args[3], args[4], args[5]);
  }
  if (name == "translate") {
    if (args.size() < 1 || args.size() > 2) {
      throw stx_parse_error("bad translate transform", attribute);
    }
    double ty = args.size() > 1 ? args[1] : 0.0;
    return xform.translate(args[0], ty);
  }
  if (name == "scale") {
    if (args.size() < 1 || args.size() > 2) {
      throw stx_parse_error("bad scale transform", attribute);
    }
    double sy = args.size() > 1 ? args[1] : args[0];
    return xform.scale(args[0], sy);
  }
  if (name == "rotate") {
    if (args.size() != 1 && args.size() != 3) {
      throw stx_parse_error("bad rotate transform", attribute);
    }
    if (args.size() == 1) {
      return xform.rotate_degrees(args[0]);
    }
    return xform.rotate_degrees(args[0], args[1], args[2]);
  }
  throw stx_parse_error("unsupported transform attribute", attribute);
}

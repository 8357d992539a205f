#ifndef STX_LABEL_H
#define STX_LABEL_H

#include "../../utils/stx_string.h"
#include "../../utils/stx_geometry.h"

enum class stx_text_align {
  left,
  center,
  right
};

enum class stx_font_style {
  normal,
  italic,
  oblique
};

const long STX_WEIGHT_NORMAL = 500;
const long STX_WEIGHT_BOLD = 700;

struct stx_rgb_color {
  int r = 0;
  int g = 0;
  int b = 0;

  stx_rgb_color() {}
  stx_rgb_color(int r, int g, int b) : r(r), g(g), b(b) {}

  bool is_black() const { return r == 0 && g == 0 && b == 0; }
  bool operator==(const stx_rgb_color& other) const {
    return r == other.r && g == other.g && b == other.b;
  }
};

// One unit of extracted text. pos is in document root user units until the
// overlay emitter normalizes it.
class stx_label
{
public:
  stx_point pos;
  stx_string source_id;   // id of the element the label replaces, may be empty

  explicit stx_label(const stx_point& pos_val) : pos(pos_val) {}
  virtual ~stx_label() = default;

  // picture-mode payload for \put(x, y){...}
  virtual stx_string texcode() const = 0;
};

class stx_styled_label : public stx_label
{
public:
  stx_string text;
  stx_rgb_color color;
  double angle = 0.0;                   // degrees, counter-clockwise in the output
  stx_text_align align = stx_text_align::left;
  stx_string font_family = "rm";        // LaTeX family abbreviation: rm, sf, tt
  long font_weight = STX_WEIGHT_NORMAL;
  stx_font_style font_style = stx_font_style::normal;
  stx_string font_size;                 // size command, empty for none
  double scale = 1.0;                   // not applied to the output yet

  stx_styled_label();
  stx_styled_label(const stx_point& pos_val, const stx_string& text_val);

  stx_string texcode() const override;

  // Takes font, color and alignment fields; position, angle and text stay.
  void copy_style_from(const stx_styled_label& other);

  stx_string font_tex() const;
  stx_string color_tex() const;
  stx_string alignment_tex() const;
};

// Pre-typeset markup passed through inside a fixed scale box
class stx_opaque_label : public stx_label
{
public:
  stx_string code;
  double scale_factor;

  stx_opaque_label(const stx_point& pos_val, const stx_string& code_val, double scale_factor_val);

  stx_string texcode() const override;
};

#endif // STX_LABEL_H

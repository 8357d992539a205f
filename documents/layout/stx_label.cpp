#include "stx_label.h"
#include "../../utils/stx_number_format.h"
#include <sstream>

stx_styled_label::stx_styled_label() : stx_label(stx_point()) {}

stx_styled_label::stx_styled_label(const stx_point& pos_val, const stx_string& text_val)
  : stx_label(pos_val), text(text_val)
{
}

void stx_styled_label::copy_style_from(const stx_styled_label& other) {
  color = other.color;
  align = other.align;
  font_family = other.font_family;
  font_weight = other.font_weight;
  font_style = other.font_style;
  font_size = other.font_size;
  scale = other.scale;
}

stx_string stx_styled_label::font_tex() const {
  stx_string font = stx_string("\\") + font_family + "family";
  if (font_weight >= STX_WEIGHT_BOLD) {
    font += "\\bfseries";
  }
  if (font_style == stx_font_style::italic) {
    font += "\\itshape";
  } else if (font_style == stx_font_style::oblique) {
    font += "\\slshape";
  }
  font += font_size;
  return font;
}

stx_string stx_styled_label::color_tex() const {
  if (color.is_black()) {
    return stx_string();
  }
  std::ostringstream tex;
  tex << "\\color[RGB]{" << color.r << "," << color.g << "," << color.b << "}";
  return stx_string(tex.str());
}

stx_string stx_styled_label::alignment_tex() const {
  switch (align) {
    case stx_text_align::center:
      return "\\makebox(0,0)[b]";
    case stx_text_align::right:
      return "\\makebox(0,0)[br]";
    case stx_text_align::left:
    default:
      return "\\makebox(0,0)[bl]";
  }
}

stx_string stx_styled_label::texcode() const {
  stx_string tex = font_tex() + color_tex() + alignment_tex() + "{\\smash{" + text + "}}";
  stx_string rounded_angle = stx_format_number(angle, 3);
  if (rounded_angle != "0.0") {
    tex = stx_string("\\rotatebox{") + rounded_angle + "}{" + tex + "}";
  }
  return tex;
}

stx_opaque_label::stx_opaque_label(const stx_point& pos_val, const stx_string& code_val, double scale_factor_val)
  : stx_label(pos_val), code(code_val), scale_factor(scale_factor_val)
{
}

stx_string stx_opaque_label::texcode() const {
  return stx_string("\\scalebox{") + stx_format_number(scale_factor, 6) +
         "}{\\makebox(0,0)[bl]{%\n" + code + "%\n}}";
}

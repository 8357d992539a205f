#ifndef STX_SVG_STYLE_H
#define STX_SVG_STYLE_H

#include "../../utils/stx_string.h"
#include "../layout/stx_label.h"
#include <map>
#include <vector>

using stx_style_map = std::map<stx_string, stx_string>;

// Lookup tables from SVG font values to LaTeX commands
struct stx_style_tables {
  std::map<stx_string, stx_string> font_families;  // "CMU Serif" -> "rm"
  std::map<stx_string, stx_string> font_sizes;     // "12px" -> "\normalsize"

  static stx_style_tables defaults();

  // Adds "name=value;name=value" entries, later entries override earlier ones
  static void add_entries(std::map<stx_string, stx_string>& table, const stx_string& entries);
};

// A style value with no mapping; the label keeps its previous value
struct stx_style_warning {
  stx_string key;
  stx_string value;
  stx_string element_id;
};

// "a:b; c:d" -> {a: b, c: d}; later duplicates win
stx_style_map parse_style_string(const stx_string& style);

// parent with every key of child overwritten by child's value
stx_style_map merge_styles(const stx_style_map& parent, const stx_style_map& child);

// "#rrggbb" only, throws stx_unsupported_color_format otherwise
stx_rgb_color parse_svg_color(const stx_string& value);

// bold -> 700, normal -> 500, integer tokens as-is, throws stx_invalid_weight otherwise
long parse_font_weight(const stx_string& value);

class stx_svg_style_resolver
{
  stx_style_tables tables;
  std::vector<stx_style_warning> warnings;
public:
  explicit stx_svg_style_resolver(const stx_style_tables& tables);

  // Applies fill, font-weight, font-style, text-anchor, font-family and
  // font-size to the label. Unknown keys are ignored.
  void apply(const stx_style_map& style, stx_styled_label& label, const stx_string& element_id = stx_string());

  const std::vector<stx_style_warning>& get_warnings() const { return warnings; }

private:
  void set_fill(const stx_style_map& style, stx_styled_label& label);
  void set_font_weight(const stx_style_map& style, stx_styled_label& label);
  void set_font_style(const stx_style_map& style, stx_styled_label& label);
  void set_text_anchor(const stx_style_map& style, stx_styled_label& label);
  void set_font_family(const stx_style_map& style, stx_styled_label& label, const stx_string& element_id);
  void set_font_size(const stx_style_map& style, stx_styled_label& label, const stx_string& element_id);
  void warn(const stx_string& key, const stx_string& value, const stx_string& element_id);
};

#endif // STX_SVG_STYLE_H

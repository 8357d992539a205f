#include "stx_svg_style.h"
#include "../../utils/stx_exceptions.h"
#include <iostream>
#include <cctype>

namespace {

  int hex_pair(const stx_string& value, size_t pos) {
    int result = 0;
    for (size_t i = pos; i < pos + 2; ++i) {
      char ch = value[i];
      int digit;
      if (ch >= '0' && ch <= '9') digit = ch - '0';
      else if (ch >= 'a' && ch <= 'f') digit = ch - 'a' + 10;
      else if (ch >= 'A' && ch <= 'F') digit = ch - 'A' + 10;
      else throw stx_unsupported_color_format(value);
      result = result * 16 + digit;
    }
    return result;
  }

  const stx_string* find_value(const stx_style_map& style, const char* key) {
    auto it = style.find(key);
    if (it == style.end()) {
      return nullptr;
    }
    return &it->second;
  }

}

stx_style_tables stx_style_tables::defaults() {
  stx_style_tables tables;
  tables.font_families["CMU Serif"] = "rm";
  tables.font_families["CMU Sans Serif"] = "sf";
  tables.font_families["CMU Typewriter Text"] = "tt";
  tables.font_families["Calibri"] = "rm";

  tables.font_sizes["9px"] = "\\scriptsize";
  tables.font_sizes["10px"] = "\\footnotesize";
  tables.font_sizes["11px"] = "\\small";
  tables.font_sizes["12px"] = "\\normalsize";
  tables.font_sizes["13px"] = "\\large";
  return tables;
}

void stx_style_tables::add_entries(std::map<stx_string, stx_string>& table, const stx_string& entries) {
  for (const auto& entry : entries.split(";")) {
    stx_string name, value;
    entry.partition("=", name, value);
    name = name.trim();
    value = value.trim();
    if (name.empty() || value.empty()) {
      continue;
    }
    table[name] = value;
  }
}

stx_style_map parse_style_string(const stx_string& style) {
  stx_style_map result;
  for (const auto& clause : style.split(";")) {
    stx_string part = clause.trim();
    if (part.empty()) {
      continue;
    }
    stx_string key, value;
    part.partition(":", key, value);
    result[key.trim()] = value.trim();
  }
  return result;
}

stx_style_map merge_styles(const stx_style_map& parent, const stx_style_map& child) {
  stx_style_map merged = parent;
  for (const auto& entry : child) {
    merged[entry.first] = entry.second;
  }
  return merged;
}

stx_rgb_color parse_svg_color(const stx_string& value) {
  stx_string color = value.trim();
  if (color.size() != 7 || color[0] != '#') {
    throw stx_unsupported_color_format(value);
  }
  return stx_rgb_color(hex_pair(color, 1), hex_pair(color, 3), hex_pair(color, 5));
}

long parse_font_weight(const stx_string& value) {
  stx_string weight = value.trim();
  if (weight == "bold") {
    return STX_WEIGHT_BOLD;
  }
  if (weight == "normal") {
    return STX_WEIGHT_NORMAL;
  }
  long numeric = 0;
  if (!weight.parse_integer(numeric)) {
    throw stx_invalid_weight(value);
  }
  return numeric;
}

stx_svg_style_resolver::stx_svg_style_resolver(const stx_style_tables& tables)
  : tables(tables)
{
}

void stx_svg_style_resolver::apply(const stx_style_map& style, stx_styled_label& label, const stx_string& element_id) {
  set_fill(style, label);
  set_font_weight(style, label);
  set_font_style(style, label);
  set_text_anchor(style, label);
  set_font_family(style, label, element_id);
  set_font_size(style, label, element_id);
}

void stx_svg_style_resolver::set_fill(const stx_style_map& style, stx_styled_label& label) {
  const stx_string* fill = find_value(style, "fill");
  if (fill == nullptr) {
    return;
  }
  label.color = parse_svg_color(*fill);
}

void stx_svg_style_resolver::set_font_weight(const stx_style_map& style, stx_styled_label& label) {
  const stx_string* weight = find_value(style, "font-weight");
  if (weight == nullptr) {
    return;
  }
  label.font_weight = parse_font_weight(*weight);
}

void stx_svg_style_resolver::set_font_style(const stx_style_map& style, stx_styled_label& label) {
  const stx_string* font_style = find_value(style, "font-style");
  if (font_style == nullptr) {
    return;
  }
  if (*font_style == "normal") {
    label.font_style = stx_font_style::normal;
  } else if (*font_style == "italic") {
    label.font_style = stx_font_style::italic;
  } else if (*font_style == "oblique") {
    label.font_style = stx_font_style::oblique;
  }
}

void stx_svg_style_resolver::set_text_anchor(const stx_style_map& style, stx_styled_label& label) {
  const stx_string* anchor = find_value(style, "text-anchor");
  if (anchor == nullptr) {
    return;
  }
  if (*anchor == "start") {
    label.align = stx_text_align::left;
  } else if (*anchor == "end") {
    label.align = stx_text_align::right;
  } else if (*anchor == "middle") {
    label.align = stx_text_align::center;
  }
}

void stx_svg_style_resolver::set_font_family(const stx_style_map& style, stx_styled_label& label, const stx_string& element_id) {
  const stx_string* family = find_value(style, "font-family");
  if (family == nullptr) {
    return;
  }
  stx_string name = family->trim().unquote();
  auto it = tables.font_families.find(name);
  if (it == tables.font_families.end()) {
    warn("font-family", *family, element_id);
    return;
  }
  label.font_family = it->second;
}

void stx_svg_style_resolver::set_font_size(const stx_style_map& style, stx_styled_label& label, const stx_string& element_id) {
  const stx_string* size = find_value(style, "font-size");
  if (size == nullptr) {
    return;
  }
  auto it = tables.font_sizes.find(size->trim());
  if (it == tables.font_sizes.end()) {
    warn("font-size", *size, element_id);
    return;
  }
  label.font_size = it->second;
}

void stx_svg_style_resolver::warn(const stx_string& key, const stx_string& value, const stx_string& element_id) {
  // runs of one element share its style, report each miss once
  for (const auto& seen : warnings) {
    if (seen.key == key && seen.value == value && seen.element_id == element_id) {
      return;
    }
  }

  std::cerr << "Warning: Could not match " << key.c_str() << " '" << value.c_str() << "'";
  if (!element_id.empty()) {
    std::cerr << " in element '" << element_id.c_str() << "'";
  }
  std::cerr << ", keeping the current value" << std::endl;

  stx_style_warning warning;
  warning.key = key;
  warning.value = value;
  warning.element_id = element_id;
  warnings.push_back(warning);
}

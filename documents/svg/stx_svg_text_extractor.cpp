#include "stx_svg_text_extractor.h"
#include "stx_svg_namespaces.h"
#include "../../utils/stx_exceptions.h"
#include "../../utils/stx_number_format.h"
#include <utf8cpp/utf8.h>
#include <cstdint>
#include <iterator>
#include <string>

namespace {

  // SVG presentation attributes that take part in label styling
  const char* const presentation_attributes[] = {
    "fill", "font-weight", "font-style", "text-anchor", "font-family", "font-size"
  };

  bool is_definition_container(pugi::xml_node node) {
    return stx_ns::is_svg_element(node, "defs") ||
           stx_ns::is_svg_element(node, "pattern") ||
           stx_ns::is_svg_element(node, "symbol");
  }

  bool is_opaque_element(pugi::xml_node node) {
    return static_cast<bool>(stx_ns::find_attribute(node, stx_ns::textext, "text"));
  }

  int hex_digit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
  }

  // Reads exactly count hex digits at pos
  bool read_hex(const std::string& s, size_t pos, size_t count, uint32_t& out) {
    if (pos + count > s.size()) {
      return false;
    }
    uint32_t value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
      int digit = hex_digit(s[i]);
      if (digit < 0) {
        return false;
      }
      value = value * 16 + static_cast<uint32_t>(digit);
    }
    out = value;
    return true;
  }

  bool append_code_point(std::string& out, uint32_t cp) {
    try {
      utf8::append(cp, std::back_inserter(out));
    } catch (const utf8::invalid_code_point&) {
      return false;
    }
    return true;
  }

}

// Label under construction while folding over the runs of one <text>
struct stx_svg_text_extractor::run_fold {
  std::unique_ptr<stx_styled_label> label;
  std::vector<stx_string> texts;

  void add(std::unique_ptr<stx_styled_label> run) {
    if (!run->text.empty()) {
      texts.push_back(run->text);
    }
    if (!label) {
      label = std::move(run);
      return;
    }
    label->copy_style_from(*run);
  }

  std::unique_ptr<stx_styled_label> finish() {
    if (!label) {
      label.reset(new stx_styled_label());
    }
    label->text = stx_string(" ").join(texts);
    return std::move(label);
  }
};

struct stx_svg_text_extractor::extraction_context {
  std::vector<pugi::xml_node> texts;
  std::vector<pugi::xml_node> opaque;
  std::set<stx_string> ignored_ids;
};

stx_svg_text_extractor::stx_svg_text_extractor(const stx_style_tables& tables, double dpi)
  : tables(tables), dpi(dpi)
{
  if (dpi <= 0) {
    throw std::invalid_argument("DPI must be positive.");
  }
}

stx_svg_text_extractor::~stx_svg_text_extractor() {
}

stx_extraction_result stx_svg_text_extractor::extract(const stx_svg_document& document) const {
  pugi::xml_node root = document.root();
  if (!root) {
    throw stx_document_error("Cannot extract text, missing root <svg> element", "<memory>");
  }

  // Phase 1: find text, opaque markup and definition ids
  extraction_context ctx;
  collect(root, false, ctx);

  stx_extraction_result result;
  stx_svg_style_resolver resolver(tables);
  std::set<pugi::xml_node> excluded;
  std::set<stx_string> consumed_ids;

  for (pugi::xml_node text : ctx.texts) {
    stx_string id = text.attribute("id").value();
    result.labels.push_back(interpret_text(text, resolver));
    result.labels.back()->source_id = id;
    excluded.insert(text);
    if (!id.empty()) {
      consumed_ids.insert(id);
    }
  }

  for (pugi::xml_node element : ctx.opaque) {
    stx_string id = element.attribute("id").value();
    result.labels.push_back(interpret_opaque(element));
    result.labels.back()->source_id = id;
    excluded.insert(element);
    if (!id.empty()) {
      consumed_ids.insert(id);
    }
  }

  // Phase 2: geometry-only copy
  result.residual = document.copy_excluding(excluded);
  result.residual->consumed_ids = consumed_ids;
  result.residual->ignored_ids = ctx.ignored_ids;
  result.warnings = resolver.get_warnings();
  return result;
}

void stx_svg_text_extractor::collect(pugi::xml_node node, bool inside_definitions, extraction_context& ctx) const {
  for (pugi::xml_node child = node.first_child(); child; child = child.next_sibling()) {
    if (child.type() != pugi::node_element) {
      continue;
    }
    if (inside_definitions) {
      stx_string id = child.attribute("id").value();
      if (!id.empty()) {
        ctx.ignored_ids.insert(id);
      }
    }

    if (is_opaque_element(child)) {
      // the whole group is replaced by one label
      ctx.opaque.push_back(child);
      continue;
    }
    if (stx_ns::is_svg_element(child, "text")) {
      ctx.texts.push_back(child);
      continue;
    }
    collect(child, inside_definitions || is_definition_container(child), ctx);
  }
}

std::unique_ptr<stx_styled_label> stx_svg_text_extractor::interpret_text(pugi::xml_node text, stx_svg_style_resolver& resolver) const {
  stx_style_map text_style = element_style(text);

  run_fold fold;
  bool has_runs = false;
  for (pugi::xml_node child = text.first_child(); child; child = child.next_sibling()) {
    if (child.type() == pugi::node_element && stx_ns::is_svg_element(child, "tspan")) {
      fold.add(interpret_run(child, text, text_style, resolver));
      has_runs = true;
    }
  }
  if (!has_runs) {
    fold.add(interpret_run(text, text, stx_style_map(), resolver));
  }
  return fold.finish();
}

std::unique_ptr<stx_styled_label> stx_svg_text_extractor::interpret_run(pugi::xml_node run, pugi::xml_node text,
                                                                        const stx_style_map& text_style,
                                                                        stx_svg_style_resolver& resolver) const {
  double x = coordinate(run, "x", coordinate(text, "x", 0.0));
  double y = coordinate(run, "y", coordinate(text, "y", 0.0));

  stx_affine_transform transform = accumulated_transform(run);
  std::unique_ptr<stx_styled_label> label(
    new stx_styled_label(transform.apply_to_point(stx_point(x, y)), stx_string(run.child_value())));
  label->angle = -stx_round(transform.get_rotation_degrees(), 3);

  stx_string element_id = text.attribute("id").value();
  resolver.apply(merge_styles(text_style, element_style(run)), *label, element_id);
  return label;
}

std::unique_ptr<stx_opaque_label> stx_svg_text_extractor::interpret_opaque(pugi::xml_node element) const {
  stx_string code = decode_escapes(stx_ns::find_attribute(element, stx_ns::textext, "text").value());
  stx_affine_transform transform = accumulated_transform(element);

  bool placed = false;
  double min_x = 0.0;
  double max_y = 0.0;
  std::vector<pugi::xml_node> stack;
  stack.push_back(element);
  while (!stack.empty()) {
    pugi::xml_node current = stack.back();
    stack.pop_back();
    for (pugi::xml_node child = current.last_child(); child; child = child.previous_sibling()) {
      if (child.type() != pugi::node_element) {
        continue;
      }
      stack.push_back(child);
      if (!stx_ns::is_svg_element(child, "use")) {
        continue;
      }
      stx_point p = transform.apply_to_point(stx_point(coordinate(child, "x", 0.0), coordinate(child, "y", 0.0)));
      if (!placed || p.x < min_x) min_x = p.x;
      if (!placed || p.y > max_y) max_y = p.y;
      placed = true;
    }
  }

  stx_point anchor = placed ? stx_point(min_x, max_y) : stx_point(0.0, 0.0);
  return std::unique_ptr<stx_opaque_label>(
    new stx_opaque_label(anchor, code, stx_units::big_points_per_inch / dpi));
}

stx_affine_transform stx_svg_text_extractor::accumulated_transform(pugi::xml_node node) {
  stx_affine_transform accumulated = stx_affine_transform::identity();
  for (pugi::xml_node current = node; current && current.type() == pugi::node_element; current = current.parent()) {
    pugi::xml_attribute attr = current.attribute("transform");
    if (attr) {
      accumulated = stx_affine_transform::compose(stx_affine_transform::parse(attr.value()), accumulated);
    }
  }
  return accumulated;
}

stx_style_map stx_svg_text_extractor::element_style(pugi::xml_node node) {
  stx_style_map style;
  for (const char* name : presentation_attributes) {
    pugi::xml_attribute attr = node.attribute(name);
    if (attr) {
      style[name] = stx_string(attr.value()).trim();
    }
  }
  pugi::xml_attribute style_attr = node.attribute("style");
  if (style_attr) {
    style = merge_styles(style, parse_style_string(style_attr.value()));
  }
  return style;
}

double stx_svg_text_extractor::coordinate(pugi::xml_node node, const char* name, double def) {
  pugi::xml_attribute attr = node.attribute(name);
  if (!attr) {
    return def;
  }
  // x/y may hold a list of per-glyph positions, the first one anchors the run
  stx_string value = stx_string(attr.value()).trim();
  size_t end = value.find_first_of(" \t\r\n,");
  stx_string first = end == stx_string::npos ? value : value.substr(0, end);
  double result = 0.0;
  if (!first.parse_double(result)) {
    throw stx_parse_error(stx_string("invalid ") + name + " coordinate", attr.value());
  }
  return result;
}

stx_string stx_svg_text_extractor::decode_escapes(const stx_string& text) {
  const std::string& s = text.to_std_const();
  std::string out;
  out.reserve(s.size());

  size_t i = 0;
  while (i < s.size()) {
    char ch = s[i];
    if (ch != '\\' || i + 1 >= s.size()) {
      out += ch;
      ++i;
      continue;
    }

    char esc = s[i + 1];
    switch (esc) {
      case '\\': out += '\\'; i += 2; continue;
      case '\'': out += '\''; i += 2; continue;
      case '"':  out += '"';  i += 2; continue;
      case 'n':  out += '\n'; i += 2; continue;
      case 'r':  out += '\r'; i += 2; continue;
      case 't':  out += '\t'; i += 2; continue;
      case 'a':  out += '\a'; i += 2; continue;
      case 'b':  out += '\b'; i += 2; continue;
      case 'f':  out += '\f'; i += 2; continue;
      case 'v':  out += '\v'; i += 2; continue;
      default: break;
    }

    uint32_t cp = 0;
    size_t width = 0;
    if (esc == 'x' && read_hex(s, i + 2, 2, cp)) {
      width = 4;
    } else if (esc == 'u' && read_hex(s, i + 2, 4, cp)) {
      width = 6;
    } else if (esc == 'U' && read_hex(s, i + 2, 8, cp)) {
      width = 10;
    } else if (esc >= '0' && esc <= '7') {
      size_t j = i + 1;
      while (j < s.size() && j < i + 4 && s[j] >= '0' && s[j] <= '7') {
        cp = cp * 8 + static_cast<uint32_t>(s[j] - '0');
        ++j;
      }
      width = j - i;
    }

    if (width > 0 && append_code_point(out, cp)) {
      i += width;
      continue;
    }

    // unknown or malformed escape
    out += ch;
    ++i;
  }
  return stx_string(out);
}

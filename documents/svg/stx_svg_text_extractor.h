#ifndef STX_SVG_TEXT_EXTRACTOR_H
#define STX_SVG_TEXT_EXTRACTOR_H

#include "stx_svg_document.h"
#include "stx_svg_style.h"
#include "stx_affine_transform.h"
#include "stx_svg_units.h"
#include "../layout/stx_label.h"
#include <memory>
#include <set>
#include <vector>

// Labels plus the geometry-only copy of the document
struct stx_extraction_result {
  std::vector<std::unique_ptr<stx_label>> labels;
  std::unique_ptr<stx_svg_document> residual;
  std::vector<stx_style_warning> warnings;
};

class stx_svg_text_extractor {
public:
  explicit stx_svg_text_extractor(const stx_style_tables& tables, double dpi = stx_units::default_dpi);
  ~stx_svg_text_extractor();

  // Converts every <text> element and every opaque markup element into a
  // label. The source document is left untouched; the result carries a
  // residual copy with those elements removed and the consumed / ignored
  // id sets filled in.
  stx_extraction_result extract(const stx_svg_document& document) const;

  // Product of the transform attributes from node up to the root, mapping
  // node-local coordinates to root user units.
  static stx_affine_transform accumulated_transform(pugi::xml_node node);

  // Backslash escapes of opaque markup (\n, \t, \\, \xhh, \ooo, \uXXXX, ...)
  // decoded to UTF-8. Unknown escapes are kept as written.
  static stx_string decode_escapes(const stx_string& text);

private:
  struct run_fold;
  struct extraction_context;

  stx_style_tables tables;
  double dpi;

  void collect(pugi::xml_node node, bool inside_definitions, extraction_context& ctx) const;
  std::unique_ptr<stx_styled_label> interpret_text(pugi::xml_node text, stx_svg_style_resolver& resolver) const;
  std::unique_ptr<stx_styled_label> interpret_run(pugi::xml_node run, pugi::xml_node text,
                                                  const stx_style_map& text_style,
                                                  stx_svg_style_resolver& resolver) const;
  std::unique_ptr<stx_opaque_label> interpret_opaque(pugi::xml_node element) const;

  static stx_style_map element_style(pugi::xml_node node);
  static double coordinate(pugi::xml_node node, const char* name, double def);
};

#endif // STX_SVG_TEXT_EXTRACTOR_H

#ifndef STX_SVG_NAMESPACES_H
#define STX_SVG_NAMESPACES_H

#include "../../utils/stx_string.h"
#include <pugixml.hpp>

namespace stx_ns {
  const char* const svg = "http://www.w3.org/2000/svg";
  const char* const xlink = "http://www.w3.org/1999/xlink";
  const char* const inkscape = "http://www.inkscape.org/namespaces/inkscape";
  const char* const sodipodi = "http://sodipodi.sourceforge.net/DTD/sodipodi-0.dtd";
  const char* const textext = "http://www.iki.fi/pav/software/textext/";

  // Namespace URI bound to prefix at node (empty prefix: default namespace).
  // Returns an empty string when the prefix is not declared.
  stx_string lookup_namespace(pugi::xml_node node, const stx_string& prefix);

  stx_string local_name(const char* qualified_name);

  // Element namespace; unprefixed elements without a default namespace
  // declaration count as SVG.
  stx_string element_namespace(pugi::xml_node node);

  bool is_svg_element(pugi::xml_node node, const char* local);

  // Attribute in namespace ns_uri with the given local name. Unprefixed
  // attributes are in no namespace and only match an empty ns_uri.
  pugi::xml_attribute find_attribute(pugi::xml_node node, const char* ns_uri, const char* local);
} // namespace stx_ns

#endif // STX_SVG_NAMESPACES_H

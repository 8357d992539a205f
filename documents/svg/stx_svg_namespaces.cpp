#include "stx_svg_namespaces.h"
#include <cstring>

namespace stx_ns {

  stx_string lookup_namespace(pugi::xml_node node, const stx_string& prefix) {
    stx_string attr_name = prefix.empty() ? stx_string("xmlns") : stx_string("xmlns:") + prefix;
    for (pugi::xml_node current = node; current; current = current.parent()) {
      if (current.type() != pugi::node_element) {
        continue;
      }
      pugi::xml_attribute decl = current.attribute(attr_name.c_str());
      if (decl) {
        return stx_string(decl.value());
      }
    }
    return stx_string();
  }

  stx_string local_name(const char* qualified_name) {
    const char* colon = std::strchr(qualified_name, ':');
    return stx_string(colon ? colon + 1 : qualified_name);
  }

  stx_string element_namespace(pugi::xml_node node) {
    const char* name = node.name();
    const char* colon = std::strchr(name, ':');
    if (colon == nullptr) {
      stx_string ns = lookup_namespace(node, stx_string());
      return ns.empty() ? stx_string(svg) : ns;
    }
    return lookup_namespace(node, stx_string(name, static_cast<size_t>(colon - name)));
  }

  bool is_svg_element(pugi::xml_node node, const char* local) {
    if (node.type() != pugi::node_element) {
      return false;
    }
    return local_name(node.name()) == local && element_namespace(node) == svg;
  }

  pugi::xml_attribute find_attribute(pugi::xml_node node, const char* ns_uri, const char* local) {
    for (pugi::xml_attribute attr = node.first_attribute(); attr; attr = attr.next_attribute()) {
      const char* name = attr.name();
      const char* colon = std::strchr(name, ':');
      if (colon == nullptr) {
        if (ns_uri[0] == '\0' && std::strcmp(name, local) == 0) {
          return attr;
        }
        continue;
      }
      stx_string prefix(name, static_cast<size_t>(colon - name));
      if (prefix == "xmlns" || std::strcmp(colon + 1, local) != 0) {
        continue;
      }
      if (lookup_namespace(node, prefix) == ns_uri) {
        return attr;
      }
    }
    return pugi::xml_attribute();
  }

} // namespace stx_ns

#ifndef STX_SVG_DOCUMENT_H
#define STX_SVG_DOCUMENT_H

#include "../../utils/stx_string.h"
#include <pugixml.hpp>
#include <memory>
#include <set>

// SVG working tree plus the id sets collected during text extraction
class stx_svg_document
{
private:
  std::unique_ptr<pugi::xml_document> doc;

public:
  // text-bearing elements converted to labels and removed from the tree
  std::set<stx_string> consumed_ids;
  // elements inside <defs>, <pattern> or <symbol>, never painted directly
  std::set<stx_string> ignored_ids;

  stx_svg_document();
  ~stx_svg_document();
  stx_svg_document(stx_svg_document&&) = default;
  stx_svg_document& operator=(stx_svg_document&&) = default;

  // Core document operations
  bool read(const stx_string& filename);
  bool write(const stx_string& filename) const;
  bool parse(const stx_string& data);
  bool serialize(stx_string& data) const;

  // Root <svg> element, empty node before a successful parse
  pugi::xml_node root() const;
  stx_string root_id() const;

  // Root width/height converted to user units
  bool size_in_user_units(double dpi, double& width, double& height) const;
  void log_size(double dpi) const;

  // Deep copy of the tree without the excluded nodes and their subtrees.
  // The id sets are copied as well.
  std::unique_ptr<stx_svg_document> copy_excluding(const std::set<pugi::xml_node>& excluded) const;
};

#endif // STX_SVG_DOCUMENT_H

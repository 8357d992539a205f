#include "stx_svg_document.h"
#include "stx_svg_namespaces.h"
#include "stx_svg_units.h"
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace {

  void copy_children(pugi::xml_node source, pugi::xml_node target, const std::set<pugi::xml_node>& excluded) {
    for (pugi::xml_node child = source.first_child(); child; child = child.next_sibling()) {
      if (excluded.count(child) > 0) {
        continue;
      }
      if (child.type() == pugi::node_element) {
        pugi::xml_node copy = target.append_child(child.name());
        for (pugi::xml_attribute attr = child.first_attribute(); attr; attr = attr.next_attribute()) {
          copy.append_copy(attr);
        }
        copy_children(child, copy, excluded);
      } else {
        target.append_copy(child);
      }
    }
  }

}

stx_svg_document::stx_svg_document() : doc(new pugi::xml_document()) {
}

stx_svg_document::~stx_svg_document() {
}

bool stx_svg_document::read(const stx_string& filename) {
  std::fstream f;
  f.open(filename.c_str(), std::ios::in | std::ios::binary);
  if (!f.is_open())
  {
    std::cerr << "Error: Cannot open SVG file " << filename.c_str() << std::endl;
    return false;
  }
  // read all bytes from the file
  std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  f.close();

  return parse(stx_string(data));
}

bool stx_svg_document::write(const stx_string& filename) const {
  stx_string data;
  if (!serialize(data)) {
    return false;
  }
  std::fstream f;
  f.open(filename.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!f.is_open())
  {
    std::cerr << "Error: Cannot write SVG file " << filename.c_str() << std::endl;
    return false;
  }
  f.write(data.c_str(), static_cast<std::streamsize>(data.size()));
  f.close();
  return !f.fail();
}

bool stx_svg_document::parse(const stx_string& data) {
  doc->reset();
  consumed_ids.clear();
  ignored_ids.clear();

  pugi::xml_parse_result result = doc->load_buffer(data.c_str(), data.size());
  if (!result) {
    std::cerr << "XML parse error: " << result.description()
              << " at offset " << result.offset << std::endl;
    return false;
  }

  if (!root()) {
    std::cerr << "Error: Input file is missing root <svg> element" << std::endl;
    return false;
  }
  return true;
}

bool stx_svg_document::serialize(stx_string& data) const {
  if (!root()) {
    std::cerr << "Error: Cannot serialize a document without root <svg> element" << std::endl;
    return false;
  }
  std::ostringstream oss;
  doc->save(oss, "", pugi::format_raw, pugi::encoding_utf8);
  data = stx_string(oss.str());
  return true;
}

pugi::xml_node stx_svg_document::root() const {
  pugi::xml_node element = doc->document_element();
  if (!element || !stx_ns::is_svg_element(element, "svg")) {
    return pugi::xml_node();
  }
  return element;
}

stx_string stx_svg_document::root_id() const {
  return stx_string(root().attribute("id").value());
}

bool stx_svg_document::size_in_user_units(double dpi, double& width, double& height) const {
  pugi::xml_node svg = root();
  if (!svg) {
    return false;
  }
  return stx_units::length_to_user_units(svg.attribute("width").value(), dpi, width) &&
         stx_units::length_to_user_units(svg.attribute("height").value(), dpi, height);
}

void stx_svg_document::log_size(double dpi) const {
  double w = 0.0;
  double h = 0.0;
  if (!size_in_user_units(dpi, w, h)) {
    std::cerr << "Warning: Root <svg> has no usable width/height" << std::endl;
    return;
  }
  std::cout << std::fixed << std::setprecision(2)
            << "width = " << w << " px, height = " << h << " px" << std::endl
            << "width = " << stx_units::user_units_to_inches(w, dpi) << " in, height = "
            << stx_units::user_units_to_inches(h, dpi) << " in" << std::endl
            << "width = " << stx_units::user_units_to_big_points(w, dpi) << " bp, height = "
            << stx_units::user_units_to_big_points(h, dpi) << " bp" << std::endl;
  std::cout.unsetf(std::ios::floatfield);
  std::cout << std::setprecision(6);
}

std::unique_ptr<stx_svg_document> stx_svg_document::copy_excluding(const std::set<pugi::xml_node>& excluded) const {
  std::unique_ptr<stx_svg_document> copy(new stx_svg_document());
  copy_children(*doc, *copy->doc, excluded);
  copy->consumed_ids = consumed_ids;
  copy->ignored_ids = ignored_ids;
  return copy;
}

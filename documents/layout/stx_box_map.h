#ifndef STX_BOX_MAP_H
#define STX_BOX_MAP_H

#include "../../utils/stx_string.h"
#include "stx_layout_bounds.h"
#include <map>
#include <vector>

// Element id -> bounding box, remembering the order in which the renderer
// reported the ids. A repeated id keeps its first position and the last box.
class stx_box_map
{
  std::map<stx_string, stx_layout_bounds> boxes;
  std::vector<stx_string> order;
public:
  void insert(const stx_string& id, const stx_layout_bounds& box);

  // nullptr when the id is unknown
  const stx_layout_bounds* find(const stx_string& id) const;
  bool contains(const stx_string& id) const;

  // First id in report order starting with prefix, empty when none
  stx_string first_with_prefix(const stx_string& prefix) const;

  const std::vector<stx_string>& ids() const { return order; }
  size_t size() const { return order.size(); }
  bool empty() const { return order.empty(); }
};

#endif // STX_BOX_MAP_H

#include "stx_box_map.h"

void stx_box_map::insert(const stx_string& id, const stx_layout_bounds& box) {
  auto it = boxes.find(id);
  if (it == boxes.end()) {
    order.push_back(id);
    boxes[id] = box;
  } else {
    it->second = box;
  }
}

const stx_layout_bounds* stx_box_map::find(const stx_string& id) const {
  auto it = boxes.find(id);
  if (it == boxes.end()) {
    return nullptr;
  }
  return &it->second;
}

bool stx_box_map::contains(const stx_string& id) const {
  return boxes.find(id) != boxes.end();
}

stx_string stx_box_map::first_with_prefix(const stx_string& prefix) const {
  for (const auto& id : order) {
    if (id.starts_with(prefix)) {
      return id;
    }
  }
  return stx_string();
}

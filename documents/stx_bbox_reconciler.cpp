#include "stx_bbox_reconciler.h"
#include "../utils/stx_exceptions.h"
#include <cmath>
#include <iostream>
#include <vector>

stx_string stx_bbox_reconciler::select_background_id(const stx_box_map& stripped, const stx_string& root_id) {
  if (!root_id.empty()) {
    if (stripped.contains(root_id)) {
      return root_id;
    }
    throw stx_reconciliation_error(stx_string("Renderer reported no box for the root element '") + root_id + "'");
  }
  stx_string id = stripped.first_with_prefix("svg");
  if (id.empty()) {
    throw stx_reconciliation_error("Renderer reported no box for the drawing area");
  }
  return id;
}

stx_reconciliation stx_bbox_reconciler::reconcile(const stx_box_map& original,
                                                  const stx_box_map& stripped,
                                                  const stx_string& root_id,
                                                  const std::set<stx_string>& consumed_ids,
                                                  const std::set<stx_string>& ignored_ids,
                                                  const std::vector<std::unique_ptr<stx_label>>& labels) const {
  stx_reconciliation result;
  result.background_id = select_background_id(stripped, root_id);
  result.pdf_box = *stripped.find(result.background_id);

  std::vector<stx_point> points;
  points.push_back(result.pdf_box.top_left());
  points.push_back(result.pdf_box.top_right());
  points.push_back(result.pdf_box.bottom_left());
  points.push_back(result.pdf_box.bottom_right());

  size_t folded = 0;
  for (const auto& id : consumed_ids) {
    if (ignored_ids.count(id) > 0) {
      continue;
    }
    const stx_layout_bounds* box = original.find(id);
    if (box == nullptr) {
      continue;
    }
    points.push_back(box->bottom_left());
    points.push_back(box->top_right());
    ++folded;
  }

  // ink boxes can miss the anchor (side bearings, baseline below the glyphs)
  for (const auto& label : labels) {
    if (consumed_ids.count(label->source_id) == 0 || ignored_ids.count(label->source_id) > 0) {
      continue;
    }
    points.push_back(label->pos);
  }

  stx_layout_bounds hull = stx_layout_bounds::from_points(points);
  result.frame.x_min = hull.get_left();
  result.frame.x_max = hull.get_right();
  result.frame.y_min = hull.get_top();
  result.frame.y_max = hull.get_bottom();

  if (!std::isfinite(result.frame.width()) || !(result.frame.width() > 0.0)) {
    throw stx_reconciliation_error("Canonical frame has no width, the drawing is empty");
  }

  std::cout << "Background '" << result.background_id.c_str() << "': "
            << result.pdf_box.width << " x " << result.pdf_box.height
            << ", frame " << result.frame.width() << " x " << result.frame.height()
            << " (" << folded << " text boxes folded in)" << std::endl;
  return result;
}

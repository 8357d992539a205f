#ifndef STX_BBOX_RECONCILER_H
#define STX_BBOX_RECONCILER_H

#include "../utils/stx_string.h"
#include "layout/stx_box_map.h"
#include "layout/stx_label.h"
#include "layout/stx_layout_bounds.h"
#include <memory>
#include <set>
#include <vector>

// Region all overlay coordinates are normalized against, in user units
struct stx_canonical_frame {
  double x_min = 0.0;
  double x_max = 0.0;
  double y_min = 0.0;
  double y_max = 0.0;

  double width() const { return x_max - x_min; }
  double height() const { return y_max - y_min; }

  // inclusive
  bool contains_point(double x, double y) const {
    return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
  }
};

struct stx_reconciliation {
  stx_string background_id;
  stx_layout_bounds pdf_box;
  stx_canonical_frame frame;
};

class stx_bbox_reconciler
{
public:
  // The stripped map's box for root_id, or when the root has no id, the
  // first reported id starting with "svg". Throws stx_reconciliation_error
  // when neither exists.
  static stx_string select_background_id(const stx_box_map& stripped, const stx_string& root_id);

  // Frame = bounding box of the background box corners, the bottom-left /
  // top-right corners of every consumed, non-ignored id found in original,
  // and the anchor of every label whose source id is consumed and not ignored.
  stx_reconciliation reconcile(const stx_box_map& original,
                               const stx_box_map& stripped,
                               const stx_string& root_id,
                               const std::set<stx_string>& consumed_ids,
                               const std::set<stx_string>& ignored_ids,
                               const std::vector<std::unique_ptr<stx_label>>& labels) const;
};

#endif // STX_BBOX_RECONCILER_H

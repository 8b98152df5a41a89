// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_ROWLAYOUT_HH__
#define __LOOM_ROWLAYOUT_HH__

#include <ui/layout.hh>

namespace Loom {

/** Packs children at their preferred size in rows (or columns for VERTICAL).
 * With wrap, a new row is started once the next child would exceed the available extent.
 * Child sizes are determined by RowData where present.
 */
class RowLayout : public Layout {
  struct Item {
    Control *control;
    Point    size;
  };
  struct Line {
    size_t   first, count;
    int      extent;            // along the flow axis, including spacing
    int      thickness;         // across the flow axis
  };
  vector<Item>  collect_items   (Composite &composite, bool flush_cache) const;
  vector<Line>  break_lines     (const vector<Item> &items, int available) const;
  int           lead_major      () const;
  int           trail_major     () const;
  int           lead_minor      () const;
  int           trail_minor     () const;
public:
  Orientation   type;
  int           margin_width, margin_height;
  int           margin_left, margin_top, margin_right, margin_bottom;
  int           spacing;
  bool          wrap, pack, fill, center, justify;
  explicit              RowLayout       (Orientation type = HORIZONTAL);
  virtual const char*   name            () const override { return "RowLayout"; }
  virtual Point         compute_size    (Composite &composite, int whint, int hhint, bool flush_cache) override;
  virtual void          layout          (Composite &composite, bool flush_cache) override;
};

} // Loom

#endif  /* __LOOM_ROWLAYOUT_HH__ */

// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_GRIDLAYOUT_HH__
#define __LOOM_GRIDLAYOUT_HH__

#include <ui/layout.hh>

namespace Loom {

/** Arranges children into a grid of num_columns columns.
 * Rows are added as needed, children are assigned to cells in list order and may
 * span multiple cells as requested by their GridData. Surplus space is distributed
 * among the columns and rows that contain a child grabbing excess space.
 */
class GridLayout : public Layout {
  struct Placement {
    Control    *control;
    GridData    data;
    int         row, col, hspan, vspan;
    Point       size;           // preferred size, hints and minimum applied
  };
  /* cell arena, each cell holds an index into placements or -1 */
  struct Grid {
    int                 n_rows, n_cols;
    vector<int>         cells;
    vector<Placement>   placements;
    explicit    Grid            (int columns) : n_rows (0), n_cols (columns) {}
    int         cell            (int row, int col) const        { return cells[row * n_cols + col]; }
    int&        cell            (int row, int col)              { return cells[row * n_cols + col]; }
    void        add_rows        (int count);
  };
  struct Cache {
    bool        valid;
    Point       size;
    vector<int> column_widths, row_heights;
    Cache() : valid (false) {}
  };
  Cache         cache_;
  int           columns         () const;
  int           left_margin     () const { return margin (margin_left, margin_width); }
  int           right_margin    () const { return margin (margin_right, margin_width); }
  int           top_margin      () const { return margin (margin_top, margin_height); }
  int           bottom_margin   () const { return margin (margin_bottom, margin_height); }
  Grid          build_grid      (Composite &composite, bool flush_cache) const;
  void          compute_sizes   (const Grid &grid, vector<int> &widths, vector<int> &heights) const;
  Point         total_size      (const vector<int> &widths, const vector<int> &heights) const;
public:
  int           num_columns;
  bool          make_columns_equal_width;
  int           margin_width, margin_height;
  int           margin_left, margin_top, margin_right, margin_bottom;
  int           horizontal_spacing, vertical_spacing;
  explicit              GridLayout      (int num_columns = 1, bool make_columns_equal_width = false);
  virtual const char*   name            () const override { return "GridLayout"; }
  virtual Point         compute_size    (Composite &composite, int whint, int hhint, bool flush_cache) override;
  virtual void          layout          (Composite &composite, bool flush_cache) override;
  virtual bool          flush_cache     (Control *control) override;
};

} // Loom

#endif  /* __LOOM_GRIDLAYOUT_HH__ */

// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "gridlayout.hh"

#define LDEBUG(...)     LOOM_KEY_DEBUG ("Layout", __VA_ARGS__)

namespace Loom {

GridLayout::GridLayout (int num_columns_, bool make_columns_equal_width_) :
  num_columns (num_columns_), make_columns_equal_width (make_columns_equal_width_),
  margin_width (5), margin_height (5),
  margin_left (0), margin_top (0), margin_right (0), margin_bottom (0),
  horizontal_spacing (5), vertical_spacing (5)
{}

void
GridLayout::Grid::add_rows (int count)
{
  n_rows += count;
  cells.resize (n_rows * n_cols, -1);
}

int
GridLayout::columns () const
{
  if (num_columns < 1)
    {
      LOOM_CRITICAL ("invalid number of grid columns: %d", num_columns);
      return 1;
    }
  return num_columns;
}

bool
GridLayout::flush_cache (Control *control)
{
  cache_.valid = false;
  return true;
}

/// Assign every visible, non-excluded child to its cells.
GridLayout::Grid
GridLayout::build_grid (Composite &composite, bool flush_cache) const
{
  Grid grid (columns());
  int row = 0, col = 0;
  for (auto child : composite)
    {
      if (!child->visible())
        continue;
      const GridData *data = child->layout_data_as<GridData>();
      if (data && data->exclude)
        continue;
      Placement p;
      p.control = child.get();
      if (data)
        p.data = *data;
      /* advance to the next unoccupied cell */
      for (;;)
        {
          if (col >= grid.n_cols)
            {
              row++;
              col = 0;
            }
          if (row >= grid.n_rows || grid.cell (row, col) < 0)
            break;
          col++;
        }
      p.row = row;
      p.col = col;
      p.hspan = CLAMP (p.data.horizontal_span, 1, grid.n_cols - col);
      if (row < grid.n_rows)
        for (int s = 1; s < p.hspan; s++)
          if (grid.cell (row, col + s) >= 0)
            {
              p.hspan = s;      // stop at a cell claimed by a row spanning child
              break;
            }
      p.vspan = MAX (1, p.data.vertical_span);
      if (p.hspan != p.data.horizontal_span || p.vspan != p.data.vertical_span)
        LDEBUG ("%s: clamped span of %s to %dx%d", composite.name(), child->name(), p.hspan, p.vspan);
      if (row + p.vspan > grid.n_rows)
        grid.add_rows (row + p.vspan - grid.n_rows);
      const int index = grid.placements.size();
      for (int r = row; r < row + p.vspan; r++)
        for (int c = col; c < col + p.hspan; c++)
          grid.cell (r, c) = index;
      p.size = child_size (*child, p.data.width_hint, p.data.height_hint, flush_cache);
      p.size.x = MAX (p.size.x, p.data.minimum_width);
      p.size.y = MAX (p.size.y, p.data.minimum_height);
      grid.placements.push_back (p);
      col += p.hspan;
    }
  return grid;
}

/// Intrinsic column widths and row heights, determined by children that do not span.
void
GridLayout::compute_sizes (const Grid &grid, vector<int> &widths, vector<int> &heights) const
{
  widths.assign (grid.n_cols, 0);
  heights.assign (grid.n_rows, 0);
  for (const Placement &p : grid.placements)
    {
      if (p.hspan == 1)
        widths[p.col] = MAX (widths[p.col], p.size.x + p.data.horizontal_indent);
      if (p.vspan == 1)
        heights[p.row] = MAX (heights[p.row], p.size.y + p.data.vertical_indent);
    }
  if (make_columns_equal_width)
    {
      int max_width = 0;
      for (int w : widths)
        max_width = MAX (max_width, w);
      widths.assign (grid.n_cols, max_width);
    }
}

Point
GridLayout::total_size (const vector<int> &widths, const vector<int> &heights) const
{
  int width = left_margin() + right_margin(), height = top_margin() + bottom_margin();
  for (size_t c = 0; c < widths.size(); c++)
    width += widths[c] + (c ? horizontal_spacing : 0);
  for (size_t r = 0; r < heights.size(); r++)
    height += heights[r] + (r ? vertical_spacing : 0);
  return Point (width, height);
}

Point
GridLayout::compute_size (Composite &composite, int whint, int hhint, bool flush_cache)
{
  if (flush_cache)
    cache_.valid = false;
  const bool default_hints = whint == DEFAULT && hhint == DEFAULT;
  if (default_hints && cache_.valid)
    return cache_.size;
  const Grid grid = build_grid (composite, flush_cache);
  if (grid.placements.empty())
    return Point (left_margin() + right_margin(), top_margin() + bottom_margin());
  vector<int> widths, heights;
  compute_sizes (grid, widths, heights);
  const Point size = total_size (widths, heights);
  if (default_hints)
    {
      cache_.column_widths = widths;
      cache_.row_heights = heights;
      cache_.size = size;
      cache_.valid = true;
    }
  return size;
}

/* hand out surplus space evenly to the grabbing lines, the division remainder is dropped */
static void
distribute_surplus (vector<int> &sizes, const vector<bool> &grabbing, int available, int spacing)
{
  int used = 0, n_grab = 0;
  for (size_t i = 0; i < sizes.size(); i++)
    {
      used += sizes[i] + (i ? spacing : 0);
      n_grab += grabbing[i];
    }
  const int extra = available - used;
  if (extra <= 0 || n_grab == 0)
    return;
  const int per_line = extra / n_grab;
  for (size_t i = 0; i < sizes.size(); i++)
    if (grabbing[i])
      sizes[i] += per_line;
}

/* position and extent of a child along one axis of its cell */
static void
align_in_cell (Alignment alignment, int cell_pos, int cell_extent, int preferred, int indent, int hint, int minimum,
               int *pos, int *extent)
{
  const int room = cell_extent - indent;
  int p = cell_pos + indent, e = MIN (preferred, room);
  switch (alignment)
    {
    case BEGINNING:
      break;
    case CENTER:
      p += (room - e) / 2;
      break;
    case END:
      p = cell_pos + cell_extent - e;
      break;
    case FILL:
      e = room;
      break;
    }
  if (hint != DEFAULT)
    e = hint;
  e = MAX (e, minimum);
  *pos = p;
  *extent = MAX (e, 0);
}

void
GridLayout::layout (Composite &composite, bool flush_cache)
{
  if (flush_cache)
    cache_.valid = false;
  const Grid grid = build_grid (composite, flush_cache);
  if (grid.placements.empty())
    return;
  if (!cache_.valid ||
      cache_.column_widths.size() != size_t (grid.n_cols) ||
      cache_.row_heights.size() != size_t (grid.n_rows))
    {
      compute_sizes (grid, cache_.column_widths, cache_.row_heights);
      cache_.size = total_size (cache_.column_widths, cache_.row_heights);
      cache_.valid = true;
    }
  vector<int> widths = cache_.column_widths, heights = cache_.row_heights;
  /* mark lines containing a grabbing child, spanned cells included */
  vector<bool> grab_cols (grid.n_cols, false), grab_rows (grid.n_rows, false);
  for (int r = 0; r < grid.n_rows; r++)
    for (int c = 0; c < grid.n_cols; c++)
      {
        const int index = grid.cell (r, c);
        if (index < 0)
          continue;
        const GridData &data = grid.placements[index].data;
        grab_cols[c] = grab_cols[c] || data.grab_excess_horizontal_space;
        grab_rows[r] = grab_rows[r] || data.grab_excess_vertical_space;
      }
  const Rect area = composite.client_area();
  distribute_surplus (widths, grab_cols, area.width - left_margin() - right_margin(), horizontal_spacing);
  distribute_surplus (heights, grab_rows, area.height - top_margin() - bottom_margin(), vertical_spacing);
  /* cell origins */
  vector<int> col_x (grid.n_cols), row_y (grid.n_rows);
  for (int c = 0, x = area.x + left_margin(); c < grid.n_cols; c++)
    {
      col_x[c] = x;
      x += widths[c] + horizontal_spacing;
    }
  for (int r = 0, y = area.y + top_margin(); r < grid.n_rows; r++)
    {
      row_y[r] = y;
      y += heights[r] + vertical_spacing;
    }
  /* place each child once, at its top-left cell */
  vector<bool> processed (grid.placements.size(), false);
  for (int r = 0; r < grid.n_rows; r++)
    for (int c = 0; c < grid.n_cols; c++)
      {
        const int index = grid.cell (r, c);
        if (index < 0 || processed[index])
          continue;
        processed[index] = true;
        const Placement &p = grid.placements[index];
        int cell_width = horizontal_spacing * (p.hspan - 1), cell_height = vertical_spacing * (p.vspan - 1);
        for (int i = 0; i < p.hspan; i++)
          cell_width += widths[p.col + i];
        for (int i = 0; i < p.vspan; i++)
          cell_height += heights[p.row + i];
        int x, y, width, height;
        align_in_cell (p.data.horizontal_alignment, col_x[p.col], cell_width, p.size.x, p.data.horizontal_indent,
                       p.data.width_hint, p.data.minimum_width, &x, &width);
        align_in_cell (p.data.vertical_alignment, row_y[p.row], cell_height, p.size.y, p.data.vertical_indent,
                       p.data.height_hint, p.data.minimum_height, &y, &height);
        p.control->set_bounds (x, y, width, height);
      }
  LDEBUG ("%s: grid of %d columns x %d rows with %zu children", composite.name(),
          grid.n_cols, grid.n_rows, grid.placements.size());
}

} // Loom

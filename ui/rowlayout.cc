// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "rowlayout.hh"

#define LDEBUG(...)     LOOM_KEY_DEBUG ("Layout", __VA_ARGS__)

namespace Loom {

/* Major refers to the flow axis (x for HORIZONTAL), minor to the cross axis. */
static inline int
major (Orientation type, const Point &p)
{
  return type == HORIZONTAL ? p.x : p.y;
}

static inline int
minor (Orientation type, const Point &p)
{
  return type == HORIZONTAL ? p.y : p.x;
}

static inline Point
major_minor (Orientation type, int major, int minor)
{
  return type == HORIZONTAL ? Point (major, minor) : Point (minor, major);
}

RowLayout::RowLayout (Orientation type_) :
  type (type_),
  margin_width (0), margin_height (0),
  margin_left (3), margin_top (3), margin_right (3), margin_bottom (3),
  spacing (3),
  wrap (true), pack (true), fill (false), center (false), justify (false)
{}

int
RowLayout::lead_major () const
{
  return type == HORIZONTAL ? margin_width + margin_left : margin_height + margin_top;
}

int
RowLayout::trail_major () const
{
  return type == HORIZONTAL ? margin_width + margin_right : margin_height + margin_bottom;
}

int
RowLayout::lead_minor () const
{
  return type == HORIZONTAL ? margin_height + margin_top : margin_width + margin_left;
}

int
RowLayout::trail_minor () const
{
  return type == HORIZONTAL ? margin_height + margin_bottom : margin_width + margin_right;
}

vector<RowLayout::Item>
RowLayout::collect_items (Composite &composite, bool flush_cache) const
{
  vector<Item> items;
  Point largest;
  for (auto child : composite)
    {
      if (!child->visible())
        continue;
      const RowData *data = child->layout_data_as<RowData>();
      if (data && data->exclude)
        continue;
      Item item;
      item.control = child.get();
      item.size = data ? child_size (*child, data->width, data->height, flush_cache) : child_size (*child, DEFAULT, DEFAULT, flush_cache);
      largest = Point (MAX (largest.x, item.size.x), MAX (largest.y, item.size.y));
      items.push_back (item);
    }
  if (!pack)    // uniform child sizes
    for (auto &item : items)
      item.size = largest;
  return items;
}

/// Split @a items into lines, wrapping at @a available along the flow axis unless it is DEFAULT.
vector<RowLayout::Line>
RowLayout::break_lines (const vector<Item> &items, int available) const
{
  vector<Line> lines;
  for (size_t i = 0; i < items.size(); i++)
    {
      const int extent = major (type, items[i].size), thickness = minor (type, items[i].size);
      if (lines.empty() ||
          (wrap && available != DEFAULT && lines.back().count > 0 &&
           lines.back().extent + spacing + extent > available))
        {
          Line line = { i, 0, 0, 0 };
          lines.push_back (line);
        }
      Line &line = lines.back();
      line.extent += (line.count ? spacing : 0) + extent;
      line.thickness = MAX (line.thickness, thickness);
      line.count++;
    }
  return lines;
}

Point
RowLayout::compute_size (Composite &composite, int whint, int hhint, bool flush_cache)
{
  const vector<Item> items = collect_items (composite, flush_cache);
  const int hint = type == HORIZONTAL ? whint : hhint;
  const int available = hint == DEFAULT ? DEFAULT : hint - lead_major() - trail_major();
  const vector<Line> lines = break_lines (items, available);
  int total_major = 0, total_minor = 0;
  for (size_t l = 0; l < lines.size(); l++)
    {
      total_major = MAX (total_major, lines[l].extent);
      total_minor += (l ? spacing : 0) + lines[l].thickness;
    }
  return major_minor (type,
                      total_major + lead_major() + trail_major(),
                      total_minor + lead_minor() + trail_minor());
}

void
RowLayout::layout (Composite &composite, bool flush_cache)
{
  const vector<Item> items = collect_items (composite, flush_cache);
  const Rect area = composite.client_area();
  const int available = major (type, area.size()) - lead_major() - trail_major();
  const vector<Line> lines = break_lines (items, MAX (0, available));
  int minor_pos = minor (type, area.origin()) + lead_minor();
  for (const Line &line : lines)
    {
      /* with justify, the remaining space of a line is split into gaps around its children */
      const int gap = justify ? MAX (0, available - line.extent) / int (line.count + 1) : 0;
      int major_pos = major (type, area.origin()) + lead_major();
      for (size_t j = 0; j < line.count; j++)
        {
          const Item &item = items[line.first + j];
          int child_minor = minor_pos, thickness = minor (type, item.size);
          if (fill)
            thickness = line.thickness;
          else if (center)
            child_minor += (line.thickness - thickness) / 2;
          const int child_major = major_pos + int (j + 1) * gap;
          const Point pos = major_minor (type, child_major, child_minor);
          const Point size = major_minor (type, major (type, item.size), thickness);
          item.control->set_bounds (pos.x, pos.y, size.x, size.y);
          major_pos += major (type, item.size) + spacing;
        }
      minor_pos += line.thickness + spacing;
    }
  LDEBUG ("%s: %zu children in %zu lines", composite.name(), items.size(), lines.size());
}

} // Loom

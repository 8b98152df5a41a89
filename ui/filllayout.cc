// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "filllayout.hh"

#define LDEBUG(...)     LOOM_KEY_DEBUG ("Layout", __VA_ARGS__)

namespace Loom {

FillLayout::FillLayout (Orientation type_) :
  type (type_), margin_width (0), margin_height (0), spacing (0)
{}

Point
FillLayout::compute_size (Composite &composite, int whint, int hhint, bool flush_cache)
{
  int n_visible = 0, max_width = 0, max_height = 0;
  for (auto child : composite)
    {
      if (!child->visible())
        continue;
      const Point size = child_size (*child, DEFAULT, DEFAULT, flush_cache);
      max_width = MAX (max_width, size.x);
      max_height = MAX (max_height, size.y);
      n_visible++;
    }
  if (n_visible == 0)
    return Point (2 * margin_width, 2 * margin_height);
  if (type == HORIZONTAL)
    return Point (max_width * n_visible + spacing * (n_visible - 1) + 2 * margin_width,
                  max_height + 2 * margin_height);
  else
    return Point (max_width + 2 * margin_width,
                  max_height * n_visible + spacing * (n_visible - 1) + 2 * margin_height);
}

void
FillLayout::layout (Composite &composite, bool flush_cache)
{
  vector<Control*> visible;
  for (auto child : composite)
    if (child->visible())
      visible.push_back (child.get());
  const int n_visible = visible.size();
  if (n_visible == 0)
    return;
  const Rect area = composite.client_area();
  const int x = area.x + margin_width, y = area.y + margin_height;
  const int width = area.width - 2 * margin_width, height = area.height - 2 * margin_height;
  /* divide the flow axis evenly, the division remainder stays unassigned */
  if (type == HORIZONTAL)
    {
      const int child_width = MAX (0, (width - spacing * (n_visible - 1)) / n_visible);
      for (int i = 0; i < n_visible; i++)
        visible[i]->set_bounds (x + i * (child_width + spacing), y, child_width, MAX (0, height));
    }
  else
    {
      const int child_height = MAX (0, (height - spacing * (n_visible - 1)) / n_visible);
      for (int i = 0; i < n_visible; i++)
        visible[i]->set_bounds (x, y + i * (child_height + spacing), MAX (0, width), child_height);
    }
  LDEBUG ("%s: filled %d children into %s", composite.name(), n_visible, area.string());
}

} // Loom

// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "stacklayout.hh"

#define LDEBUG(...)     LOOM_KEY_DEBUG ("Layout", __VA_ARGS__)

namespace Loom {

StackLayout::StackLayout () :
  margin_width (0), margin_height (0)
{}

Point
StackLayout::compute_size (Composite &composite, int whint, int hhint, bool flush_cache)
{
  const Point margins (2 * margin_width, 2 * margin_height);
  const ControlP top_control = top_control_.lock();
  if (!top_control || !composite.has_child (top_control.get()))
    return margins;
  const int cwhint = whint == DEFAULT ? DEFAULT : MAX (0, whint - margins.x);
  const int chhint = hhint == DEFAULT ? DEFAULT : MAX (0, hhint - margins.y);
  const Point size = child_size (*top_control, cwhint, chhint, flush_cache);
  return Point (size.x + margins.x, size.y + margins.y);
}

void
StackLayout::layout (Composite &composite, bool flush_cache)
{
  const Rect area = composite.client_area();
  const ControlP top_control = top_control_.lock();
  for (auto child : composite)
    if (child == top_control && child->visible())
      child->set_bounds (area.x + margin_width, area.y + margin_height,
                         MAX (0, area.width - 2 * margin_width), MAX (0, area.height - 2 * margin_height));
    else
      child->set_bounds (-1, -1, 0, 0);     // hidden
  LDEBUG ("%s: top control: %s", composite.name(), top_control ? top_control->name() : String ("(none)"));
}

} // Loom

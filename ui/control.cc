// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "control.hh"
#include "layout.hh"
#include <algorithm>

#define LDEBUG(...)     LOOM_KEY_DEBUG ("Layout", __VA_ARGS__)

namespace Loom {

Control::Control (const String &name) :
  name_ (name), parent_ (NULL), visible_ (true)
{}

Control::~Control ()
{
  LOOM_CRITICAL_UNLESS (parent_ == NULL);
}

void
Control::set_bounds (const Rect &rect)
{
  if (rect == bounds_)
    return;
  const Rect old_bounds = bounds_;
  bounds_ = rect;
  if (old_bounds.width != rect.width || old_bounds.height != rect.height)
    size_changed (old_bounds);
}

void
Control::size_changed (const Rect &old_bounds)
{}

void
Control::relayout_parent ()
{
  if (!parent_)
    return;
  LayoutP layout = parent_->layout_manager();
  if (layout)
    {
      layout->flush_cache (this);
      parent_->layout (true);
    }
}

void
Control::visible (bool visible)
{
  if (visible_ == visible)
    return;
  visible_ = visible;
  relayout_parent();
}

/// Assign constraints for the layout of the parent, the parent layout is recalculated.
void
Control::layout_data (LayoutDataP data)
{
  layout_data_ = data;
  relayout_parent();
}

Composite::Composite (const String &name) :
  Control (name)
{}

Composite::~Composite ()
{
  if (layout_)
    layout_->owner_ = NULL;
  for (auto child : children_)
    child->parent_ = NULL;
}

ControlP
Composite::nth_child (size_t nth) const
{
  LOOM_ASSERT_RETURN (nth < children_.size(), NULL);
  return children_[nth];
}

ControlP
Composite::find_child (const String &name) const
{
  for (auto child : children_)
    if (child->name() == name)
      return child;
  return NULL;
}

bool
Composite::has_child (const Control *control) const
{
  for (auto child : children_)
    if (child.get() == control)
      return true;
  return false;
}

/// Append @a child, children are positioned in the order they have been added.
void
Composite::add (ControlP child)
{
  LOOM_ASSERT_RETURN (child != NULL);
  if (child->parent_)
    throw Exception ("not adding control with parent: ", child->name());
  LOOM_ASSERT_RETURN (child.get() != this);
  children_.push_back (child);
  child->parent_ = this;
  if (layout_)
    {
      layout_->flush_cache (child.get());
      layout (true);
    }
}

void
Composite::remove (Control &child)
{
  auto it = std::find_if (children_.begin(), children_.end(),
                          [&child] (const ControlP &c) { return c.get() == &child; });
  if (it == children_.end())
    {
      LOOM_CRITICAL ("%s: not removing control that is not a child: %s", name(), child.name());
      return;
    }
  ControlP keep = *it;  // keep child alive during relayout
  children_.erase (it);
  keep->parent_ = NULL;
  if (layout_)
    {
      layout_->flush_cache (keep.get());
      layout (true);
    }
}

/** Install @a layout to arrange the children, an immediate layout pass is performed.
 * A layout that is still installed on another Composite is rejected, the previous
 * layout of this Composite is released and its caches are flushed.
 */
void
Composite::set_layout (LayoutP layout)
{
  if (layout && layout->owner_ && layout->owner_ != this)
    {
      LOOM_CRITICAL ("%s: not using %s installed on: %s", name(), layout->name(), layout->owner_->name());
      return;
    }
  if (layout_ && layout_ != layout)
    {
      layout_->owner_ = NULL;
      layout_->flush_cache (NULL);
    }
  layout_ = layout;
  if (layout_)
    {
      layout_->owner_ = this;
      layout_->flush_cache (NULL);
      LDEBUG ("%s: using %s", name(), layout_->name());
    }
  this->layout (true);
}

/// Interior area available to the children, relative to this Composite.
Rect
Composite::client_area () const
{
  return Rect (0, 0, bounds().width, bounds().height);
}

/// Preferred size of this Composite as determined by its layout.
Point
Composite::compute_size (int whint, int hhint, bool flush_cache)
{
  if (!layout_)
    return Point (DEFAULT_WIDTH, DEFAULT_HEIGHT);
  Point size = layout_->compute_size (*this, whint, hhint, flush_cache);
  if (size.x == 0)
    size.x = DEFAULT_WIDTH;
  if (size.y == 0)
    size.y = DEFAULT_HEIGHT;
  return size;
}

/** Position and size all children according to the layout.
 * With @a changed, cached layout information is recomputed, with @a all, the
 * layout of child Composites is updated recursively.
 */
void
Composite::layout (bool changed, bool all)
{
  if (layout_)
    layout_->layout (*this, changed);
  if (all)
    for (auto child : children_)
      {
        Composite *composite = child->as_composite();
        if (composite)
          composite->layout (changed, true);
      }
}

void
Composite::size_changed (const Rect &old_bounds)
{
  if (layout_)
    layout (false);
}

} // Loom

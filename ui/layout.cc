// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "layout.hh"

namespace Loom {

Layout::Layout () :
  owner_ (NULL)
{}

Layout::~Layout ()
{}

/// Discard cached information about @a control, returns true if the layout has no per-control cache.
bool
Layout::flush_cache (Control *control)
{
  return true;
}

/** Preferred size of @a child.
 * Composites are asked for their computed size, other controls default to 64x24.
 * Hints other than DEFAULT override the respective dimension.
 */
Point
Layout::child_size (Control &child, int whint, int hhint, bool flush_cache)
{
  Composite *composite = child.as_composite();
  Point size = composite ? composite->compute_size (whint, hhint, flush_cache) : Point (DEFAULT_WIDTH, DEFAULT_HEIGHT);
  if (whint != DEFAULT)
    size.x = whint;
  if (hhint != DEFAULT)
    size.y = hhint;
  return size;
}

} // Loom

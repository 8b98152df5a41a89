// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_LAYOUT_HH__
#define __LOOM_LAYOUT_HH__

#include <ui/layoutdata.hh>

namespace Loom {

/** Algorithm that positions and sizes the children of a Composite.
 * A Layout is installed on at most one Composite at a time, compute_size() reports a preferred
 * size without touching the children, layout() assigns the bounds of all children.
 */
class Layout {
  Composite            *owner_;
  friend class          Composite;
  LOOM_CLASS_NON_COPYABLE (Layout);
protected:
  static const int      DEFAULT_WIDTH = 64;
  static const int      DEFAULT_HEIGHT = 24;
  static Point          child_size      (Control &child, int whint, int hhint, bool flush_cache = true);
  static int            margin          (int specific, int fallback) { return specific != 0 ? specific : fallback; }
  explicit              Layout          ();
public:
  virtual              ~Layout          ();
  Composite*            owner           () const { return owner_; } ///< Composite this layout is installed on.
  virtual const char*   name            () const = 0;
  virtual Point         compute_size    (Composite &composite, int whint, int hhint, bool flush_cache) = 0;
  virtual void          layout          (Composite &composite, bool flush_cache) = 0;
  virtual bool          flush_cache     (Control *control);
};

} // Loom

#endif  /* __LOOM_LAYOUT_HH__ */

// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_STACKLAYOUT_HH__
#define __LOOM_STACKLAYOUT_HH__

#include <ui/layout.hh>

namespace Loom {

/** Shows only the top control, which fills the client area.
 * All other children are moved outside of the client area with zero size. Changing
 * top_control() requires a subsequent Composite::layout() call to take effect.
 */
class StackLayout : public Layout {
  std::weak_ptr<Control> top_control_;
public:
  int           margin_width, margin_height;
  explicit              StackLayout     ();
  ControlP              top_control     () const            { return top_control_.lock(); }
  void                  top_control     (ControlP control)  { top_control_ = control; }
  virtual const char*   name            () const override { return "StackLayout"; }
  virtual Point         compute_size    (Composite &composite, int whint, int hhint, bool flush_cache) override;
  virtual void          layout          (Composite &composite, bool flush_cache) override;
};

} // Loom

#endif  /* __LOOM_STACKLAYOUT_HH__ */

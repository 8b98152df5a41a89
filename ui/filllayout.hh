// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_FILLLAYOUT_HH__
#define __LOOM_FILLLAYOUT_HH__

#include <ui/layout.hh>

namespace Loom {

/// Arranges all visible children in a single row or column, each receiving the same size.
class FillLayout : public Layout {
public:
  Orientation   type;
  int           margin_width, margin_height;
  int           spacing;
  explicit              FillLayout      (Orientation type = HORIZONTAL);
  virtual const char*   name            () const override { return "FillLayout"; }
  virtual Point         compute_size    (Composite &composite, int whint, int hhint, bool flush_cache) override;
  virtual void          layout          (Composite &composite, bool flush_cache) override;
};

} // Loom

#endif  /* __LOOM_FILLLAYOUT_HH__ */

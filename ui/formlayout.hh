// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_FORMLAYOUT_HH__
#define __LOOM_FORMLAYOUT_HH__

#include <ui/layout.hh>

namespace Loom {

/** Positions children by attaching their edges to the parent or to sibling controls.
 * Each edge of a child is attached through the FormAttachment fields of its FormData,
 * either to a fraction of the client area extent or to an edge of a visible sibling.
 * Children are resolved in dependency order, circular attachments raise CircularAttachment.
 */
class FormLayout : public Layout {
  struct Node {
    Control        *control;
    const FormData *data;
    vector<size_t>  depends;    // indices of attachment targets
  };
  int           left_margin     () const { return margin (margin_left, margin_width); }
  int           right_margin    () const { return margin (margin_right, margin_width); }
  int           top_margin      () const { return margin (margin_top, margin_height); }
  int           bottom_margin   () const { return margin (margin_bottom, margin_height); }
  vector<Node>  collect_nodes   (Composite &composite) const;
  vector<size_t> resolve_order  (const vector<Node> &nodes) const;
  int           attached_edge   (const FormAttachment &attachment, int extent, const vector<Node> &nodes,
                                 const vector<Rect> &resolved, bool horizontal, bool leading) const;
public:
  int           margin_width, margin_height;
  int           margin_left, margin_top, margin_right, margin_bottom;
  int           spacing;
  explicit              FormLayout      ();
  virtual const char*   name            () const override { return "FormLayout"; }
  virtual Point         compute_size    (Composite &composite, int whint, int hhint, bool flush_cache) override;
  virtual void          layout          (Composite &composite, bool flush_cache) override;
};

} // Loom

#endif  /* __LOOM_FORMLAYOUT_HH__ */

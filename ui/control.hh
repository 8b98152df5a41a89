// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_CONTROL_HH__
#define __LOOM_CONTROL_HH__

#include <ui/primitives.hh>
#include <ui/utilities.hh>

namespace Loom {

class Control;
class Composite;
class Layout;
struct LayoutData;
typedef std::shared_ptr<Control>    ControlP;
typedef std::shared_ptr<Composite>  CompositeP;
typedef std::shared_ptr<Layout>     LayoutP;
typedef std::shared_ptr<LayoutData> LayoutDataP;

/// Leaf of the control tree, positioned by the layout of its parent Composite.
class Control {
  String        name_;
  Rect          bounds_;
  Composite    *parent_;
  LayoutDataP   layout_data_;
  bool          visible_;
  friend class  Composite;
  LOOM_CLASS_NON_COPYABLE (Control);
  void                  relayout_parent ();
protected:
  virtual void          size_changed    (const Rect &old_bounds);
public:
  explicit              Control         (const String &name = "");
  virtual              ~Control         ();
  const String&         name            () const                { return name_; }
  void                  name            (const String &name)    { name_ = name; }
  Composite*            parent          () const                { return parent_; }
  const Rect&           bounds          () const                { return bounds_; }
  void                  set_bounds      (const Rect &rect);
  void                  set_bounds      (int x, int y, int width, int height) { set_bounds (Rect (x, y, width, height)); }
  bool                  visible         () const                { return visible_; }
  void                  visible         (bool visible);
  LayoutDataP           layout_data     () const                { return layout_data_; }
  void                  layout_data     (LayoutDataP data);
  template<class Data>
  const Data*           layout_data_as  () const                { return dynamic_cast<const Data*> (layout_data_.get()); }
  virtual Composite*    as_composite    ()                      { return NULL; }
};

/// Container of an ordered list of child controls, arranged by an optional Layout.
class Composite : public Control {
  vector<ControlP>      children_;
  LayoutP               layout_;
protected:
  virtual void          size_changed    (const Rect &old_bounds) override;
public:
  static const int      DEFAULT_WIDTH = 64;
  static const int      DEFAULT_HEIGHT = 64;
  typedef vector<ControlP>::const_iterator ConstChildIter;
  explicit              Composite       (const String &name = "");
  virtual              ~Composite       ();
  virtual Composite*    as_composite    () override { return this; }
  ConstChildIter        begin           () const { return children_.begin(); }
  ConstChildIter        end             () const { return children_.end(); }
  const vector<ControlP>& children      () const { return children_; }
  size_t                n_children      () const { return children_.size(); }
  ControlP              nth_child       (size_t nth) const;
  ControlP              find_child      (const String &name) const;
  bool                  has_child       (const Control *control) const;
  void                  add             (ControlP child);
  void                  remove          (Control &child);
  LayoutP               layout_manager  () const { return layout_; }
  void                  set_layout      (LayoutP layout);
  virtual Rect          client_area     () const;
  Point                 compute_size    (int whint, int hhint, bool flush_cache = true);
  void                  layout          (bool changed = true, bool all = false);
};

} // Loom

#endif  /* __LOOM_CONTROL_HH__ */

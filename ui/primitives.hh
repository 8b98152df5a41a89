// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_PRIMITIVES_HH__
#define __LOOM_PRIMITIVES_HH__

#include <loom-core.hh>

#if !defined __LOOM_UI_HH__ && !defined __LOOM_BUILD__
#error Only <loom.hh> can be included directly.
#endif

namespace Loom {

/* --- constants --- */
/// Hint value requesting the natural size of a control.
static const int DEFAULT = -1;

/// Flow direction of Fill and Row layouts, also used as style bits for GridData::from_style().
enum Orientation {
  HORIZONTAL    = 1 << 0,
  VERTICAL      = 1 << 1,
};

/// Placement of a control within its grid cell.
enum Alignment {
  BEGINNING     = 1,
  CENTER        = 2,
  END           = 3,
  FILL          = 4,
};

/// Edge of a target control that a FormAttachment refers to.
enum Attach {
  ATTACH_DEFAULT = -1,  ///< Opposite edge of the target, separated by the layout spacing.
  ATTACH_LEFT,
  ATTACH_RIGHT,
  ATTACH_TOP,
  ATTACH_BOTTOM,
  ATTACH_CENTER,
};

/* --- Point --- */
class Point {
public:
  int x, y;
  Point (int ax,
         int ay) :
    x (ax),
    y (ay)
  {}
  explicit Point () :
    x (0),
    y (0)
  {}
  inline bool   operator== (const Point &p2) const { return x == p2.x && y == p2.y; }
  inline bool   operator!= (const Point &p2) const { return x != p2.x || y != p2.y; }
  String        string     () const;
};

/* --- Rect --- */
class Rect {
public:
  int x, y;
  int width;
  int height;
  explicit      Rect            ();
  explicit      Rect            (Point p0, int cwidth, int cheight);
  explicit      Rect            (int cx, int cy, int cwidth, int cheight);
  Rect&         assign          (int cx, int cy, int cwidth, int cheight);
  int           upper_x         () const { return x + width; }
  int           upper_y         () const { return y + height; }
  Point         origin          () const { return Point (x, y); }
  Point         size            () const { return Point (width, height); }
  bool          contains        (const Point &point) const      { return x <= point.x && y <= point.y && point.x < x + width && point.y < y + height; }
  bool          operator==      (const Rect  &other) const;
  bool          operator!=      (const Rect  &other) const      { return !operator== (other); }
  bool          empty           () const;
  String        string          () const;
};

} // Loom

#endif  /* __LOOM_PRIMITIVES_HH__ */

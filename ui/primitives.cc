// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "primitives.hh"

namespace Loom {

String
Point::string () const
{
  return string_format ("Point {X=%d, Y=%d}", x, y);
}

Rect::Rect () :
  x (0), y (0), width (0), height (0)
{}

Rect::Rect (Point p0, int cwidth, int cheight) :
  x (p0.x), y (p0.y), width (cwidth), height (cheight)
{}

Rect::Rect (int cx, int cy, int cwidth, int cheight) :
  x (cx), y (cy), width (cwidth), height (cheight)
{}

Rect&
Rect::assign (int cx, int cy, int cwidth, int cheight)
{
  x = cx;
  y = cy;
  width = cwidth;
  height = cheight;
  return *this;
}

bool
Rect::operator== (const Rect &other) const
{
  return x == other.x && y == other.y && width == other.width && height == other.height;
}

/// A rectangle is empty if it covers no area.
bool
Rect::empty () const
{
  return width <= 0 || height <= 0;
}

String
Rect::string () const
{
  return string_format ("Rect {X=%d, Y=%d, Width=%d, Height=%d}", x, y, width, height);
}

} // Loom

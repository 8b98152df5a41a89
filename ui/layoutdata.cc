// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "layoutdata.hh"

namespace Loom {

LayoutData::~LayoutData ()
{}

static const char*
alignment_name (Alignment alignment)
{
  switch (alignment)
    {
    case BEGINNING:     return "BEGINNING";
    case CENTER:        return "CENTER";
    case END:           return "END";
    case FILL:          return "FILL";
    }
  return "?";
}

static const char*
attach_name (Attach attach)
{
  switch (attach)
    {
    case ATTACH_DEFAULT:        return "DEFAULT";
    case ATTACH_LEFT:           return "LEFT";
    case ATTACH_RIGHT:          return "RIGHT";
    case ATTACH_TOP:            return "TOP";
    case ATTACH_BOTTOM:         return "BOTTOM";
    case ATTACH_CENTER:         return "CENTER";
    }
  return "?";
}

// == GridData ==
GridData::GridData () :
  horizontal_alignment (BEGINNING), vertical_alignment (CENTER),
  width_hint (DEFAULT), height_hint (DEFAULT),
  horizontal_indent (0), vertical_indent (0),
  horizontal_span (1), vertical_span (1),
  minimum_width (0), minimum_height (0),
  grab_excess_horizontal_space (false), grab_excess_vertical_space (false),
  exclude (false)
{}

GridData::GridData (int width_hint_, int height_hint_) :
  GridData()
{
  width_hint = width_hint_;
  height_hint = height_hint_;
}

GridData::GridData (Alignment h_align, Alignment v_align, bool grab_h, bool grab_v, int h_span, int v_span) :
  GridData()
{
  horizontal_alignment = h_align;
  vertical_alignment = v_align;
  grab_excess_horizontal_space = grab_h;
  grab_excess_vertical_space = grab_v;
  horizontal_span = h_span;
  vertical_span = v_span;
}

/// Create GridData that fills and grabs along each Orientation bit set in @a orientation.
GridData
GridData::from_style (uint orientation)
{
  GridData gd;
  if (orientation & HORIZONTAL)
    {
      gd.horizontal_alignment = FILL;
      gd.grab_excess_horizontal_space = true;
    }
  if (orientation & VERTICAL)
    {
      gd.vertical_alignment = FILL;
      gd.grab_excess_vertical_space = true;
    }
  return gd;
}

String
GridData::string () const
{
  return string_format ("GridData {HAlign=%s, VAlign=%s, HSpan=%d, VSpan=%d, WidthHint=%d, HeightHint=%d, "
                        "HIndent=%d, VIndent=%d, MinWidth=%d, MinHeight=%d, GrabH=%d, GrabV=%d, Exclude=%d}",
                        alignment_name (horizontal_alignment), alignment_name (vertical_alignment),
                        horizontal_span, vertical_span, width_hint, height_hint,
                        horizontal_indent, vertical_indent, minimum_width, minimum_height,
                        grab_excess_horizontal_space, grab_excess_vertical_space, exclude);
}

// == RowData ==
RowData::RowData (int width_, int height_) :
  width (width_), height (height_), exclude (false)
{}

RowData::RowData (const Point &size) :
  RowData (size.x, size.y)
{}

String
RowData::string () const
{
  return string_format ("RowData {Width=%d, Height=%d, Exclude=%d}", width, height, exclude);
}

// == FormAttachment ==
FormAttachment::FormAttachment () :
  kind_ (NONE), numerator_ (0), denominator_ (100), alignment_ (ATTACH_DEFAULT), offset_ (0)
{}

/// Attach to @a numerator percent of the parent extent.
FormAttachment
FormAttachment::percent (int numerator, int offset)
{
  return fraction (numerator, 100, offset);
}

/// Attach to @a numerator / @a denominator of the parent extent.
FormAttachment
FormAttachment::fraction (int numerator, int denominator, int offset)
{
  FormAttachment fa;
  fa.kind_ = PERCENTAGE;
  fa.numerator_ = numerator;
  fa.denominator_ = denominator;
  fa.offset_ = offset;
  if (denominator <= 0)
    {
      LOOM_CRITICAL ("invalid FormAttachment denominator: %d", denominator);
      fa.denominator_ = 100;
    }
  return fa;
}

/// Attach to the @a alignment edge of a sibling @a target control.
FormAttachment
FormAttachment::control (ControlP target, int offset, Attach alignment)
{
  FormAttachment fa;
  LOOM_ASSERT_RETURN (target != NULL, fa);
  fa.kind_ = CONTROL;
  fa.target_ = target;
  fa.alignment_ = alignment;
  fa.offset_ = offset;
  return fa;
}

String
FormAttachment::string () const
{
  switch (kind_)
    {
    case PERCENTAGE:
      return string_format ("FormAttachment {%d/%d, Offset=%d}", numerator_, denominator_, offset_);
    case CONTROL:
      {
        ControlP target = target_.lock();
        return string_format ("FormAttachment {Control=%s, Alignment=%s, Offset=%d}",
                              target ? target->name() : "(destroyed)", attach_name (alignment_), offset_);
      }
    case NONE: ;
    }
  return "FormAttachment {}";
}

// == FormData ==
FormData::FormData (int width_, int height_) :
  width (width_), height (height_)
{}

String
FormData::string () const
{
  return string_format ("FormData {Width=%d, Height=%d, Left=%s, Right=%s, Top=%s, Bottom=%s}",
                        width, height, left.string(), right.string(), top.string(), bottom.string());
}

} // Loom

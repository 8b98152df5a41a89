// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __LOOM_LAYOUTDATA_HH__
#define __LOOM_LAYOUTDATA_HH__

#include <ui/control.hh>

namespace Loom {

/// Base of the per-child constraint records interpreted by a matching Layout.
struct LayoutData {
  virtual      ~LayoutData ();
  virtual String string    () const = 0;
};

/// Constraints of a child in a GridLayout.
struct GridData : LayoutData {
  Alignment     horizontal_alignment;
  Alignment     vertical_alignment;
  int           width_hint, height_hint;        ///< Preferred size override or DEFAULT.
  int           horizontal_indent, vertical_indent;
  int           horizontal_span, vertical_span;
  int           minimum_width, minimum_height;
  bool          grab_excess_horizontal_space;
  bool          grab_excess_vertical_space;
  bool          exclude;
  explicit        GridData  ();
  explicit        GridData  (int width_hint, int height_hint);
  explicit        GridData  (Alignment h_align, Alignment v_align, bool grab_h, bool grab_v, int h_span = 1, int v_span = 1);
  static GridData from_style (uint orientation);
  virtual String  string    () const override;
};
typedef std::shared_ptr<GridData> GridDataP;

/// Constraints of a child in a RowLayout.
struct RowData : LayoutData {
  int           width, height;                  ///< Preferred size override or DEFAULT.
  bool          exclude;
  explicit        RowData   (int width = DEFAULT, int height = DEFAULT);
  explicit        RowData   (const Point &size);
  virtual String  string    () const override;
};
typedef std::shared_ptr<RowData> RowDataP;

/** Attachment of one edge of a control in a FormLayout.
 * An attachment is either unset, a fraction of the parent extent or an edge of a sibling control,
 * each carrying an additional pixel offset. The sibling is not kept alive by the attachment.
 */
class FormAttachment {
public:
  enum Kind { NONE, PERCENTAGE, CONTROL };
private:
  Kind          kind_;
  int           numerator_, denominator_;
  std::weak_ptr<Control> target_;
  Attach        alignment_;
  int           offset_;
public:
  explicit      FormAttachment  ();
  static FormAttachment percent  (int numerator, int offset = 0);
  static FormAttachment fraction (int numerator, int denominator, int offset = 0);
  static FormAttachment control  (ControlP target, int offset = 0, Attach alignment = ATTACH_DEFAULT);
  Kind          kind            () const { return kind_; }
  bool          is_set          () const { return kind_ != NONE; }
  int           numerator       () const { return numerator_; }
  int           denominator     () const { return denominator_; }
  ControlP      target          () const { return target_.lock(); } ///< Target of a CONTROL attachment, NULL otherwise or once destroyed.
  Attach        alignment       () const { return alignment_; }
  int           offset          () const { return offset_; }
  String        string          () const;
};

/// Constraints of a child in a FormLayout.
struct FormData : LayoutData {
  int            width, height;                 ///< Preferred size override or DEFAULT.
  FormAttachment left, right, top, bottom;
  explicit        FormData  (int width = DEFAULT, int height = DEFAULT);
  virtual String  string    () const override;
};
typedef std::shared_ptr<FormData> FormDataP;

} // Loom

#endif  /* __LOOM_LAYOUTDATA_HH__ */

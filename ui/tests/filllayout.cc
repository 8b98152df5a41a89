// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <loom-test.hh>
#include <loom.hh>

namespace { // Anon
using namespace Loom;

static CompositeP
create_shell (int n_children, LayoutP layout)
{
  CompositeP shell = std::make_shared<Composite> ("shell");
  for (int i = 0; i < n_children; i++)
    shell->add (std::make_shared<Control> (string_format ("child%d", i)));
  shell->set_layout (layout);
  return shell;
}

static void
test_fill_horizontal()
{
  CompositeP shell = create_shell (3, std::make_shared<FillLayout>());
  shell->set_bounds (0, 0, 300, 90);
  TASSERT (shell->nth_child (0)->bounds() == Rect (0, 0, 100, 90));
  TASSERT (shell->nth_child (1)->bounds() == Rect (100, 0, 100, 90));
  TASSERT (shell->nth_child (2)->bounds() == Rect (200, 0, 100, 90));
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (192, 24));
}
REGISTER_TEST ("FillLayout/Horizontal", test_fill_horizontal);

static void
test_fill_vertical()
{
  CompositeP shell = create_shell (2, std::make_shared<FillLayout> (VERTICAL));
  shell->set_bounds (0, 0, 50, 100);
  TASSERT (shell->nth_child (0)->bounds() == Rect (0, 0, 50, 50));
  TASSERT (shell->nth_child (1)->bounds() == Rect (0, 50, 50, 50));
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (64, 48));
}
REGISTER_TEST ("FillLayout/Vertical", test_fill_vertical);

static void
test_fill_margins_spacing()
{
  std::shared_ptr<FillLayout> fill = std::make_shared<FillLayout>();
  fill->margin_width = 5;
  fill->margin_height = 5;
  fill->spacing = 10;
  CompositeP shell = create_shell (3, fill);
  shell->set_bounds (0, 0, 300, 100);
  TASSERT (shell->nth_child (0)->bounds() == Rect (5, 5, 90, 90));
  TASSERT (shell->nth_child (1)->bounds() == Rect (105, 5, 90, 90));
  TASSERT (shell->nth_child (2)->bounds() == Rect (205, 5, 90, 90));
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (3 * 64 + 2 * 10 + 2 * 5, 24 + 2 * 5));
  // a client area smaller than margins and spacing yields empty children
  shell->set_bounds (0, 0, 20, 8);
  TCMP (shell->nth_child (0)->bounds().width, ==, 0);
  TCMP (shell->nth_child (0)->bounds().height, ==, 0);
}
REGISTER_TEST ("FillLayout/Margins and Spacing", test_fill_margins_spacing);

static void
test_fill_remainder()
{
  CompositeP shell = create_shell (3, std::make_shared<FillLayout>());
  shell->set_bounds (0, 0, 100, 30);
  // 100 / 3 leaves one pixel unassigned at the end
  TASSERT (shell->nth_child (0)->bounds() == Rect (0, 0, 33, 30));
  TASSERT (shell->nth_child (1)->bounds() == Rect (33, 0, 33, 30));
  TASSERT (shell->nth_child (2)->bounds() == Rect (66, 0, 33, 30));
  TCMP (shell->nth_child (2)->bounds().upper_x(), ==, 99);
}
REGISTER_TEST ("FillLayout/Division Remainder", test_fill_remainder);

static void
test_fill_invisible()
{
  CompositeP shell = create_shell (3, std::make_shared<FillLayout>());
  ControlP hidden = shell->nth_child (1);
  hidden->visible (false);
  shell->set_bounds (0, 0, 200, 50);
  TASSERT (shell->nth_child (0)->bounds() == Rect (0, 0, 100, 50));
  TASSERT (shell->nth_child (2)->bounds() == Rect (100, 0, 100, 50));
  TASSERT (hidden->bounds() == Rect());
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (128, 24));
  // without visible children only the margins remain
  FillLayout fill;
  fill.margin_width = 4;
  fill.margin_height = 2;
  CompositeP empty = std::make_shared<Composite> ("empty");
  TASSERT (fill.compute_size (*empty, DEFAULT, DEFAULT, true) == Point (8, 4));
}
REGISTER_TEST ("FillLayout/Invisible Children", test_fill_invisible);

} // Anon

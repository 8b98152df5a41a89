// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <loom-test.hh>
#include <loom.hh>

namespace { // Anon
using namespace Loom;

static CompositeP
create_form_shell (std::shared_ptr<FormLayout> form = std::make_shared<FormLayout>())
{
  CompositeP shell = std::make_shared<Composite> ("shell");
  shell->set_layout (form);
  shell->set_bounds (0, 0, 200, 100);
  return shell;
}

static void
test_form_percentages()
{
  CompositeP shell = create_form_shell();
  ControlP a = std::make_shared<Control> ("a"), b = std::make_shared<Control> ("b");
  FormDataP fa = std::make_shared<FormData>();
  fa->left = FormAttachment::percent (0);
  fa->right = FormAttachment::percent (50);
  a->layout_data (fa);
  shell->add (a);
  TASSERT (a->bounds() == Rect (0, 0, 100, 24));
  FormDataP fb = std::make_shared<FormData>();
  fb->right = FormAttachment::percent (100, -10);
  fb->top = FormAttachment::percent (50);
  fb->bottom = FormAttachment::fraction (3, 4, 5);
  b->layout_data (fb);
  shell->add (b);
  // only the right edge is attached, the preferred width is kept
  TASSERT (b->bounds() == Rect (126, 50, 64, 30));
  // opposing edges in reverse order collapse to an empty extent
  fa->left = FormAttachment::percent (50);
  fa->right = FormAttachment::percent (10);
  a->layout_data (fa);
  TASSERT (a->bounds() == Rect (100, 0, 0, 24));
}
REGISTER_TEST ("FormLayout/Percentages", test_form_percentages);

static void
test_form_sibling_edges()
{
  std::shared_ptr<FormLayout> form = std::make_shared<FormLayout>();
  form->spacing = 6;
  CompositeP shell = create_form_shell (form);
  ControlP a = std::make_shared<Control> ("a"), b = std::make_shared<Control> ("b");
  ControlP c = std::make_shared<Control> ("c"), d = std::make_shared<Control> ("d");
  FormDataP fa = std::make_shared<FormData>();
  fa->left = FormAttachment::percent (0, 50);
  fa->top = FormAttachment::percent (0, 10);
  a->layout_data (fa);
  FormDataP fb = std::make_shared<FormData>();
  fb->left = FormAttachment::control (a, 5);                   // after a, plus spacing
  fb->top = FormAttachment::control (a, 0, ATTACH_TOP);
  b->layout_data (fb);
  FormDataP fc = std::make_shared<FormData>();
  fc->right = FormAttachment::control (a);                     // before a, minus spacing
  fc->top = FormAttachment::control (a);                       // below a
  c->layout_data (fc);
  FormDataP fd = std::make_shared<FormData> (10, 10);
  fd->left = FormAttachment::control (a, 0, ATTACH_CENTER);
  fd->bottom = FormAttachment::control (a, 0, ATTACH_BOTTOM);
  d->layout_data (fd);
  // dependents are added before their target
  shell->add (b);
  shell->add (c);
  shell->add (d);
  shell->add (a);
  TASSERT (a->bounds() == Rect (50, 10, 64, 24));
  TASSERT (b->bounds() == Rect (50 + 64 + 6 + 5, 10, 64, 24));
  TASSERT (c->bounds() == Rect (50 - 6 - 64, 10 + 24 + 6, 64, 24));
  TASSERT (d->bounds() == Rect (50 + 32, 10 + 24 - 10, 10, 10));
}
REGISTER_TEST ("FormLayout/Sibling Edges", test_form_sibling_edges);

static void
test_form_margins_defaults()
{
  std::shared_ptr<FormLayout> form = std::make_shared<FormLayout>();
  form->margin_width = 3;
  form->margin_height = 4;
  form->margin_left = 7;
  CompositeP shell = create_form_shell (form);
  ControlP a = std::make_shared<Control> ("a"), b = std::make_shared<Control> ("b");
  shell->add (a);
  TASSERT (a->bounds() == Rect (7, 4, 64, 24));
  FormDataP fb = std::make_shared<FormData> (20, DEFAULT);
  fb->left = FormAttachment::percent (10);
  b->layout_data (fb);
  shell->add (b);
  // percentages measure the full client area
  TASSERT (b->bounds() == Rect (20, 4, 20, 24));
  // the widest child dominates the estimate
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (64 + 7 + 3, 24 + 4 + 4));
}
REGISTER_TEST ("FormLayout/Margins", test_form_margins_defaults);

static void
test_form_foreign_targets()
{
  CompositeP shell = create_form_shell(), other = std::make_shared<Composite> ("other");
  ControlP stranger = std::make_shared<Control> ("stranger"), hidden = std::make_shared<Control> ("hidden");
  other->add (stranger);
  stranger->set_bounds (100, 50, 10, 10);
  hidden->visible (false);
  shell->add (hidden);
  ControlP a = std::make_shared<Control> ("a"), b = std::make_shared<Control> ("b");
  FormDataP fa = std::make_shared<FormData>();
  fa->left = FormAttachment::control (stranger, 7);
  a->layout_data (fa);
  FormDataP fb = std::make_shared<FormData>();
  fb->top = FormAttachment::control (hidden, 9);
  b->layout_data (fb);
  shell->add (a);
  shell->add (b);
  // edges attached to controls that are not visible siblings resolve to the offset
  TCMP (a->bounds().x, ==, 7);
  TCMP (b->bounds().y, ==, 9);
}
REGISTER_TEST ("FormLayout/Foreign Targets", test_form_foreign_targets);

static void
test_form_destroyed_target()
{
  CompositeP shell = create_form_shell();
  ControlP a = std::make_shared<Control> ("a");
  FormDataP fa = std::make_shared<FormData>();
  {
    ControlP target = std::make_shared<Control> ("target");
    fa->left = FormAttachment::control (target, 6, ATTACH_RIGHT);
    TCMP (fa->left.string(), ==, "FormAttachment {Control=target, Alignment=RIGHT, Offset=6}");
  }
  // the attachment does not keep its target alive
  TASSERT (fa->left.target() == NULL);
  TCMP (fa->left.kind(), ==, FormAttachment::CONTROL);
  TCMP (fa->left.string(), ==, "FormAttachment {Control=(destroyed), Alignment=RIGHT, Offset=6}");
  TASSERT (fa->string().find ("Control=(destroyed)") != String::npos);
  a->layout_data (fa);
  shell->add (a);
  TCMP (a->bounds().x, ==, 6);
}
REGISTER_TEST ("FormLayout/Destroyed Target", test_form_destroyed_target);

static void
test_form_circular()
{
  CompositeP shell = create_form_shell();
  ControlP a = std::make_shared<Control> ("A"), b = std::make_shared<Control> ("B");
  FormDataP fa = std::make_shared<FormData>();
  fa->left = FormAttachment::control (b);
  a->layout_data (fa);
  shell->add (a);       // b is no sibling yet
  FormDataP fb = std::make_shared<FormData>();
  fb->left = FormAttachment::control (a);
  b->layout_data (fb);
  bool thrown = false;
  try {
    shell->add (b);
  } catch (const CircularAttachment &ca) {
    thrown = true;
    TCMP (String (ca.what()), ==, "circular attachment between controls: A -> B -> A");
    TCMP (ca.cycle().size(), ==, 3u);
  }
  TASSERT (thrown);
  TASSERT (shell->has_child (b.get()));
  thrown = false;
  try {
    shell->layout();
  } catch (const CircularAttachment&) {
    thrown = true;
  }
  TASSERT (thrown);
  thrown = false;
  try {
    shell->compute_size (DEFAULT, DEFAULT);
  } catch (const Exception&) {
    thrown = true;
  }
  TASSERT (thrown);
  // breaking the cycle restores layouts
  b->layout_data (std::make_shared<FormData>());
  TASSERT (a->bounds() == Rect (64, 0, 64, 24));
}
REGISTER_TEST ("FormLayout/Circular Attachments", test_form_circular);

static void
test_form_self_attachment()
{
  CompositeP shell = create_form_shell();
  ControlP a = std::make_shared<Control> ("A");
  FormDataP fa = std::make_shared<FormData>();
  fa->top = FormAttachment::control (a);
  a->layout_data (fa);
  StringVector cycle;
  try {
    shell->add (a);
  } catch (const CircularAttachment &ca) {
    cycle = ca.cycle();
  }
  TCMP (string_join (" -> ", cycle), ==, "A -> A");
}
REGISTER_TEST ("FormLayout/Self Attachment", test_form_self_attachment);

static void
test_form_compute_size()
{
  CompositeP shell = create_form_shell();
  ControlP a = std::make_shared<Control> ("a"), b = std::make_shared<Control> ("b");
  FormDataP fa = std::make_shared<FormData>();
  fa->left = FormAttachment::percent (50);
  a->layout_data (fa);
  shell->add (a);
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (50 + 64, 24));
  TASSERT (shell->compute_size (200, DEFAULT) == Point (100 + 64, 24));
  FormDataP fb = std::make_shared<FormData> (DEFAULT, 40);
  fb->left = FormAttachment::control (a, 70);  // only the offset is estimated
  fb->top = FormAttachment::percent (10, 2);
  b->layout_data (fb);
  shell->add (b);
  TASSERT (shell->compute_size (DEFAULT, DEFAULT) == Point (70 + 64, 10 + 2 + 40));
  FormLayout form;
  form.margin_width = 4;
  CompositeP empty = std::make_shared<Composite> ("empty");
  TASSERT (form.compute_size (*empty, DEFAULT, DEFAULT, true) == Point (8, 0));
}
REGISTER_TEST ("FormLayout/Preferred Size", test_form_compute_size);

} // Anon

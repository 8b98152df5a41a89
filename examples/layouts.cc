// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include <loom.hh>
#include <string.h>

namespace {
using namespace Loom;

static CompositeP
create_shell (const String &name, LayoutP layout, const vector<LayoutDataP> &datas)
{
  CompositeP shell = std::make_shared<Composite> (name);
  for (size_t i = 0; i < datas.size(); i++)
    {
      ControlP child = std::make_shared<Control> (string_format ("%s-%zu", name, i));
      if (datas[i])
        child->layout_data (datas[i]);
      shell->add (child);
    }
  shell->set_layout (layout);
  return shell;
}

static CompositeP
fill_demo ()
{
  std::shared_ptr<FillLayout> fill = std::make_shared<FillLayout>();
  fill->spacing = 4;
  return create_shell ("fill", fill, vector<LayoutDataP> (3));
}

static CompositeP
row_demo ()
{
  vector<LayoutDataP> datas;
  for (int i = 0; i < 5; i++)
    datas.push_back (std::make_shared<RowData> (40 + 20 * i, DEFAULT));
  std::shared_ptr<RowLayout> row = std::make_shared<RowLayout>();
  row->center = true;
  return create_shell ("row", row, datas);
}

static CompositeP
grid_demo ()
{
  vector<LayoutDataP> datas;
  datas.push_back (std::make_shared<GridData> (FILL, CENTER, true, false, 2, 1));
  datas.push_back (std::make_shared<GridData> (BEGINNING, FILL, false, true, 1, 2));
  datas.push_back (std::make_shared<GridData> (GridData::from_style (HORIZONTAL)));
  datas.push_back (std::make_shared<GridData> (END, END, false, false));
  return create_shell ("grid", std::make_shared<GridLayout> (2), datas);
}

static CompositeP
form_demo ()
{
  CompositeP shell = create_shell ("form", std::make_shared<FormLayout>(), vector<LayoutDataP> (3));
  ControlP label = shell->nth_child (0);
  Control &entry = *shell->nth_child (1), &button = *shell->nth_child (2);
  FormDataP ldata = std::make_shared<FormData>();
  ldata->left = FormAttachment::percent (0, 5);
  ldata->top = FormAttachment::percent (0, 5);
  label->layout_data (ldata);
  FormDataP edata = std::make_shared<FormData>();
  edata->left = FormAttachment::control (label, 5);
  edata->right = FormAttachment::percent (100, -5);
  edata->top = FormAttachment::control (label, 0, ATTACH_TOP);
  entry.layout_data (edata);
  FormDataP bdata = std::make_shared<FormData>();
  bdata->right = FormAttachment::percent (100, -5);
  bdata->bottom = FormAttachment::percent (100, -5);
  button.layout_data (bdata);
  return shell;
}

static CompositeP
stack_demo ()
{
  std::shared_ptr<StackLayout> stack = std::make_shared<StackLayout>();
  stack->margin_width = stack->margin_height = 2;
  CompositeP shell = create_shell ("stack", stack, vector<LayoutDataP> (3));
  stack->top_control (shell->nth_child (1));
  shell->layout();
  return shell;
}

static void
print_layout (Composite &shell)
{
  const Point size = shell.compute_size (DEFAULT, DEFAULT);
  printout ("%s: %s, preferred size %dx%d\n", shell.name(), shell.layout_manager()->name(), size.x, size.y);
  for (auto child : shell)
    printout ("  %-10s %s\n", child->name(), child->bounds().string());
}

} // Anon

int
main (int   argc,
      char *argv[])
{
  init_core (__PRETTY_FILE__, &argc, argv);
  const char *layout_name = NULL;
  for (size_t i = 1; i < size_t (argc); i++)
    if (arg_parse_string_option (argc, argv, &i, "--layout", &layout_name))
      continue;
  arg_parse_collapse (&argc, argv);
  if (argc > 1)
    {
      printerr ("%s: unknown argument: %s\n", program_alias(), argv[1]);
      printerr ("Usage: %s [--fatal-warnings] [--layout=fill|row|grid|form|stack]\n", program_alias());
      return 1;
    }

  struct { const char *name; CompositeP (*create) (); } demos[] = {
    { "fill", fill_demo }, { "row", row_demo }, { "grid", grid_demo }, { "form", form_demo }, { "stack", stack_demo },
  };
  bool found = false;
  for (size_t i = 0; i < ARRAY_SIZE (demos); i++)
    if (!layout_name || strcmp (layout_name, demos[i].name) == 0)
      {
        CompositeP shell = demos[i].create();
        shell->set_bounds (0, 0, 240, 120);
        print_layout (*shell);
        found = true;
      }
  if (!found)
    {
      printerr ("%s: unknown layout: %s\n", program_alias(), layout_name);
      return 1;
    }
  return 0;
}

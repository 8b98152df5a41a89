// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "formlayout.hh"

#define LDEBUG(...)     LOOM_KEY_DEBUG ("Layout", __VA_ARGS__)

namespace Loom {

static const FormData default_form_data;

FormLayout::FormLayout () :
  margin_width (0), margin_height (0),
  margin_left (0), margin_top (0), margin_right (0), margin_bottom (0),
  spacing (0)
{}

/// Visible children with their attachment dependencies among each other.
vector<FormLayout::Node>
FormLayout::collect_nodes (Composite &composite) const
{
  vector<Node> nodes;
  map<const Control*, size_t> indices;
  for (auto child : composite)
    if (child->visible())
      {
        const FormData *data = child->layout_data_as<FormData>();
        Node node = { child.get(), data ? data : &default_form_data, vector<size_t>() };
        indices[child.get()] = nodes.size();
        nodes.push_back (node);
      }
  for (Node &node : nodes)
    {
      const FormAttachment *edges[] = { &node.data->left, &node.data->right, &node.data->top, &node.data->bottom };
      for (size_t i = 0; i < ARRAY_SIZE (edges); i++)
        if (edges[i]->kind() == FormAttachment::CONTROL)
          {
            auto it = indices.find (edges[i]->target().get());
            if (it != indices.end())
              node.depends.push_back (it->second);
          }
    }
  return nodes;
}

static void
visit_node (size_t index, const vector<vector<size_t>> &graph, vector<int> &state, vector<size_t> &path,
            vector<size_t> &order, const vector<String> &names)
{
  enum { UNSEEN = 0, ACTIVE, DONE };
  state[index] = ACTIVE;
  path.push_back (index);
  for (size_t target : graph[index])
    {
      if (state[target] == DONE)
        continue;
      if (state[target] == ACTIVE)
        {
          StringVector cycle;
          size_t i = path.size();
          while (path[i - 1] != target)
            i--;
          for (i = i - 1; i < path.size(); i++)
            cycle.push_back (names[path[i]]);
          cycle.push_back (names[target]);
          throw CircularAttachment (cycle);
        }
      visit_node (target, graph, state, path, order, names);
    }
  path.pop_back();
  state[index] = DONE;
  order.push_back (index);
}

/// Dependency order of @a nodes, attachment targets precede the controls attached to them.
vector<size_t>
FormLayout::resolve_order (const vector<Node> &nodes) const
{
  vector<vector<size_t>> graph;
  StringVector names;
  for (const Node &node : nodes)
    {
      graph.push_back (node.depends);
      names.push_back (node.control->name());
    }
  vector<int> state (nodes.size(), 0);
  vector<size_t> path, order;
  for (size_t i = 0; i < nodes.size(); i++)
    if (state[i] == 0)
      visit_node (i, graph, state, path, order, names);
  return order;
}

int
FormLayout::attached_edge (const FormAttachment &attachment, int extent, const vector<Node> &nodes,
                           const vector<Rect> &resolved, bool horizontal, bool leading) const
{
  if (attachment.kind() == FormAttachment::PERCENTAGE)
    return extent * attachment.numerator() / attachment.denominator() + attachment.offset();
  int position = 0;
  const ControlP target = attachment.target();
  for (size_t i = 0; target && i < nodes.size(); i++)
    if (nodes[i].control == target.get())
      {
        const Rect &r = resolved[i];
        const int start = horizontal ? r.x : r.y, size = horizontal ? r.width : r.height;
        const Attach near_edge = horizontal ? ATTACH_LEFT : ATTACH_TOP, far_edge = horizontal ? ATTACH_RIGHT : ATTACH_BOTTOM;
        if (attachment.alignment() == near_edge)
          position = start;
        else if (attachment.alignment() == far_edge)
          position = start + size;
        else if (attachment.alignment() == ATTACH_CENTER)
          position = start + size / 2;
        else
          position = leading ? start + size + spacing : start - spacing;
        break;
      }
  return position + attachment.offset();
}

void
FormLayout::layout (Composite &composite, bool flush_cache)
{
  const vector<Node> nodes = collect_nodes (composite);
  if (nodes.empty())
    return;
  const vector<size_t> order = resolve_order (nodes);
  const Rect area = composite.client_area();
  vector<Rect> resolved (nodes.size());
  for (size_t index : order)
    {
      const Node &node = nodes[index];
      const FormData &data = *node.data;
      const Point size = child_size (*node.control, data.width, data.height, flush_cache);
      int x = left_margin(), y = top_margin(), w = size.x, h = size.y;
      if (data.left.is_set())
        x = attached_edge (data.left, area.width, nodes, resolved, true, true);
      if (data.top.is_set())
        y = attached_edge (data.top, area.height, nodes, resolved, false, true);
      if (data.right.is_set())
        {
          const int right = attached_edge (data.right, area.width, nodes, resolved, true, false);
          if (data.left.is_set())
            w = right - x;
          else
            x = right - w;
        }
      if (data.bottom.is_set())
        {
          const int bottom = attached_edge (data.bottom, area.height, nodes, resolved, false, false);
          if (data.top.is_set())
            h = bottom - y;
          else
            y = bottom - h;
        }
      resolved[index] = Rect (x, y, MAX (w, 0), MAX (h, 0));
      node.control->set_bounds (area.x + x, area.y + y, resolved[index].width, resolved[index].height);
    }
  LDEBUG ("%s: resolved %zu attached children", composite.name(), nodes.size());
}

/* preferred extent contributed by a leading attachment, sibling edges are not resolved here */
static int
estimate_edge (const FormAttachment &attachment, int hint)
{
  switch (attachment.kind())
    {
    case FormAttachment::PERCENTAGE:
      return (hint != DEFAULT ? hint : 100) * attachment.numerator() / attachment.denominator() + attachment.offset();
    case FormAttachment::CONTROL:
      return attachment.offset();
    case FormAttachment::NONE:
      break;
    }
  return 0;
}

Point
FormLayout::compute_size (Composite &composite, int whint, int hhint, bool flush_cache)
{
  const vector<Node> nodes = collect_nodes (composite);
  Point extent (0, 0);
  if (!nodes.empty())
    {
      resolve_order (nodes);    // throws on circular attachments
      for (const Node &node : nodes)
        {
          const FormData &data = *node.data;
          const Point size = child_size (*node.control, data.width, data.height, flush_cache);
          extent.x = MAX (extent.x, estimate_edge (data.left, whint) + size.x);
          extent.y = MAX (extent.y, estimate_edge (data.top, hhint) + size.y);
        }
    }
  return Point (extent.x + left_margin() + right_margin(), extent.y + top_margin() + bottom_margin());
}

} // Loom

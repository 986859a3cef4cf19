#include "NodeFiltering.h"

namespace
{
bool filterNode(const Node& node, const QString& needle, Node* out)
{
  if (node.isLink()) {
    const bool matches = node.link.title.contains(needle, Qt::CaseInsensitive) ||
                         node.link.url.contains(needle, Qt::CaseInsensitive);
    if (matches) {
      *out = node;
    }
    return matches;
  }

  Folder filtered;
  filtered.id = node.folder.id;
  filtered.name = node.folder.name;
  filtered.expanded = true;
  for (const Node& child : node.folder.children) {
    Node kept;
    if (filterNode(child, needle, &kept)) {
      filtered.children.push_back(std::move(kept));
    }
  }

  if (filtered.children.empty()) {
    if (!node.folder.name.contains(needle, Qt::CaseInsensitive)) {
      return false;
    }
    *out = node;
    out->folder.expanded = true;
    return true;
  }

  *out = Node::fromFolder(filtered);
  return true;
}
}

namespace arcmark
{
NodeList filterNodes(const NodeList& nodes, const QString& query)
{
  const QString needle = query.trimmed();
  if (needle.isEmpty()) {
    return nodes;
  }

  NodeList result;
  for (const Node& node : nodes) {
    Node kept;
    if (filterNode(node, needle, &kept)) {
      result.push_back(std::move(kept));
    }
  }
  return result;
}
}

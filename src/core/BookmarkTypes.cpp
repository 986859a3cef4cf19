#include "BookmarkTypes.h"

#include <QRandomGenerator>

#include <algorithm>

namespace
{
struct ColorEntry
{
  WorkspaceColorId colorId;
  const char* id;
  const char* displayName;
  const char* accent;
};

const ColorEntry kColors[] = {
  {WorkspaceColorId::Blush, "blush", "Blush", "#ffb3ba"},
  {WorkspaceColorId::Apricot, "apricot", "Apricot", "#ffcca1"},
  {WorkspaceColorId::Butter, "butter", "Butter", "#fff09d"},
  {WorkspaceColorId::Leaf, "leaf", "Leaf", "#b5e59d"},
  {WorkspaceColorId::Mint, "mint", "Mint", "#9de8d0"},
  {WorkspaceColorId::Sky, "sky", "Sky", "#9dd0ff"},
  {WorkspaceColorId::Periwinkle, "periwinkle", "Periwinkle", "#b3b9ff"},
  {WorkspaceColorId::Lavender, "lavender", "Lavender", "#d5b3ff"},
};

const ColorEntry& colorEntry(WorkspaceColorId colorId)
{
  for (const ColorEntry& entry : kColors) {
    if (entry.colorId == colorId) {
      return entry;
    }
  }
  return kColors[5];
}

bool takeNodeFrom(NodeList& nodes, const QUuid& id, Node* removed)
{
  for (auto it = nodes.begin(); it != nodes.end(); ++it) {
    if (it->id() == id) {
      if (removed) {
        *removed = std::move(*it);
      }
      nodes.erase(it);
      return true;
    }
    if (it->isFolder() && takeNodeFrom(it->folder.children, id, removed)) {
      return true;
    }
  }
  return false;
}

bool findLocationIn(const NodeList& nodes, const QUuid& id, const QUuid& parentId, NodeLocation* location)
{
  for (int i = 0; i < static_cast<int>(nodes.size()); ++i) {
    const Node& node = nodes[i];
    if (node.id() == id) {
      if (location) {
        location->parentId = parentId;
        location->index = i;
      }
      return true;
    }
    if (node.isFolder() && findLocationIn(node.folder.children, id, node.folder.id, location)) {
      return true;
    }
  }
  return false;
}
}

Node Node::fromFolder(const Folder& folder)
{
  Node node;
  node.type = Type::Folder;
  node.folder = folder;
  return node;
}

Node Node::fromLink(const Link& link)
{
  Node node;
  node.type = Type::Link;
  node.link = link;
  return node;
}

QUuid Node::id() const
{
  return isFolder() ? folder.id : link.id;
}

void Node::setId(const QUuid& id)
{
  if (isFolder()) {
    folder.id = id;
  } else {
    link.id = id;
  }
}

QString Node::displayName() const
{
  return isFolder() ? folder.name : link.title;
}

bool operator==(const Link& a, const Link& b)
{
  return a.id == b.id && a.title == b.title && a.url == b.url && a.faviconPath.isNull() == b.faviconPath.isNull() &&
         a.faviconPath == b.faviconPath;
}

bool operator==(const Folder& a, const Folder& b)
{
  return a.id == b.id && a.name == b.name && a.expanded == b.expanded && a.children == b.children;
}

bool operator==(const Node& a, const Node& b)
{
  if (a.type != b.type) {
    return false;
  }
  return a.isFolder() ? a.folder == b.folder : a.link == b.link;
}

bool operator==(const Workspace& a, const Workspace& b)
{
  return a.id == b.id && a.name == b.name && a.colorId == b.colorId && a.items == b.items &&
         a.pinnedLinks == b.pinnedLinks;
}

bool operator==(const AppState& a, const AppState& b)
{
  return a.schemaVersion == b.schemaVersion && a.selectedWorkspaceId == b.selectedWorkspaceId &&
         a.settingsSelected == b.settingsSelected && a.workspaces == b.workspaces;
}

namespace arcmark
{
QString colorIdToString(WorkspaceColorId colorId)
{
  return QString::fromLatin1(colorEntry(colorId).id);
}

WorkspaceColorId colorIdFromString(const QString& value)
{
  const QString key = value.trimmed();
  for (const ColorEntry& entry : kColors) {
    if (key == QLatin1String(entry.id)) {
      return entry.colorId;
    }
  }
  return WorkspaceColorId::Sky;
}

QString colorDisplayName(WorkspaceColorId colorId)
{
  return QString::fromLatin1(colorEntry(colorId).displayName);
}

QColor accentColor(WorkspaceColorId colorId)
{
  return QColor(QLatin1String(colorEntry(colorId).accent));
}

QColor backgroundColor(WorkspaceColorId colorId)
{
  constexpr double kAlpha = 0.92;
  const QColor c = accentColor(colorId);
  const auto blend = [](int channel) {
    return static_cast<int>(channel * kAlpha + 255 * (1.0 - kAlpha));
  };
  return QColor(blend(c.red()), blend(c.green()), blend(c.blue()));
}

WorkspaceColorId defaultColorId()
{
  return WorkspaceColorId::Sky;
}

WorkspaceColorId randomColorId()
{
  const int count = static_cast<int>(sizeof(kColors) / sizeof(kColors[0]));
  return kColors[QRandomGenerator::global()->bounded(count)].colorId;
}

QVector<WorkspaceColorId> allColorIds()
{
  QVector<WorkspaceColorId> out;
  for (const ColorEntry& entry : kColors) {
    out.push_back(entry.colorId);
  }
  return out;
}

Workspace makeWorkspace(const QString& name, WorkspaceColorId colorId)
{
  Workspace workspace;
  workspace.id = QUuid::createUuid();
  workspace.name = name;
  workspace.colorId = colorId;
  return workspace;
}

AppState defaultAppState()
{
  const Workspace inbox = makeWorkspace(QStringLiteral("Inbox"), defaultColorId());

  AppState state;
  state.schemaVersion = AppState::kCurrentSchemaVersion;
  state.workspaces.push_back(inbox);
  state.selectedWorkspaceId = inbox.id;
  state.settingsSelected = false;
  return state;
}

const Node* findNode(const NodeList& nodes, const QUuid& id)
{
  for (const Node& node : nodes) {
    if (node.id() == id) {
      return &node;
    }
    if (node.isFolder()) {
      if (const Node* found = findNode(node.folder.children, id)) {
        return found;
      }
    }
  }
  return nullptr;
}

Node* findNode(NodeList& nodes, const QUuid& id)
{
  return const_cast<Node*>(findNode(static_cast<const NodeList&>(nodes), id));
}

bool findLocation(const NodeList& nodes, const QUuid& id, NodeLocation* location)
{
  if (id.isNull()) {
    return false;
  }
  return findLocationIn(nodes, id, QUuid(), location);
}

bool subtreeContains(const Node& root, const QUuid& id)
{
  if (root.id() == id) {
    return true;
  }
  if (!root.isFolder()) {
    return false;
  }
  return std::any_of(root.folder.children.begin(), root.folder.children.end(), [&id](const Node& child) {
    return subtreeContains(child, id);
  });
}

bool takeNode(NodeList& nodes, const QUuid& id, Node* removed)
{
  if (id.isNull()) {
    return false;
  }
  return takeNodeFrom(nodes, id, removed);
}

bool insertNode(NodeList& nodes, const Node& node, const QUuid& parentId, int index)
{
  NodeList* target = &nodes;
  if (!parentId.isNull()) {
    Node* parent = findNode(nodes, parentId);
    if (!parent || !parent->isFolder()) {
      return false;
    }
    target = &parent->folder.children;
  }

  const int size = static_cast<int>(target->size());
  if (index < 0 || index >= size) {
    target->push_back(node);
  } else {
    target->insert(target->begin() + index, node);
  }
  return true;
}

int countLinks(const NodeList& nodes)
{
  int count = 0;
  for (const Node& node : nodes) {
    if (node.isLink()) {
      ++count;
    } else {
      count += countLinks(node.folder.children);
    }
  }
  return count;
}

int countFolders(const NodeList& nodes)
{
  int count = 0;
  for (const Node& node : nodes) {
    if (node.isFolder()) {
      count += 1 + countFolders(node.folder.children);
    }
  }
  return count;
}

void collectIds(const NodeList& nodes, QVector<QUuid>* ids)
{
  if (!ids) {
    return;
  }
  for (const Node& node : nodes) {
    ids->push_back(node.id());
    if (node.isFolder()) {
      collectIds(node.folder.children, ids);
    }
  }
}
}

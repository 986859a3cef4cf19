#pragma once

#include <QColor>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVector>

#include <vector>

enum class WorkspaceColorId
{
  Blush,
  Apricot,
  Butter,
  Leaf,
  Mint,
  Sky,
  Periwinkle,
  Lavender,
};

enum class WorkspaceMoveDirection
{
  Left,
  Right,
};

struct Link
{
  QUuid id;
  QString title;
  QString url;
  // Null when no icon has been cached yet.
  QString faviconPath;
};

struct Node;
using NodeList = std::vector<Node>;

struct Folder
{
  QUuid id;
  QString name;
  NodeList children;
  bool expanded = true;
};

struct Node
{
  enum class Type
  {
    Folder,
    Link,
  };

  Type type = Type::Link;
  Folder folder;
  Link link;

  static Node fromFolder(const Folder& folder);
  static Node fromLink(const Link& link);

  bool isFolder() const { return type == Type::Folder; }
  bool isLink() const { return type == Type::Link; }
  QUuid id() const;
  void setId(const QUuid& id);
  QString displayName() const;
};

struct NodeLocation
{
  // Null at the workspace root.
  QUuid parentId;
  int index = -1;
};

struct Workspace
{
  // 4 columns x 3 rows in the pinned grid.
  static constexpr int kMaxPinnedLinks = 12;

  QUuid id;
  QString name;
  WorkspaceColorId colorId = WorkspaceColorId::Sky;
  NodeList items;
  QVector<Link> pinnedLinks;
};

struct AppState
{
  static constexpr int kCurrentSchemaVersion = 2;

  int schemaVersion = 1;
  QVector<Workspace> workspaces;
  QUuid selectedWorkspaceId;
  bool settingsSelected = false;
};

bool operator==(const Link& a, const Link& b);
bool operator==(const Folder& a, const Folder& b);
bool operator==(const Node& a, const Node& b);
bool operator==(const Workspace& a, const Workspace& b);
bool operator==(const AppState& a, const AppState& b);

inline bool operator!=(const Node& a, const Node& b)
{
  return !(a == b);
}

namespace arcmark
{
QString colorIdToString(WorkspaceColorId colorId);
// Unknown ids map to sky.
WorkspaceColorId colorIdFromString(const QString& value);
QString colorDisplayName(WorkspaceColorId colorId);
QColor accentColor(WorkspaceColorId colorId);
QColor backgroundColor(WorkspaceColorId colorId);
WorkspaceColorId defaultColorId();
WorkspaceColorId randomColorId();
QVector<WorkspaceColorId> allColorIds();

Workspace makeWorkspace(const QString& name, WorkspaceColorId colorId);
AppState defaultAppState();

// Depth-first lookups over a nested node list. Pointers stay valid until the list is modified.
const Node* findNode(const NodeList& nodes, const QUuid& id);
Node* findNode(NodeList& nodes, const QUuid& id);
bool findLocation(const NodeList& nodes, const QUuid& id, NodeLocation* location);
bool subtreeContains(const Node& root, const QUuid& id);

// Removes the first node with the given id, wherever it is nested.
bool takeNode(NodeList& nodes, const QUuid& id, Node* removed = nullptr);

// A null parentId targets the root list. index < 0 appends; larger indices are clamped.
bool insertNode(NodeList& nodes, const Node& node, const QUuid& parentId, int index = -1);

int countLinks(const NodeList& nodes);
int countFolders(const NodeList& nodes);
void collectIds(const NodeList& nodes, QVector<QUuid>* ids);
}

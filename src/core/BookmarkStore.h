#pragma once

#include "BookmarkTypes.h"
#include "DataStore.h"

#include <QObject>
#include <QPointer>

#include <memory>

class AppSettings;

// Owns the application state. Every committed mutation is written to disk before
// changed() is emitted. Operations that name an unknown id or would break an invariant
// (last workspace, full pinned grid, folder cycle) change nothing and emit nothing.
// Not thread-safe: call from the thread that owns the store.
class BookmarkStore final : public QObject
{
  Q_OBJECT

public:
  struct DuplicateLink
  {
    QString workspaceName;
    QString linkTitle;
  };

  // An empty dataDir resolves to arcmark::appDataRoot(). settings may be null.
  explicit BookmarkStore(const QString& dataDir = {}, AppSettings* settings = nullptr, QObject* parent = nullptr);

  // Takes the data directory's write lock before loading. Null when another process
  // already holds it.
  static std::unique_ptr<BookmarkStore> openExclusive(const QString& dataDir, AppSettings* settings,
                                                      QString* error = nullptr);

  const AppState& state() const;
  const QVector<Workspace>& workspaces() const;

  // Selected workspace, else the first one. Recreates an Inbox if the list is empty.
  const Workspace& currentWorkspace();
  QUuid currentWorkspaceId() const;
  const Workspace* workspaceById(const QUuid& id) const;

  const QVector<Link>& pinnedLinks();
  const Link* pinnedLinkById(const QUuid& id) const;
  bool canPinMore() const;

  const Node* nodeById(const QUuid& id) const;
  bool location(const QUuid& id, NodeLocation* location) const;

  QString iconsDirectory() const;
  DataStore& dataStore();

  void selectWorkspace(const QUuid& id);
  void selectSettingsView();
  QUuid createWorkspace(const QString& name, WorkspaceColorId colorId);
  void renameWorkspace(const QUuid& id, const QString& name);
  void setWorkspaceColor(const QUuid& id, WorkspaceColorId colorId);
  bool deleteWorkspace(const QUuid& id);
  bool moveWorkspace(const QUuid& id, WorkspaceMoveDirection direction);
  bool reorderWorkspace(const QUuid& id, int toIndex);

  // A null parentId targets the workspace root. Returns a null id when the parent is
  // not a folder of the current workspace.
  QUuid addFolder(const QString& name, const QUuid& parentId = {}, bool expanded = true);
  QUuid addLink(const QString& url, const QString& title, const QUuid& parentId = {});
  void renameNode(const QUuid& id, const QString& name);
  void deleteNode(const QUuid& id);
  // index is a drop position in the target list before the node is removed.
  bool moveNode(const QUuid& id, const QUuid& newParentId, int index);
  void moveNodeToWorkspace(const QUuid& id, const QUuid& workspaceId);
  void moveNodesToWorkspace(const QVector<QUuid>& ids, const QUuid& workspaceId);
  QUuid groupIntoNewFolder(const QVector<QUuid>& ids, const QString& folderName);
  void setFolderExpanded(const QUuid& id, bool expanded);

  void updateLinkUrl(const QUuid& id, const QString& url);
  void updateLinkFaviconPath(const QUuid& id, const QString& path, bool notify = true);
  bool updateLinkTitleIfDefault(const QUuid& id, const QString& title);

  bool pinLink(const QUuid& id);
  bool unpinLink(const QUuid& id);
  void updatePinnedLinkFaviconPath(const QUuid& id, const QString& path);

  // Appends each workspace under a fresh id and selects the last one. Node ids that
  // already exist anywhere in the state are replaced.
  int importWorkspaces(const QVector<Workspace>& workspaces);

  bool findDuplicateLink(const QString& url, DuplicateLink* match = nullptr) const;
  static QString normalizeUrl(const QString& url);

signals:
  void changed();

private:
  Workspace* mutableWorkspace(const QUuid& id);
  Workspace& mutableCurrentWorkspace();
  const Workspace* selectedOrFirstWorkspace() const;
  void restoreSelection();
  void rememberSelection(const QUuid& id);
  void commit(bool notify = true);

  DataStore m_dataStore;
  QPointer<AppSettings> m_settings;
  AppState m_state;
};

#include "BookmarkStore.h"

#include "AppSettings.h"
#include "AppStateJson.h"

#include <QDebug>
#include <QSet>
#include <QUrl>

#include <algorithm>

namespace
{
void reassignCollidingIds(NodeList& nodes, QSet<QUuid>& taken)
{
  for (Node& node : nodes) {
    if (node.id().isNull() || taken.contains(node.id())) {
      node.setId(QUuid::createUuid());
    }
    taken.insert(node.id());
    if (node.isFolder()) {
      reassignCollidingIds(node.folder.children, taken);
    }
  }
}

QSet<QUuid> allNodeIds(const AppState& state)
{
  QSet<QUuid> ids;
  for (const Workspace& workspace : state.workspaces) {
    QVector<QUuid> nodeIds;
    arcmark::collectIds(workspace.items, &nodeIds);
    for (const QUuid& id : nodeIds) {
      ids.insert(id);
    }
    for (const Link& link : workspace.pinnedLinks) {
      ids.insert(link.id);
    }
  }
  return ids;
}

const Link* findLinkByNormalizedUrl(const NodeList& nodes, const QString& normalizedUrl)
{
  for (const Node& node : nodes) {
    if (node.isLink()) {
      if (BookmarkStore::normalizeUrl(node.link.url) == normalizedUrl) {
        return &node.link;
      }
      continue;
    }
    if (const Link* found = findLinkByNormalizedUrl(node.folder.children, normalizedUrl)) {
      return found;
    }
  }
  return nullptr;
}

QString defaultTitleForUrl(const QString& url)
{
  const QUrl parsed(url, QUrl::StrictMode);
  if (parsed.isValid() && !parsed.isRelative() && !parsed.host().isEmpty()) {
    return parsed.host();
  }
  return url;
}
}

BookmarkStore::BookmarkStore(const QString& dataDir, AppSettings* settings, QObject* parent)
  : QObject(parent)
  , m_dataStore(dataDir)
  , m_settings(settings)
{
  m_state = m_dataStore.load();
  restoreSelection();
}

std::unique_ptr<BookmarkStore> BookmarkStore::openExclusive(const QString& dataDir, AppSettings* settings,
                                                            QString* error)
{
  DataStore lockHolder(dataDir);
  if (!lockHolder.acquireWriteLock(error)) {
    return nullptr;
  }
  auto store = std::make_unique<BookmarkStore>(lockHolder.baseDirectory(), settings);
  store->m_dataStore.adoptWriteLock(lockHolder);
  return store;
}

const AppState& BookmarkStore::state() const
{
  return m_state;
}

const QVector<Workspace>& BookmarkStore::workspaces() const
{
  return m_state.workspaces;
}

const Workspace& BookmarkStore::currentWorkspace()
{
  return mutableCurrentWorkspace();
}

QUuid BookmarkStore::currentWorkspaceId() const
{
  const Workspace* workspace = selectedOrFirstWorkspace();
  return workspace ? workspace->id : QUuid();
}

const Workspace* BookmarkStore::workspaceById(const QUuid& id) const
{
  for (const Workspace& workspace : m_state.workspaces) {
    if (workspace.id == id) {
      return &workspace;
    }
  }
  return nullptr;
}

const QVector<Link>& BookmarkStore::pinnedLinks()
{
  return mutableCurrentWorkspace().pinnedLinks;
}

const Link* BookmarkStore::pinnedLinkById(const QUuid& id) const
{
  const Workspace* workspace = selectedOrFirstWorkspace();
  if (!workspace) {
    return nullptr;
  }
  for (const Link& link : workspace->pinnedLinks) {
    if (link.id == id) {
      return &link;
    }
  }
  return nullptr;
}

bool BookmarkStore::canPinMore() const
{
  const Workspace* workspace = selectedOrFirstWorkspace();
  return workspace && workspace->pinnedLinks.size() < Workspace::kMaxPinnedLinks;
}

const Node* BookmarkStore::nodeById(const QUuid& id) const
{
  const Workspace* workspace = selectedOrFirstWorkspace();
  if (!workspace || id.isNull()) {
    return nullptr;
  }
  return arcmark::findNode(workspace->items, id);
}

bool BookmarkStore::location(const QUuid& id, NodeLocation* location) const
{
  const Workspace* workspace = selectedOrFirstWorkspace();
  if (!workspace) {
    return false;
  }
  return arcmark::findLocation(workspace->items, id, location);
}

QString BookmarkStore::iconsDirectory() const
{
  return m_dataStore.iconsDirectory();
}

DataStore& BookmarkStore::dataStore()
{
  return m_dataStore;
}

void BookmarkStore::selectWorkspace(const QUuid& id)
{
  if (!workspaceById(id)) {
    return;
  }
  m_state.selectedWorkspaceId = id;
  m_state.settingsSelected = false;
  rememberSelection(id);
  commit();
}

void BookmarkStore::selectSettingsView()
{
  m_state.settingsSelected = true;
  m_state.selectedWorkspaceId = QUuid();
  commit();
}

QUuid BookmarkStore::createWorkspace(const QString& name, WorkspaceColorId colorId)
{
  const Workspace workspace = arcmark::makeWorkspace(name, colorId);
  m_state.workspaces.push_back(workspace);
  m_state.selectedWorkspaceId = workspace.id;
  m_state.settingsSelected = false;
  rememberSelection(workspace.id);
  commit();
  return workspace.id;
}

void BookmarkStore::renameWorkspace(const QUuid& id, const QString& name)
{
  Workspace* workspace = mutableWorkspace(id);
  if (!workspace) {
    return;
  }
  workspace->name = name;
  commit();
}

void BookmarkStore::setWorkspaceColor(const QUuid& id, WorkspaceColorId colorId)
{
  Workspace* workspace = mutableWorkspace(id);
  if (!workspace) {
    return;
  }
  workspace->colorId = colorId;
  commit();
}

bool BookmarkStore::deleteWorkspace(const QUuid& id)
{
  if (m_state.workspaces.size() <= 1) {
    return false;
  }

  const auto it = std::find_if(m_state.workspaces.begin(), m_state.workspaces.end(), [&id](const Workspace& ws) {
    return ws.id == id;
  });
  if (it == m_state.workspaces.end()) {
    return false;
  }
  m_state.workspaces.erase(it);

  if (m_state.selectedWorkspaceId == id) {
    m_state.selectedWorkspaceId = m_state.workspaces.first().id;
    rememberSelection(m_state.selectedWorkspaceId);
  }
  commit();
  return true;
}

bool BookmarkStore::moveWorkspace(const QUuid& id, WorkspaceMoveDirection direction)
{
  int index = -1;
  for (int i = 0; i < m_state.workspaces.size(); ++i) {
    if (m_state.workspaces[i].id == id) {
      index = i;
      break;
    }
  }
  if (index < 0) {
    return false;
  }

  int target = -1;
  if (direction == WorkspaceMoveDirection::Left && index > 0) {
    target = index - 1;
  } else if (direction == WorkspaceMoveDirection::Right && index < m_state.workspaces.size() - 1) {
    target = index + 1;
  }
  if (target < 0) {
    return false;
  }

  m_state.workspaces.move(index, target);
  commit();
  return true;
}

bool BookmarkStore::reorderWorkspace(const QUuid& id, int toIndex)
{
  int index = -1;
  for (int i = 0; i < m_state.workspaces.size(); ++i) {
    if (m_state.workspaces[i].id == id) {
      index = i;
      break;
    }
  }
  if (index < 0 || toIndex < 0 || toIndex >= m_state.workspaces.size() || index == toIndex) {
    return false;
  }

  m_state.workspaces.move(index, toIndex);
  commit();
  return true;
}

QUuid BookmarkStore::addFolder(const QString& name, const QUuid& parentId, bool expanded)
{
  Folder folder;
  folder.id = QUuid::createUuid();
  folder.name = name;
  folder.expanded = expanded;

  if (!arcmark::insertNode(mutableCurrentWorkspace().items, Node::fromFolder(folder), parentId)) {
    return {};
  }
  commit();
  return folder.id;
}

QUuid BookmarkStore::addLink(const QString& url, const QString& title, const QUuid& parentId)
{
  Link link;
  link.id = QUuid::createUuid();
  link.title = title;
  link.url = url;

  if (!arcmark::insertNode(mutableCurrentWorkspace().items, Node::fromLink(link), parentId)) {
    return {};
  }
  commit();
  return link.id;
}

void BookmarkStore::renameNode(const QUuid& id, const QString& name)
{
  Node* node = arcmark::findNode(mutableCurrentWorkspace().items, id);
  if (!node) {
    return;
  }
  if (node->isFolder()) {
    node->folder.name = name;
  } else {
    node->link.title = name;
  }
  commit();
}

void BookmarkStore::deleteNode(const QUuid& id)
{
  if (!arcmark::takeNode(mutableCurrentWorkspace().items, id)) {
    return;
  }
  commit();
}

bool BookmarkStore::moveNode(const QUuid& id, const QUuid& newParentId, int index)
{
  NodeList& items = mutableCurrentWorkspace().items;

  NodeLocation from;
  if (!arcmark::findLocation(items, id, &from)) {
    return false;
  }

  if (!newParentId.isNull()) {
    const Node* parent = arcmark::findNode(items, newParentId);
    if (!parent || !parent->isFolder()) {
      return false;
    }
    // The target folder must not be the node itself or one of its descendants.
    const Node* moving = arcmark::findNode(items, id);
    if (moving && arcmark::subtreeContains(*moving, newParentId)) {
      return false;
    }
  }

  Node removed;
  if (!arcmark::takeNode(items, id, &removed)) {
    return false;
  }

  int targetIndex = std::max(0, index);
  if (from.parentId == newParentId && from.index < targetIndex) {
    --targetIndex;
  }

  if (!arcmark::insertNode(items, removed, newParentId, targetIndex)) {
    qWarning().noquote() << "BookmarkStore: move target vanished, restoring node" << arcmark::uuidToString(id);
    arcmark::insertNode(items, removed, from.parentId, from.index);
    return false;
  }

  commit();
  return true;
}

void BookmarkStore::moveNodeToWorkspace(const QUuid& id, const QUuid& workspaceId)
{
  moveNodesToWorkspace({id}, workspaceId);
}

void BookmarkStore::moveNodesToWorkspace(const QVector<QUuid>& ids, const QUuid& workspaceId)
{
  if (ids.isEmpty() || workspaceId == currentWorkspaceId()) {
    return;
  }
  Workspace* destination = mutableWorkspace(workspaceId);
  if (!destination) {
    return;
  }

  NodeList moved;
  NodeList& source = mutableCurrentWorkspace().items;
  for (const QUuid& id : ids) {
    Node removed;
    if (arcmark::takeNode(source, id, &removed)) {
      moved.push_back(std::move(removed));
    }
  }
  if (moved.empty()) {
    return;
  }

  // Removal and insertion share one commit.
  for (Node& node : moved) {
    destination->items.push_back(std::move(node));
  }
  commit();
}

QUuid BookmarkStore::groupIntoNewFolder(const QVector<QUuid>& ids, const QString& folderName)
{
  if (ids.isEmpty()) {
    return {};
  }

  Workspace& workspace = mutableCurrentWorkspace();

  Folder folder;
  folder.id = QUuid::createUuid();
  folder.name = folderName;
  folder.expanded = true;
  for (const QUuid& id : ids) {
    Node removed;
    if (arcmark::takeNode(workspace.items, id, &removed)) {
      folder.children.push_back(std::move(removed));
    }
  }
  if (folder.children.empty()) {
    return {};
  }

  workspace.items.push_back(Node::fromFolder(folder));
  commit();
  return folder.id;
}

void BookmarkStore::setFolderExpanded(const QUuid& id, bool expanded)
{
  Node* node = arcmark::findNode(mutableCurrentWorkspace().items, id);
  if (!node || !node->isFolder() || node->folder.expanded == expanded) {
    return;
  }
  node->folder.expanded = expanded;
  commit();
}

void BookmarkStore::updateLinkUrl(const QUuid& id, const QString& url)
{
  Node* node = arcmark::findNode(mutableCurrentWorkspace().items, id);
  if (!node || !node->isLink()) {
    return;
  }
  node->link.url = url;
  node->link.faviconPath = QString();
  commit();
}

void BookmarkStore::updateLinkFaviconPath(const QUuid& id, const QString& path, bool notify)
{
  Node* node = arcmark::findNode(mutableCurrentWorkspace().items, id);
  if (!node || !node->isLink()) {
    return;
  }
  if (node->link.faviconPath == path && node->link.faviconPath.isNull() == path.isNull()) {
    return;
  }
  node->link.faviconPath = path;
  commit(notify);
}

bool BookmarkStore::updateLinkTitleIfDefault(const QUuid& id, const QString& title)
{
  const QString trimmed = title.trimmed();
  if (trimmed.isEmpty()) {
    return false;
  }

  Node* node = arcmark::findNode(mutableCurrentWorkspace().items, id);
  if (!node || !node->isLink()) {
    return false;
  }

  Link& link = node->link;
  if (link.title != defaultTitleForUrl(link.url) || link.title == trimmed) {
    return false;
  }

  link.title = trimmed;
  commit();
  return true;
}

bool BookmarkStore::pinLink(const QUuid& id)
{
  if (!canPinMore() || pinnedLinkById(id)) {
    return false;
  }

  Workspace& workspace = mutableCurrentWorkspace();
  const Node* node = arcmark::findNode(workspace.items, id);
  if (!node || !node->isLink()) {
    return false;
  }

  Node removed;
  if (!arcmark::takeNode(workspace.items, id, &removed)) {
    return false;
  }
  workspace.pinnedLinks.push_back(removed.link);
  commit();
  return true;
}

bool BookmarkStore::unpinLink(const QUuid& id)
{
  Workspace& workspace = mutableCurrentWorkspace();
  for (int i = 0; i < workspace.pinnedLinks.size(); ++i) {
    if (workspace.pinnedLinks[i].id != id) {
      continue;
    }
    const Link link = workspace.pinnedLinks.takeAt(i);
    workspace.items.push_back(Node::fromLink(link));
    commit();
    return true;
  }
  return false;
}

void BookmarkStore::updatePinnedLinkFaviconPath(const QUuid& id, const QString& path)
{
  Workspace& workspace = mutableCurrentWorkspace();
  for (Link& link : workspace.pinnedLinks) {
    if (link.id == id) {
      link.faviconPath = path;
      commit();
      return;
    }
  }
}

int BookmarkStore::importWorkspaces(const QVector<Workspace>& workspaces)
{
  if (workspaces.isEmpty()) {
    return 0;
  }

  QSet<QUuid> taken = allNodeIds(m_state);
  for (const Workspace& imported : workspaces) {
    Workspace workspace = arcmark::makeWorkspace(imported.name, imported.colorId);
    workspace.items = imported.items;
    for (int i = 0; i < imported.pinnedLinks.size(); ++i) {
      if (i < Workspace::kMaxPinnedLinks) {
        workspace.pinnedLinks.push_back(imported.pinnedLinks[i]);
      } else {
        workspace.items.push_back(Node::fromLink(imported.pinnedLinks[i]));
      }
    }

    reassignCollidingIds(workspace.items, taken);
    for (Link& link : workspace.pinnedLinks) {
      if (link.id.isNull() || taken.contains(link.id)) {
        link.id = QUuid::createUuid();
      }
      taken.insert(link.id);
    }

    m_state.workspaces.push_back(workspace);
    m_state.selectedWorkspaceId = workspace.id;
  }

  m_state.settingsSelected = false;
  rememberSelection(m_state.selectedWorkspaceId);
  qInfo().noquote() << "BookmarkStore: imported" << workspaces.size() << "workspace(s)";
  commit();
  return workspaces.size();
}

bool BookmarkStore::findDuplicateLink(const QString& url, DuplicateLink* match) const
{
  const QString normalized = normalizeUrl(url);
  for (const Workspace& workspace : m_state.workspaces) {
    const Link* link = findLinkByNormalizedUrl(workspace.items, normalized);
    if (!link) {
      continue;
    }
    if (match) {
      match->workspaceName = workspace.name;
      match->linkTitle = link->title;
    }
    return true;
  }
  return false;
}

QString BookmarkStore::normalizeUrl(const QString& url)
{
  // One trailing slash is stripped before and one after the www and fragment edits.
  QString normalized = url.toLower().trimmed();

  const QString http = QStringLiteral("http://");
  if (normalized.startsWith(http)) {
    normalized = QStringLiteral("https://") + normalized.mid(http.size());
  }

  if (normalized.endsWith(QLatin1Char('/'))) {
    normalized.chop(1);
  }

  const QString wwwTag = QStringLiteral("://www.");
  const int wwwIdx = normalized.indexOf(wwwTag);
  if (wwwIdx >= 0) {
    normalized = normalized.left(wwwIdx + 3) + normalized.mid(wwwIdx + wwwTag.size());
  }

  const int hashIdx = normalized.indexOf(QLatin1Char('#'));
  if (hashIdx >= 0) {
    normalized.truncate(hashIdx);
  }

  if (normalized.endsWith(QLatin1Char('/'))) {
    normalized.chop(1);
  }

  return normalized;
}

Workspace* BookmarkStore::mutableWorkspace(const QUuid& id)
{
  for (Workspace& workspace : m_state.workspaces) {
    if (workspace.id == id) {
      return &workspace;
    }
  }
  return nullptr;
}

Workspace& BookmarkStore::mutableCurrentWorkspace()
{
  if (!m_state.selectedWorkspaceId.isNull()) {
    if (Workspace* selected = mutableWorkspace(m_state.selectedWorkspaceId)) {
      return *selected;
    }
  }
  if (!m_state.workspaces.isEmpty()) {
    return m_state.workspaces.first();
  }

  qWarning() << "BookmarkStore: no workspaces left, recreating Inbox";
  const Workspace inbox = arcmark::makeWorkspace(QStringLiteral("Inbox"), arcmark::defaultColorId());
  m_state.workspaces.push_back(inbox);
  m_state.selectedWorkspaceId = inbox.id;
  commit(false);
  return m_state.workspaces.last();
}

const Workspace* BookmarkStore::selectedOrFirstWorkspace() const
{
  if (!m_state.selectedWorkspaceId.isNull()) {
    if (const Workspace* selected = workspaceById(m_state.selectedWorkspaceId)) {
      return selected;
    }
  }
  return m_state.workspaces.isEmpty() ? nullptr : &m_state.workspaces.first();
}

void BookmarkStore::restoreSelection()
{
  if (m_state.settingsSelected) {
    return;
  }

  if (m_settings) {
    const QUuid saved = QUuid::fromString(m_settings->lastSelectedWorkspaceId());
    if (!saved.isNull() && workspaceById(saved)) {
      m_state.selectedWorkspaceId = saved;
    }
  }
  if (m_state.selectedWorkspaceId.isNull() && !m_state.workspaces.isEmpty()) {
    m_state.selectedWorkspaceId = m_state.workspaces.first().id;
  }
}

void BookmarkStore::rememberSelection(const QUuid& id)
{
  if (m_settings && !id.isNull()) {
    m_settings->setLastSelectedWorkspaceId(arcmark::uuidToString(id));
  }
}

void BookmarkStore::commit(bool notify)
{
  // A failed write is logged by DataStore; the in-memory state stays authoritative.
  m_dataStore.save(m_state);
  if (notify) {
    emit changed();
  }
}

#include "BookmarkTreeModel.h"

#include "AppStateJson.h"
#include "BookmarkStore.h"
#include "NodeFiltering.h"

BookmarkTreeModel::BookmarkTreeModel(BookmarkStore* store, QObject* parent)
  : QAbstractListModel(parent)
  , m_store(store)
{
  if (m_store) {
    connect(m_store, &BookmarkStore::changed, this, &BookmarkTreeModel::reload);
  }
  reload();
}

int BookmarkTreeModel::rowCount(const QModelIndex& parent) const
{
  if (parent.isValid()) {
    return 0;
  }
  return m_rows.size();
}

QVariant BookmarkTreeModel::data(const QModelIndex& index, int role) const
{
  if (!index.isValid() || index.row() < 0 || index.row() >= m_rows.size()) {
    return {};
  }

  const Row& row = m_rows[index.row()];
  switch (role) {
    case NodeIdRole:
      return arcmark::uuidToString(row.id);
    case Qt::DisplayRole:
    case TitleRole:
      return row.title;
    case UrlRole:
      return row.url;
    case FaviconPathRole:
      return row.faviconPath;
    case IsFolderRole:
      return row.isFolder;
    case ParentIdRole:
      return row.parentId.isNull() ? QString() : arcmark::uuidToString(row.parentId);
    case DepthRole:
      return row.depth;
    case ExpandedRole:
      return row.expanded;
    case HasChildrenRole:
      return row.childCount > 0;
    case VisibleRole:
      return row.visible;
    default:
      return {};
  }
}

QHash<int, QByteArray> BookmarkTreeModel::roleNames() const
{
  return {
    {NodeIdRole, "nodeId"},
    {TitleRole, "title"},
    {UrlRole, "url"},
    {FaviconPathRole, "faviconPath"},
    {IsFolderRole, "isFolder"},
    {ParentIdRole, "parentId"},
    {DepthRole, "depth"},
    {ExpandedRole, "expanded"},
    {HasChildrenRole, "hasChildren"},
    {VisibleRole, "treeVisible"},
  };
}

int BookmarkTreeModel::count() const
{
  return m_rows.size();
}

QString BookmarkTreeModel::searchText() const
{
  return m_searchText;
}

void BookmarkTreeModel::setSearchText(const QString& text)
{
  if (m_searchText == text) {
    return;
  }
  m_searchText = text;
  emit searchTextChanged();
  reload();
}

int BookmarkTreeModel::rowForId(const QString& nodeId) const
{
  return m_rowById.value(QUuid::fromString(nodeId), -1);
}

QString BookmarkTreeModel::nodeIdAt(int row) const
{
  if (row < 0 || row >= m_rows.size()) {
    return {};
  }
  return arcmark::uuidToString(m_rows[row].id);
}

void BookmarkTreeModel::toggleExpanded(const QString& folderId)
{
  if (!m_store) {
    return;
  }

  const QUuid id = QUuid::fromString(folderId);
  const Node* node = m_store->nodeById(id);
  if (!node || !node->isFolder()) {
    return;
  }
  m_store->setFolderExpanded(id, !node->folder.expanded);
}

void BookmarkTreeModel::reload()
{
  const int oldCount = m_rows.size();

  beginResetModel();
  m_rows.clear();
  m_rowById.clear();
  if (m_store) {
    const NodeList& items = m_store->currentWorkspace().items;
    if (m_searchText.trimmed().isEmpty()) {
      appendRows(items, QUuid(), 0, true);
    } else {
      appendRows(arcmark::filterNodes(items, m_searchText), QUuid(), 0, true);
    }
  }
  endResetModel();

  if (oldCount != m_rows.size()) {
    emit countChanged();
  }
}

void BookmarkTreeModel::appendRows(const NodeList& nodes, const QUuid& parentId, int depth, bool visible)
{
  for (const Node& node : nodes) {
    Row row;
    row.id = node.id();
    row.parentId = parentId;
    row.isFolder = node.isFolder();
    row.title = node.displayName();
    row.depth = depth;
    row.visible = visible;
    if (node.isFolder()) {
      row.expanded = node.folder.expanded;
      row.childCount = static_cast<int>(node.folder.children.size());
    } else {
      row.url = node.link.url;
      row.faviconPath = node.link.faviconPath;
    }

    m_rowById.insert(row.id, m_rows.size());
    m_rows.push_back(row);

    if (node.isFolder()) {
      appendRows(node.folder.children, node.folder.id, depth + 1, visible && node.folder.expanded);
    }
  }
}

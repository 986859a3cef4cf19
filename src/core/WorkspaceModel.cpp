#include "WorkspaceModel.h"

#include "AppStateJson.h"
#include "BookmarkStore.h"

WorkspaceModel::WorkspaceModel(BookmarkStore* store, QObject* parent)
  : QAbstractListModel(parent)
  , m_store(store)
{
  if (m_store) {
    connect(m_store, &BookmarkStore::changed, this, &WorkspaceModel::reload);
  }
  reload();
}

int WorkspaceModel::rowCount(const QModelIndex& parent) const
{
  if (parent.isValid()) {
    return 0;
  }
  return m_workspaces.size();
}

QVariant WorkspaceModel::data(const QModelIndex& index, int role) const
{
  if (!index.isValid()) {
    return {};
  }

  const int row = index.row();
  if (row < 0 || row >= m_workspaces.size()) {
    return {};
  }

  const auto& ws = m_workspaces[row];
  switch (role) {
    case WorkspaceIdRole:
      return arcmark::uuidToString(ws.id);
    case Qt::DisplayRole:
    case NameRole:
      return ws.name;
    case ColorIdRole:
      return ws.colorId;
    case AccentColorRole:
      return ws.accentColor;
    case BackgroundColorRole:
      return ws.backgroundColor;
    case IsActiveRole:
      return row == m_activeIndex;
    case ItemCountRole:
      return ws.itemCount;
    case PinnedCountRole:
      return ws.pinnedCount;
    default:
      return {};
  }
}

QHash<int, QByteArray> WorkspaceModel::roleNames() const
{
  return {
    {WorkspaceIdRole, "workspaceId"},
    {NameRole, "name"},
    {ColorIdRole, "colorId"},
    {AccentColorRole, "accentColor"},
    {BackgroundColorRole, "backgroundColor"},
    {IsActiveRole, "isActive"},
    {ItemCountRole, "itemCount"},
    {PinnedCountRole, "pinnedCount"},
  };
}

int WorkspaceModel::activeIndex() const
{
  return m_activeIndex;
}

bool WorkspaceModel::settingsSelected() const
{
  return m_settingsSelected;
}

int WorkspaceModel::count() const
{
  return m_workspaces.size();
}

QString WorkspaceModel::workspaceIdAt(int index) const
{
  if (index < 0 || index >= m_workspaces.size()) {
    return {};
  }
  return arcmark::uuidToString(m_workspaces[index].id);
}

QString WorkspaceModel::nameAt(int index) const
{
  if (index < 0 || index >= m_workspaces.size()) {
    return {};
  }
  return m_workspaces[index].name;
}

QColor WorkspaceModel::accentColorAt(int index) const
{
  if (index < 0 || index >= m_workspaces.size()) {
    return {};
  }
  return m_workspaces[index].accentColor;
}

void WorkspaceModel::activate(int index)
{
  if (!m_store || index < 0 || index >= m_workspaces.size()) {
    return;
  }
  m_store->selectWorkspace(m_workspaces[index].id);
}

bool WorkspaceModel::moveWorkspace(int fromIndex, int toIndex)
{
  if (!m_store || fromIndex < 0 || fromIndex >= m_workspaces.size()) {
    return false;
  }
  return m_store->reorderWorkspace(m_workspaces[fromIndex].id, toIndex);
}

void WorkspaceModel::reload()
{
  const int oldActiveIndex = m_activeIndex;
  const bool oldSettingsSelected = m_settingsSelected;

  beginResetModel();
  m_workspaces.clear();
  m_activeIndex = -1;
  m_settingsSelected = false;

  if (m_store) {
    const AppState& state = m_store->state();
    m_settingsSelected = state.settingsSelected;
    const QUuid activeId = m_settingsSelected ? QUuid() : m_store->currentWorkspaceId();

    for (const Workspace& workspace : state.workspaces) {
      WorkspaceEntry entry;
      entry.id = workspace.id;
      entry.name = workspace.name;
      entry.colorId = arcmark::colorIdToString(workspace.colorId);
      entry.accentColor = arcmark::accentColor(workspace.colorId);
      entry.backgroundColor = arcmark::backgroundColor(workspace.colorId);
      entry.itemCount = arcmark::countLinks(workspace.items) + arcmark::countFolders(workspace.items);
      entry.pinnedCount = workspace.pinnedLinks.size();
      if (!activeId.isNull() && workspace.id == activeId) {
        m_activeIndex = m_workspaces.size();
      }
      m_workspaces.push_back(entry);
    }
  }
  endResetModel();

  if (oldActiveIndex != m_activeIndex || oldSettingsSelected != m_settingsSelected) {
    emit activeIndexChanged();
  }
}

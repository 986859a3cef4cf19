#pragma once

#include <QAbstractListModel>
#include <QColor>
#include <QPointer>
#include <QUuid>

class BookmarkStore;

// Read-only projection of the store's workspaces for the workspace switcher.
class WorkspaceModel : public QAbstractListModel
{
  Q_OBJECT
  Q_PROPERTY(int activeIndex READ activeIndex NOTIFY activeIndexChanged)
  Q_PROPERTY(bool settingsSelected READ settingsSelected NOTIFY activeIndexChanged)

public:
  enum Role
  {
    WorkspaceIdRole = Qt::UserRole + 1,
    NameRole,
    ColorIdRole,
    AccentColorRole,
    BackgroundColorRole,
    IsActiveRole,
    ItemCountRole,
    PinnedCountRole,
  };
  Q_ENUM(Role)

  explicit WorkspaceModel(BookmarkStore* store, QObject* parent = nullptr);

  int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
  QHash<int, QByteArray> roleNames() const override;

  int activeIndex() const;
  bool settingsSelected() const;

  Q_INVOKABLE int count() const;
  Q_INVOKABLE QString workspaceIdAt(int index) const;
  Q_INVOKABLE QString nameAt(int index) const;
  Q_INVOKABLE QColor accentColorAt(int index) const;
  Q_INVOKABLE void activate(int index);
  Q_INVOKABLE bool moveWorkspace(int fromIndex, int toIndex);

signals:
  void activeIndexChanged();

private:
  struct WorkspaceEntry
  {
    QUuid id;
    QString name;
    QString colorId;
    QColor accentColor;
    QColor backgroundColor;
    int itemCount = 0;
    int pinnedCount = 0;
  };

  void reload();

  QPointer<BookmarkStore> m_store;
  QVector<WorkspaceEntry> m_workspaces;
  int m_activeIndex = -1;
  bool m_settingsSelected = false;
};

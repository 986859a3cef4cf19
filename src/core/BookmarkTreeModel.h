#pragma once

#include "BookmarkTypes.h"

#include <QAbstractListModel>
#include <QHash>
#include <QPointer>
#include <QVector>

class BookmarkStore;

// The current workspace's tree flattened in display order. Rows inside collapsed folders
// stay in the model with treeVisible = false. A non-empty searchText shows the filtered tree.
class BookmarkTreeModel final : public QAbstractListModel
{
  Q_OBJECT
  Q_PROPERTY(int count READ count NOTIFY countChanged)
  Q_PROPERTY(QString searchText READ searchText WRITE setSearchText NOTIFY searchTextChanged)

public:
  enum Role
  {
    NodeIdRole = Qt::UserRole + 1,
    TitleRole,
    UrlRole,
    FaviconPathRole,
    IsFolderRole,
    ParentIdRole,
    DepthRole,
    ExpandedRole,
    HasChildrenRole,
    VisibleRole,
  };
  Q_ENUM(Role)

  explicit BookmarkTreeModel(BookmarkStore* store, QObject* parent = nullptr);

  int rowCount(const QModelIndex& parent = QModelIndex()) const override;
  QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
  QHash<int, QByteArray> roleNames() const override;

  int count() const;
  QString searchText() const;
  void setSearchText(const QString& text);

  Q_INVOKABLE int rowForId(const QString& nodeId) const;
  Q_INVOKABLE QString nodeIdAt(int row) const;
  Q_INVOKABLE void toggleExpanded(const QString& folderId);

signals:
  void countChanged();
  void searchTextChanged();

private:
  struct Row
  {
    QUuid id;
    QUuid parentId;
    bool isFolder = false;
    QString title;
    QString url;
    QString faviconPath;
    int depth = 0;
    bool expanded = false;
    int childCount = 0;
    bool visible = true;
  };

  void reload();
  void appendRows(const NodeList& nodes, const QUuid& parentId, int depth, bool visible);

  QPointer<BookmarkStore> m_store;
  QString m_searchText;
  QVector<Row> m_rows;
  QHash<QUuid, int> m_rowById;
};

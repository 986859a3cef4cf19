#include "ArcImporter.h"

#include <QDebug>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>
#include <QStringList>

namespace
{
// Objects carrying a string "id", keyed by that id, in first-seen order.
struct ItemIndex
{
  QStringList order;
  QHash<QString, QJsonObject> byId;
};

void collectItems(const QJsonValue& value, ItemIndex* index)
{
  if (value.isObject()) {
    const QJsonObject obj = value.toObject();
    const QString id = obj.value(QStringLiteral("id")).toString();
    if (!id.isEmpty()) {
      if (!index->byId.contains(id)) {
        index->order.push_back(id);
      }
      index->byId.insert(id, obj);
    }
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
      collectItems(it.value(), index);
    }
  } else if (value.isArray()) {
    const QJsonArray array = value.toArray();
    for (const QJsonValue& child : array) {
      collectItems(child, index);
    }
  }
}

QString stringOrNull(const QJsonObject& obj, const QString& key)
{
  const QJsonValue value = obj.value(key);
  return value.isString() ? value.toString() : QString();
}

// visiting guards against childrenIds cycles.
bool parseItem(const QJsonObject& item, const ItemIndex& index, QSet<QString>* visiting, Node* node)
{
  QString title;
  QString url;

  const QJsonObject tab = item.value(QStringLiteral("data")).toObject().value(QStringLiteral("tab")).toObject();
  title = stringOrNull(tab, QStringLiteral("savedTitle"));
  url = stringOrNull(tab, QStringLiteral("savedURL"));
  if (title.isNull()) {
    title = stringOrNull(tab, QStringLiteral("title"));
  }
  if (url.isNull()) {
    url = stringOrNull(tab, QStringLiteral("url"));
  }
  if (title.isNull()) {
    title = stringOrNull(item, QStringLiteral("title"));
  }
  if (url.isNull()) {
    url = stringOrNull(item, QStringLiteral("url"));
  }

  QStringList childrenIds;
  const QJsonArray children = item.value(QStringLiteral("childrenIds")).toArray();
  for (const QJsonValue& child : children) {
    const QString childId = child.toString();
    if (!childId.isEmpty()) {
      childrenIds.push_back(childId);
    }
  }

  if (!childrenIds.isEmpty()) {
    const QString itemId = item.value(QStringLiteral("id")).toString();
    if (!itemId.isEmpty()) {
      visiting->insert(itemId);
    }

    Folder folder;
    folder.id = QUuid::createUuid();
    folder.name = title.isNull() ? QStringLiteral("Folder") : title;
    folder.expanded = false;
    for (const QString& childId : childrenIds) {
      const auto it = index.byId.constFind(childId);
      if (it == index.byId.constEnd() || visiting->contains(childId)) {
        continue;
      }
      Node childNode;
      if (parseItem(it.value(), index, visiting, &childNode)) {
        folder.children.push_back(std::move(childNode));
      }
    }

    if (!itemId.isEmpty()) {
      visiting->remove(itemId);
    }
    *node = Node::fromFolder(folder);
    return true;
  }

  if (url.trimmed().isEmpty()) {
    return false;
  }

  Link link;
  link.id = QUuid::createUuid();
  link.title = title.isNull() ? url : title;
  link.url = url;
  *node = Node::fromLink(link);
  return true;
}

bool parseSpace(const QJsonObject& space, Workspace* workspace)
{
  const QJsonValue titleValue = space.value(QStringLiteral("title"));
  Workspace out = arcmark::makeWorkspace(titleValue.isString() ? titleValue.toString() : QStringLiteral("Arc Space"),
                                         arcmark::randomColorId());

  QJsonValue items;
  for (const char* key : {"items", "tabs", "pinnedTabs"}) {
    if (space.contains(QLatin1String(key))) {
      items = space.value(QLatin1String(key));
      break;
    }
  }

  if (items.isArray()) {
    ItemIndex index;
    collectItems(space, &index);

    const QJsonArray array = items.toArray();
    for (const QJsonValue& value : array) {
      if (!value.isObject()) {
        continue;
      }
      QSet<QString> visiting;
      Node node;
      if (parseItem(value.toObject(), index, &visiting, &node)) {
        out.items.push_back(std::move(node));
      }
    }
  }

  if (out.items.empty()) {
    return false;
  }
  *workspace = std::move(out);
  return true;
}

ImportResult parseFlat(const QJsonValue& root)
{
  Workspace workspace = arcmark::makeWorkspace(QStringLiteral("Arc Import"), WorkspaceColorId::Sky);

  ItemIndex index;
  collectItems(root, &index);
  for (const QString& id : index.order) {
    const QJsonObject item = index.byId.value(id);
    const QString url = stringOrNull(item, QStringLiteral("savedURL"));
    if (url.trimmed().isEmpty()) {
      continue;
    }
    const QString title = stringOrNull(item, QStringLiteral("savedTitle"));

    Link link;
    link.id = QUuid::createUuid();
    link.title = title.isNull() ? url : title;
    link.url = url;
    workspace.items.push_back(Node::fromLink(link));
  }

  if (workspace.items.empty()) {
    return ImportResult::failure(QStringLiteral("No bookmarks found in Arc data."));
  }
  return ImportResult::fromWorkspaces({workspace});
}
}

ImportResult ArcImporter::importFile(const QString& filePath)
{
  QByteArray bytes;
  QString error;
  if (!arcmark::readImportFile(filePath, &bytes, &error)) {
    qWarning().noquote() << "ArcImporter:" << error;
    return ImportResult::failure(error);
  }
  return importJson(bytes);
}

ImportResult ArcImporter::importJson(const QByteArray& json)
{
  QJsonParseError parseError;
  const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
  if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
    const QString reason = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                                        : QStringLiteral("not a JSON object");
    return ImportResult::failure(QStringLiteral("Failed to import Arc data: %1").arg(reason));
  }

  const QJsonObject root = doc.object();
  QJsonValue spaces;
  bool foundSpaces = false;
  if (root.value(QStringLiteral("sidebar")).toObject().contains(QStringLiteral("containers"))) {
    spaces = root.value(QStringLiteral("sidebar")).toObject().value(QStringLiteral("containers"));
    foundSpaces = true;
  } else if (root.contains(QStringLiteral("spaces"))) {
    spaces = root.value(QStringLiteral("spaces"));
    foundSpaces = true;
  } else if (root.value(QStringLiteral("sidebarSyncState")).toObject().contains(QStringLiteral("spaces"))) {
    spaces = root.value(QStringLiteral("sidebarSyncState")).toObject().value(QStringLiteral("spaces"));
    foundSpaces = true;
  }

  if (!foundSpaces) {
    return parseFlat(root);
  }
  if (!spaces.isArray()) {
    return ImportResult::failure(QStringLiteral("Failed to import Arc data: spaces list is not an array."));
  }

  QVector<Workspace> workspaces;
  const QJsonArray array = spaces.toArray();
  for (const QJsonValue& value : array) {
    if (!value.isObject()) {
      continue;
    }
    Workspace workspace;
    if (parseSpace(value.toObject(), &workspace)) {
      workspaces.push_back(std::move(workspace));
    }
  }

  if (workspaces.isEmpty()) {
    return ImportResult::failure(QStringLiteral("No spaces found in Arc data."));
  }
  return ImportResult::fromWorkspaces(workspaces);
}

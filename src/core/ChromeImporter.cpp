#include "ChromeImporter.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace
{
bool parseNode(const QJsonObject& obj, Node* node)
{
  const QString type = obj.value(QStringLiteral("type")).toString();
  const QString name = obj.value(QStringLiteral("name")).toString();

  if (type == QLatin1String("url")) {
    Link link;
    link.id = QUuid::createUuid();
    link.title = name;
    link.url = obj.value(QStringLiteral("url")).toString();
    *node = Node::fromLink(link);
    return true;
  }

  if (type == QLatin1String("folder")) {
    Folder folder;
    folder.id = QUuid::createUuid();
    folder.name = name;
    folder.expanded = false;
    const QJsonArray children = obj.value(QStringLiteral("children")).toArray();
    for (const QJsonValue& child : children) {
      Node childNode;
      if (parseNode(child.toObject(), &childNode)) {
        folder.children.push_back(std::move(childNode));
      }
    }
    *node = Node::fromFolder(folder);
    return true;
  }

  return false;
}

bool parseRoot(const QJsonObject& roots, const QString& key, const QString& defaultName, Workspace* workspace)
{
  if (!roots.contains(key)) {
    return false;
  }

  const QJsonObject root = roots.value(key).toObject();
  const QJsonValue nameValue = root.value(QStringLiteral("name"));
  Workspace out = arcmark::makeWorkspace(nameValue.isString() ? nameValue.toString() : defaultName,
                                         arcmark::randomColorId());

  const QJsonArray children = root.value(QStringLiteral("children")).toArray();
  for (const QJsonValue& child : children) {
    Node node;
    if (parseNode(child.toObject(), &node)) {
      out.items.push_back(std::move(node));
    }
  }

  if (out.items.empty()) {
    return false;
  }
  *workspace = std::move(out);
  return true;
}
}

ImportResult ChromeImporter::importFile(const QString& filePath, bool mergeIntoSingle)
{
  QByteArray bytes;
  QString error;
  if (!arcmark::readImportFile(filePath, &bytes, &error)) {
    qWarning().noquote() << "ChromeImporter:" << error;
    return ImportResult::failure(error);
  }
  return importJson(bytes, mergeIntoSingle);
}

ImportResult ChromeImporter::importJson(const QByteArray& json, bool mergeIntoSingle)
{
  QJsonParseError parseError;
  const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
  if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
    const QString reason = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                                        : QStringLiteral("not a JSON object");
    return ImportResult::failure(QStringLiteral("Failed to import Chrome bookmarks: %1").arg(reason));
  }

  const QJsonObject root = doc.object();
  if (!root.value(QStringLiteral("roots")).isObject()) {
    return ImportResult::failure(QStringLiteral("Invalid Chrome bookmarks format: missing 'roots'."));
  }
  const QJsonObject roots = root.value(QStringLiteral("roots")).toObject();

  QVector<Workspace> workspaces;
  const struct
  {
    const char* key;
    const char* defaultName;
  } kRoots[] = {
    {"bookmark_bar", "Bookmarks Bar"},
    {"other", "Other Bookmarks"},
    {"synced", "Mobile Bookmarks"},
  };
  for (const auto& entry : kRoots) {
    Workspace workspace;
    if (parseRoot(roots, QString::fromLatin1(entry.key), QString::fromLatin1(entry.defaultName), &workspace)) {
      workspaces.push_back(std::move(workspace));
    }
  }

  if (mergeIntoSingle && workspaces.size() > 1) {
    Workspace merged = arcmark::makeWorkspace(QStringLiteral("Chrome Bookmarks"), WorkspaceColorId::Sky);
    for (const Workspace& workspace : workspaces) {
      merged.items.insert(merged.items.end(), workspace.items.begin(), workspace.items.end());
    }
    workspaces = {merged};
  }

  return ImportResult::fromWorkspaces(workspaces);
}

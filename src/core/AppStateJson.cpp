#include "AppStateJson.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace
{
void setError(QString* error, const QString& message)
{
  if (error) {
    *error = message;
  }
}

QUuid idOrFresh(const QJsonValue& value)
{
  const QUuid id = arcmark::uuidFromJson(value);
  return id.isNull() ? QUuid::createUuid() : id;
}

QJsonValue nullableString(const QString& value)
{
  return value.isNull() ? QJsonValue(QJsonValue::Null) : QJsonValue(value);
}

QJsonObject folderToJson(const Folder& folder)
{
  QJsonArray children;
  for (const Node& child : folder.children) {
    children.push_back(arcmark::nodeToJson(child));
  }

  QJsonObject obj;
  obj.insert(QStringLiteral("id"), arcmark::uuidToString(folder.id));
  obj.insert(QStringLiteral("name"), folder.name);
  obj.insert(QStringLiteral("children"), children);
  obj.insert(QStringLiteral("isExpanded"), folder.expanded);
  return obj;
}

bool folderFromJson(const QJsonValue& value, Folder* folder, QString* error)
{
  if (!value.isObject()) {
    setError(error, QStringLiteral("Node with type 'folder' is missing 'folder' property."));
    return false;
  }

  const QJsonObject obj = value.toObject();
  Folder out;
  out.id = idOrFresh(obj.value(QStringLiteral("id")));
  out.name = obj.value(QStringLiteral("name")).toString();
  out.expanded = obj.value(QStringLiteral("isExpanded")).toBool(false);

  const QJsonArray children = obj.value(QStringLiteral("children")).toArray();
  out.children.reserve(children.size());
  for (const QJsonValue& child : children) {
    Node node;
    if (!arcmark::nodeFromJson(child, &node, error)) {
      return false;
    }
    out.children.push_back(std::move(node));
  }

  *folder = std::move(out);
  return true;
}
}

namespace arcmark
{
QString uuidToString(const QUuid& id)
{
  return id.toString(QUuid::WithoutBraces);
}

QUuid uuidFromJson(const QJsonValue& value)
{
  if (!value.isString()) {
    return {};
  }
  return QUuid::fromString(value.toString().trimmed());
}

QJsonObject linkToJson(const Link& link)
{
  QJsonObject obj;
  obj.insert(QStringLiteral("id"), uuidToString(link.id));
  obj.insert(QStringLiteral("title"), link.title);
  obj.insert(QStringLiteral("url"), link.url);
  obj.insert(QStringLiteral("faviconPath"), nullableString(link.faviconPath));
  return obj;
}

QJsonObject nodeToJson(const Node& node)
{
  QJsonObject obj;
  if (node.isFolder()) {
    obj.insert(QStringLiteral("type"), QStringLiteral("folder"));
    obj.insert(QStringLiteral("folder"), folderToJson(node.folder));
  } else {
    obj.insert(QStringLiteral("type"), QStringLiteral("link"));
    obj.insert(QStringLiteral("link"), linkToJson(node.link));
  }
  return obj;
}

QJsonObject workspaceToJson(const Workspace& workspace)
{
  QJsonArray items;
  for (const Node& node : workspace.items) {
    items.push_back(nodeToJson(node));
  }

  QJsonArray pinned;
  for (const Link& link : workspace.pinnedLinks) {
    pinned.push_back(linkToJson(link));
  }

  QJsonObject obj;
  obj.insert(QStringLiteral("id"), uuidToString(workspace.id));
  obj.insert(QStringLiteral("name"), workspace.name);
  obj.insert(QStringLiteral("colorId"), colorIdToString(workspace.colorId));
  obj.insert(QStringLiteral("items"), items);
  obj.insert(QStringLiteral("pinnedLinks"), pinned);
  return obj;
}

QJsonObject appStateToJson(const AppState& state)
{
  QJsonArray workspaces;
  for (const Workspace& workspace : state.workspaces) {
    workspaces.push_back(workspaceToJson(workspace));
  }

  QJsonObject root;
  root.insert(QStringLiteral("schemaVersion"), state.schemaVersion);
  root.insert(QStringLiteral("workspaces"), workspaces);
  root.insert(
    QStringLiteral("selectedWorkspaceId"),
    state.selectedWorkspaceId.isNull() ? QJsonValue(QJsonValue::Null)
                                       : QJsonValue(uuidToString(state.selectedWorkspaceId)));
  root.insert(QStringLiteral("isSettingsSelected"), state.settingsSelected);
  return root;
}

bool linkFromJson(const QJsonValue& value, Link* link, QString* error)
{
  if (!value.isObject()) {
    setError(error, QStringLiteral("Link entry is not a JSON object."));
    return false;
  }

  const QJsonObject obj = value.toObject();
  Link out;
  out.id = idOrFresh(obj.value(QStringLiteral("id")));
  out.title = obj.value(QStringLiteral("title")).toString();
  out.url = obj.value(QStringLiteral("url")).toString();

  const QJsonValue favicon = obj.value(QStringLiteral("faviconPath"));
  if (favicon.isString()) {
    out.faviconPath = favicon.toString();
  }

  *link = std::move(out);
  return true;
}

bool nodeFromJson(const QJsonValue& value, Node* node, QString* error)
{
  if (!value.isObject()) {
    setError(error, QStringLiteral("Node entry is not a JSON object."));
    return false;
  }

  const QJsonObject obj = value.toObject();
  const QJsonValue typeValue = obj.value(QStringLiteral("type"));
  if (!typeValue.isString()) {
    setError(error, QStringLiteral("Node JSON is missing required 'type' property."));
    return false;
  }

  const QString type = typeValue.toString();
  if (type == QLatin1String("folder")) {
    Folder folder;
    if (!folderFromJson(obj.value(QStringLiteral("folder")), &folder, error)) {
      return false;
    }
    *node = Node::fromFolder(folder);
    return true;
  }

  if (type == QLatin1String("link")) {
    const QJsonValue payload = obj.value(QStringLiteral("link"));
    if (!payload.isObject()) {
      setError(error, QStringLiteral("Node with type 'link' is missing 'link' property."));
      return false;
    }
    Link link;
    if (!linkFromJson(payload, &link, error)) {
      return false;
    }
    *node = Node::fromLink(link);
    return true;
  }

  setError(error, QStringLiteral("Unknown Node type: '%1'.").arg(type));
  return false;
}

bool workspaceFromJson(const QJsonValue& value, Workspace* workspace, QString* error)
{
  if (!value.isObject()) {
    setError(error, QStringLiteral("Workspace entry is not a JSON object."));
    return false;
  }

  const QJsonObject obj = value.toObject();
  Workspace out;
  out.id = idOrFresh(obj.value(QStringLiteral("id")));
  out.name = obj.value(QStringLiteral("name")).toString();
  out.colorId = colorIdFromString(obj.value(QStringLiteral("colorId")).toString());

  const QJsonArray items = obj.value(QStringLiteral("items")).toArray();
  out.items.reserve(items.size());
  for (const QJsonValue& item : items) {
    Node node;
    if (!nodeFromJson(item, &node, error)) {
      return false;
    }
    out.items.push_back(std::move(node));
  }

  const QJsonArray pinned = obj.value(QStringLiteral("pinnedLinks")).toArray();
  for (const QJsonValue& item : pinned) {
    Link link;
    if (!linkFromJson(item, &link, error)) {
      return false;
    }
    out.pinnedLinks.push_back(link);
  }

  *workspace = std::move(out);
  return true;
}

bool appStateFromJson(const QJsonObject& root, AppState* state, QString* error)
{
  AppState out;
  out.schemaVersion = root.value(QStringLiteral("schemaVersion")).toInt(1);
  out.selectedWorkspaceId = uuidFromJson(root.value(QStringLiteral("selectedWorkspaceId")));
  out.settingsSelected = root.value(QStringLiteral("isSettingsSelected")).toBool(false);

  const QJsonArray workspaces = root.value(QStringLiteral("workspaces")).toArray();
  for (const QJsonValue& value : workspaces) {
    Workspace workspace;
    if (!workspaceFromJson(value, &workspace, error)) {
      return false;
    }
    out.workspaces.push_back(std::move(workspace));
  }

  *state = std::move(out);
  return true;
}

QByteArray serializeAppState(const AppState& state)
{
  // QJsonObject keeps its keys ordered, so every level is emitted sorted.
  return QJsonDocument(appStateToJson(state)).toJson(QJsonDocument::Indented);
}

bool parseAppState(const QByteArray& json, AppState* state, QString* error)
{
  QJsonParseError parseError;
  const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    setError(error, parseError.errorString());
    return false;
  }
  if (!doc.isObject()) {
    setError(error, QStringLiteral("data.json is not a JSON object"));
    return false;
  }
  return appStateFromJson(doc.object(), state, error);
}
}

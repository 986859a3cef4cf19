#pragma once

#include "BookmarkTypes.h"

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>

namespace arcmark
{
QString uuidToString(const QUuid& id);
QUuid uuidFromJson(const QJsonValue& value);

QJsonObject linkToJson(const Link& link);
QJsonObject nodeToJson(const Node& node);
QJsonObject workspaceToJson(const Workspace& workspace);
QJsonObject appStateToJson(const AppState& state);

// Parsers return false and fill error on a malformed document. A node without a known
// "type" or without its payload object fails the whole document.
bool linkFromJson(const QJsonValue& value, Link* link, QString* error = nullptr);
bool nodeFromJson(const QJsonValue& value, Node* node, QString* error = nullptr);
bool workspaceFromJson(const QJsonValue& value, Workspace* workspace, QString* error = nullptr);
bool appStateFromJson(const QJsonObject& root, AppState* state, QString* error = nullptr);

// Indented, keys sorted at every object level.
QByteArray serializeAppState(const AppState& state);
bool parseAppState(const QByteArray& json, AppState* state, QString* error = nullptr);
}

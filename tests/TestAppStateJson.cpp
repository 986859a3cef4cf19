#include <QtTest/QtTest>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "core/AppStateJson.h"

namespace
{
AppState sampleState()
{
  Link github;
  github.id = QUuid::createUuid();
  github.title = QStringLiteral("GitHub");
  github.url = QStringLiteral("https://github.com");
  github.faviconPath = QStringLiteral("/icons/github.com.ico");

  Link jira;
  jira.id = QUuid::createUuid();
  jira.title = QStringLiteral("Jira Board");
  jira.url = QStringLiteral("https://x/jira");

  Folder nested;
  nested.id = QUuid::createUuid();
  nested.name = QStringLiteral("Nested");
  nested.expanded = false;
  nested.children.push_back(Node::fromLink(jira));

  Folder work;
  work.id = QUuid::createUuid();
  work.name = QStringLiteral("Work");
  work.children.push_back(Node::fromLink(github));
  work.children.push_back(Node::fromFolder(nested));

  Link pinned;
  pinned.id = QUuid::createUuid();
  pinned.title = QStringLiteral("Mail");
  pinned.url = QStringLiteral("https://mail.example.com");

  Workspace inbox = arcmark::makeWorkspace(QStringLiteral("Inbox"), WorkspaceColorId::Sky);
  inbox.items.push_back(Node::fromFolder(work));
  inbox.pinnedLinks.push_back(pinned);

  Workspace other = arcmark::makeWorkspace(QStringLiteral("Other"), WorkspaceColorId::Periwinkle);

  AppState state;
  state.schemaVersion = AppState::kCurrentSchemaVersion;
  state.workspaces = {inbox, other};
  state.selectedWorkspaceId = other.id;
  state.settingsSelected = false;
  return state;
}
}

class TestAppStateJson final : public QObject
{
  Q_OBJECT

private slots:
  void roundTrip_preservesStructure()
  {
    const AppState state = sampleState();

    AppState parsed;
    QString error;
    QVERIFY2(arcmark::parseAppState(arcmark::serializeAppState(state), &parsed, &error), qPrintable(error));
    QVERIFY(parsed == state);

    const Folder& work = parsed.workspaces.first().items.at(0).folder;
    QCOMPARE(work.children.size(), std::size_t(2));
    QVERIFY(work.children.at(1).isFolder());
    QVERIFY(!work.children.at(1).folder.expanded);
    QVERIFY(work.children.at(1).folder.children.at(0).link.faviconPath.isNull());
  }

  void nodes_useTaggedUnionShape()
  {
    const AppState state = sampleState();
    const QJsonObject folderJson = arcmark::nodeToJson(state.workspaces.first().items.at(0));
    QCOMPARE(folderJson.value("type").toString(), QStringLiteral("folder"));
    QVERIFY(folderJson.value("folder").isObject());
    QCOMPARE(folderJson.value("folder").toObject().value("name").toString(), QStringLiteral("Work"));
    QVERIFY(folderJson.value("folder").toObject().value("isExpanded").toBool());

    const Node& link = state.workspaces.first().items.at(0).folder.children.at(0);
    const QJsonObject linkJson = arcmark::nodeToJson(link);
    QCOMPARE(linkJson.value("type").toString(), QStringLiteral("link"));
    QCOMPARE(linkJson.value("link").toObject().value("url").toString(), QStringLiteral("https://github.com"));
    QCOMPARE(linkJson.value("link").toObject().value("id").toString(), arcmark::uuidToString(link.id()));
  }

  void link_nullFaviconIsWrittenAsNull()
  {
    Link link;
    link.id = QUuid::createUuid();
    link.title = QStringLiteral("A");
    link.url = QStringLiteral("https://a.com");

    const QJsonObject obj = arcmark::linkToJson(link);
    QVERIFY(obj.contains("faviconPath"));
    QVERIFY(obj.value("faviconPath").isNull());
  }

  void workspace_colorIsLowercaseAndPinnedAlwaysPresent()
  {
    const Workspace workspace = arcmark::makeWorkspace(QStringLiteral("Test"), WorkspaceColorId::Sky);
    const QJsonObject obj = arcmark::workspaceToJson(workspace);
    QCOMPARE(obj.value("colorId").toString(), QStringLiteral("sky"));
    QVERIFY(obj.value("pinnedLinks").isArray());
    QCOMPARE(obj.value("pinnedLinks").toArray().size(), 0);
  }

  void unknownColor_fallsBackToSky()
  {
    QJsonObject obj;
    obj.insert("id", QUuid::createUuid().toString(QUuid::WithoutBraces));
    obj.insert("name", "Odd");
    obj.insert("colorId", "Magenta");

    Workspace workspace;
    QVERIFY(arcmark::workspaceFromJson(obj, &workspace));
    QCOMPARE(workspace.colorId, WorkspaceColorId::Sky);
    QVERIFY(workspace.items.empty());
  }

  void serialized_keysAreSorted()
  {
    const QByteArray json = arcmark::serializeAppState(sampleState());
    const int isSettings = json.indexOf("\"isSettingsSelected\"");
    const int schema = json.indexOf("\"schemaVersion\"");
    const int selected = json.indexOf("\"selectedWorkspaceId\"");
    const int workspaces = json.indexOf("\"workspaces\"");
    QVERIFY(isSettings >= 0);
    QVERIFY(isSettings < schema);
    QVERIFY(schema < selected);
    QVERIFY(selected < workspaces);

    const int colorId = json.indexOf("\"colorId\"");
    const int items = json.indexOf("\"items\"", colorId);
    const int name = json.indexOf("\"name\"", colorId);
    QVERIFY(colorId < items);
    QVERIFY(items < name);
  }

  void nullSelection_roundTripsAsNull()
  {
    AppState state = sampleState();
    state.selectedWorkspaceId = QUuid();
    state.settingsSelected = true;

    const QJsonObject root = arcmark::appStateToJson(state);
    QVERIFY(root.value("selectedWorkspaceId").isNull());

    AppState parsed;
    QVERIFY(arcmark::appStateFromJson(root, &parsed));
    QVERIFY(parsed.selectedWorkspaceId.isNull());
    QVERIFY(parsed.settingsSelected);
  }

  void crossPlatformSample_parses()
  {
    const QByteArray json = R"({
      "schemaVersion": 1,
      "workspaces": [{
        "id": "550e8400-e29b-41d4-a716-446655440000",
        "name": "Inbox",
        "colorId": "sky",
        "items": [{
          "type": "folder",
          "folder": {
            "id": "660e8400-e29b-41d4-a716-446655440001",
            "name": "Work",
            "children": [{
              "type": "link",
              "link": {
                "id": "770e8400-e29b-41d4-a716-446655440002",
                "title": "GitHub",
                "url": "https://github.com",
                "faviconPath": null
              }
            }],
            "isExpanded": true
          }
        }],
        "pinnedLinks": []
      }],
      "selectedWorkspaceId": "550e8400-e29b-41d4-a716-446655440000",
      "isSettingsSelected": false
    })";

    AppState state;
    QString error;
    QVERIFY2(arcmark::parseAppState(json, &state, &error), qPrintable(error));
    QCOMPARE(state.schemaVersion, 1);
    QCOMPARE(state.workspaces.size(), 1);
    QCOMPARE(state.selectedWorkspaceId, QUuid(QStringLiteral("550e8400-e29b-41d4-a716-446655440000")));

    const Node& folder = state.workspaces.first().items.at(0);
    QVERIFY(folder.isFolder());
    QCOMPARE(folder.folder.name, QStringLiteral("Work"));
    QCOMPARE(folder.folder.children.at(0).link.title, QStringLiteral("GitHub"));
    QCOMPARE(folder.folder.children.at(0).id(), QUuid(QStringLiteral("770e8400-e29b-41d4-a716-446655440002")));
  }

  void unknownNodeType_failsParse()
  {
    const QByteArray json = R"({"schemaVersion":2,"workspaces":[{"id":"550e8400-e29b-41d4-a716-446655440000",
      "name":"Inbox","colorId":"sky","items":[{"type":"separator"}],"pinnedLinks":[]}]})";

    AppState state;
    QString error;
    QVERIFY(!arcmark::parseAppState(json, &state, &error));
    QVERIFY(error.contains(QStringLiteral("separator")));
  }

  void missingPayload_failsParse()
  {
    QJsonObject node;
    node.insert("type", "link");

    Node parsed;
    QString error;
    QVERIFY(!arcmark::nodeFromJson(node, &parsed, &error));
    QVERIFY(!error.isEmpty());

    QJsonObject untyped;
    untyped.insert("folder", QJsonObject());
    QVERIFY(!arcmark::nodeFromJson(untyped, &parsed, &error));
  }

  void missingIds_getFreshOnes()
  {
    QJsonObject link;
    link.insert("title", "A");
    link.insert("url", "https://a.com");

    Link parsed;
    QVERIFY(arcmark::linkFromJson(link, &parsed));
    QVERIFY(!parsed.id.isNull());
  }
};

QTEST_GUILESS_MAIN(TestAppStateJson)

#include "TestAppStateJson.moc"

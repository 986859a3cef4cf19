#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <QUrl>
#include <limits>
#include <memory>

#include "core/AppPaths.h"
#include "core/AppSettings.h"
#include "core/AppStateJson.h"
#include "core/ArcImporter.h"
#include "core/BookmarkStore.h"
#include "core/ChromeImporter.h"
#include "core/FaviconCache.h"
#include "core/NodeFiltering.h"

namespace
{
QFile* g_logFile = nullptr;
QMutex g_logMutex;

QString logLevel(QtMsgType type)
{
  switch (type) {
    case QtDebugMsg:
      return QStringLiteral("DEBUG");
    case QtInfoMsg:
      return QStringLiteral("INFO");
    case QtWarningMsg:
      return QStringLiteral("WARN");
    case QtCriticalMsg:
      return QStringLiteral("ERROR");
    case QtFatalMsg:
      return QStringLiteral("FATAL");
    default:
      return QStringLiteral("LOG");
  }
}

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
  QMutexLocker locker(&g_logMutex);
  if (g_logFile && g_logFile->isOpen()) {
    QTextStream out(g_logFile);
    out << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << " [" << logLevel(type) << "] " << msg << "\n";
    g_logFile->flush();
  }

  if (type == QtCriticalMsg || type == QtFatalMsg) {
    QTextStream err(stderr);
    err << msg << "\n";
  }
}

void installLogging()
{
  static QFile file;
  file.setFileName(arcmark::logFilePath());
  if (file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
    g_logFile = &file;
    qInstallMessageHandler(messageHandler);
    qInfo().noquote() << "Logging to" << file.fileName();
  }
}

const QStringList kNodeCommands = {
  QStringLiteral("add-link"), QStringLiteral("add-folder"), QStringLiteral("move"),
  QStringLiteral("delete"),   QStringLiteral("pin"),        QStringLiteral("unpin"),
};

// Puts the selection back after a command that ran against another workspace.
class SelectionRestorer
{
public:
  explicit SelectionRestorer(BookmarkStore& store)
    : m_store(store)
    , m_settingsSelected(store.state().settingsSelected)
    , m_workspaceId(store.currentWorkspaceId())
  {
  }

  ~SelectionRestorer() { restore(); }

  SelectionRestorer(const SelectionRestorer&) = delete;
  SelectionRestorer& operator=(const SelectionRestorer&) = delete;

  void switchTo(const QUuid& id)
  {
    if (!m_settingsSelected && id == m_workspaceId) {
      return;
    }
    m_store.selectWorkspace(id);
    m_switched = true;
  }

  void restore()
  {
    if (!m_switched) {
      return;
    }
    m_switched = false;
    if (m_settingsSelected) {
      m_store.selectSettingsView();
    } else {
      m_store.selectWorkspace(m_workspaceId);
    }
  }

private:
  BookmarkStore& m_store;
  bool m_settingsSelected = false;
  QUuid m_workspaceId;
  bool m_switched = false;
};

QTextStream& out()
{
  static QTextStream stream(stdout);
  return stream;
}

QTextStream& err()
{
  static QTextStream stream(stderr);
  return stream;
}

// Matches a workspace by id, else by case-insensitive name.
const Workspace* resolveWorkspace(const BookmarkStore& store, const QString& key)
{
  const QUuid id = QUuid::fromString(key.trimmed());
  if (!id.isNull()) {
    if (const Workspace* workspace = store.workspaceById(id)) {
      return workspace;
    }
  }
  for (const Workspace& workspace : store.workspaces()) {
    if (workspace.name.compare(key.trimmed(), Qt::CaseInsensitive) == 0) {
      return &workspace;
    }
  }
  return nullptr;
}

void printNodes(const NodeList& nodes, int depth)
{
  const QString indent(depth * 2, QLatin1Char(' '));
  for (const Node& node : nodes) {
    if (node.isFolder()) {
      out() << indent << (node.folder.expanded ? "[-] " : "[+] ") << node.folder.name << "  ("
            << arcmark::uuidToString(node.folder.id) << ")\n";
      printNodes(node.folder.children, depth + 1);
    } else {
      out() << indent << "- " << node.link.title << " <" << node.link.url << ">  ("
            << arcmark::uuidToString(node.link.id) << ")\n";
    }
  }
}

void printWorkspace(const Workspace& workspace)
{
  out() << workspace.name << " [" << arcmark::colorIdToString(workspace.colorId) << "]\n";
  for (const Link& link : workspace.pinnedLinks) {
    out() << "  * " << link.title << " <" << link.url << ">  (" << arcmark::uuidToString(link.id) << ")\n";
  }
  printNodes(workspace.items, 1);
}

bool requireArgs(const QStringList& args, int count, const QString& usage)
{
  if (args.size() < count) {
    err() << "Usage: arcmark " << usage << "\n";
    return false;
  }
  return true;
}

int importResult(BookmarkStore& store, const ImportResult& result)
{
  if (!result.success) {
    err() << result.summary() << "\n";
    qWarning().noquote() << result.summary();
    return 1;
  }
  const int added = store.importWorkspaces(result.workspaces);
  qInfo().noquote() << result.summary();
  out() << result.summary() << "\n";
  return added > 0 || result.workspaces.isEmpty() ? 0 : 1;
}
}

int main(int argc, char* argv[])
{
  QCoreApplication::setOrganizationName("Arcmark");
  QCoreApplication::setApplicationName("Arcmark");
  QCoreApplication::setApplicationVersion(QStringLiteral(ARCMARK_VERSION));

  QCoreApplication app(argc, argv);

  QCommandLineParser parser;
  parser.setApplicationDescription(QStringLiteral("Workspace-organized bookmarks."));
  parser.addHelpOption();
  parser.addVersionOption();

  QCommandLineOption dataDirOpt(QStringLiteral("data-dir"), QStringLiteral("Override data directory."), QStringLiteral("dir"));
  QCommandLineOption parentOpt(QStringLiteral("parent"), QStringLiteral("Target folder id."), QStringLiteral("id"));
  QCommandLineOption workspaceOpt(QStringLiteral("workspace"), QStringLiteral("Workspace name or id."), QStringLiteral("workspace"));
  QCommandLineOption colorOpt(QStringLiteral("color"), QStringLiteral("Workspace color id."), QStringLiteral("color"));
  QCommandLineOption mergeOpt(QStringLiteral("merge"), QStringLiteral("Merge Chrome roots into one workspace."));
  parser.addOption(dataDirOpt);
  parser.addOption(parentOpt);
  parser.addOption(workspaceOpt);
  parser.addOption(colorOpt);
  parser.addOption(mergeOpt);
  parser.addPositionalArgument(
    QStringLiteral("command"),
    QStringLiteral("list | workspaces | select | new-workspace | add-link | add-folder | move | delete | pin | unpin | "
                   "search | duplicate | import-chrome | import-arc"));
  parser.process(app);

  if (parser.isSet(dataDirOpt)) {
    arcmark::overrideDataDir(parser.value(dataDirOpt));
  }

  installLogging();

  QStringList args = parser.positionalArguments();
  if (args.isEmpty()) {
    parser.showHelp(2);
  }
  const QString command = args.takeFirst();

  AppSettings settings;
  QString lockError;
  const std::unique_ptr<BookmarkStore> storeHolder = BookmarkStore::openExclusive({}, &settings, &lockError);
  if (!storeHolder) {
    err() << lockError << "\n";
    return 1;
  }
  BookmarkStore& store = *storeHolder;

  // Read-only commands print the named workspace directly. Node commands act on the
  // current workspace, so it is selected for the command only.
  const Workspace* scoped = nullptr;
  if (parser.isSet(workspaceOpt)) {
    scoped = resolveWorkspace(store, parser.value(workspaceOpt));
    if (!scoped) {
      err() << "Unknown workspace: " << parser.value(workspaceOpt) << "\n";
      return 1;
    }
  }
  const Workspace& target = scoped ? *scoped : store.currentWorkspace();
  SelectionRestorer selection(store);
  if (scoped && kNodeCommands.contains(command)) {
    selection.switchTo(scoped->id);
  }

  const QUuid parentId = parser.isSet(parentOpt) ? QUuid::fromString(parser.value(parentOpt)) : QUuid();
  if (parser.isSet(parentOpt) && parentId.isNull()) {
    err() << "Invalid folder id: " << parser.value(parentOpt) << "\n";
    return 2;
  }

  int exitCode = 0;
  if (command == QLatin1String("list")) {
    printWorkspace(target);
  } else if (command == QLatin1String("workspaces")) {
    const QUuid current = store.state().settingsSelected ? QUuid() : store.currentWorkspaceId();
    for (const Workspace& workspace : store.workspaces()) {
      out() << (workspace.id == current ? "* " : "  ") << workspace.name << " ["
            << arcmark::colorIdToString(workspace.colorId) << "] " << arcmark::countLinks(workspace.items)
            << " link(s)  (" << arcmark::uuidToString(workspace.id) << ")\n";
    }
  } else if (command == QLatin1String("select")) {
    if (!requireArgs(args, 1, QStringLiteral("select <workspace>"))) {
      return 2;
    }
    const Workspace* workspace = resolveWorkspace(store, args.at(0));
    if (!workspace) {
      err() << "Unknown workspace: " << args.at(0) << "\n";
      return 1;
    }
    store.selectWorkspace(workspace->id);
  } else if (command == QLatin1String("new-workspace")) {
    if (!requireArgs(args, 1, QStringLiteral("new-workspace <name> [--color <id>]"))) {
      return 2;
    }
    const WorkspaceColorId color =
      parser.isSet(colorOpt) ? arcmark::colorIdFromString(parser.value(colorOpt)) : arcmark::randomColorId();
    const QUuid id = store.createWorkspace(args.at(0), color);
    out() << arcmark::uuidToString(id) << "\n";
  } else if (command == QLatin1String("add-link")) {
    if (!requireArgs(args, 1, QStringLiteral("add-link <url> [title] [--parent <id>]"))) {
      return 2;
    }
    const QString url = args.at(0);
    BookmarkStore::DuplicateLink duplicate;
    if (store.findDuplicateLink(url, &duplicate)) {
      err() << "Note: already saved as \"" << duplicate.linkTitle << "\" in " << duplicate.workspaceName << "\n";
    }
    const QString title = args.size() > 1 ? args.at(1) : QUrl(url).host();
    const QUuid id = store.addLink(url, title.isEmpty() ? url : title, parentId);
    if (id.isNull()) {
      err() << "No such folder in the current workspace\n";
      return 1;
    }

    FaviconCache favicons(store.iconsDirectory());
    const QString icon = favicons.cachedIconPath(QUrl(url));
    if (!icon.isEmpty()) {
      store.updateLinkFaviconPath(id, icon);
    }
    out() << arcmark::uuidToString(id) << "\n";
  } else if (command == QLatin1String("add-folder")) {
    if (!requireArgs(args, 1, QStringLiteral("add-folder <name> [--parent <id>]"))) {
      return 2;
    }
    const QUuid id = store.addFolder(args.at(0), parentId);
    if (id.isNull()) {
      err() << "No such folder in the current workspace\n";
      return 1;
    }
    out() << arcmark::uuidToString(id) << "\n";
  } else if (command == QLatin1String("move")) {
    if (!requireArgs(args, 1, QStringLiteral("move <node-id> [index] [--parent <id>]"))) {
      return 2;
    }
    int index = std::numeric_limits<int>::max();
    if (args.size() > 1) {
      bool ok = false;
      index = args.at(1).toInt(&ok);
      if (!ok || index < 0) {
        err() << "Invalid index: " << args.at(1) << "\n";
        return 2;
      }
    }
    exitCode = store.moveNode(QUuid::fromString(args.at(0)), parentId, index) ? 0 : 1;
  } else if (command == QLatin1String("delete")) {
    if (!requireArgs(args, 1, QStringLiteral("delete <node-id>"))) {
      return 2;
    }
    const QUuid id = QUuid::fromString(args.at(0));
    if (!store.nodeById(id)) {
      err() << "Unknown node: " << args.at(0) << "\n";
      return 1;
    }
    store.deleteNode(id);
  } else if (command == QLatin1String("pin")) {
    if (!requireArgs(args, 1, QStringLiteral("pin <link-id>"))) {
      return 2;
    }
    if (!store.pinLink(QUuid::fromString(args.at(0)))) {
      err() << "Cannot pin: unknown link or the pinned grid is full\n";
      exitCode = 1;
    }
  } else if (command == QLatin1String("unpin")) {
    if (!requireArgs(args, 1, QStringLiteral("unpin <link-id>"))) {
      return 2;
    }
    exitCode = store.unpinLink(QUuid::fromString(args.at(0))) ? 0 : 1;
  } else if (command == QLatin1String("search")) {
    if (!requireArgs(args, 1, QStringLiteral("search <query>"))) {
      return 2;
    }
    const NodeList matches = arcmark::filterNodes(target.items, args.join(QLatin1Char(' ')));
    if (matches.empty()) {
      exitCode = 1;
    } else {
      printNodes(matches, 0);
    }
  } else if (command == QLatin1String("duplicate")) {
    if (!requireArgs(args, 1, QStringLiteral("duplicate <url>"))) {
      return 2;
    }
    BookmarkStore::DuplicateLink duplicate;
    if (store.findDuplicateLink(args.at(0), &duplicate)) {
      out() << duplicate.workspaceName << ": " << duplicate.linkTitle << "\n";
    } else {
      exitCode = 1;
    }
  } else if (command == QLatin1String("import-chrome")) {
    if (!requireArgs(args, 1, QStringLiteral("import-chrome <Bookmarks file> [--merge]"))) {
      return 2;
    }
    exitCode = importResult(store, ChromeImporter::importFile(args.at(0), parser.isSet(mergeOpt)));
  } else if (command == QLatin1String("import-arc")) {
    if (!requireArgs(args, 1, QStringLiteral("import-arc <StorableSidebar.json>"))) {
      return 2;
    }
    exitCode = importResult(store, ArcImporter::importFile(args.at(0)));
  } else {
    err() << "Unknown command: " << command << "\n";
    return 2;
  }

  selection.restore();

  out().flush();
  QString settingsError;
  if (!settings.saveNow(&settingsError)) {
    qWarning().noquote() << "Failed to save settings:" << settingsError;
  }
  return exitCode;
}

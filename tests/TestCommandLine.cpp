#include <QtTest/QtTest>

#include <QProcess>
#include <QTemporaryDir>

#include "core/BookmarkStore.h"
#include "core/DataStore.h"

namespace
{
struct RunResult
{
  int exitCode = -1;
  QString out;
  QString err;
};

RunResult runArcmark(const QString& dataDir, const QStringList& args)
{
  QProcess process;
  process.setProgram(QStringLiteral(ARCMARK_EXECUTABLE));
  process.setArguments(QStringList{QStringLiteral("--data-dir"), dataDir} + args);
  process.start();

  RunResult result;
  if (!process.waitForFinished(30000)) {
    process.kill();
    return result;
  }
  if (process.exitStatus() == QProcess::NormalExit) {
    result.exitCode = process.exitCode();
  }
  result.out = QString::fromUtf8(process.readAllStandardOutput());
  result.err = QString::fromUtf8(process.readAllStandardError());
  return result;
}

const Workspace* findWorkspace(const AppState& state, const QUuid& id)
{
  for (const Workspace& workspace : state.workspaces) {
    if (workspace.id == id) {
      return &workspace;
    }
  }
  return nullptr;
}
}

class TestCommandLine final : public QObject
{
  Q_OBJECT

private slots:
  void init()
  {
    QVERIFY(m_dir.isValid());
    m_path = QDir(m_dir.path()).filePath(QString::number(m_counter++));

    BookmarkStore store(m_path);
    m_inbox = store.currentWorkspaceId();
    m_first = store.addLink(QStringLiteral("https://first.example"), QStringLiteral("First"));
    m_second = store.addLink(QStringLiteral("https://second.example"), QStringLiteral("Second"));
    m_work = store.createWorkspace(QStringLiteral("Work"), WorkspaceColorId::Leaf);
    store.addLink(QStringLiteral("https://jira.example"), QStringLiteral("Jira"));
    store.selectWorkspace(m_inbox);
  }

  void listWithWorkspace_keepsSelection()
  {
    const RunResult result = runArcmark(m_path, {QStringLiteral("list"), QStringLiteral("--workspace"), QStringLiteral("work")});
    QCOMPARE(result.exitCode, 0);
    QVERIFY(result.out.contains(QStringLiteral("Jira")));
    QVERIFY(!result.out.contains(QStringLiteral("First")));

    DataStore dataStore(m_path);
    QCOMPARE(dataStore.load().selectedWorkspaceId, m_inbox);
  }

  void addLinkWithWorkspace_restoresSelection()
  {
    const RunResult result = runArcmark(m_path, {QStringLiteral("add-link"), QStringLiteral("https://wiki.example"),
                                                 QStringLiteral("Wiki"), QStringLiteral("--workspace"),
                                                 QStringLiteral("Work")});
    QCOMPARE(result.exitCode, 0);

    DataStore dataStore(m_path);
    const AppState state = dataStore.load();
    QCOMPARE(state.selectedWorkspaceId, m_inbox);
    const Workspace* work = findWorkspace(state, m_work);
    QVERIFY(work != nullptr);
    QCOMPARE(work->items.size(), std::size_t(2));
    QCOMPARE(work->items.at(1).link.title, QStringLiteral("Wiki"));
    QCOMPARE(findWorkspace(state, m_inbox)->items.size(), std::size_t(2));
  }

  void moveWithBadIndex_isUsageError()
  {
    const QString id = arcmark::uuidToString(m_second);
    RunResult result = runArcmark(m_path, {QStringLiteral("move"), id, QStringLiteral("abc")});
    QCOMPARE(result.exitCode, 2);
    QVERIFY(result.err.contains(QStringLiteral("Invalid index")));

    {
      DataStore dataStore(m_path);
      const Workspace* inbox = findWorkspace(dataStore.load(), m_inbox);
      QVERIFY(inbox != nullptr);
      QCOMPARE(inbox->items.at(0).id(), m_first);
    }

    result = runArcmark(m_path, {QStringLiteral("move"), id, QStringLiteral("0")});
    QCOMPARE(result.exitCode, 0);

    DataStore dataStore(m_path);
    const AppState state = dataStore.load();
    const Workspace* inbox = findWorkspace(state, m_inbox);
    QVERIFY(inbox != nullptr);
    QCOMPARE(inbox->items.at(0).id(), m_second);
    QCOMPARE(inbox->items.at(1).id(), m_first);
  }

  void heldLock_refusesToRun()
  {
    DataStore holder(m_path);
    QVERIFY(holder.acquireWriteLock());

    const RunResult result = runArcmark(m_path, {QStringLiteral("list")});
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.err.contains(QStringLiteral("in use")));
  }

private:
  QTemporaryDir m_dir;
  QString m_path;
  int m_counter = 0;
  QUuid m_inbox;
  QUuid m_work;
  QUuid m_first;
  QUuid m_second;
};

QTEST_GUILESS_MAIN(TestCommandLine)

#include "TestCommandLine.moc"

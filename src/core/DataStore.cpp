#include "DataStore.h"

#include "AppPaths.h"
#include "AppStateJson.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QLockFile>
#include <QSaveFile>
#include <QSet>

namespace
{
bool reassignIds(NodeList& nodes, QSet<QUuid>& seen)
{
  bool changed = false;
  for (Node& node : nodes) {
    if (node.id().isNull() || seen.contains(node.id())) {
      node.setId(QUuid::createUuid());
      changed = true;
    }
    seen.insert(node.id());
    if (node.isFolder() && reassignIds(node.folder.children, seen)) {
      changed = true;
    }
  }
  return changed;
}
}

DataStore::DataStore(const QString& baseDir)
  : m_baseDir(arcmark::resolveDataDir(baseDir))
{
}

DataStore::~DataStore() = default;

QString DataStore::baseDirectory() const
{
  return m_baseDir;
}

QString DataStore::dataFilePath() const
{
  return QDir(m_baseDir).filePath(QString::fromLatin1(kDataFileName));
}

QString DataStore::lastError() const
{
  return m_lastError;
}

QString DataStore::lockFilePath() const
{
  return dataFilePath() + QStringLiteral(".lock");
}

bool DataStore::acquireWriteLock(QString* error)
{
  if (m_writeLock) {
    return true;
  }

  QDir().mkpath(m_baseDir);
  auto lock = std::make_unique<QLockFile>(lockFilePath());
  if (lock->tryLock(0)) {
    m_writeLock = std::move(lock);
    return true;
  }

  QString message;
  qint64 pid = 0;
  QString hostname;
  QString appname;
  switch (lock->error()) {
    case QLockFile::LockFailedError:
      if (lock->getLockInfo(&pid, &hostname, &appname)) {
        message = QStringLiteral("%1 is in use by %2 (pid %3 on %4).")
                    .arg(QDir::toNativeSeparators(m_baseDir), appname.isEmpty() ? QStringLiteral("another process") : appname)
                    .arg(pid)
                    .arg(hostname);
      } else {
        message = QStringLiteral("%1 is in use by another process.").arg(QDir::toNativeSeparators(m_baseDir));
      }
      break;
    case QLockFile::PermissionError:
      message = QStringLiteral("Cannot create %1: permission denied.").arg(QDir::toNativeSeparators(lockFilePath()));
      break;
    default:
      message = QStringLiteral("Cannot lock %1.").arg(QDir::toNativeSeparators(lockFilePath()));
      break;
  }

  qWarning().noquote() << "DataStore:" << message;
  setLastError(message);
  if (error) {
    *error = message;
  }
  return false;
}

void DataStore::releaseWriteLock()
{
  m_writeLock.reset();
}

void DataStore::adoptWriteLock(DataStore& other)
{
  if (other.m_writeLock) {
    m_writeLock = std::move(other.m_writeLock);
  }
}

bool DataStore::hasWriteLock() const
{
  return m_writeLock != nullptr;
}

AppState DataStore::load()
{
  QDir().mkpath(m_baseDir);

  QFile f(dataFilePath());
  if (!f.exists()) {
    AppState state = arcmark::defaultAppState();
    save(state);
    return state;
  }

  if (!f.open(QIODevice::ReadOnly)) {
    return substituteDefault(f.errorString());
  }
  const QByteArray bytes = f.readAll();
  f.close();

  AppState state;
  QString error;
  if (!arcmark::parseAppState(bytes, &state, &error)) {
    return substituteDefault(error);
  }

  if (repairState(&state)) {
    qInfo().noquote() << "DataStore: repaired" << dataFilePath();
    save(state);
  }

  setLastError({});
  return state;
}

bool DataStore::save(const AppState& state, QString* error)
{
  QDir().mkpath(m_baseDir);

  QSaveFile out(dataFilePath());
  if (!out.open(QIODevice::WriteOnly)) {
    const QString message = out.errorString();
    qWarning().noquote() << "DataStore: failed to save state:" << message;
    setLastError(message);
    if (error) {
      *error = message;
    }
    return false;
  }

  out.write(arcmark::serializeAppState(state));
  if (!out.commit()) {
    const QString message = out.errorString();
    qWarning().noquote() << "DataStore: failed to save state:" << message;
    setLastError(message);
    if (error) {
      *error = message;
    }
    return false;
  }

  setLastError({});
  return true;
}

QString DataStore::iconsDirectory() const
{
  const QString path = QDir(m_baseDir).filePath(QString::fromLatin1(kIconsDirName));
  QDir().mkpath(path);
  return path;
}

bool DataStore::repairState(AppState* state)
{
  if (!state) {
    return false;
  }

  bool changed = false;

  if (state->workspaces.isEmpty()) {
    const Workspace inbox = arcmark::makeWorkspace(QStringLiteral("Inbox"), arcmark::defaultColorId());
    state->workspaces.push_back(inbox);
    state->selectedWorkspaceId = inbox.id;
    changed = true;
  }

  QSet<QUuid> workspaceIds;
  QSet<QUuid> nodeIds;
  for (Workspace& workspace : state->workspaces) {
    if (workspace.id.isNull() || workspaceIds.contains(workspace.id)) {
      workspace.id = QUuid::createUuid();
      changed = true;
    }
    workspaceIds.insert(workspace.id);

    while (workspace.pinnedLinks.size() > Workspace::kMaxPinnedLinks) {
      const Link overflow = workspace.pinnedLinks.takeAt(Workspace::kMaxPinnedLinks);
      workspace.items.push_back(Node::fromLink(overflow));
      changed = true;
    }

    if (reassignIds(workspace.items, nodeIds)) {
      changed = true;
    }
    for (Link& link : workspace.pinnedLinks) {
      if (link.id.isNull() || nodeIds.contains(link.id)) {
        link.id = QUuid::createUuid();
        changed = true;
      }
      nodeIds.insert(link.id);
    }
  }

  if (!state->selectedWorkspaceId.isNull() && !workspaceIds.contains(state->selectedWorkspaceId)) {
    state->selectedWorkspaceId = QUuid();
    changed = true;
  }

  return changed;
}

AppState DataStore::substituteDefault(const QString& reason)
{
  qWarning().noquote() << "DataStore: could not load" << dataFilePath() << "-" << reason
                       << "- falling back to a default state";
  AppState state = arcmark::defaultAppState();
  save(state);
  setLastError(reason);
  return state;
}

void DataStore::setLastError(const QString& error)
{
  m_lastError = error;
}

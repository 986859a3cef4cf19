#include "ImportResult.h"

#include <QFile>
#include <QUrl>

ImportResult ImportResult::failure(const QString& message)
{
  ImportResult result;
  result.success = false;
  result.errorMessage = message;
  return result;
}

ImportResult ImportResult::fromWorkspaces(const QVector<Workspace>& workspaces)
{
  ImportResult result;
  result.success = true;
  result.workspaces = workspaces;
  result.workspaceCount = workspaces.size();
  for (const Workspace& workspace : workspaces) {
    result.linkCount += arcmark::countLinks(workspace.items);
    result.folderCount += arcmark::countFolders(workspace.items);
  }
  return result;
}

QString ImportResult::summary() const
{
  if (!success) {
    return QStringLiteral("Import failed: %1").arg(errorMessage);
  }
  return QStringLiteral("Imported %1 workspace(s), %2 link(s), %3 folder(s).")
    .arg(workspaceCount)
    .arg(linkCount)
    .arg(folderCount);
}

namespace arcmark
{
QString normalizeUserFilePath(const QString& input)
{
  const QString trimmed = input.trimmed();
  if (trimmed.isEmpty()) {
    return {};
  }

  if (trimmed.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
    const QUrl url(trimmed);
    if (url.isValid() && url.isLocalFile()) {
      const QString local = url.toLocalFile();
      if (!local.trimmed().isEmpty()) {
        return local;
      }
    }
  }

  return trimmed;
}

bool readImportFile(const QString& filePath, QByteArray* bytes, QString* error)
{
  const QString path = normalizeUserFilePath(filePath);
  if (path.isEmpty()) {
    if (error) {
      *error = QStringLiteral("No file path specified");
    }
    return false;
  }

  QFile in(path);
  if (!in.exists()) {
    if (error) {
      *error = QStringLiteral("File not found: %1").arg(path);
    }
    return false;
  }
  if (!in.open(QIODevice::ReadOnly)) {
    if (error) {
      *error = in.errorString();
    }
    return false;
  }

  if (bytes) {
    *bytes = in.readAll();
  }
  return true;
}
}

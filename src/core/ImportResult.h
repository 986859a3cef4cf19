#pragma once

#include "BookmarkTypes.h"

#include <QString>
#include <QVector>

struct ImportResult
{
  bool success = false;
  QString errorMessage;
  QVector<Workspace> workspaces;
  int workspaceCount = 0;
  int linkCount = 0;
  int folderCount = 0;

  static ImportResult failure(const QString& message);
  // Fills the counts from workspaces.
  static ImportResult fromWorkspaces(const QVector<Workspace>& workspaces);

  QString summary() const;
};

namespace arcmark
{
// Accepts plain paths and file: URLs.
QString normalizeUserFilePath(const QString& input);
bool readImportFile(const QString& filePath, QByteArray* bytes, QString* error = nullptr);
}

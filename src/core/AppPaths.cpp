#include "AppPaths.h"

#include <QDebug>
#include <QDir>
#include <QStandardPaths>

namespace
{
QString ensureDir(const QString& dir)
{
  const QString absolute = QDir(dir).absolutePath();
  if (!QDir().mkpath(absolute)) {
    qWarning().noquote() << "AppPaths: cannot create" << QDir::toNativeSeparators(absolute);
  }
  return absolute;
}
}

namespace arcmark
{
QString appDataRoot()
{
  const QString fromEnv = qEnvironmentVariable(kDataDirEnvVar).trimmed();
  if (!fromEnv.isEmpty()) {
    return ensureDir(fromEnv);
  }
  return ensureDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation));
}

QString resolveDataDir(const QString& dir)
{
  return dir.trimmed().isEmpty() ? appDataRoot() : ensureDir(dir.trimmed());
}

QString overrideDataDir(const QString& dir)
{
  const QString resolved = resolveDataDir(dir);
  qputenv(kDataDirEnvVar, QDir::toNativeSeparators(resolved).toUtf8());
  return resolved;
}

QString logFilePath()
{
  return QDir(appDataRoot()).filePath(QStringLiteral("arcmark.log"));
}
}

#include "FaviconCache.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

namespace
{
void setError(QString* error, const QString& message)
{
  if (error) {
    *error = message;
  }
}
}

FaviconCache::FaviconCache(const QString& iconsDir, QObject* parent)
  : QObject(parent)
  , m_iconsDir(iconsDir)
{
}

QString FaviconCache::iconsDirectory() const
{
  return m_iconsDir;
}

QString FaviconCache::hostKey(const QUrl& pageUrl)
{
  const QString host = pageUrl.host().trimmed().toLower();
  if (host == QLatin1String("localhost") || host == QLatin1String("127.0.0.1")) {
    return {};
  }
  return host;
}

QString FaviconCache::iconPathForUrl(const QUrl& pageUrl) const
{
  const QString host = hostKey(pageUrl);
  if (host.isEmpty() || m_iconsDir.isEmpty()) {
    return {};
  }
  QString fileName = host;
  fileName.replace(QLatin1Char(':'), QLatin1Char('_'));
  return QDir(m_iconsDir).filePath(fileName + QStringLiteral(".ico"));
}

QString FaviconCache::cachedIconPath(const QUrl& pageUrl, const QString& storedPath)
{
  const QString host = hostKey(pageUrl);
  if (host.isEmpty()) {
    return {};
  }

  const QString known = m_cachedPaths.value(host);
  if (!known.isEmpty() && QFileInfo::exists(known)) {
    return known;
  }

  if (!storedPath.isEmpty() && QFileInfo::exists(storedPath)) {
    m_cachedPaths.insert(host, storedPath);
    return storedPath;
  }

  const QString path = iconPathForUrl(pageUrl);
  if (QFileInfo::exists(path)) {
    m_cachedPaths.insert(host, path);
    return path;
  }

  m_cachedPaths.remove(host);
  return {};
}

bool FaviconCache::storeIcon(const QUrl& pageUrl, const QByteArray& bytes, QString* path, QString* error)
{
  const QString target = iconPathForUrl(pageUrl);
  if (target.isEmpty()) {
    setError(error, QStringLiteral("URL has no cacheable host"));
    return false;
  }
  if (bytes.isEmpty()) {
    setError(error, QStringLiteral("Icon data is empty"));
    return false;
  }

  QDir().mkpath(m_iconsDir);

  QSaveFile out(target);
  if (!out.open(QIODevice::WriteOnly)) {
    setError(error, out.errorString());
    qWarning().noquote() << "FaviconCache: cannot write" << target << "-" << out.errorString();
    return false;
  }
  out.write(bytes);
  if (!out.commit()) {
    setError(error, out.errorString());
    qWarning().noquote() << "FaviconCache: cannot write" << target << "-" << out.errorString();
    return false;
  }

  const QString host = hostKey(pageUrl);
  m_cachedPaths.insert(host, target);
  if (path) {
    *path = target;
  }
  emit faviconAvailable(host, target);
  return true;
}

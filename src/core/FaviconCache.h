#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <QUrl>

// Disk cache of site icons, one "<host>.ico" file per host inside the icons directory.
// Fetching is left to the caller; the cache only answers lookups and stores bytes.
class FaviconCache final : public QObject
{
  Q_OBJECT

public:
  explicit FaviconCache(const QString& iconsDir, QObject* parent = nullptr);

  QString iconsDirectory() const;

  // Lowercased host, or empty for URLs without a host and for loopback hosts.
  static QString hostKey(const QUrl& pageUrl);

  Q_INVOKABLE QString iconPathForUrl(const QUrl& pageUrl) const;
  // Existing icon for the URL's host. A storedPath that still exists on disk wins.
  Q_INVOKABLE QString cachedIconPath(const QUrl& pageUrl, const QString& storedPath = {});
  bool storeIcon(const QUrl& pageUrl, const QByteArray& bytes, QString* path = nullptr, QString* error = nullptr);

signals:
  void faviconAvailable(const QString& host, const QString& path);

private:
  QString m_iconsDir;
  QHash<QString, QString> m_cachedPaths;
};

#include "AppSettings.h"

#include "AppPaths.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace
{
constexpr int kSettingsVersion = 1;

QString normalizeSidebarPosition(const QString& position)
{
  const QString lower = position.trimmed().toLower();
  return lower == QStringLiteral("left") ? lower : QStringLiteral("right");
}
}

AppSettings::AppSettings(const QString& baseDir, QObject* parent)
  : QObject(parent)
  , m_baseDir(arcmark::resolveDataDir(baseDir))
{
  m_saveTimer.setSingleShot(true);
  m_saveTimer.setInterval(250);
  connect(&m_saveTimer, &QTimer::timeout, this, [this] {
    QString error;
    if (!saveNow(&error)) {
      qWarning().noquote() << "AppSettings: failed to save:" << error;
    }
  });

  load();
}

AppSettings::~AppSettings()
{
  if (m_saveTimer.isActive()) {
    m_saveTimer.stop();
    QString error;
    if (!saveNow(&error)) {
      qWarning().noquote() << "AppSettings: failed to save:" << error;
    }
  }
}

QString AppSettings::settingsPath() const
{
  return QDir(m_baseDir).filePath(QStringLiteral("settings.json"));
}

QString AppSettings::lastSelectedWorkspaceId() const
{
  return m_lastSelectedWorkspaceId;
}

void AppSettings::setLastSelectedWorkspaceId(const QString& id)
{
  const QString next = id.trimmed();
  if (m_lastSelectedWorkspaceId == next) {
    return;
  }
  m_lastSelectedWorkspaceId = next;
  emit lastSelectedWorkspaceIdChanged();
  scheduleSave();
}

bool AppSettings::alwaysOnTop() const
{
  return m_alwaysOnTop;
}

void AppSettings::setAlwaysOnTop(bool enabled)
{
  if (m_alwaysOnTop == enabled) {
    return;
  }
  m_alwaysOnTop = enabled;
  emit alwaysOnTopChanged();
  scheduleSave();
}

QString AppSettings::mainWindowSize() const
{
  return m_mainWindowSize;
}

void AppSettings::setMainWindowSize(const QString& size)
{
  if (m_mainWindowSize == size) {
    return;
  }
  m_mainWindowSize = size;
  emit mainWindowSizeChanged();
  scheduleSave();
}

bool AppSettings::sidebarAttachmentEnabled() const
{
  return m_sidebarAttachmentEnabled;
}

void AppSettings::setSidebarAttachmentEnabled(bool enabled)
{
  if (m_sidebarAttachmentEnabled == enabled) {
    return;
  }
  m_sidebarAttachmentEnabled = enabled;
  emit sidebarAttachmentEnabledChanged();
  scheduleSave();
}

QString AppSettings::sidebarPosition() const
{
  return m_sidebarPosition;
}

void AppSettings::setSidebarPosition(const QString& position)
{
  const QString next = normalizeSidebarPosition(position);
  if (m_sidebarPosition == next) {
    return;
  }
  m_sidebarPosition = next;
  emit sidebarPositionChanged();
  scheduleSave();
}

QString AppSettings::defaultBrowserPath() const
{
  return m_defaultBrowserPath;
}

void AppSettings::setDefaultBrowserPath(const QString& path)
{
  const QString next = path.trimmed();
  if (m_defaultBrowserPath == next) {
    return;
  }
  m_defaultBrowserPath = next;
  emit defaultBrowserPathChanged();
  scheduleSave();
}

QString AppSettings::toggleSidebarShortcut() const
{
  return m_toggleSidebarShortcut;
}

void AppSettings::setToggleSidebarShortcut(const QString& shortcut)
{
  const QString next = shortcut.trimmed();
  if (next.isEmpty() || m_toggleSidebarShortcut == next) {
    return;
  }
  m_toggleSidebarShortcut = next;
  emit toggleSidebarShortcutChanged();
  scheduleSave();
}

void AppSettings::load()
{
  QFile f(settingsPath());
  if (!f.exists()) {
    return;
  }
  if (!f.open(QIODevice::ReadOnly)) {
    qWarning().noquote() << "AppSettings: cannot read" << f.fileName() << "-" << f.errorString();
    return;
  }

  const QJsonDocument doc = QJsonDocument::fromJson(f.readAll());
  if (!doc.isObject()) {
    qWarning().noquote() << "AppSettings: ignoring malformed" << f.fileName();
    return;
  }
  const QJsonObject obj = doc.object();

  m_lastSelectedWorkspaceId = obj.value("lastSelectedWorkspaceId").toString().trimmed();
  m_alwaysOnTop = obj.value("alwaysOnTopEnabled").toBool(m_alwaysOnTop);
  m_mainWindowSize = obj.value("mainWindowSize").toString();
  m_sidebarAttachmentEnabled = obj.value("sidebarAttachmentEnabled").toBool(m_sidebarAttachmentEnabled);
  m_sidebarPosition = normalizeSidebarPosition(obj.value("sidebarPosition").toString(m_sidebarPosition));
  m_defaultBrowserPath = obj.value("defaultBrowserPath").toString().trimmed();

  const QString shortcut = obj.value("toggleSidebarShortcut").toString().trimmed();
  if (!shortcut.isEmpty()) {
    m_toggleSidebarShortcut = shortcut;
  }
}

void AppSettings::scheduleSave()
{
  m_saveTimer.start();
}

bool AppSettings::saveNow(QString* error) const
{
  QDir().mkpath(m_baseDir);

  QSaveFile f(settingsPath());
  if (!f.open(QIODevice::WriteOnly)) {
    if (error) {
      *error = f.errorString();
    }
    return false;
  }

  QJsonObject obj;
  obj.insert("version", kSettingsVersion);
  obj.insert("lastSelectedWorkspaceId", m_lastSelectedWorkspaceId);
  obj.insert("alwaysOnTopEnabled", m_alwaysOnTop);
  obj.insert("mainWindowSize", m_mainWindowSize);
  obj.insert("sidebarAttachmentEnabled", m_sidebarAttachmentEnabled);
  obj.insert("sidebarPosition", m_sidebarPosition);
  obj.insert("defaultBrowserPath", m_defaultBrowserPath);
  obj.insert("toggleSidebarShortcut", m_toggleSidebarShortcut);

  f.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
  if (!f.commit()) {
    if (error) {
      *error = f.errorString();
    }
    return false;
  }

  return true;
}

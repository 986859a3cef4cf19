#pragma once

#include <QObject>
#include <QString>
#include <QTimer>

class AppSettings : public QObject
{
  Q_OBJECT

  Q_PROPERTY(
    QString lastSelectedWorkspaceId READ lastSelectedWorkspaceId WRITE setLastSelectedWorkspaceId NOTIFY
      lastSelectedWorkspaceIdChanged)
  Q_PROPERTY(bool alwaysOnTop READ alwaysOnTop WRITE setAlwaysOnTop NOTIFY alwaysOnTopChanged)
  Q_PROPERTY(QString mainWindowSize READ mainWindowSize WRITE setMainWindowSize NOTIFY mainWindowSizeChanged)
  Q_PROPERTY(
    bool sidebarAttachmentEnabled READ sidebarAttachmentEnabled WRITE setSidebarAttachmentEnabled NOTIFY
      sidebarAttachmentEnabledChanged)
  Q_PROPERTY(QString sidebarPosition READ sidebarPosition WRITE setSidebarPosition NOTIFY sidebarPositionChanged)
  Q_PROPERTY(
    QString defaultBrowserPath READ defaultBrowserPath WRITE setDefaultBrowserPath NOTIFY defaultBrowserPathChanged)
  Q_PROPERTY(
    QString toggleSidebarShortcut READ toggleSidebarShortcut WRITE setToggleSidebarShortcut NOTIFY
      toggleSidebarShortcutChanged)

public:
  // An empty baseDir resolves to arcmark::appDataRoot().
  explicit AppSettings(const QString& baseDir = {}, QObject* parent = nullptr);
  ~AppSettings() override;

  QString settingsPath() const;

  QString lastSelectedWorkspaceId() const;
  void setLastSelectedWorkspaceId(const QString& id);

  bool alwaysOnTop() const;
  void setAlwaysOnTop(bool enabled);

  QString mainWindowSize() const;
  void setMainWindowSize(const QString& size);

  bool sidebarAttachmentEnabled() const;
  void setSidebarAttachmentEnabled(bool enabled);

  QString sidebarPosition() const;
  void setSidebarPosition(const QString& position);

  QString defaultBrowserPath() const;
  void setDefaultBrowserPath(const QString& path);

  QString toggleSidebarShortcut() const;
  void setToggleSidebarShortcut(const QString& shortcut);

  bool saveNow(QString* error = nullptr) const;

signals:
  void lastSelectedWorkspaceIdChanged();
  void alwaysOnTopChanged();
  void mainWindowSizeChanged();
  void sidebarAttachmentEnabledChanged();
  void sidebarPositionChanged();
  void defaultBrowserPathChanged();
  void toggleSidebarShortcutChanged();

private:
  void load();
  void scheduleSave();

  QString m_baseDir;
  QString m_lastSelectedWorkspaceId;
  bool m_alwaysOnTop = false;
  QString m_mainWindowSize;
  bool m_sidebarAttachmentEnabled = false;
  QString m_sidebarPosition = QStringLiteral("right");
  QString m_defaultBrowserPath;
  QString m_toggleSidebarShortcut = QStringLiteral("Ctrl+Shift+A");
  QTimer m_saveTimer;
};

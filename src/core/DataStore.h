#pragma once

#include "BookmarkTypes.h"

#include <QString>

#include <memory>

class QLockFile;

class DataStore
{
public:
  static constexpr const char* kDataFileName = "data.json";
  static constexpr const char* kIconsDirName = "Icons";

  // An empty baseDir resolves to arcmark::appDataRoot().
  explicit DataStore(const QString& baseDir = {});
  ~DataStore();

  DataStore(const DataStore&) = delete;
  DataStore& operator=(const DataStore&) = delete;

  QString baseDirectory() const;
  QString dataFilePath() const;
  QString lastError() const;
  QString lockFilePath() const;

  // One writer per data directory. The lock sits beside data.json and is held until
  // releaseWriteLock() or destruction. Fails when another live process holds it.
  bool acquireWriteLock(QString* error = nullptr);
  void releaseWriteLock();
  // Moves other's lock, if any, into this store.
  void adoptWriteLock(DataStore& other);
  bool hasWriteLock() const;

  AppState load();
  bool save(const AppState& state, QString* error = nullptr);
  QString iconsDirectory() const;

  // Fixes what a hand-edited or foreign file can break: an empty workspace list,
  // duplicate or null ids, pinned overflow and a dangling selection.
  static bool repairState(AppState* state);

private:
  AppState substituteDefault(const QString& reason);
  void setLastError(const QString& error);

  QString m_baseDir;
  QString m_lastError;
  std::unique_ptr<QLockFile> m_writeLock;
};

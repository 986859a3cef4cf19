#pragma once

#include "ImportResult.h"

#include <QByteArray>
#include <QString>

// Reads Chrome's "Bookmarks" JSON file. Each non-empty root (bookmark bar, other, mobile)
// becomes a workspace, or all of them fold into one "Chrome Bookmarks" workspace.
class ChromeImporter final
{
public:
  static ImportResult importFile(const QString& filePath, bool mergeIntoSingle = false);
  static ImportResult importJson(const QByteArray& json, bool mergeIntoSingle = false);
};

#pragma once

#include "ImportResult.h"

#include <QByteArray>
#include <QString>

// Reads Arc's StorableSidebar.json. Every space with at least one importable item becomes a
// workspace; items that list childrenIds become collapsed folders.
class ArcImporter final
{
public:
  static ImportResult importFile(const QString& filePath);
  static ImportResult importJson(const QByteArray& json);
};

#pragma once

#include <QString>

namespace arcmark
{
inline constexpr char kDataDirEnvVar[] = "ARCMARK_DATA_DIR";

// Shared by data.json, settings.json, Icons/ and the log. Honors ARCMARK_DATA_DIR.
QString appDataRoot();

// A blank dir resolves to appDataRoot(). The result is absolute and exists.
QString resolveDataDir(const QString& dir);

// Points appDataRoot() at dir for the rest of the process.
QString overrideDataDir(const QString& dir);

QString logFilePath();
}
